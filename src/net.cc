#include <arpa/inet.h>
#include <charconv>

#include "net.hh"

using namespace wren;

SocketAddr
SocketAddr::loopback(std::uint16_t port)
{
  return SocketAddr(INADDR_LOOPBACK, port);
}

std::optional<SocketAddr>
SocketAddr::parse(std::string_view str)
{
  auto const colon = str.rfind(':');
  if (colon == std::string_view::npos)
    return std::nullopt;

  std::string const host(str.substr(0, colon));
  std::string_view const port_str = str.substr(colon + 1);

  in_addr addr{};
  if (::inet_pton(AF_INET, host.c_str(), &addr) != 1)
    return std::nullopt;

  std::uint16_t port = 0;
  auto const [end, ec] =
    std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
  if (ec != std::errc{} || end != port_str.data() + port_str.size() ||
      port_str.empty())
    return std::nullopt;

  return SocketAddr(ntohl(addr.s_addr), port);
}

SocketAddr
SocketAddr::from_native(sockaddr_in const& addr)
{
  return SocketAddr(ntohl(addr.sin_addr.s_addr), ntohs(addr.sin_port));
}

sockaddr_in
SocketAddr::to_native() const
{
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(m_ip);
  addr.sin_port = htons(m_port);
  return addr;
}

std::string
SocketAddr::to_string() const
{
  std::string out;

  for (int i = 0; i < 4; i++) {
    if (i)
      out += '.';
    out += std::to_string(unsigned((*this)[i]));
  }

  out += ':';
  out += std::to_string(m_port);
  return out;
}

std::ostream&
wren::operator<<(std::ostream& out, SocketAddr const& addr)
{
  return out << addr.to_string();
}
