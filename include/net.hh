#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <netinet/in.h>

/* ipv4 only. posix socket types leak out on purpose,
 * the tcp adapters are the only real users */

namespace wren {

class SocketAddr
{
public:
  /* host byte order for both */
  SocketAddr(std::uint32_t ip, std::uint16_t port)
    : m_ip(ip)
    , m_port(port) {};

  static SocketAddr loopback(std::uint16_t port);

  /* "a.b.c.d:port" */
  static std::optional<SocketAddr> parse(std::string_view);

  static SocketAddr from_native(sockaddr_in const&);
  sockaddr_in to_native() const;

  std::uint32_t ip() const { return m_ip; }
  std::uint16_t port() const { return m_port; }

  /* octets in dotted order, [0] is the leftmost one */
  unsigned char operator[](int i) const
  {
    return (m_ip >> ((3 - i) * 8)) & 0xFF;
  }

  std::string to_string() const;

  std::strong_ordering operator<=>(SocketAddr const&) const = default;
  bool operator==(SocketAddr const&) const = default;

private:
  std::uint32_t m_ip;
  std::uint16_t m_port;
};

std::ostream&
operator<<(std::ostream&, SocketAddr const&);

};
