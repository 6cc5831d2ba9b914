#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>

#include "log.hh"
#include "tools/tcp.hh"

using namespace wren;

namespace {

IOResult<SocketAddr>
sockname(int fd, bool peer)
{
  sockaddr_in addr{};
  socklen_t len = sizeof addr;

  int const res = peer ? ::getpeername(fd, (sockaddr*)&addr, &len)
                       : ::getsockname(fd, (sockaddr*)&addr, &len);
  if (res < 0)
    return last_error();

  return SocketAddr::from_native(addr);
}

bool
would_block(Errno err)
{
  return err == EAGAIN || err == EWOULDBLOCK;
}

};

IOResult<TCPStream>
TCPStream::from_fd(Reactor& reactor, FileDesc fd)
{
  auto registration =
    reactor.register_source(fd.get(), Ready::Readable | Ready::Writable);
  if (!registration)
    return std::unexpected(registration.error());

  return TCPStream(std::move(fd), std::move(*registration));
}

auto
TCPStream::connect(Reactor& reactor, SocketAddr addr) -> Connect
{
  return Connect(reactor, addr);
}

Poll<IOResult<std::size_t>>
TCPStream::poll_read(Waker const& waker, std::span<std::byte> buf)
{
  for (;;) {
    if (!has(m_registration.readiness(), Ready::Readable)) {
      m_registration.set_read_waker(waker);
      return std::nullopt;
    }

    ssize_t const num = ::recv(m_fd.get(), buf.data(), buf.size(), 0);
    if (num >= 0) {
      m_registration.reset_read_waker();
      return std::size_t(num);
    }

    Errno const err = errno;
    if (err == EINTR)
      continue;

    if (would_block(err)) {
      m_registration.remove_readiness(Ready::Readable);
      m_registration.set_read_waker(waker);
      return std::nullopt;
    }

    m_registration.reset_read_waker();
    return std::unexpected(err);
  }
}

Poll<IOResult<std::size_t>>
TCPStream::poll_write(Waker const& waker, std::span<std::byte const> buf)
{
  for (;;) {
    if (!has(m_registration.readiness(), Ready::Writable)) {
      m_registration.set_write_waker(waker);
      return std::nullopt;
    }

    ssize_t const num =
      ::send(m_fd.get(), buf.data(), buf.size(), MSG_NOSIGNAL);
    if (num >= 0) {
      m_registration.reset_write_waker();
      return std::size_t(num);
    }

    Errno const err = errno;
    if (err == EINTR)
      continue;

    if (would_block(err)) {
      m_registration.remove_readiness(Ready::Writable);
      m_registration.set_write_waker(waker);
      return std::nullopt;
    }

    m_registration.reset_write_waker();
    return std::unexpected(err);
  }
}

IOResult<SocketAddr>
TCPStream::peer_addr() const
{
  return sockname(m_fd.get(), true);
}

IOResult<SocketAddr>
TCPStream::local_addr() const
{
  return sockname(m_fd.get(), false);
}

IOResult<Empty>
TCPStream::shutdown_write()
{
  if (::shutdown(m_fd.get(), SHUT_WR) < 0)
    return last_error();
  return Empty{};
}

Poll<IOResult<TCPStream>>
TCPStream::Connect::poll_once(Waker const& waker)
{
  if (!m_registration) {
    int const fd =
      ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
      return std::unexpected(errno);
    m_fd = FileDesc(fd);

    sockaddr_in const addr = m_addr.to_native();
    bool connected = true;

    if (::connect(m_fd.get(), (sockaddr const*)&addr, sizeof addr) < 0) {
      Errno const err = errno;

      /* an interrupted connect carries on in the background */
      if (err != EINPROGRESS && err != EINTR)
        return std::unexpected(err);
      connected = false;
    }

    auto registration = m_reactor->register_source(
      m_fd.get(), Ready::Readable | Ready::Writable);
    if (!registration)
      return std::unexpected(registration.error());

    m_registration.emplace(std::move(*registration));

    if (connected)
      return TCPStream(std::move(m_fd), std::move(*m_registration));
  }

  if (!has(m_registration->readiness(), Ready::Writable)) {
    m_registration->set_write_waker(waker);
    return std::nullopt;
  }

  m_registration->reset_write_waker();

  int err = 0;
  socklen_t len = sizeof err;
  if (::getsockopt(m_fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0)
    return std::unexpected(errno);
  if (err != 0) {
    log::debug("connecting to ", m_addr, ": ", describe(err));
    return std::unexpected(err);
  }

  return TCPStream(std::move(m_fd), std::move(*m_registration));
}

IOResult<TCPListener>
TCPListener::bind(Reactor& reactor, SocketAddr addr)
{
  return bind(reactor, addr, Options{});
}

IOResult<TCPListener>
TCPListener::bind(Reactor& reactor, SocketAddr addr, Options const& options)
{
  int const raw =
    ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (raw < 0)
    return last_error();
  FileDesc fd(raw);

  if (options.reuseaddr) {
    int val = 1;
    if (::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &val, sizeof val) < 0)
      return last_error();
  }

  sockaddr_in const native = addr.to_native();
  if (::bind(fd.get(), (sockaddr const*)&native, sizeof native) < 0)
    return last_error();

  if (::listen(fd.get(), options.backlog) < 0)
    return last_error();

  auto registration = reactor.register_source(fd.get(), Ready::Readable);
  if (!registration)
    return std::unexpected(registration.error());

  return TCPListener(reactor, std::move(fd), std::move(*registration));
}

Poll<IOResult<TCPListener::Accepted>>
TCPListener::poll_accept(Waker const& waker)
{
  for (;;) {
    if (!has(m_registration.readiness(), Ready::Readable)) {
      m_registration.set_read_waker(waker);
      return std::nullopt;
    }

    sockaddr_in addr{};
    socklen_t len = sizeof addr;
    int const fd = ::accept4(
      m_fd.get(), (sockaddr*)&addr, &len, SOCK_NONBLOCK | SOCK_CLOEXEC);

    if (fd < 0) {
      Errno const err = errno;
      if (err == EINTR)
        continue;

      if (would_block(err)) {
        m_registration.remove_readiness(Ready::Readable);
        m_registration.set_read_waker(waker);
        return std::nullopt;
      }

      m_registration.reset_read_waker();
      return std::unexpected(err);
    }

    m_registration.reset_read_waker();

    auto stream = TCPStream::from_fd(*m_reactor, FileDesc(fd));
    if (!stream)
      return std::unexpected(stream.error());

    return Accepted(std::move(*stream), SocketAddr::from_native(addr));
  }
}

IOResult<SocketAddr>
TCPListener::local_addr() const
{
  return sockname(m_fd.get(), false);
}
