#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <utility>

#include "../common.hh"
#include "../io.hh"
#include "../net.hh"
#include "../reactor.hh"
#include "../task.hh"

/* im _not_ trying to build a cross-platform networking
 * library here, so some of the internal posix networking
 * datatypes might leak out. */

namespace wren {

/* connected, non-blocking tcp socket registered Readable|Writable */
class TCPStream
{
public:
  class Read final : public Pollable<IOResult<std::size_t>>
  {
    friend class TCPStream;

  protected:
    Poll<IOResult<std::size_t>> poll_once(Waker const& waker) override
    {
      return m_stream->poll_read(waker, m_buf);
    }

  private:
    Read(TCPStream& stream, std::span<std::byte> buf)
      : m_stream(&stream)
      , m_buf(buf) {};

    TCPStream* m_stream;
    std::span<std::byte> m_buf;
  };

  class Write final : public Pollable<IOResult<std::size_t>>
  {
    friend class TCPStream;

  protected:
    Poll<IOResult<std::size_t>> poll_once(Waker const& waker) override
    {
      return m_stream->poll_write(waker, m_buf);
    }

  private:
    Write(TCPStream& stream, std::span<std::byte const> buf)
      : m_stream(&stream)
      , m_buf(buf) {};

    TCPStream* m_stream;
    std::span<std::byte const> m_buf;
  };

  class Connect;

  TCPStream(TCPStream&&) = default;

  /* takes over an already connected socket */
  static IOResult<TCPStream> from_fd(Reactor& reactor, FileDesc fd);

  /* completes once the socket turns writable, SO_ERROR is checked then */
  static Connect connect(Reactor& reactor, SocketAddr addr);

  /* 0 bytes read means the peer closed its end */
  Read read(std::span<std::byte> buf) { return Read(*this, buf); }

  /* SIGPIPE is weird and ugly. writes never raise it. */
  Write write(std::span<std::byte const> buf) { return Write(*this, buf); }

  Poll<IOResult<std::size_t>> poll_read(Waker const& waker,
                                        std::span<std::byte> buf);
  Poll<IOResult<std::size_t>> poll_write(Waker const& waker,
                                         std::span<std::byte const> buf);

  IOResult<SocketAddr> peer_addr() const;
  IOResult<SocketAddr> local_addr() const;

  IOResult<Empty> shutdown_write();

  int fd() const { return m_fd.get(); }

private:
  TCPStream(FileDesc fd, Registration registration)
    : m_fd(std::move(fd))
    , m_registration(std::move(registration)) {};

  /* registration goes first on destruction, while the fd is still open */
  FileDesc m_fd;
  Registration m_registration;
};

class TCPStream::Connect final : public Pollable<IOResult<TCPStream>>
{
  friend class TCPStream;

protected:
  Poll<IOResult<TCPStream>> poll_once(Waker const& waker) override;

private:
  Connect(Reactor& reactor, SocketAddr addr)
    : m_reactor(&reactor)
    , m_addr(addr) {};

  Reactor* m_reactor;
  SocketAddr m_addr;

  FileDesc m_fd;
  std::optional<Registration> m_registration;
};

class TCPListener
{
public:
  using Accepted = std::pair<TCPStream, SocketAddr>;

  class Accept final : public Pollable<IOResult<Accepted>>
  {
    friend class TCPListener;

  protected:
    Poll<IOResult<Accepted>> poll_once(Waker const& waker) override
    {
      return m_listener->poll_accept(waker);
    }

  private:
    Accept(TCPListener& listener)
      : m_listener(&listener) {};

    TCPListener* m_listener;
  };

  struct Options
  {
    bool reuseaddr = true;
    int backlog = 128;
  };

  TCPListener(TCPListener&&) = default;

  static IOResult<TCPListener> bind(Reactor& reactor, SocketAddr addr);
  static IOResult<TCPListener> bind(Reactor& reactor,
                                    SocketAddr addr,
                                    Options const& options);

  /* asynchronously blocks this task and awaits
   * an incoming connection */
  Accept accept() { return Accept(*this); }

  Poll<IOResult<Accepted>> poll_accept(Waker const& waker);

  /* the actual port when bound to port 0 */
  IOResult<SocketAddr> local_addr() const;

  int fd() const { return m_fd.get(); }

private:
  TCPListener(Reactor& reactor, FileDesc fd, Registration registration)
    : m_reactor(&reactor)
    , m_fd(std::move(fd))
    , m_registration(std::move(registration)) {};

  Reactor* m_reactor;
  FileDesc m_fd;
  Registration m_registration;
};

};
