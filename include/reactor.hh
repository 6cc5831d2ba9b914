#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>

#include "io.hh"
#include "task.hh"

namespace wren {

/* readiness bits accumulated per registered source */
enum class Ready : unsigned
{
  None = 0,
  Readable = 1 << 0,
  Writable = 1 << 1,
};

constexpr Ready
operator|(Ready lhs, Ready rhs)
{
  return Ready(unsigned(lhs) | unsigned(rhs));
}

constexpr Ready
operator&(Ready lhs, Ready rhs)
{
  return Ready(unsigned(lhs) & unsigned(rhs));
}

/* true if every bit of `bits` is set in `mask` */
constexpr bool
has(Ready mask, Ready bits)
{
  return bits != Ready::None && (mask & bits) == bits;
}

std::ostream&
operator<<(std::ostream&, Ready);

using Token = std::size_t;

class Reactor;

/* RAII handle onto a node of the reactor.
 * destroying it removes the source from epoll and frees the token */
class Registration
{
  friend class Reactor;

public:
  Registration(const Registration&) = delete;
  Registration& operator=(const Registration&) = delete;

  Registration(Registration&& rhs) noexcept;
  Registration& operator=(Registration&& rhs) noexcept;

  ~Registration();

  Token token() const { return m_token; }

  /* everything below is a no-op (readiness() is None) once the
   * registration has been deregistered or moved from */
  Ready readiness() const;

  /* adapters clear a bit right after the syscall said EWOULDBLOCK.
   * the bit stays clear until the next edge comes in */
  void remove_readiness(Ready bits);

  void set_read_waker(Waker waker);
  void set_write_waker(Waker waker);
  void reset_read_waker();
  void reset_write_waker();

  /* safe to call more than once, only the first call talks to epoll.
   * the node is freed even if EPOLL_CTL_DEL fails */
  IOResult<Empty> deregister();

private:
  Registration(Reactor& reactor, Token token, int fd)
    : m_reactor(&reactor)
    , m_token(token)
    , m_fd(fd) {};

  Reactor* m_reactor;
  Token m_token;
  int m_fd;
};

/* heart of the asynchronous IO implementation.
 * sources are registered edge-triggered with epoll, keyed by a
 * small token. turn() waits on epoll, ORs the new readiness into the
 * node of every token it sees, then wakes the matching wakers.
 * single threaded, nothing in here is locked. */
class Reactor
{
  friend class Registration;

public:
  struct Config
  {
    /* how many epoll events a single turn() can pick up */
    unsigned event_capacity = 1024;
  };

  struct Data;

  Reactor();
  explicit Reactor(Config const& config);
  ~Reactor();

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  /* the fd stays owned by the caller and has to outlive the registration */
  IOResult<Registration> register_source(int fd, Ready interest);

  /* waits for events, nullopt blocks until something arrives.
   * returns the number of events dispatched, 0 on EINTR.
   * any other epoll failure is fatal and thrown as std::system_error */
  std::size_t turn(std::optional<std::chrono::milliseconds> timeout);

  std::size_t num_registrations() const;

private:
  std::unique_ptr<Data> m_data;
};

};
