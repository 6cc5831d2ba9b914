#include <algorithm>
#include <cerrno>
#include <exception>
#include <iostream>
#include <limits>
#include <system_error>
#include <utility>

#include "log.hh"
#include "priv_reactor.hh"

using namespace wren;

std::ostream&
wren::operator<<(std::ostream& out, Ready ready)
{
  switch (ready) {
    case Ready::None:
      return out << "none";
    case Ready::Readable:
      return out << "readable";
    case Ready::Writable:
      return out << "writable";
    default:
      return out << "readable|writable";
  }
}

Token
Reactor::Data::allocate()
{
  used++;

  if (!free_tokens.empty()) {
    Token const token = free_tokens.back();
    free_tokens.pop_back();
    nodes[token].emplace();
    return token;
  }

  nodes.emplace_back(std::in_place);
  return nodes.size() - 1;
}

void
Reactor::Data::release(Token token)
{
  if (!find(token))
    return;

  nodes[token].reset();
  free_tokens.push_back(token);
  used--;
}

ReactorNode*
Reactor::Data::find(Token token)
{
  if (token >= nodes.size() || !nodes[token])
    return nullptr;
  return &*nodes[token];
}

ReactorNode&
Reactor::Data::at(Token token)
{
  if (auto* node = find(token))
    return *node;

  std::cerr << "registration token " << token
            << " has no node in the reactor, panicking!\n",
    std::terminate();
}

Reactor::Reactor()
  : Reactor(Config{}) {};

Reactor::Reactor(Config const& config)
  : m_data(new Data)
{
  int const fd = ::epoll_create1(EPOLL_CLOEXEC);
  if (fd < 0)
    throw std::system_error(errno, std::system_category(), "epoll_create1");

  m_data->epoll = FileDesc(fd);
  m_data->events.resize(config.event_capacity ? config.event_capacity : 1);
}

Reactor::~Reactor() {}

IOResult<Registration>
Reactor::register_source(int fd, Ready interest)
{
  Token const token = m_data->allocate();

  epoll_event ev{};
  ev.events = EPOLLET;
  if (has(interest, Ready::Readable))
    ev.events |= EPOLLIN | EPOLLRDHUP;
  if (has(interest, Ready::Writable))
    ev.events |= EPOLLOUT;
  ev.data.u64 = token;

  if (::epoll_ctl(m_data->epoll.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
    auto const err = last_error();
    m_data->release(token);
    return err;
  }

  log::trace("registered fd ", fd, " as token ", token, " for ", interest);
  return Registration(*this, token, fd);
}

std::size_t
Reactor::turn(std::optional<std::chrono::milliseconds> timeout)
{
  int wait_ms = -1;
  if (timeout)
    wait_ms = int(std::clamp<std::chrono::milliseconds::rep>(
      timeout->count(), 0, std::numeric_limits<int>::max()));

  int const num = ::epoll_wait(m_data->epoll.get(),
                               m_data->events.data(),
                               int(m_data->events.size()),
                               wait_ms);

  if (num < 0) {
    if (errno == EINTR)
      return 0;
    throw std::system_error(errno, std::system_category(), "epoll_wait");
  }

  std::size_t dispatched = 0;

  for (int i = 0; i < num; i++) {
    epoll_event const& ev = m_data->events[i];
    Token const token = ev.data.u64;

    /* deregistered by an earlier event of this very turn */
    ReactorNode* node = m_data->find(token);
    if (!node)
      continue;

    Ready ready = Ready::None;
    if (ev.events & (EPOLLIN | EPOLLRDHUP))
      ready = ready | Ready::Readable;
    if (ev.events & EPOLLOUT)
      ready = ready | Ready::Writable;

    /* blocked tasks find out about the error through their syscall */
    if (ev.events & (EPOLLERR | EPOLLHUP))
      ready = Ready::Readable | Ready::Writable;

    node->readiness = node->readiness | ready;
    dispatched++;

    log::trace("token ", token, " became ", ready);

    /* waking may end up touching the slab, so wake copies */
    Waker const read_waker =
      has(ready, Ready::Readable) ? node->read_waker : Waker{};
    Waker const write_waker =
      has(ready, Ready::Writable) ? node->write_waker : Waker{};

    read_waker.wake();
    write_waker.wake();
  }

  return dispatched;
}

std::size_t
Reactor::num_registrations() const
{
  return m_data->used;
}

Registration::Registration(Registration&& rhs) noexcept
  : m_reactor(std::exchange(rhs.m_reactor, nullptr))
  , m_token(rhs.m_token)
  , m_fd(rhs.m_fd) {};

Registration&
Registration::operator=(Registration&& rhs) noexcept
{
  if (this != &rhs) {
    if (auto const res = deregister(); !res)
      log::debug("deregistering token ", m_token, ": ", describe(res.error()));

    m_reactor = std::exchange(rhs.m_reactor, nullptr);
    m_token = rhs.m_token;
    m_fd = rhs.m_fd;
  }
  return *this;
}

Registration::~Registration()
{
  if (auto const res = deregister(); !res)
    log::debug("deregistering token ", m_token, ": ", describe(res.error()));
}

Ready
Registration::readiness() const
{
  if (!m_reactor)
    return Ready::None;
  return m_reactor->m_data->at(m_token).readiness;
}

void
Registration::remove_readiness(Ready bits)
{
  if (!m_reactor)
    return;

  auto& node = m_reactor->m_data->at(m_token);
  node.readiness = Ready(unsigned(node.readiness) & ~unsigned(bits));
}

void
Registration::set_read_waker(Waker waker)
{
  if (m_reactor)
    m_reactor->m_data->at(m_token).read_waker = std::move(waker);
}

void
Registration::set_write_waker(Waker waker)
{
  if (m_reactor)
    m_reactor->m_data->at(m_token).write_waker = std::move(waker);
}

void
Registration::reset_read_waker()
{
  if (m_reactor)
    m_reactor->m_data->at(m_token).read_waker = Waker{};
}

void
Registration::reset_write_waker()
{
  if (m_reactor)
    m_reactor->m_data->at(m_token).write_waker = Waker{};
}

IOResult<Empty>
Registration::deregister()
{
  Reactor* reactor = std::exchange(m_reactor, nullptr);
  if (!reactor)
    return Empty{};

  int const res =
    ::epoll_ctl(reactor->m_data->epoll.get(), EPOLL_CTL_DEL, m_fd, nullptr);
  Errno const err = res < 0 ? errno : 0;

  reactor->m_data->release(m_token);
  log::trace("deregistered token ", m_token);

  if (err)
    return std::unexpected(err);
  return Empty{};
}
