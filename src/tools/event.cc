#include <cerrno>
#include <cstdint>
#include <sys/eventfd.h>
#include <unistd.h>

#include "log.hh"
#include "tools/event.hh"

using namespace wren;

IOResult<std::shared_ptr<UserEvent>>
UserEvent::create()
{
  int const fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (fd < 0)
    return last_error();

  return std::shared_ptr<UserEvent>(new UserEvent(FileDesc(fd)));
}

void
UserEvent::set_readable() const
{
  std::uint64_t const one = 1;

  while (::write(m_fd.get(), &one, sizeof(one)) < 0) {
    if (errno == EINTR)
      continue;

    /* EAGAIN means the counter is saturated, which is still readable */
    if (errno != EAGAIN)
      log::warn("signalling eventfd ", m_fd.get(), ": ", describe(errno));
    return;
  }
}

void
UserEvent::clear() const
{
  std::uint64_t count = 0;

  while (::read(m_fd.get(), &count, sizeof(count)) < 0) {
    if (errno == EINTR)
      continue;

    if (errno != EAGAIN)
      log::warn("draining eventfd ", m_fd.get(), ": ", describe(errno));
    return;
  }
}
