#include <algorithm>
#include <cstring>
#include <sys/stat.h>

#include "log.hh"
#include "tools/file.hh"

using namespace wren;

File::Open
File::open(Reactor& reactor, std::string path)
{
  return open(reactor, std::move(path), OffloadQueue::global());
}

File::Open
File::open(Reactor& reactor, std::string path, OffloadQueue& queue)
{
  return Open(reactor, queue, std::move(path));
}

Poll<IOResult<File>>
File::Open::poll_once(Waker const& waker)
{
  if (!m_pending) {
    auto event = UserEvent::create();
    if (!event)
      return std::unexpected(event.error());

    auto registration =
      m_reactor->register_source((*event)->fd(), Ready::Readable);
    if (!registration)
      return std::unexpected(registration.error());

    m_event = std::move(*event);
    m_registration.emplace(std::move(*registration));
    m_pending.emplace(m_queue->push_open(m_path, m_event));
  }

  auto result = m_pending->try_take();
  if (!result) {
    m_registration->set_read_waker(waker);
    return std::nullopt;
  }

  m_registration->reset_read_waker();
  m_registration->remove_readiness(Ready::Readable);
  m_event->clear();

  if (!*result) {
    log::debug("opening ", m_path, ": ", describe(result->error()));
    return std::unexpected(result->error());
  }

  return File(*m_queue,
              std::move(m_event),
              std::move(*m_registration),
              std::make_shared<FileDesc const>(std::move(**result)));
}

Poll<IOResult<std::size_t>>
File::poll_read(Waker const& waker, std::span<std::byte> buf)
{
  if (!m_pendingRead)
    m_pendingRead.emplace(m_queue->push_read(m_file, buf.size(), m_event));

  auto result = m_pendingRead->try_take();
  if (!result) {
    m_registration.set_read_waker(waker);
    return std::nullopt;
  }

  m_pendingRead.reset();
  m_registration.reset_read_waker();
  m_registration.remove_readiness(Ready::Readable);
  m_event->clear();

  if (!*result)
    return std::unexpected(result->error());

  std::size_t const num = std::min(buf.size(), (*result)->size());
  std::memcpy(buf.data(), (*result)->data(), num);
  return num;
}

IOResult<std::size_t>
File::size() const
{
  struct stat st{};
  if (::fstat(m_file->get(), &st) < 0)
    return last_error();

  return std::size_t(st.st_size);
}
