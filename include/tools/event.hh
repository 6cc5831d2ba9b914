#pragma once

#include <memory>

#include "io.hh"

namespace wren {

/* a readiness source driven from user space, backed by an eventfd.
 * registered Readable with the reactor, so anything (another thread
 * included) that calls set_readable() ends up waking the task parked
 * on it. */
class UserEvent
{
public:
  static IOResult<std::shared_ptr<UserEvent>> create();

  UserEvent(const UserEvent&) = delete;
  UserEvent& operator=(const UserEvent&) = delete;

  int fd() const { return m_fd.get(); }

  /* bumps the counter, producing a readable edge */
  void set_readable() const;

  /* drains the counter so the next set_readable() is a fresh edge */
  void clear() const;

private:
  explicit UserEvent(FileDesc fd)
    : m_fd(std::move(fd)) {};

  FileDesc m_fd;
};

};
