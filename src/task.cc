#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "log.hh"
#include "task.hh"

using namespace wren;

static thread_local Task* t_currentTask = nullptr;

namespace {

/* marks a task as the current one for the duration of a poll */
class CurrentTaskScope
{
public:
  CurrentTaskScope(Task& task)
    : m_previous(std::exchange(t_currentTask, &task)) {};

  ~CurrentTaskScope() { t_currentTask = m_previous; }

private:
  Task* m_previous;
};

};

Task::Task(TaskKey key, Coro<> coro)
  : m_key(key)
  , m_coro(std::move(coro))
  , m_resume(m_coro.handle()) {};

bool
Task::poll(Waker const& waker)
{
  CurrentTaskScope scope(*this);
  m_pollWaker = &waker;

  if (m_blockedOn) {
    if (!m_blockedOn->poll(waker)) {
      m_pollWaker = nullptr;
      return false;
    }

    m_blockedOn = nullptr;
  }

  /* suspended somewhere that isn't a Pollable. nothing will
   * ever tell us when it is safe to resume, so don't. */
  if (!m_resume) {
    m_pollWaker = nullptr;
    return m_coro.done();
  }

  std::exchange(m_resume, nullptr).resume();
  m_pollWaker = nullptr;

  if (!m_coro.done())
    return false;

  /* the task is finished either way, the executor never sees it throw */
  if (auto const exception = m_coro.exception()) {
    try {
      std::rethrow_exception(exception);
    } catch (std::exception const& e) {
      log::error("task ", m_key, " died with an exception: ", e.what());
    } catch (...) {
      log::error("task ", m_key, " died with a non standard exception");
    }
  }

  return true;
}

void
Task::block_on(PollableBase& pollable, std::coroutine_handle<> handle)
{
  m_blockedOn = &pollable;
  m_resume = handle;
}

Waker const&
Task::waker() const
{
  if (!m_pollWaker)
    std::cerr << "task " << m_key << " has no waker outside of a poll\n",
      std::terminate();

  return *m_pollWaker;
}

Task&
Task::current()
{
  if (!t_currentTask)
    std::cerr << "awaiting a pollable outside of a task, panicking!\n",
      std::terminate();

  return *t_currentTask;
}

Poll<Empty>
Yield::poll_once(Waker const& waker)
{
  if (m_yielded)
    return Empty{};

  m_yielded = true;
  waker.wake();
  return std::nullopt;
}
