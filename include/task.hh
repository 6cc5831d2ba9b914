#pragma once

#include <coroutine>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "common.hh"
#include "coro.hh"

namespace wren {

/* whatever a waker ends up scheduling.
 * wake() may be called from any thread, any number of times,
 * and after the thing it schedules is long gone. */
class Wakeable
{
public:
  virtual ~Wakeable() = default;
  virtual void wake() const = 0;
};

/* copyable handle onto a Wakeable. copies share the target,
 * so the target lives as long as the last copy does. */
class Waker
{
public:
  /* a default constructed waker does nothing when woken */
  Waker() = default;
  explicit Waker(std::shared_ptr<Wakeable const> target)
    : m_target(std::move(target)) {};

  void wake() const
  {
    if (m_target)
      m_target->wake();
  }

  bool is_noop() const { return !m_target; }

  /* true if both wakers schedule the same target */
  bool will_wake(Waker const& rhs) const { return m_target == rhs.m_target; }

private:
  std::shared_ptr<Wakeable const> m_target;
};

/* nullopt means the operation is still pending */
template<typename T>
using Poll = std::optional<T>;

/* anything a task can block on. returning false from poll() is only
 * allowed once the waker has been stashed somewhere that will
 * eventually wake it, otherwise the task sleeps forever. */
class PollableBase
{
public:
  virtual ~PollableBase() = default;
  virtual bool poll(Waker const& waker) = 0;
};

using TaskKey = std::uint64_t;

/* a spawned root coroutine plus where it is currently parked */
class Task
{
public:
  Task(TaskKey key, Coro<> coro);

  Task(const Task&) = delete;
  Task(Task&&) = delete;
  Task& operator=(const Task&) = delete;
  Task& operator=(Task&&) = delete;

  /* polls the task once. returns true when the coroutine has finished,
   * with or without an exception. */
  bool poll(Waker const& waker);

  /* called by a pending Pollable from inside poll() */
  void block_on(PollableBase& pollable, std::coroutine_handle<> handle);

  TaskKey key() const { return m_key; }

  /* the waker of the poll that is currently running */
  Waker const& waker() const;

  /* the task currently being polled on this thread.
   * panics if called from outside of a task */
  static Task& current();

private:
  TaskKey m_key;
  Coro<> m_coro;

  /* frame to resume once m_blockedOn is ready */
  std::coroutine_handle<> m_resume;
  PollableBase* m_blockedOn{ nullptr };
  Waker const* m_pollWaker{ nullptr };
};

/* base for leaf awaitables. the operation is attempted inline when
 * awaited; if it is pending the task parks on it and the executor
 * re-polls it (not the coroutine) whenever the task is woken. */
template<typename T>
class Pollable : public PollableBase
{
public:
  bool await_ready() { return poll(Task::current().waker()); }

  void await_suspend(std::coroutine_handle<> handle)
  {
    Task::current().block_on(*this, handle);
  }

  T await_resume() { return std::move(*m_output); }

  bool poll(Waker const& waker) final
  {
    if (!m_output)
      if (auto out = poll_once(waker))
        m_output.emplace(std::move(*out));

    return m_output.has_value();
  }

protected:
  virtual Poll<T> poll_once(Waker const& waker) = 0;

private:
  Poll<T> m_output;
};

/* wraps a Poll<T>(Waker const&) callable as an awaitable */
template<typename F>
class PollFn final
  : public Pollable<
      typename std::invoke_result_t<F&, Waker const&>::value_type>
{
  using Output = typename std::invoke_result_t<F&, Waker const&>::value_type;

public:
  explicit PollFn(F fn)
    : m_fn(std::move(fn)) {};

protected:
  Poll<Output> poll_once(Waker const& waker) override { return m_fn(waker); }

private:
  F m_fn;
};

template<typename F>
PollFn<F>
poll_fn(F fn)
{
  return PollFn<F>(std::move(fn));
}

/* cooperatively gives up the rest of this poll.
 * the task wakes itself, so it runs again on the next executor pass */
class Yield final : public Pollable<Empty>
{
protected:
  Poll<Empty> poll_once(Waker const& waker) override;

private:
  bool m_yielded{ false };
};

inline Yield
yield_now()
{
  return {};
}

};
