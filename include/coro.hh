#pragma once

#include <coroutine>
#include <exception>
#include <iostream>
#include <optional>
#include <utility>

#include "common.hh"

namespace wren {

/* represents the barest information required for a coroutine
 * to resume/start/end. return type information is provided
 * in the Coro promise_type. */
class PromiseBase
{
public:
  /* hands control back to whoever co_await'd this coroutine,
   * or back to the executor when it is the root of a task */
  struct FinalAwaiter
  {
    bool await_ready() noexcept { return false; }

    template<typename P>
    std::coroutine_handle<> await_suspend(
      std::coroutine_handle<P> handle) noexcept
    {
      if (auto next = handle.promise().continuation)
        return next;
      return std::noop_coroutine();
    }

    void await_resume() noexcept {}
  };

  /* every coroutine is lazily started by its first await/poll */
  std::suspend_always initial_suspend() noexcept { return {}; }
  FinalAwaiter final_suspend() noexcept { return {}; }

  /* rethrown in the awaiting coroutine */
  void unhandled_exception() { exception = std::current_exception(); }

  /* parent coroutine frame */
  std::coroutine_handle<> continuation{};
  std::exception_ptr exception{};
};

template<typename T = Empty>
class Coro
{
public:
  struct promise_type : PromiseBase
  {
    Coro get_return_object()
    {
      return Coro(std::coroutine_handle<promise_type>::from_promise(*this));
    }

    void return_value(T in) { retval.emplace(std::move(in)); }

    std::optional<T> retval;
  };

  /* nested awaits transfer straight into the child frame.
   * once it finishes the final awaiter transfers back here */
  struct Awaiter
  {
    Awaiter(std::coroutine_handle<promise_type> inside)
      : inside(inside) {};

    bool await_ready() noexcept { return false; }

    std::coroutine_handle<> await_suspend(
      std::coroutine_handle<> outside) noexcept
    {
      inside.promise().continuation = outside;
      return inside;
    }

    T await_resume()
    {
      promise_type& promise = inside.promise();

      if (promise.exception)
        std::rethrow_exception(promise.exception);

      if (!promise.retval.has_value())
        std::cerr << ("promise is NOT fulfilled despite coroutine awaiter "
                      "resuming! panicking!\n"),
          std::terminate();

      return std::move(*promise.retval);
    }

  private:
    std::coroutine_handle<promise_type> inside;
  };

  Coro() = default;
  Coro(const Coro&) = delete;
  Coro& operator=(const Coro&) = delete;

  Coro(Coro&& rhs) noexcept
    : m_handle(std::exchange(rhs.m_handle, nullptr)) {};

  Coro& operator=(Coro&& rhs) noexcept
  {
    if (this != &rhs) {
      if (m_handle)
        m_handle.destroy();
      m_handle = std::exchange(rhs.m_handle, nullptr);
    }
    return *this;
  }

  ~Coro()
  {
    if (m_handle)
      m_handle.destroy();
  }

  Awaiter operator co_await() const noexcept { return Awaiter(m_handle); }

  explicit operator bool() const { return bool(m_handle); }
  bool done() const { return m_handle && m_handle.done(); }

  /* only meaningful once done() */
  std::exception_ptr exception() const
  {
    return m_handle ? m_handle.promise().exception : nullptr;
  }

  std::coroutine_handle<> handle() const { return m_handle; }

private:
  explicit Coro(std::coroutine_handle<promise_type> handle)
    : m_handle(handle) {};

  std::coroutine_handle<promise_type> m_handle{};
};

};
