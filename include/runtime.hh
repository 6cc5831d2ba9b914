#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "coro.hh"
#include "executor.hh"
#include "reactor.hh"

namespace wren {

/* one reactor plus one executor, driven from the calling thread */
class Runtime
{
public:
  struct Config
  {
    Reactor::Config reactor;
  };

  Runtime();
  explicit Runtime(Config const& config);

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  Reactor& get_reactor() { return m_reactor; }
  Executor& get_executor() { return m_executor; }

  Executor::Spawner spawner() const { return m_executor.spawner(); }
  void spawn(Coro<>&& coro) { m_executor.spawn(std::move(coro)); }

  template<typename F>
  void spawn_lambda(F lambda)
  {
    /* lambdas and coroutines are _insidious_
     * if you spawn a coroutine lambda without moving
     * the lambda to the heap, the spawner may end up leaving
     * scope. then, the lambda ITSELF will be dropped from memory,
     * taking all of its captures with it while the coroutine
     * still refers to them. so the wrapper coroutine owns it. */
    auto owned = std::make_unique<F>(std::move(lambda));

    spawn([](Runtime& rt, std::unique_ptr<F> fn) -> Coro<> {
      co_await (*fn)(rt);
      co_return {};
    }(*this, std::move(owned)));
  }

  /* blockingly drives the loop until no task is left.
   * errors thrown by the reactor propagate out of here */
  void run();

  /* spawns the entry point first.
   * you should use this as your main entry point */
  void run(std::function<Coro<>(Runtime&)> entry);

  /* one turn of the reactor followed by one executor pass.
   * the timeout is dropped to zero if tasks are already woken */
  void step(std::optional<std::chrono::milliseconds> timeout);

  std::size_t num_tasks() const { return m_executor.num_tasks(); }

private:
  Reactor m_reactor;

  /* declared after the reactor so tasks (and their registrations)
   * are torn down while the reactor still exists */
  Executor m_executor;

  /* nested run loops on one runtime are a bug */
  bool m_running{ false };
};

};
