#include <exception>
#include <iostream>

#include "log.hh"
#include "runtime.hh"

using namespace wren;

Runtime::Runtime()
  : Runtime(Config{}) {};

Runtime::Runtime(Config const& config)
  : m_reactor(config.reactor) {};

void
Runtime::step(std::optional<std::chrono::milliseconds> timeout)
{
  if (m_executor.has_pending_work())
    timeout = std::chrono::milliseconds(0);

  std::size_t const events = m_reactor.turn(timeout);
  log::trace("reactor turn dispatched ", events, " events");

  m_executor.run();
}

void
Runtime::run()
{
  if (m_running)
    std::cerr << "attempting to start multiple run loops on a single "
                 "wren runtime\n",
      std::terminate();

  m_running = true;

  /* admit whatever was spawned before the loop started */
  m_executor.run();

  try {
    while (m_executor.num_tasks() != 0 || m_executor.has_pending_work())
      step(std::nullopt);
  } catch (...) {
    m_running = false;
    throw;
  }

  m_running = false;
}

void
Runtime::run(std::function<Coro<>(Runtime&)> entry)
{
  spawn(entry(*this));
  run();
}
