#include <atomic>
#include <exception>
#include <iostream>
#include <thread>

#include "common.hh"

using namespace wren;

void
Mutex::lock()
{
  auto const self = std::this_thread::get_id();
  if (m_owner.load(std::memory_order_relaxed) == self)
    std::cerr << "deadlock detected. thread: " << self << '\n',
      std::terminate();

  while (m_flag.test_and_set(std::memory_order_acquire))
    m_flag.wait(true, std::memory_order_relaxed);

  m_owner.store(self, std::memory_order_relaxed);
}

bool
Mutex::try_lock()
{
  auto const self = std::this_thread::get_id();
  if (m_owner.load(std::memory_order_relaxed) == self)
    std::cerr << "deadlock detected. thread: " << self << '\n',
      std::terminate();

  /* test_and_set hands back the previous state */
  if (m_flag.test_and_set(std::memory_order_acquire))
    return false;

  m_owner.store(self, std::memory_order_relaxed);
  return true;
}

void
Mutex::unlock()
{
  auto const self = std::this_thread::get_id();
  if (m_owner.load(std::memory_order_relaxed) != self)
    std::cerr << "unlock when not owning mutex. thread: " << self << '\n',
      std::terminate();

  m_owner.store(std::thread::id{}, std::memory_order_relaxed);
  m_flag.clear(std::memory_order_release);
  m_flag.notify_one();
}

bool
Mutex::is_locked() const
{
  return m_flag.test(std::memory_order_acquire);
}
