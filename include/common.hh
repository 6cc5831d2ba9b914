#pragma once

#include <atomic>
#include <concepts>
#include <thread>

namespace wren {

/* dealing with void return types in coroutines is _really_ annoying
 * for like no reason whatsoever. so i just use an empty
 * type in place of void */
struct Empty
{};

/* general use spinlock-based mutex.
 * does not yield to the executor on lock(), so only
 * hold it for short critical sections. the offload worker
 * and the executor thread share a few of these. */
class Mutex
{
  /* implemented in common.cc btw */
public:
  void lock();
  void unlock();
  bool is_locked() const;

  /* returns false if unable to lock */
  bool try_lock();

private:
  std::atomic_flag m_flag{};
  std::atomic<std::thread::id> m_owner{};
};

class MutexLock
{
public:
  MutexLock(Mutex& mutex)
    : mutex(mutex)
  {
    mutex.lock();
  }

  ~MutexLock() { mutex.unlock(); }

  MutexLock(const MutexLock&) = delete;
  MutexLock& operator=(const MutexLock&) = delete;

private:
  Mutex& mutex;
};

template<typename T>
class MutexWrapper
{
public:
  MutexWrapper() = default;
  MutexWrapper(T in)
    : m_data(std::move(in)) {};

  auto with_lock(std::invocable<T&> auto lambda)
  {
    MutexLock lock(m_mutex);
    return lambda(m_data);
  };

private:
  Mutex m_mutex;
  T m_data;
};

};
