#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "atomic.hh"
#include "common.hh"
#include "log.hh"
#include "thread_queue.hh"

using namespace wren;

TEST(Mutex, TryLockFailsWhileHeldElsewhere)
{
  Mutex mutex;
  mutex.lock();
  EXPECT_TRUE(mutex.is_locked());

  bool acquired = true;
  std::thread([&] { acquired = mutex.try_lock(); }).join();
  EXPECT_FALSE(acquired);

  mutex.unlock();
  EXPECT_FALSE(mutex.is_locked());

  EXPECT_TRUE(mutex.try_lock());
  mutex.unlock();
}

TEST(Atom, TransactionsSerializeWriters)
{
  Atom<int> counter;
  std::vector<std::thread> threads;

  for (int t = 0; t < 4; t++)
    threads.emplace_back([&] {
      for (int i = 0; i < 10000; i++)
        (*counter.acquire())++;
    });

  for (auto& thread : threads)
    thread.join();

  EXPECT_EQ(*counter.acquire(), 40000);
}

TEST(Atom, TryAcquireAndDrop)
{
  Atom<std::vector<int>> data(std::vector<int>{ 1, 2 });

  auto trans = data.acquire();
  trans->push_back(3);

  bool contended = false;
  std::thread([&] { contended = !data.try_acquire().has_value(); }).join();
  EXPECT_TRUE(contended);

  trans.drop();

  auto again = data.try_acquire();
  ASSERT_TRUE(again);
  EXPECT_EQ((*again)->size(), 3u);
}

TEST(MutexWrapper, WithLockReturnsTheLambdaResult)
{
  MutexWrapper<std::vector<int>> wrapped;
  wrapped.with_lock([](std::vector<int>& v) { v.push_back(7); });
  EXPECT_EQ(wrapped.with_lock([](std::vector<int>& v) { return v.size(); }),
            1u);
}

TEST(ThreadQueue, RunsJobsInOrderOnAWorker)
{
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<int> order;
  std::vector<std::thread::id> ids;

  {
    ThreadQueue queue(1);

    for (int i = 0; i < 8; i++)
      queue.push_task([&, i] {
        std::lock_guard lock(mutex);
        order.push_back(i);
        ids.push_back(std::this_thread::get_id());
        cv.notify_all();
      });

    std::unique_lock lock(mutex);
    cv.wait(lock, [&] { return order.size() == 8; });
    EXPECT_FALSE(queue.quitting());
  }

  EXPECT_EQ(order, (std::vector<int>{ 0, 1, 2, 3, 4, 5, 6, 7 }));
  for (auto id : ids) {
    EXPECT_EQ(id, ids.front());
    EXPECT_NE(id, std::this_thread::get_id());
  }
}

TEST(ThreadQueue, AcceptsMoveOnlyJobs)
{
  std::atomic<int> seen{ 0 };
  std::mutex mutex;
  std::condition_variable cv;

  ThreadQueue queue(2);
  auto value = std::make_unique<int>(42);

  queue.push_task([&, value = std::move(value)] {
    seen = *value;
    std::lock_guard lock(mutex);
    cv.notify_all();
  });

  std::unique_lock lock(mutex);
  cv.wait(lock, [&] { return seen.load() != 0; });
  EXPECT_EQ(seen.load(), 42);
}

TEST(Log, LevelsParseAndFilter)
{
  auto const previous = log::level();

  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("off"), log::Level::Off);
  EXPECT_FALSE(log::parse_level("loud"));

  log::set_level(log::Level::Warn);
  EXPECT_FALSE(log::enabled(log::Level::Info));
  EXPECT_TRUE(log::enabled(log::Level::Error));

  log::set_level(log::Level::Off);
  EXPECT_FALSE(log::enabled(log::Level::Error));
  EXPECT_FALSE(log::enabled(log::Level::Off));

  log::set_level(previous);
}
