#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace wren {

/* basic thread/worker queue used for blocking work.
 * jobs run in submission order when there is a single worker,
 * which is how the offload queue uses it. */
class ThreadQueue
{
public:
  using Job = std::move_only_function<void()>;

  explicit ThreadQueue(unsigned num_workers = 1);
  ~ThreadQueue();

  ThreadQueue(const ThreadQueue&) = delete;
  ThreadQueue(ThreadQueue&&) = delete;
  ThreadQueue& operator=(const ThreadQueue&) = delete;
  ThreadQueue& operator=(ThreadQueue&&) = delete;

  /* pushing after the queue started quitting is a bug and panics */
  void push_task(Job&&);

  bool quitting() const;

private:
  void work();

  mutable std::mutex m_taskQueueMutex;
  std::condition_variable m_taskQueueNotify;
  std::queue<Job> m_taskQueue;
  std::vector<std::thread> m_threads;

  /* if true, the next time taskQueueNotify is triggered
   * the workers return & await to be joined. queued jobs are dropped */
  bool m_taskQueueQuit{ false };
};

};
