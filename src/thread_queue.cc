#include <exception>
#include <iostream>
#include <mutex>

#include "log.hh"
#include "thread_queue.hh"

using namespace wren;

ThreadQueue::ThreadQueue(unsigned num_workers)
{
  for (unsigned i = 0; i < num_workers; i++)
    m_threads.emplace_back([this] { work(); });
}

ThreadQueue::~ThreadQueue()
{
  {
    std::lock_guard lock(m_taskQueueMutex);
    m_taskQueueQuit = true;
  }

  m_taskQueueNotify.notify_all();

  /* a worker in the middle of a blocking call finishes it first */
  for (auto& thread : m_threads)
    thread.join();

  if (!m_taskQueue.empty())
    log::debug("thread queue dropped ", m_taskQueue.size(), " pending jobs");
}

void
ThreadQueue::work()
{
  for (;;) {
    std::unique_lock lock(m_taskQueueMutex);

    m_taskQueueNotify.wait(
      lock, [&] { return not m_taskQueue.empty() or m_taskQueueQuit; });

    /* quit exception */
    if (m_taskQueueQuit)
      break;

    Job job = std::move(m_taskQueue.front());
    m_taskQueue.pop();

    lock.unlock();

    job();
  }
}

void
ThreadQueue::push_task(Job&& job)
{
  {
    std::lock_guard lock(m_taskQueueMutex);

    if (m_taskQueueQuit)
      std::cerr << "pushed a job onto a quitting thread queue, panicking!\n",
        std::terminate();

    m_taskQueue.push(std::move(job));
  }

  m_taskQueueNotify.notify_one();
}

bool
ThreadQueue::quitting() const
{
  std::lock_guard lock(m_taskQueueMutex);
  return m_taskQueueQuit;
}
