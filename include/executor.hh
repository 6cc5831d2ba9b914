#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "common.hh"
#include "coro.hh"
#include "task.hh"

namespace wren {

/* single threaded cooperative task runner.
 * tasks are only polled when their key sits in the woken set,
 * and the wakers handed to them are what put the key back. */
class Executor
{
  class TaskWaker;

  using WokenSet = MutexWrapper<std::set<TaskKey>>;
  using SpawnQueue = MutexWrapper<std::vector<Coro<>>>;

public:
  /* cheap copyable handle for spawning from inside running tasks.
   * spawned tasks are admitted on the next run() */
  class Spawner
  {
    friend class Executor;

  public:
    void spawn(Coro<>&& coro) const;

  private:
    Spawner(std::shared_ptr<SpawnQueue> queue)
      : m_queue(std::move(queue)) {};

    std::shared_ptr<SpawnQueue> m_queue;
  };

  Executor();
  ~Executor();

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  Spawner spawner() const;
  void spawn(Coro<>&& coro);

  /* admits spawned tasks, then polls every woken task exactly once.
   * tasks woken while this runs are left for the next call. */
  void run();

  /* admitted tasks that haven't finished */
  std::size_t num_tasks() const { return m_tasks.size(); }

  /* true if the next run() has something to do without
   * waiting on the reactor */
  bool has_pending_work() const;

private:
  struct Entry
  {
    std::unique_ptr<Task> task;

    /* built on first poll, then reused */
    std::optional<Waker> waker;
  };

  void admit();

  std::map<TaskKey, Entry> m_tasks;
  std::shared_ptr<SpawnQueue> m_spawned;
  std::shared_ptr<WokenSet> m_woken;
  TaskKey m_nextKey{ 0 };
};

};
