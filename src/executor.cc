#include <memory>
#include <utility>

#include "executor.hh"
#include "log.hh"

using namespace wren;

/* wakes a task by putting its key back into the woken set.
 * it only holds the set, so outliving the task is harmless:
 * run() skips keys it no longer knows about. */
class Executor::TaskWaker final : public Wakeable
{
public:
  TaskWaker(TaskKey key, std::shared_ptr<WokenSet> woken)
    : m_key(key)
    , m_woken(std::move(woken)) {};

  void wake() const override
  {
    m_woken->with_lock([this](std::set<TaskKey>& woken) {
      woken.insert(m_key);
    });
  }

private:
  TaskKey m_key;
  std::shared_ptr<WokenSet> m_woken;
};

void
Executor::Spawner::spawn(Coro<>&& coro) const
{
  m_queue->with_lock([&](std::vector<Coro<>>& queue) {
    queue.push_back(std::move(coro));
  });
}

Executor::Executor()
  : m_spawned(std::make_shared<SpawnQueue>())
  , m_woken(std::make_shared<WokenSet>()) {};

Executor::~Executor()
{
  /* never-admitted coroutines can hold spawners (and so the queue
   * itself) alive. pull them out and kill them outside of the lock */
  auto orphans = m_spawned->with_lock(
    [](std::vector<Coro<>>& queue) { return std::exchange(queue, {}); });

  if (!orphans.empty())
    log::debug("dropping ", orphans.size(), " never admitted tasks");

  orphans.clear();
  m_tasks.clear();
}

auto
Executor::spawner() const -> Spawner
{
  return Spawner(m_spawned);
}

void
Executor::spawn(Coro<>&& coro)
{
  spawner().spawn(std::move(coro));
}

bool
Executor::has_pending_work() const
{
  return m_spawned->with_lock(
           [](std::vector<Coro<>>& queue) { return !queue.empty(); }) ||
         m_woken->with_lock(
           [](std::set<TaskKey>& woken) { return !woken.empty(); });
}

void
Executor::admit()
{
  auto spawned = m_spawned->with_lock(
    [](std::vector<Coro<>>& queue) { return std::exchange(queue, {}); });

  for (Coro<>& coro : spawned) {
    TaskKey const key = m_nextKey++;
    m_tasks.emplace(key, Entry{ std::make_unique<Task>(key, std::move(coro)) });

    /* fresh tasks start out woken */
    m_woken->with_lock([&](std::set<TaskKey>& woken) { woken.insert(key); });
    log::debug("admitted task ", key);
  }
}

void
Executor::run()
{
  admit();

  /* anything woken from here on lands in the now empty set
   * and waits for the next run() */
  auto const woken = m_woken->with_lock(
    [](std::set<TaskKey>& woken) { return std::exchange(woken, {}); });

  for (TaskKey const key : woken) {
    auto it = m_tasks.find(key);

    /* woken after it already finished */
    if (it == m_tasks.end())
      continue;

    Entry& entry = it->second;
    if (!entry.waker)
      entry.waker.emplace(std::make_shared<TaskWaker const>(key, m_woken));

    if (entry.task->poll(*entry.waker)) {
      log::debug("task ", key, " finished");
      m_tasks.erase(it);
    }
  }
}
