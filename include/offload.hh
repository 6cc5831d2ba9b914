#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "atomic.hh"
#include "io.hh"
#include "thread_queue.hh"
#include "tools/event.hh"

namespace wren {

using OffloadToken = std::uint64_t;

using OpenResult = IOResult<FileDesc>;
using ReadResult = IOResult<std::vector<std::byte>>;
using OffloadResult = std::variant<OpenResult, ReadResult>;

class OffloadQueue;

/* claim ticket for one offloaded operation.
 * destroying it unclaimed tells the queue to throw the result away */
template<typename R>
class Future
{
  friend class OffloadQueue;

public:
  Future(const Future&) = delete;
  Future& operator=(const Future&) = delete;

  Future(Future&& rhs) noexcept
    : m_queue(std::exchange(rhs.m_queue, nullptr))
    , m_token(rhs.m_token) {};

  Future& operator=(Future&&) = delete;

  ~Future();

  OffloadToken token() const { return m_token; }

  /* nullopt while the worker is still busy. the result can be taken
   * exactly once, after that this keeps returning nullopt */
  std::optional<R> try_take();

private:
  Future(OffloadQueue& queue, OffloadToken token)
    : m_queue(&queue)
    , m_token(token) {};

  /* null once claimed or moved from */
  OffloadQueue* m_queue;
  OffloadToken m_token;
};

/* runs blocking filesystem calls on a worker thread.
 * the worker parks each result in a channel and then signals the
 * request's UserEvent, which the reactor turns into a wakeup for
 * whoever polls the future. */
class OffloadQueue
{
public:
  struct OpenRequest
  {
    std::string path;
  };

  struct ReadRequest
  {
    std::shared_ptr<FileDesc const> file;
    std::size_t max_len;
  };

  using Request = std::variant<OpenRequest, ReadRequest>;

  OffloadQueue() = default;

  OffloadQueue(const OffloadQueue&) = delete;
  OffloadQueue& operator=(const OffloadQueue&) = delete;

  /* the process wide queue, started on first use */
  static OffloadQueue& global();

  Future<OpenResult> push_open(std::string path,
                               std::shared_ptr<UserEvent const> event);
  Future<ReadResult> push_read(std::shared_ptr<FileDesc const> file,
                               std::size_t max_len,
                               std::shared_ptr<UserEvent const> event);

  /* removes and returns the result of `token` if it arrived */
  std::optional<OffloadResult> take(OffloadToken token);

  /* the result of `token` won't be claimed, drop it now or on arrival */
  void forget(OffloadToken token);

  /* results that arrived and are still waiting for their future */
  std::size_t num_unclaimed();

private:
  struct Delivery
  {
    OffloadToken token;
    OffloadResult result;
  };

  struct Results
  {
    std::map<OffloadToken, OffloadResult> ready;
    std::set<OffloadToken> abandoned;
  };

  OffloadToken submit(Request request,
                      std::shared_ptr<UserEvent const> event);

  static OffloadResult execute(Request const& request);

  /* moves everything out of the channel into the result map */
  void collect(Atom<Results>::Transaction& results);

  std::atomic<OffloadToken> m_nextToken{ 1 };

  /* written by the worker, drained by the executor thread */
  Atom<std::deque<Delivery>> m_channel;
  Atom<Results> m_results;

  /* declared last so the worker is joined before the rest goes away */
  ThreadQueue m_worker{ 1 };
};

template<typename R>
Future<R>::~Future()
{
  if (m_queue)
    m_queue->forget(m_token);
}

template<typename R>
std::optional<R>
Future<R>::try_take()
{
  if (!m_queue)
    return std::nullopt;

  auto result = m_queue->take(m_token);
  if (!result)
    return std::nullopt;

  m_queue = nullptr;
  return std::get<R>(std::move(*result));
}

};
