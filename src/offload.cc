#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

#include "log.hh"
#include "offload.hh"

using namespace wren;

OffloadQueue&
OffloadQueue::global()
{
  static OffloadQueue queue;
  return queue;
}

Future<OpenResult>
OffloadQueue::push_open(std::string path,
                        std::shared_ptr<UserEvent const> event)
{
  return Future<OpenResult>(
    *this, submit(OpenRequest{ std::move(path) }, std::move(event)));
}

Future<ReadResult>
OffloadQueue::push_read(std::shared_ptr<FileDesc const> file,
                        std::size_t max_len,
                        std::shared_ptr<UserEvent const> event)
{
  return Future<ReadResult>(
    *this,
    submit(ReadRequest{ std::move(file), max_len }, std::move(event)));
}

OffloadToken
OffloadQueue::submit(Request request, std::shared_ptr<UserEvent const> event)
{
  OffloadToken const token = m_nextToken++;

  m_worker.push_task([this,
                      token,
                      request = std::move(request),
                      event = std::move(event)]() mutable {
    OffloadResult result = execute(request);

    /* the result must be visible before the edge is */
    m_channel.acquire()->push_back(Delivery{ token, std::move(result) });
    event->set_readable();
  });

  log::trace("offloaded request ", token);
  return token;
}

OffloadResult
OffloadQueue::execute(Request const& request)
{
  if (auto const* open = std::get_if<OpenRequest>(&request)) {
    int fd;
    do
      fd = ::open(open->path.c_str(), O_RDONLY | O_CLOEXEC);
    while (fd < 0 && errno == EINTR);

    if (fd < 0)
      return OpenResult(last_error());
    return OpenResult(FileDesc(fd));
  }

  auto const& read = std::get<ReadRequest>(request);
  std::vector<std::byte> buf(read.max_len);

  ssize_t num;
  do
    num = ::read(read.file->get(), buf.data(), buf.size());
  while (num < 0 && errno == EINTR);

  if (num < 0)
    return ReadResult(last_error());

  buf.resize(std::size_t(num));
  return ReadResult(std::move(buf));
}

void
OffloadQueue::collect(Atom<Results>::Transaction& results)
{
  auto channel = m_channel.acquire();

  while (!channel->empty()) {
    Delivery delivery = std::move(channel->front());
    channel->pop_front();

    if (results->abandoned.erase(delivery.token)) {
      log::trace("discarding abandoned result ", delivery.token);
      continue;
    }

    results->ready.insert_or_assign(delivery.token, std::move(delivery.result));
  }
}

std::optional<OffloadResult>
OffloadQueue::take(OffloadToken token)
{
  auto results = m_results.acquire();
  collect(results);

  auto it = results->ready.find(token);
  if (it == results->ready.end())
    return std::nullopt;

  OffloadResult result = std::move(it->second);
  results->ready.erase(it);
  return result;
}

void
OffloadQueue::forget(OffloadToken token)
{
  auto results = m_results.acquire();
  collect(results);

  if (!results->ready.erase(token))
    results->abandoned.insert(token);
}

std::size_t
OffloadQueue::num_unclaimed()
{
  auto results = m_results.acquire();
  collect(results);
  return results->ready.size();
}
