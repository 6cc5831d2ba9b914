#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "io.hh"
#include "offload.hh"
#include "reactor.hh"
#include "task.hh"
#include "tools/event.hh"

namespace wren {

/* a read-only file whose blocking calls run on the offload queue.
 * completion comes back through a UserEvent registered with the
 * reactor, so awaiting a read parks the task like any socket would. */
class File
{
public:
  class Open;

  class Read final : public Pollable<IOResult<std::size_t>>
  {
    friend class File;

  protected:
    Poll<IOResult<std::size_t>> poll_once(Waker const& waker) override
    {
      return m_file->poll_read(waker, m_buf);
    }

  private:
    Read(File& file, std::span<std::byte> buf)
      : m_file(&file)
      , m_buf(buf) {};

    File* m_file;
    std::span<std::byte> m_buf;
  };

  File(File&&) = default;

  /* opens `path` read-only on the worker */
  static Open open(Reactor& reactor, std::string path);
  static Open open(Reactor& reactor, std::string path, OffloadQueue& queue);

  /* a single read of up to buf.size() bytes, 0 at end of file */
  Read read(std::span<std::byte> buf) { return Read(*this, buf); }

  /* only one read may be in flight per file */
  Poll<IOResult<std::size_t>> poll_read(Waker const& waker,
                                        std::span<std::byte> buf);

  IOResult<std::size_t> size() const;
  int fd() const { return m_file->get(); }

private:
  File(OffloadQueue& queue,
       std::shared_ptr<UserEvent const> event,
       Registration registration,
       std::shared_ptr<FileDesc const> file)
    : m_queue(&queue)
    , m_event(std::move(event))
    , m_registration(std::move(registration))
    , m_file(std::move(file)) {};

  OffloadQueue* m_queue;
  std::shared_ptr<UserEvent const> m_event;
  Registration m_registration;

  /* shared with the worker while a read is in flight */
  std::shared_ptr<FileDesc const> m_file;
  std::optional<Future<ReadResult>> m_pendingRead;
};

class File::Open final : public Pollable<IOResult<File>>
{
  friend class File;

protected:
  Poll<IOResult<File>> poll_once(Waker const& waker) override;

private:
  Open(Reactor& reactor, OffloadQueue& queue, std::string path)
    : m_reactor(&reactor)
    , m_queue(&queue)
    , m_path(std::move(path)) {};

  Reactor* m_reactor;
  OffloadQueue* m_queue;
  std::string m_path;

  std::shared_ptr<UserEvent const> m_event;
  std::optional<Registration> m_registration;
  std::optional<Future<OpenResult>> m_pending;
};

};
