#pragma once

#include <cerrno>
#include <concepts>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <utility>

#include "coro.hh"

namespace wren {

/* raw errno value of the failing syscall */
using Errno = int;

template<typename T>
using IOResult = std::expected<T, Errno>;

/* wraps the current errno as an error result.
 * grab it immediately after the failing syscall. */
inline std::unexpected<Errno>
last_error()
{
  return std::unexpected(Errno(errno));
}

/* strerror, but as a string */
std::string
describe(Errno);

/* owns a posix file descriptor, closes it on destruction */
class FileDesc
{
public:
  FileDesc() = default;
  explicit FileDesc(int fd)
    : m_fd(fd) {};

  FileDesc(const FileDesc&) = delete;
  FileDesc& operator=(const FileDesc&) = delete;

  FileDesc(FileDesc&& rhs) noexcept
    : m_fd(std::exchange(rhs.m_fd, -1)) {};

  FileDesc& operator=(FileDesc&& rhs) noexcept
  {
    if (this != &rhs) {
      reset();
      m_fd = std::exchange(rhs.m_fd, -1);
    }
    return *this;
  }

  ~FileDesc() { reset(); }

  int get() const { return m_fd; }
  explicit operator bool() const { return m_fd >= 0; }

  /* gives up ownership without closing */
  int release() { return std::exchange(m_fd, -1); }
  void reset();

private:
  int m_fd = -1;
};

template<typename T>
concept AsyncWriter = requires(T t, std::span<std::byte const> buf) {
  { t.write(buf).await_resume() } -> std::same_as<IOResult<std::size_t>>;
};

template<typename T>
concept AsyncReader = requires(T t, std::span<std::byte> buf) {
  { t.read(buf).await_resume() } -> std::same_as<IOResult<std::size_t>>;
};

/* keeps writing until the whole buffer went out.
 * a zero length write ends early, the return value is then short. */
Coro<IOResult<std::size_t>>
write_all(AsyncWriter auto& writer, std::span<std::byte const> buf)
{
  std::size_t idx = 0;

  while (idx != buf.size_bytes()) {
    auto const res = co_await writer.write(buf.subspan(idx));
    if (!res)
      co_return std::unexpected(res.error());
    if (*res == 0)
      break;
    idx += *res;
  }

  co_return idx;
}

/* keeps reading until the buffer is full or the reader hits eof.
 * returns how much actually landed in the buffer. */
Coro<IOResult<std::size_t>>
read_all(AsyncReader auto& reader, std::span<std::byte> buf)
{
  std::size_t idx = 0;

  while (idx != buf.size_bytes()) {
    auto const res = co_await reader.read(buf.subspan(idx));
    if (!res)
      co_return std::unexpected(res.error());
    if (*res == 0)
      break;
    idx += *res;
  }

  co_return idx;
}

};
