#include <array>
#include <cerrno>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "offload.hh"
#include "runtime.hh"
#include "test_util.hh"
#include "tools/file.hh"

using namespace wren;

TEST(File, OpenMissingFileIsNotFound)
{
  Runtime rt;
  OffloadQueue queue;
  test::TempDir dir;

  std::optional<Errno> error;

  rt.run([&](Runtime& rt) -> Coro<> {
    auto file = co_await File::open(
      rt.get_reactor(), (dir.path() / "missing").string(), queue);
    if (!file)
      error = file.error();
    co_return {};
  });

  ASSERT_TRUE(error);
  EXPECT_EQ(*error, ENOENT);
  EXPECT_EQ(rt.get_reactor().num_registrations(), 0u);
}

TEST(File, ReadsTheWholeFile)
{
  Runtime rt;
  OffloadQueue queue;
  test::TempDir dir;

  std::string contents;
  for (int i = 0; i < 1000; i++)
    contents += "line " + std::to_string(i) + "\n";
  auto const path = dir.write("big.txt", contents);

  std::string read_back;
  std::optional<std::size_t> size;

  rt.run([&](Runtime& rt) -> Coro<> {
    auto file = co_await File::open(rt.get_reactor(), path.string(), queue);
    if (!file)
      co_return {};

    if (auto const s = file->size())
      size = *s;

    /* chunked on purpose so every chunk is its own offloaded read */
    std::array<std::byte, 1000> chunk{};
    for (;;) {
      auto const len = co_await file->read(chunk);
      if (!len || *len == 0)
        break;
      read_back.append((char const*)chunk.data(), *len);
    }

    co_return {};
  });

  ASSERT_TRUE(size);
  EXPECT_EQ(*size, contents.size());
  EXPECT_EQ(read_back, contents);
  EXPECT_EQ(queue.num_unclaimed(), 0u);
}

TEST(File, ReadAllIntoAnOversizedBuffer)
{
  Runtime rt;
  OffloadQueue queue;
  test::TempDir dir;
  auto const path = dir.write("short.txt", "short");

  std::optional<IOResult<std::size_t>> result;
  std::vector<std::byte> buf(64);

  rt.run([&](Runtime& rt) -> Coro<> {
    auto file = co_await File::open(rt.get_reactor(), path.string(), queue);
    if (!file)
      co_return {};

    result.emplace(co_await read_all(*file, buf));
    co_return {};
  });

  ASSERT_TRUE(result);
  ASSERT_TRUE(*result);
  EXPECT_EQ(**result, 5u);
  EXPECT_EQ(std::string((char const*)buf.data(), 5), "short");
}

TEST(File, UsesTheGlobalQueueByDefault)
{
  Runtime rt;
  test::TempDir dir;
  auto const path = dir.write("hello", "hi");

  std::string got;

  rt.run([&](Runtime& rt) -> Coro<> {
    auto file = co_await File::open(rt.get_reactor(), path.string());
    if (!file)
      co_return {};

    std::array<std::byte, 8> buf{};
    auto const len = co_await file->read(buf);
    if (len)
      got.assign((char const*)buf.data(), *len);
    co_return {};
  });

  EXPECT_EQ(got, "hi");
}
