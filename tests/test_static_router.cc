#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <sys/stat.h>

#include "http/static_router.hh"
#include "offload.hh"
#include "runtime.hh"
#include "test_util.hh"

using namespace wren;
using namespace wren::http;

namespace {

class StaticRouterTest : public ::testing::Test
{
protected:
  StaticRouterTest()
    : router(rt.get_reactor(), dir.path(), queue)
  {
    dir.write("hello.txt", "hello, world\n");
    std::filesystem::create_directory(dir.path() / "sub");
    dir.write("sub/inner.html", "<p>inner</p>");
    dir.write("sub/a&b.txt", "amp");
  }

  std::optional<Response> get(std::string uri)
  {
    std::optional<Response> out;

    rt.run([&](Runtime&) -> Coro<> {
      out.emplace(co_await router.route(Request("GET", uri, "HTTP/1.1")));
      co_return {};
    });

    return out;
  }

  static std::string body(Response const& res)
  {
    return std::string((char const*)res.body().data(), res.body_len());
  }

  test::TempDir dir;
  OffloadQueue queue;
  Runtime rt;
  StaticRouter router;
};

};

TEST_F(StaticRouterTest, ServesAFile)
{
  auto const res = get("/hello.txt");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status_code().code(), 200u);
  EXPECT_EQ(body(*res), "hello, world\n");
  EXPECT_EQ(queue.num_unclaimed(), 0u);
}

TEST_F(StaticRouterTest, IgnoresTheQueryString)
{
  auto const res = get("/sub/inner.html?x=1#top");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status_code().code(), 200u);
  EXPECT_EQ(body(*res), "<p>inner</p>");
}

TEST_F(StaticRouterTest, MissingPathIsNotFound)
{
  auto const res = get("/nope.txt");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status_code().code(), 404u);
  EXPECT_EQ(res->body_len(), 0u);
}

TEST_F(StaticRouterTest, ParentSegmentsAreRejected)
{
  for (auto const* uri : { "/../etc/passwd", "/sub/../hello.txt", "/.." }) {
    auto const res = get(uri);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status_code().code(), 400u) << uri;
  }

  /* dots inside a name are fine */
  auto const res = get("/hello.txt..");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status_code().code(), 404u);
}

TEST_F(StaticRouterTest, FifoIsRefusedWithoutBlockingOtherFiles)
{
  ASSERT_EQ(::mkfifo((dir.path() / "pipe").c_str(), 0600), 0);

  std::optional<Response> fifo;
  std::optional<Response> file;

  auto fetch = [](StaticRouter const& router,
                  std::string uri,
                  std::optional<Response>& out) -> Coro<> {
    out.emplace(co_await router.route(Request("GET", uri, "HTTP/1.1")));
    co_return {};
  };

  rt.spawn(fetch(router, "/pipe", fifo));
  rt.spawn(fetch(router, "/hello.txt", file));

  ASSERT_TRUE(test::run_until(
    rt, [&] { return fifo && file; }, std::chrono::seconds(2)));

  EXPECT_EQ(fifo->status_code().code(), 404u);
  EXPECT_EQ(file->status_code().code(), 200u);
  EXPECT_EQ(body(*file), "hello, world\n");
}

TEST_F(StaticRouterTest, DirectoryGetsAListing)
{
  auto const res = get("/sub");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status_code().code(), 200u);
  EXPECT_EQ(res->header("content-type"), "text/html; charset=utf-8");

  auto const page = body(*res);
  EXPECT_NE(page.find("<title>/sub</title>"), std::string::npos);
  EXPECT_NE(page.find("<a href=\"/sub/inner.html\">inner.html</a>"),
            std::string::npos);
  EXPECT_NE(page.find("<a href=\"/sub/a&amp;b.txt\">a&amp;b.txt</a>"),
            std::string::npos);

  /* entries are sorted */
  EXPECT_LT(page.find("a&amp;b.txt"), page.find("inner.html"));
}

TEST_F(StaticRouterTest, RootListsTheTopLevel)
{
  auto const res = get("/");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status_code().code(), 200u);

  auto const page = body(*res);
  EXPECT_NE(page.find("href=\"/hello.txt\""), std::string::npos);
  EXPECT_NE(page.find("href=\"/sub\""), std::string::npos);
}

TEST_F(StaticRouterTest, AppForwardsToRoute)
{
  auto const app = router.app();
  std::optional<Response> out;

  rt.run([&](Runtime&) -> Coro<> {
    out.emplace(co_await app(Request("GET", "/hello.txt", "HTTP/1.1")));
    co_return {};
  });

  ASSERT_TRUE(out);
  EXPECT_EQ(body(*out), "hello, world\n");
}
