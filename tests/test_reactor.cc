#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "io.hh"
#include "reactor.hh"
#include "task.hh"
#include "tools/event.hh"

using namespace wren;
using namespace std::chrono_literals;

namespace {

class CountingWaker final : public Wakeable
{
public:
  void wake() const override { hits++; }
  mutable std::atomic<int> hits{ 0 };
};

struct Pipe
{
  Pipe()
  {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0) {
      read_end = FileDesc(fds[0]);
      write_end = FileDesc(fds[1]);
    }
  }

  void poke() const
  {
    char const c = 'x';
    ASSERT_EQ(::write(write_end.get(), &c, 1), 1);
  }

  FileDesc read_end;
  FileDesc write_end;
};

};

TEST(Reactor, RegistrationHoldsOneNode)
{
  Reactor reactor;
  Pipe pipe;
  ASSERT_TRUE(pipe.read_end);

  EXPECT_EQ(reactor.num_registrations(), 0u);

  {
    auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
    ASSERT_TRUE(reg) << describe(reg.error());
    EXPECT_EQ(reactor.num_registrations(), 1u);
    EXPECT_EQ(reg->readiness(), Ready::None);
  }

  EXPECT_EQ(reactor.num_registrations(), 0u);
}

TEST(Reactor, FreedTokensAreReused)
{
  Reactor reactor;
  Pipe a, b;

  auto first = reactor.register_source(a.read_end.get(), Ready::Readable);
  auto second = reactor.register_source(b.read_end.get(), Ready::Readable);
  ASSERT_TRUE(first && second);
  EXPECT_NE(first->token(), second->token());

  Token const freed = first->token();
  ASSERT_TRUE(first->deregister());

  auto third = reactor.register_source(a.read_end.get(), Ready::Readable);
  ASSERT_TRUE(third);
  EXPECT_EQ(third->token(), freed);
  EXPECT_EQ(reactor.num_registrations(), 2u);
}

TEST(Reactor, RegisteringABadFdFails)
{
  Reactor reactor;

  auto reg = reactor.register_source(-1, Ready::Readable);
  ASSERT_FALSE(reg);
  EXPECT_EQ(reg.error(), EBADF);
  EXPECT_EQ(reactor.num_registrations(), 0u);
}

TEST(Reactor, TurnWakesTheReadWaker)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);

  auto reader = std::make_shared<CountingWaker>();
  auto writer = std::make_shared<CountingWaker>();
  reg->set_read_waker(Waker(reader));
  reg->set_write_waker(Waker(writer));

  EXPECT_EQ(reactor.turn(0ms), 0u);

  pipe.poke();
  EXPECT_EQ(reactor.turn(1000ms), 1u);

  EXPECT_TRUE(has(reg->readiness(), Ready::Readable));
  EXPECT_FALSE(has(reg->readiness(), Ready::Writable));
  EXPECT_EQ(reader->hits.load(), 1);
  EXPECT_EQ(writer->hits.load(), 0);
}

TEST(Reactor, RemovedReadinessStaysHiddenUntilTheNextEdge)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);

  pipe.poke();
  reactor.turn(1000ms);
  ASSERT_TRUE(has(reg->readiness(), Ready::Readable));

  reg->remove_readiness(Ready::Readable);
  EXPECT_EQ(reg->readiness(), Ready::None);

  /* edge triggered, the unread byte doesn't show up again */
  EXPECT_EQ(reactor.turn(0ms), 0u);
  EXPECT_EQ(reg->readiness(), Ready::None);

  pipe.poke();
  EXPECT_EQ(reactor.turn(1000ms), 1u);
  EXPECT_TRUE(has(reg->readiness(), Ready::Readable));
}

TEST(Reactor, ResetWakerIsNoop)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);

  auto reader = std::make_shared<CountingWaker>();
  reg->set_read_waker(Waker(reader));
  reg->reset_read_waker();

  pipe.poke();
  reactor.turn(1000ms);
  EXPECT_EQ(reader->hits.load(), 0);
}

TEST(Reactor, DeregisterIsIdempotent)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);

  EXPECT_TRUE(reg->deregister());
  EXPECT_EQ(reactor.num_registrations(), 0u);
  EXPECT_TRUE(reg->deregister());
  EXPECT_EQ(reactor.num_registrations(), 0u);
}

TEST(Reactor, DeregisteredHandleIgnoresAccessors)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);
  ASSERT_TRUE(reg->deregister());

  auto reader = std::make_shared<CountingWaker>();
  reg->set_read_waker(Waker(reader));
  reg->set_write_waker(Waker(reader));
  reg->remove_readiness(Ready::Readable);
  reg->reset_read_waker();
  reg->reset_write_waker();

  EXPECT_EQ(reg->readiness(), Ready::None);
  EXPECT_EQ(reactor.num_registrations(), 0u);

  /* a moved-from handle behaves the same */
  auto other = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(other);
  Registration moved = std::move(*other);
  EXPECT_EQ(other->readiness(), Ready::None);
  other->set_read_waker(Waker(reader));
  EXPECT_EQ(reactor.num_registrations(), 1u);
}

TEST(Reactor, TimeoutsOutsideTheIntRangeAreClamped)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);

  /* negative means "don't wait", not "wait forever" */
  EXPECT_EQ(reactor.turn(-5ms), 0u);

  pipe.poke();
  auto const huge =
    std::chrono::milliseconds(std::chrono::milliseconds::rep(
                                std::numeric_limits<int>::max()) *
                              4);
  EXPECT_EQ(reactor.turn(huge), 1u);
}

TEST(Reactor, DeregisteredSourceIsNotDispatched)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);
  auto reader = std::make_shared<CountingWaker>();
  reg->set_read_waker(Waker(reader));

  ASSERT_TRUE(reg->deregister());

  pipe.poke();
  EXPECT_EQ(reactor.turn(0ms), 0u);
  EXPECT_EQ(reader->hits.load(), 0);
}

TEST(Reactor, HangupCountsAsBothDirections)
{
  Reactor reactor;
  Pipe pipe;

  auto reg = reactor.register_source(pipe.read_end.get(), Ready::Readable);
  ASSERT_TRUE(reg);

  pipe.write_end.reset();
  EXPECT_EQ(reactor.turn(1000ms), 1u);
  EXPECT_TRUE(has(reg->readiness(), Ready::Readable | Ready::Writable));
}

TEST(UserEvent, SignalsThroughTheReactor)
{
  Reactor reactor;

  auto event = UserEvent::create();
  ASSERT_TRUE(event);

  auto reg = reactor.register_source((*event)->fd(), Ready::Readable);
  ASSERT_TRUE(reg);

  auto reader = std::make_shared<CountingWaker>();
  reg->set_read_waker(Waker(reader));

  EXPECT_EQ(reactor.turn(0ms), 0u);

  (*event)->set_readable();
  EXPECT_EQ(reactor.turn(1000ms), 1u);
  EXPECT_EQ(reader->hits.load(), 1);

  (*event)->clear();
  reg->remove_readiness(Ready::Readable);

  (*event)->set_readable();
  EXPECT_EQ(reactor.turn(1000ms), 1u);
  EXPECT_EQ(reader->hits.load(), 2);
}
