#include "portico/event-loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <system_error>
#include <thread>

#include "portico/event-fd.hpp"
#include "portico/event.hpp"

using namespace portico;
using namespace std::chrono_literals;

TEST(EventLoop, PollTimesOutWithoutEvents) {
  EventLoop loop(10ms);
  const auto start = std::chrono::steady_clock::now();
  auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 5ms);
}

TEST(EventLoop, ReportsReadableEventFd) {
  EventLoop loop(100ms);
  EventFd eventFd;
  loop.addOrThrow(eventFd.fd(), EventIn);

  eventFd.send();
  auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, eventFd.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);

  eventFd.read();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, WakesUpFromAnotherThread) {
  EventLoop loop(5000ms);
  EventFd eventFd;
  loop.addOrThrow(eventFd.fd(), EventIn);

  std::jthread sender([&eventFd] {
    std::this_thread::sleep_for(20ms);
    eventFd.send();
  });
  const auto start = std::chrono::steady_clock::now();
  auto events = loop.poll();
  EXPECT_EQ(events.size(), 1U);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 4000ms);
}

TEST(EventLoop, DelStopsReporting) {
  EventLoop loop(10ms);
  EventFd eventFd;
  loop.addOrThrow(eventFd.fd(), EventIn);
  loop.del(eventFd.fd());
  eventFd.send();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, AddTwiceFails) {
  EventLoop loop(10ms);
  EventFd eventFd;
  EXPECT_TRUE(loop.add(eventFd.fd(), EventIn));
  EXPECT_FALSE(loop.add(eventFd.fd(), EventIn));
  EXPECT_THROW(loop.addOrThrow(eventFd.fd(), EventIn), std::system_error);
}

TEST(EventLoop, ModUnknownFdFails) {
  EventLoop loop(10ms);
  EventFd eventFd;
  EXPECT_FALSE(loop.mod(eventFd.fd(), EventIn | EventOut));
}

TEST(EventLoop, CapacityGrowsWhenSaturated) {
  EventLoop loop(10ms, 1);
  EventFd first;
  EventFd second;
  loop.addOrThrow(first.fd(), EventIn);
  loop.addOrThrow(second.fd(), EventIn);
  first.send();
  second.send();
  EXPECT_EQ(loop.capacity(), 1U);
  auto events = loop.poll();
  EXPECT_EQ(events.size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
  events = loop.poll();
  EXPECT_EQ(events.size(), 2U);
}
