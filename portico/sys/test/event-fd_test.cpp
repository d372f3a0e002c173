#include "portico/event-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

using namespace portico;

namespace {

bool IsReadable(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

TEST(EventFd, SendMakesReadableAndReadResets) {
  EventFd eventFd;
  ASSERT_GE(eventFd.fd(), 0);
  EXPECT_FALSE(IsReadable(eventFd.fd()));
  eventFd.send();
  eventFd.send();
  EXPECT_TRUE(IsReadable(eventFd.fd()));
  eventFd.read();
  EXPECT_FALSE(IsReadable(eventFd.fd()));
}

TEST(EventFd, ReadWithoutSendIsHarmless) {
  EventFd eventFd;
  eventFd.read();
  EXPECT_FALSE(IsReadable(eventFd.fd()));
}
