#include "portico/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <span>

#include "portico/errno-throw.hpp"
#include "portico/event.hpp"
#include "portico/log.hpp"

namespace portico {

static_assert(EventIn == EPOLLIN);
static_assert(EventOut == EPOLLOUT);
static_assert(EventErr == EPOLLERR);
static_assert(EventHup == EPOLLHUP);
static_assert(EventRdHup == EPOLLRDHUP);
static_assert(EventExclusive == EPOLLEXCLUSIVE);
static_assert(EventEt == EPOLLET);

EventLoop::EventLoop(Duration pollTimeout, uint32_t initialCapacity)
    : _epollEvents(std::max(1U, initialCapacity)),
      _pollTimeoutMs(static_cast<int>(pollTimeout.count())),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::~EventLoop() = default;

void EventLoop::addOrThrow(int fd, EventBmp eventBmp) const {
  epoll_event ev{};
  ev.events = eventBmp;
  ev.data.fd = fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", fd, eventBmp);
  }
}

bool EventLoop::add(int fd, EventBmp eventBmp) const {
  epoll_event ev{};
  ev.events = eventBmp;
  ev.data.fd = fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}): {}", fd, eventBmp, std::strerror(err));
    return false;
  }
  return true;
}

bool EventLoop::mod(int fd, EventBmp eventBmp) const {
  epoll_event ev{};
  ev.events = eventBmp;
  ev.data.fd = fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, fd, &ev) != 0) {
    const auto err = errno;
    log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}): {}", fd, eventBmp, std::strerror(err));
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    // Benign when the fd was already closed.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}): {}", fd, std::strerror(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll() {
  _readyEvents.clear();
  const int nbReady =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReady == -1) {
    if (errno == EINTR) {
      return _readyEvents;
    }
    throw_errno("epoll_wait failed (fd # {})", _baseFd.fd());
  }

  for (int idx = 0; idx < nbReady; ++idx) {
    _readyEvents.push_back(Event{_epollEvents[static_cast<std::size_t>(idx)].data.fd,
                                 _epollEvents[static_cast<std::size_t>(idx)].events});
  }

  if (static_cast<std::size_t>(nbReady) == _epollEvents.size()) {
    _epollEvents.resize(_epollEvents.size() * 2U);
    log::debug("EventLoop fd # {} saturated, capacity grown to {}", _baseFd.fd(), _epollEvents.size());
  }
  return _readyEvents;
}

}  // namespace portico
