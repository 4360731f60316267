/**
 * Zeroconf Service Advertisement Daemon
 * Copyright (C) 2024 The zeroconfd authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#include <errno.h>
#include <string.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <climits>
#include <cstdint>
#include <map>
#include <vector>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>
#include <zeroconfd/poller.hpp>

using namespace zeroconfd;

static constexpr std::chrono::milliseconds MAX_TIMER =
    std::chrono::hours(24 * 365 * 100);

struct timer_event_t {
  std::chrono::steady_clock::time_point when;
  int id;
  std::function<void(void)> callback;
};

namespace zeroconfd {
struct poller_private_data_t {
  int epollfd = -1;
  std::map<int, std::function<void(int, uint32_t)>> fd_events;
  std::vector<timer_event_t> timer_events;
  std::vector<std::function<void(void)>> later_events;
  int max_timer_id = 1;
};
} // namespace zeroconfd

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
poller_t zeroconfd::poller;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static bool poller_initialized = false;

poller_t::poller_t() : private_data(std::make_unique<poller_private_data_t>()) {
  if (poller_initialized) {
    throw exception("Poller already initialized. Can only use one poller "
                    "(zeroconfd::poller).");
  }
  poller_initialized = true;

  private_data->epollfd = epoll_create1(EPOLL_CLOEXEC);
  if (private_data->epollfd < 0) {
    throw system_exception("epoll_create1", errno);
  }
}

poller_t::~poller_t() {
  close();
  clear_timers();

  poller_initialized = false;
}

bool poller_t::is_open() const { return private_data->epollfd >= 0; }

void poller_t::close() {
  if (private_data->epollfd >= 0) {
    ::close(private_data->epollfd);
    private_data->epollfd = -1;
  }
}

static poller_t::listener_t add_fd(poller_private_data_t *private_data, int fd,
                                   uint32_t events,
                                   std::function<void(int, uint32_t)> f) {
  struct epoll_event ev {};
  memset(&ev, 0, sizeof(ev));

  ev.events = events;
  ev.data.fd = fd;
  auto r = epoll_ctl(private_data->epollfd, EPOLL_CTL_ADD, fd, &ev);
  if (r == -1) {
    throw exception("Can't add fd {} to poller: {} ({})", fd, strerror(errno),
                    errno);
  }
  private_data->fd_events[fd] = std::move(f);
  return poller_t::listener_t(fd);
}

static std::function<void(int, uint32_t)>
ignore_events(std::function<void(int)> f) {
  return [f = std::move(f)](int fd, uint32_t) { f(fd); };
}

poller_t::listener_t poller_t::add_fd_in(int fd, std::function<void(int)> f) {
  return add_fd(private_data.get(), fd, EPOLLIN, ignore_events(std::move(f)));
}

poller_t::listener_t poller_t::add_fd_out(int fd, std::function<void(int)> f) {
  return add_fd(private_data.get(), fd, EPOLLOUT, ignore_events(std::move(f)));
}

poller_t::listener_t poller_t::add_fd_inout(int fd,
                                            std::function<void(int)> f) {
  return add_fd(private_data.get(), fd, EPOLLIN | EPOLLOUT,
                ignore_events(std::move(f)));
}

poller_t::listener_t
poller_t::add_fd_events(int fd, uint32_t events,
                        std::function<void(int, uint32_t)> f) {
  return add_fd(private_data.get(), fd, events, std::move(f));
}

void poller_t::update_fd_events(int fd, uint32_t events) {
  struct epoll_event ev {};
  ev.events = events;
  ev.data.fd = fd;
  auto r = epoll_ctl(private_data->epollfd, EPOLL_CTL_MOD, fd, &ev);
  if (r == -1) {
    throw exception("Can't update fd {} at poller: {} ({})", fd,
                    strerror(errno), errno);
  }
}

poller_t::timer_t poller_t::add_timer_event(std::chrono::milliseconds ms,
                                            std::function<void(void)> f) {
  using namespace std::chrono_literals;

  // Can not call directly, the caller may not expect reentrancy
  if (ms.count() <= 0) {
    call_later(std::move(f));
    return poller_t::timer_t(0);
  }

  // steady_clock counts in ns, beyond ~292 years it overflows
  ms = std::min(ms, MAX_TIMER);

  // now() is finer than ms, the extra 1ms ensures we never wake up early
  auto timer_id = private_data->max_timer_id++;
  auto when = std::chrono::steady_clock::now() + ms + 1ms;

  private_data->timer_events.push_back(
      timer_event_t{when, timer_id, std::move(f)});
  std::sort(std::begin(private_data->timer_events),
            std::end(private_data->timer_events),
            [](const auto &a, const auto &b) { return a.when < b.when; });

  return poller_t::timer_t(timer_id);
}

void poller_t::call_later(std::function<void(void)> later_f) {
  private_data->later_events.push_back(std::move(later_f));
}

// Called from listener_t destructors, so it must never throw
void poller_t::__remove_fd(int fd) {
  private_data->fd_events.erase(fd);
  if (is_open()) {
    auto r = epoll_ctl(private_data->epollfd, EPOLL_CTL_DEL, fd, NULL);
    if (r == -1) {
      WARNING("Can't remove fd {} from poller: {} ({})", fd, strerror(errno),
              errno);
    }
  }
}

void poller_t::remove_timer(timer_t &tid) {
  // already invalidated
  if (tid.id == 0) {
    return;
  }
  private_data->timer_events.erase(
      std::remove_if(private_data->timer_events.begin(),
                     private_data->timer_events.end(),
                     [&tid](const auto &b) { return b.id == tid.id; }),
      private_data->timer_events.end());
  tid.id = 0;
}

void poller_t::clear_timers() { private_data->timer_events.clear(); }

static int64_t ms_to_now(const std::chrono::steady_clock::time_point &tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp - std::chrono::steady_clock::now())
      .count();
}

static void run_expired_timer_events(std::vector<timer_event_t> &events) {
  while (!events.empty() && ms_to_now(events[0].when) <= 0) {
    // The callback may add or remove timers, so it runs from a copy. The
    // timer_t removes the event when it goes out of scope.
    auto callback = events[0].callback;
    poller_t::timer_t id(events[0].id);
    callback();
  }
}

static void run_call_later_events(poller_private_data_t *private_data) {
  while (!private_data->later_events.empty()) {
    std::vector<std::function<void(void)>> call_now;
    std::swap(call_now, private_data->later_events);
    for (auto &f : call_now) {
      f();
    }
  }
}

void poller_t::wait(std::optional<std::chrono::milliseconds> max_wait_ms) {
  const auto MAX_EVENTS = 10;
  std::array<struct epoll_event, MAX_EVENTS> events{};
  int64_t wait_ms = 10'000'000; // not forever, but a lot (10'000s)

  if (max_wait_ms.has_value()) {
    wait_ms = max_wait_ms->count();
  }

  if (!private_data->timer_events.empty()) {
    wait_ms = std::min(wait_ms, ms_to_now(private_data->timer_events[0].when));
  }
  // Long timers just take several rounds
  wait_ms = std::clamp(wait_ms, int64_t(0), int64_t(INT_MAX));
  run_call_later_events(private_data.get());
  if (!is_open()) {
    return;
  }

  auto nfds = 0;
  if (wait_ms != 0) {
    nfds =
        epoll_wait(private_data->epollfd, events.data(), MAX_EVENTS,
                   int(wait_ms));

    if (nfds == -1) {
      // A signal interrupts the wait, the caller checks why
      if (errno != EINTR && is_open()) {
        ERROR("epoll_wait failed: {}", strerror(errno));
      }
      nfds = 0;
    }
  }
  assert(nfds <= MAX_EVENTS);

  for (auto n = 0; n < nfds; n++) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
    auto fd = events[n].data.fd;
    auto event_f = private_data->fd_events.find(fd);
    // removed by a previous callback of this same round
    if (event_f == private_data->fd_events.end()) {
      continue;
    }
    auto f = event_f->second;
    try {
      f(fd, events[n].events);
    } catch (const std::exception &e) {
      ERROR_ONCE("Caught exception at poller: {}", e.what());
    }
  }

  run_call_later_events(private_data.get());
  run_expired_timer_events(private_data->timer_events);
  run_call_later_events(private_data.get());
}

poller_t::timer_t::timer_t() : id(0) {}
poller_t::timer_t::timer_t(int id_) : id(id_) {}
poller_t::timer_t::timer_t(poller_t::timer_t &&other) noexcept : id(other.id) {
  other.id = 0;
}
poller_t::timer_t::~timer_t() {
  if (id != 0) {
    poller.remove_timer(*this);
  }
}
poller_t::timer_t &
poller_t::timer_t::operator=(poller_t::timer_t &&other) noexcept {
  if (id != 0) {
    poller.remove_timer(*this);
  }
  id = other.id;
  other.id = 0;

  return *this;
}

void poller_t::timer_t::disable() {
  if (id == 0) {
    return;
  }
  poller.remove_timer(*this);
}
