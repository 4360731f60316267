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

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <vector>
#include <zeroconfd/avahi_responder.hpp>
#include <zeroconfd/exceptions.hpp>
#include <zeroconfd/logger.hpp>
#include <zeroconfd/poller.hpp>

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-common/error.h>
#include <avahi-common/strlst.h>
#include <avahi-common/timeval.h>
#include <avahi-common/watch.h>
#include <sys/epoll.h>

struct AvahiTimeout {
  void *userdata = nullptr;
  AvahiTimeoutCallback callback = nullptr;
  zeroconfd::poller_t::timer_t timer;
};

struct AvahiWatch {
  int fd = -1;
  void *userdata = nullptr;
  AvahiWatchCallback callback = nullptr;
  AvahiWatchEvent event = (AvahiWatchEvent)0;
  // Events that happened, valid during the callback
  AvahiWatchEvent revents = (AvahiWatchEvent)0;
  zeroconfd::avahi_watches_t *owner = nullptr;
};

namespace zeroconfd {
// dbus may watch the same fd twice, once for read and once for write. epoll
// only takes each fd once, so all the watches of a fd share one listener.
struct avahi_fd_watches_t {
  uint32_t mask = 0;
  poller_t::listener_t listener;
  std::vector<AvahiWatch *> watches;
};

struct avahi_watches_t {
  std::map<int, avahi_fd_watches_t> fds;
};
} // namespace zeroconfd

ENUM_FORMATTER_BEGIN(AvahiClientState);
ENUM_FORMATTER_ELEMENT(AVAHI_CLIENT_S_REGISTERING, "S_REGISTERING");
ENUM_FORMATTER_ELEMENT(AVAHI_CLIENT_S_RUNNING, "S_RUNNING");
ENUM_FORMATTER_ELEMENT(AVAHI_CLIENT_S_COLLISION, "S_COLLISION");
ENUM_FORMATTER_ELEMENT(AVAHI_CLIENT_FAILURE, "FAILURE");
ENUM_FORMATTER_ELEMENT(AVAHI_CLIENT_CONNECTING, "CONNECTING");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(AvahiEntryGroupState);
ENUM_FORMATTER_ELEMENT(AVAHI_ENTRY_GROUP_UNCOMMITED, "UNCOMMITED");
ENUM_FORMATTER_ELEMENT(AVAHI_ENTRY_GROUP_REGISTERING, "REGISTERING");
ENUM_FORMATTER_ELEMENT(AVAHI_ENTRY_GROUP_ESTABLISHED, "ESTABLISHED");
ENUM_FORMATTER_ELEMENT(AVAHI_ENTRY_GROUP_COLLISION, "COLLISION");
ENUM_FORMATTER_ELEMENT(AVAHI_ENTRY_GROUP_FAILURE, "FAILURE");
ENUM_FORMATTER_END();

static uint32_t to_epoll(AvahiWatchEvent event) {
  uint32_t ret = 0;
  if (event & AVAHI_WATCH_IN)
    ret |= EPOLLIN;
  if (event & AVAHI_WATCH_OUT)
    ret |= EPOLLOUT;
  return ret;
}

static AvahiWatchEvent from_epoll(uint32_t events) {
  int ret = 0;
  if (events & EPOLLIN)
    ret |= AVAHI_WATCH_IN;
  if (events & EPOLLOUT)
    ret |= AVAHI_WATCH_OUT;
  if (events & EPOLLERR)
    ret |= AVAHI_WATCH_ERR;
  if (events & EPOLLHUP)
    ret |= AVAHI_WATCH_HUP;
  return (AvahiWatchEvent)ret;
}

static bool has_watch(zeroconfd::avahi_watches_t *owner, int fd,
                      AvahiWatch *wd) {
  auto it = owner->fds.find(fd);
  if (it == owner->fds.end()) {
    return false;
  }
  auto &watches = it->second.watches;
  return std::find(watches.begin(), watches.end(), wd) != watches.end();
}

static void watch_dispatch(zeroconfd::avahi_watches_t *owner, int fd,
                           uint32_t events) {
  auto it = owner->fds.find(fd);
  if (it == owner->fds.end()) {
    return;
  }
  auto happened = from_epoll(events);
  // callbacks may add or free watches
  auto watches = it->second.watches;
  for (auto *wd : watches) {
    if (!has_watch(owner, fd, wd)) {
      continue;
    }
    // errors and hangups are always reported
    auto revents = (AvahiWatchEvent)(happened & (wd->event | AVAHI_WATCH_ERR |
                                                 AVAHI_WATCH_HUP));
    if (revents == 0) {
      continue;
    }
    wd->revents = revents;
    wd->callback(wd, fd, revents, wd->userdata);
    if (has_watch(owner, fd, wd)) {
      wd->revents = (AvahiWatchEvent)0;
    }
  }
}

// Sets the epoll registration of the fd to what its watches want
static void watch_sync(zeroconfd::avahi_watches_t *owner, int fd) {
  auto it = owner->fds.find(fd);
  if (it == owner->fds.end()) {
    return;
  }
  auto &fd_watches = it->second;
  if (fd_watches.watches.empty()) {
    owner->fds.erase(it);
    return;
  }

  uint32_t mask = 0;
  for (auto *wd : fd_watches.watches) {
    mask |= to_epoll(wd->event);
  }
  if (fd_watches.listener.fd < 0) {
    fd_watches.listener = zeroconfd::poller.add_fd_events(
        fd, mask,
        [owner](int fd, uint32_t events) { watch_dispatch(owner, fd, events); });
  } else if (mask != fd_watches.mask) {
    zeroconfd::poller.update_fd_events(fd, mask);
  }
  fd_watches.mask = mask;
}

static void watch_remove(AvahiWatch *wd) {
  auto it = wd->owner->fds.find(wd->fd);
  if (it == wd->owner->fds.end()) {
    return;
  }
  auto &watches = it->second.watches;
  watches.erase(std::remove(watches.begin(), watches.end(), wd),
                watches.end());
}

/// Create a new watch for the specified file descriptor and for the specified
/// events.
static AvahiWatch *poller_adapter_watch_new(const AvahiPoll *api, int fd,
                                            AvahiWatchEvent event,
                                            AvahiWatchCallback callback,
                                            void *userdata) {
  // NOLINTNEXTLINE
  auto *responder = (zeroconfd::avahi_responder_t *)api->userdata;
  auto wd = std::make_unique<AvahiWatch>();
  wd->fd = fd;
  wd->userdata = userdata;
  wd->callback = callback;
  wd->event = event;
  wd->owner = responder->watches.get();
  wd->owner->fds[fd].watches.push_back(wd.get());
  // We are called from C, no exceptions past this point
  try {
    watch_sync(wd->owner, fd);
  } catch (const std::exception &e) {
    ERROR("Could not watch avahi fd={}: {}", fd, e.what());
    watch_remove(wd.get());
    try {
      watch_sync(wd->owner, fd);
    } catch (const std::exception &sync_error) {
      ERROR("Could not restore avahi watch fd={}: {}", fd,
            sync_error.what());
    }
    return nullptr;
  }
  return wd.release();
}

/// Update the events to wait for.
static void poller_adapter_watch_update(AvahiWatch *wd, AvahiWatchEvent event) {
  wd->event = event;
  try {
    watch_sync(wd->owner, wd->fd);
  } catch (const std::exception &e) {
    ERROR("Could not update avahi watch fd={}: {}", wd->fd, e.what());
  }
}

/// Return the events that happened.
static AvahiWatchEvent poller_adapter_watch_get_events(AvahiWatch *wd) {
  return wd->revents;
}

static void poller_adapter_watch_free(AvahiWatch *wd) {
  watch_remove(wd);
  try {
    watch_sync(wd->owner, wd->fd);
  } catch (const std::exception &e) {
    ERROR("Could not update avahi watch fd={}: {}", wd->fd, e.what());
  }
  // NOLINTNEXTLINE
  delete wd;
}

// avahi gives absolute wall clock times, the poller wants relative ones.
// Never 0ms: those go to call_later, which can not be cancelled.
static std::chrono::milliseconds timeval_to_wait(const struct timeval *tv) {
  // avahi_age is positive for times already past
  auto usec = -avahi_age(tv);
  return std::max(std::chrono::milliseconds(usec / 1000),
                  std::chrono::milliseconds(1));
}

static void timeout_schedule(AvahiTimeout *to, const struct timeval *tv) {
  to->timer.disable();
  if (tv) {
    to->timer = zeroconfd::poller.add_timer_event(
        timeval_to_wait(tv), [to] { to->callback(to, to->userdata); });
  }
}

/// Set a wakeup time for the polling loop.
static AvahiTimeout *poller_adapter_timeout_new(const AvahiPoll *api,
                                                const struct timeval *tv,
                                                AvahiTimeoutCallback callback,
                                                void *userdata) {
  auto to = std::make_unique<AvahiTimeout>();
  to->userdata = userdata;
  to->callback = callback;
  timeout_schedule(to.get(), tv);
  return to.release();
}

/// Update the absolute expiration time for a timeout. If tv is NULL, the
/// timeout is disabled.
static void poller_adapter_timeout_update(AvahiTimeout *to,
                                          const struct timeval *tv) {
  timeout_schedule(to, tv);
}

static void poller_adapter_timeout_free(AvahiTimeout *to) {
  // NOLINTNEXTLINE
  delete to;
}

static void client_callback(AvahiClient *c, AvahiClientState state,
                            void *userdata) {
  // NOLINTNEXTLINE
  auto *responder = (zeroconfd::avahi_responder_t *)userdata;
  // First calls happen inside avahi_client_new, before it returns
  if (responder->client == nullptr) {
    responder->client = c;
  }
  responder->client_callback((zeroconfd::avahi_client_state_e)state);
}

static void entry_group_callback(AvahiEntryGroup *g, AvahiEntryGroupState state,
                                 void *userdata) {
  // NOLINTNEXTLINE
  auto *responder = (zeroconfd::avahi_responder_t *)userdata;
  responder->entry_group_callback(g, (zeroconfd::entry_group_state_e)state);
}

namespace zeroconfd {

avahi_responder_t::avahi_responder_t()
    : watches(std::make_unique<avahi_watches_t>()) {
  poller_adapter = std::make_unique<AvahiPoll>();
  poller_adapter->userdata = this;
  poller_adapter->watch_new = poller_adapter_watch_new;
  poller_adapter->watch_update = poller_adapter_watch_update;
  poller_adapter->watch_get_events = poller_adapter_watch_get_events;
  poller_adapter->watch_free = poller_adapter_watch_free;
  poller_adapter->timeout_new = poller_adapter_timeout_new;
  poller_adapter->timeout_update = poller_adapter_timeout_update;
  poller_adapter->timeout_free = poller_adapter_timeout_free;
}

avahi_responder_t::~avahi_responder_t() {
  if (client == nullptr) {
    return;
  }
  try {
    close();
  } catch (const shutdown_error &e) {
    ERROR("Error closing avahi session: {}", e.what());
  }
}

void avahi_responder_t::open() {
  if (client != nullptr) {
    WARNING("Avahi client already open. Doing nothing.");
    return;
  }
  INFO("Connecting to avahi-daemon");

  int error = 0;
  // No AVAHI_CLIENT_NO_FAIL: no daemon means no advertisement, and that
  // must fail now
  auto *new_client =
      avahi_client_new(poller_adapter.get(), (AvahiClientFlags)0,
                       ::client_callback, this, &error);
  if (!new_client) {
    client = nullptr;
    throw registration_error("Could not connect to avahi-daemon: {} ({})",
                             avahi_strerror(error), error);
  }
  client = new_client;
  const char *version = avahi_client_get_version_string(client);
  const char *host = avahi_client_get_host_name_fqdn(client);
  INFO("Connected to {} on host {}", version ? version : "avahi-daemon",
       host ? host : "(unknown)");
}

void avahi_responder_t::free_client() {
  // avahi_client_free frees the entry groups too
  groups.clear();
  if (client) {
    avahi_client_free(client);
    client = nullptr;
  }
}

void avahi_responder_t::wait_for_client_running() {
  while (true) {
    auto state = avahi_client_get_state(client);
    switch (state) {
    case AVAHI_CLIENT_S_RUNNING:
      return;
    case AVAHI_CLIENT_S_REGISTERING:
    case AVAHI_CLIENT_CONNECTING:
      break;
    default:
      throw registration_error("avahi-daemon is not running, client state {}",
                               state);
    }
    if (!poller.is_open()) {
      throw registration_error("Event loop closed waiting for avahi-daemon");
    }
    DEBUG("Waiting for avahi-daemon, client state {}", state);
    poller.wait();
  }
}

void avahi_responder_t::wait_for_group_established(
    AvahiEntryGroup *group, const advertisement_t &advertisement) {
  while (true) {
    auto state = avahi_entry_group_get_state(group);
    switch (state) {
    case AVAHI_ENTRY_GROUP_ESTABLISHED:
      return;
    case AVAHI_ENTRY_GROUP_COLLISION:
      throw registration_error("Name collision, \"{}\" is already in use on "
                               "the network",
                               advertisement.instance_name);
    case AVAHI_ENTRY_GROUP_FAILURE:
      throw registration_error("Could not publish \"{}\": {}",
                               advertisement.instance_name,
                               avahi_strerror(avahi_client_errno(client)));
    default:
      break;
    }
    if (avahi_client_get_state(client) == AVAHI_CLIENT_FAILURE) {
      throw registration_error("Lost avahi-daemon while publishing \"{}\"",
                               advertisement.instance_name);
    }
    if (!poller.is_open()) {
      throw registration_error("Event loop closed while publishing \"{}\"",
                               advertisement.instance_name);
    }
    poller.wait();
  }
}

registration_t
avahi_responder_t::register_service(const advertisement_t &advertisement) {
  if (client == nullptr) {
    throw registration_error("Not connected to avahi-daemon");
  }
  // avahi-daemon restarted or crashed. Our groups are gone with it.
  if (avahi_client_get_state(client) == AVAHI_CLIENT_FAILURE) {
    WARNING("Avahi client failed ({}). Reconnecting.",
            avahi_strerror(avahi_client_errno(client)));
    free_client();
    open();
  }
  wait_for_client_running();

  auto *group = avahi_entry_group_new(client, ::entry_group_callback, this);
  if (!group) {
    throw registration_error("avahi_entry_group_new() failed: {}",
                             avahi_strerror(avahi_client_errno(client)));
  }

  AvahiStringList *txt = nullptr;
  for (auto &entry : advertisement.txt_entries()) {
    txt = avahi_string_list_add(txt, entry.c_str());
  }
  // add prepends
  txt = avahi_string_list_reverse(txt);

  auto name = advertisement.instance_label();
  auto type = advertisement.service_type_label();
  DEBUG("Publish name=\"{}\" type={} port={} txt={}", name, type,
        advertisement.port, advertisement.properties);
  int ret = avahi_entry_group_add_service_strlst(
      group, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, (AvahiPublishFlags)0,
      name.c_str(), type.c_str(), MDNS_LOCAL_DOMAIN, nullptr,
      (uint16_t)advertisement.port, txt);
  avahi_string_list_free(txt);
  if (ret < 0) {
    avahi_entry_group_free(group);
    throw registration_error("Failed to add service name=\"{}\" type={}: {}",
                             name, type, avahi_strerror(ret));
  }

  ret = avahi_entry_group_commit(group);
  if (ret < 0) {
    avahi_entry_group_free(group);
    throw registration_error("Failed to commit entry group: {}",
                             avahi_strerror(ret));
  }

  try {
    wait_for_group_established(group, advertisement);
  } catch (const registration_error &) {
    avahi_entry_group_free(group);
    throw;
  }

  registration_t registration{max_registration_id++};
  groups[registration.id] = group;
  INFO("Published \"{}\" {} port {}", name, type, advertisement.port);
  return registration;
}

void avahi_responder_t::unregister_service(const registration_t &registration) {
  auto it = groups.find(registration.id);
  if (it == groups.end()) {
    throw registration_error("Unknown {}", registration);
  }
  auto *group = it->second;
  groups.erase(it);

  // Freeing the group makes avahi-daemon send the goodbye packets
  auto ret = avahi_entry_group_free(group);
  if (ret < 0) {
    throw registration_error("Could not withdraw {}: {}", registration,
                             avahi_strerror(ret));
  }
  DEBUG("Withdrawn {}", registration);
}

void avahi_responder_t::close() {
  int failures = 0;
  int last_error = 0;
  for (auto &[id, group] : groups) {
    auto ret = avahi_entry_group_free(group);
    if (ret < 0) {
      ERROR("Could not withdraw registration_t[{}]: {}", id,
            avahi_strerror(ret));
      failures++;
      last_error = ret;
    }
  }
  groups.clear();
  free_client();
  INFO("Avahi session closed");

  if (failures > 0) {
    throw shutdown_error("{} records could not be withdrawn: {}", failures,
                         avahi_strerror(last_error));
  }
}

void avahi_responder_t::client_callback(avahi_client_state_e state_) {
  auto state = (AvahiClientState)state_;
  DEBUG("New avahi client state: {}", state);

  switch (state) {
  case AVAHI_CLIENT_S_RUNNING:
    INFO("Avahi client running");
    break;
  case AVAHI_CLIENT_FAILURE: {
    auto avahi_errno = avahi_client_errno(client);
    ERROR("Avahi client failure: error=\"{}\" errno={}",
          avahi_strerror(avahi_errno), avahi_errno);
    if (avahi_errno == AVAHI_ERR_DISCONNECTED) {
      WARNING("Disconnected from avahi-daemon. Will reconnect at next "
              "refresh.");
    }
  } break;
  case AVAHI_CLIENT_S_COLLISION:
    WARNING("Host name collision. Records wait until avahi-daemon picks a "
            "new host name.");
    break;
  case AVAHI_CLIENT_S_REGISTERING:
  case AVAHI_CLIENT_CONNECTING:
    break;
  }
}

void avahi_responder_t::entry_group_callback(AvahiEntryGroup *group,
                                             entry_group_state_e state_) {
  auto state = (AvahiEntryGroupState)state_;
  DEBUG("Entry group {} state: {}", (void *)group, state);

  switch (state) {
  case AVAHI_ENTRY_GROUP_COLLISION:
    WARNING("Entry group collision. Another host uses our service name.");
    break;
  case AVAHI_ENTRY_GROUP_FAILURE:
    ERROR("Entry group failure: {}",
          avahi_strerror(avahi_client_errno(client)));
    break;
  default:
    break;
  }
}

} // namespace zeroconfd
