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

#pragma once

#include "responder.hpp"
#include "utils.hpp"
#include <map>
#include <memory>

struct AvahiClient;
typedef struct AvahiClient AvahiClient;
typedef struct AvahiPoll AvahiPoll;
typedef struct AvahiEntryGroup AvahiEntryGroup;

namespace zeroconfd {
struct avahi_watches_t;
typedef int avahi_client_state_e;
typedef int entry_group_state_e;

/**
 * @short Publishes services through the system avahi-daemon
 *
 * The avahi client runs on zeroconfd::poller, so it needs someone pumping
 * the poller to make progress. register_service pumps it itself until the
 * group settles, the rest of the time the poller_waiter_t does.
 */
class avahi_responder_t : public responder_t {
  NON_COPYABLE_NOR_MOVABLE(avahi_responder_t)
public:
  std::unique_ptr<avahi_watches_t> watches;
  std::unique_ptr<AvahiPoll> poller_adapter;
  AvahiClient *client = nullptr;
  std::map<int, AvahiEntryGroup *> groups;
  int max_registration_id = 1;

  avahi_responder_t();
  ~avahi_responder_t() override;

  void open() override;
  registration_t register_service(const advertisement_t &) override;
  void unregister_service(const registration_t &) override;
  void close() override;
  const char *get_type() const override { return "avahi_responder_t"; }

  void client_callback(avahi_client_state_e state);
  void entry_group_callback(AvahiEntryGroup *group, entry_group_state_e state);

private:
  void wait_for_client_running();
  void wait_for_group_established(AvahiEntryGroup *group,
                                  const advertisement_t &advertisement);
  void free_client();
};
} // namespace zeroconfd
