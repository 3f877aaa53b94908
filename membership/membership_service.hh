/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <type_traits>
#include <vector>

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/metrics_registration.hh>

#include "membership/config.hh"
#include "membership/local_health_monitor.hh"
#include "membership/membership_table_snapshot.hh"
#include "membership/membership_table_store.hh"
#include "membership/node_address.hh"
#include "membership/node_status.hh"
#include "membership/peer_directory.hh"
#include "membership/probe_outcome.hh"

namespace membership {

/**
 * The membership service of one node. It answers and issues liveness probes,
 * relays probes for peers that cannot reach a node directly, and spreads
 * membership table changes to gossip partners.
 *
 * All operations, whether invoked by a peer or by the local failure
 * detector, run in the configured scheduling group: inline if the caller is
 * already running there, queued otherwise. Operations interleave only at
 * suspension points. Concurrent outbound calls made by one operation
 * (gossip fan-out) address independent peers and share no mutable state.
 *
 * There is one instance per node, living on a single shard for the whole
 * lifetime of the node. All methods must be called on that shard.
 */
class membership_service {
public:
    using clock_type = std::chrono::steady_clock;

    // Longer probe timeouts, and grace periods, are cut down to this.
    static constexpr std::chrono::milliseconds max_probe_timeout = std::chrono::hours(24);

    struct stats {
        uint64_t pings_sent = 0;
        uint64_t ping_failures = 0;
        uint64_t indirect_probes_served = 0;
        uint64_t indirect_probe_failures = 0;
        uint64_t gossip_messages_sent = 0;
        uint64_t gossip_send_failures = 0;
        uint64_t table_refreshes = 0;
        uint64_t table_refresh_failures = 0;
        uint64_t snapshots_received = 0;
    };
private:
    membership_config _cfg;
    peer_directory& _peers;
    local_health_monitor& _health_monitor;
    membership_table_store& _store;

    // Held by every running operation; closed by stop().
    seastar::gate _gate;

    stats _stats;
    unsigned _consecutive_refresh_failures = 0;
    seastar::metrics::metric_groups _metrics;
public:
    membership_service(membership_config cfg, peer_directory& peers, local_health_monitor& health_monitor, membership_table_store& store);

    membership_service(const membership_service&) = delete;
    membership_service& operator=(const membership_service&) = delete;

    // Part of node startup. Registers metrics; has no other effect.
    seastar::future<> start();

    // Rejects new operations with stopped_error and waits for running ones.
    // Must be called before the object is destroyed.
    seastar::future<> stop();

    const node_address& self() const noexcept {
        return _cfg.self;
    }

    const stats& get_stats() const noexcept {
        return _stats;
    }

    // Calls served on behalf of peers.

    // Resolves as soon as the service gets to run it.
    seastar::future<> ping(int32_t probe_number);

    // Probe `target` directly on behalf of the calling peer, giving up after
    // `probe_timeout`. Never fails: every problem, the timeout included,
    // becomes a failed outcome. The outcome carries this node's health score
    // sampled once when the request started.
    seastar::future<probe_outcome> probe_indirectly_serve(node_address target, std::chrono::milliseconds probe_timeout, int32_t probe_number);

    // Adopt the snapshot, or read the table if it carries no usable snapshot
    // (version is membership_version::min()). Refresh failures are logged and
    // swallowed; failures applying the snapshot are returned to the sender.
    seastar::future<> membership_change_notification(membership_table_snapshot snapshot);

    // Calls made by the local failure detector.

    // Ping `target` and wait for the answer, bounded only by the transport.
    // Transport errors become a failed outcome.
    seastar::future<probe_outcome> probe_direct(node_address target, int32_t probe_number);

    // Ask `intermediary` to probe `target`. Unlike the serving side this
    // propagates errors: transport failures reaching the intermediary, and
    // timeout_error if no answer arrives within `probe_timeout` plus the
    // configured grace period.
    seastar::future<probe_outcome> probe_indirectly_request(node_address intermediary, node_address target,
            std::chrono::milliseconds probe_timeout, int32_t probe_number);

    // Notify every partner of the update, concurrently. Resolves when every
    // partner has been attempted once; individual failures are logged and
    // not retried.
    seastar::future<> gossip_to_partners(std::vector<node_address> partners, membership_table_snapshot snapshot,
            node_address updated_node, node_status updated_status);

private:
    template <typename Func>
    seastar::futurize_t<std::invoke_result_t<Func>> run_or_queue(Func&& func);

    void register_metrics();

    seastar::future<> send_ping(node_address target, int32_t probe_number);
    seastar::future<probe_outcome> do_probe_direct(node_address target, int32_t probe_number);
    seastar::future<probe_outcome> do_probe_indirectly_serve(node_address target, std::chrono::milliseconds probe_timeout, int32_t probe_number);
    seastar::future<probe_outcome> do_probe_indirectly_request(node_address intermediary, node_address target,
            std::chrono::milliseconds probe_timeout, int32_t probe_number);
    seastar::future<> do_gossip(std::vector<node_address> partners, membership_table_snapshot snapshot,
            node_address updated_node, node_status updated_status);
    seastar::future<> gossip_to_partner(const node_address& partner, const membership_table_snapshot& snapshot,
            const node_address& updated_node, node_status updated_status);
    seastar::future<> do_membership_change_notification(membership_table_snapshot snapshot);
    seastar::future<> read_table();
};

} // namespace membership
