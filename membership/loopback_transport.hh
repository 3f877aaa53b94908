/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <array>
#include <chrono>
#include <unordered_map>

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include "membership/node_address.hh"
#include "membership/peer_directory.hh"

namespace membership {

class membership_service;

// Peer directory connecting membership services which live in the same
// process and on the same shard. Calls are delivered by invoking the target
// service directly, after the configured latency.
//
// Faults can be injected per node: an unreachable node refuses every call
// with transport_error, as does a node which was removed or stopped.
class loopback_peer_directory final : public peer_directory {
    struct node_state {
        membership_service* service = nullptr;
        bool unreachable = false;
        std::chrono::milliseconds latency{0};
        std::array<uint64_t, 2> calls_received{};
    };
    std::unordered_map<node_address, node_state> _nodes;
    // Held by calls in flight, so stop() can wait for them.
    seastar::gate _gate;

    class remote;
    friend class remote;

    // Waits out the target's latency and returns its service.
    // Fails with transport_error if the target can't be reached.
    seastar::future<membership_service*> deliver(node_address to, call_options opts);
public:
    loopback_peer_directory() = default;
    loopback_peer_directory(const loopback_peer_directory&) = delete;
    loopback_peer_directory& operator=(const loopback_peer_directory&) = delete;

    // Waits for all calls in flight. Must be called before destruction.
    seastar::future<> stop();

    // `service` must stay alive until it is removed or the directory is stopped.
    void add_node(membership_service& service);

    // Later calls to the node fail as if its process was gone; the address
    // stays known.
    void remove_node(const node_address& node);

    void set_unreachable(const node_address& node, bool unreachable);
    void set_latency(const node_address& node, std::chrono::milliseconds latency);

    // Number of calls of the given class delivered to `node`.
    uint64_t calls_received(const node_address& node, traffic_class traffic) const;

    virtual seastar::shared_ptr<remote_membership_service> resolve(const node_address& node) override;

private:
    node_state& get_node(const node_address& node);
};

} // namespace membership
