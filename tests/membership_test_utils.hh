/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <seastar/core/future.hh>
#include <seastar/net/inet_address.hh>

#include "membership/config.hh"
#include "membership/exceptions.hh"
#include "membership/local_health_monitor.hh"
#include "membership/loopback_transport.hh"
#include "membership/membership_service.hh"
#include "membership/membership_table_store.hh"

namespace tests {

using namespace membership;

inline node_address make_node(unsigned i, generation_type generation = 1) {
    return node_address(seastar::net::inet_address(fmt::format("127.0.0.{}", i + 1)), 11111, generation);
}

class manual_health_monitor final : public local_health_monitor {
    health_score _score;
    unsigned _samples = 0;
public:
    virtual health_score current_score(clock_type::time_point) override {
        ++_samples;
        return _score;
    }
    void set_score(float score) {
        _score = health_score(score);
    }
    unsigned samples() const {
        return _samples;
    }
};

// Records what the router asks of the store. refresh() moves the held
// version to `backend_version`.
class recording_table_store final : public membership_table_store {
public:
    membership_version version;
    membership_version backend_version{1};
    bool fail_refresh = false;
    bool fail_apply = false;
    unsigned refreshes = 0;
    std::vector<membership_table_snapshot> applied;

    virtual seastar::future<> refresh() override {
        ++refreshes;
        if (fail_refresh) {
            return seastar::make_exception_future<>(store_unavailable_error("backend is down"));
        }
        version = backend_version;
        return seastar::make_ready_future<>();
    }

    virtual seastar::future<> apply_snapshot(membership_table_snapshot snapshot) override {
        if (fail_apply) {
            return seastar::make_exception_future<>(std::runtime_error("apply failed"));
        }
        if (snapshot.version() > version) {
            version = snapshot.version();
        }
        applied.push_back(std::move(snapshot));
        return seastar::make_ready_future<>();
    }

    virtual membership_version current_version() const noexcept override {
        return version;
    }
};

// Counts resolve() calls per node, i.e. attempts to reach it.
class counting_peer_directory final : public peer_directory {
    peer_directory& _inner;
    std::unordered_map<node_address, unsigned> _resolved;
public:
    explicit counting_peer_directory(peer_directory& inner) : _inner(inner) {}

    virtual seastar::shared_ptr<remote_membership_service> resolve(const node_address& node) override {
        ++_resolved[node];
        return _inner.resolve(node);
    }

    unsigned resolved(const node_address& node) const {
        auto it = _resolved.find(node);
        return it == _resolved.end() ? 0 : it->second;
    }
};

// Membership services connected through one loopback directory, each with
// its own health monitor and recording table store.
// Must be used in a seastar thread.
class test_cluster {
    struct node {
        manual_health_monitor monitor;
        recording_table_store store;
        membership_service service;
        bool stopped = false;

        node(membership_config cfg, peer_directory& peers)
            : service(std::move(cfg), peers, monitor, store) {
        }
    };

    loopback_peer_directory _directory;
    counting_peer_directory _counting{_directory};
    std::vector<std::unique_ptr<node>> _nodes;
    bool _stopped = false;
public:
    explicit test_cluster(size_t size, membership_config base = {}) {
        for (size_t i = 0; i < size; ++i) {
            auto cfg = base;
            cfg.self = make_node(i);
            _nodes.push_back(std::make_unique<node>(std::move(cfg), _counting));
            _nodes.back()->service.start().get();
            _directory.add_node(_nodes.back()->service);
        }
    }

    ~test_cluster() {
        stop();
    }

    void stop() {
        if (std::exchange(_stopped, true)) {
            return;
        }
        for (size_t i = 0; i < _nodes.size(); ++i) {
            stop_node(i);
        }
        _directory.stop().get();
    }

    // The node keeps its address in the directory but refuses calls.
    void stop_node(size_t i) {
        auto& n = *_nodes[i];
        if (!std::exchange(n.stopped, true)) {
            n.service.stop().get();
        }
    }

    // Like stop_node(), but returns without waiting for the node's
    // running operations. Must be called at most once per node.
    seastar::future<> begin_stop_node(size_t i) {
        auto& n = *_nodes[i];
        if (std::exchange(n.stopped, true)) {
            throw std::logic_error(fmt::format("Node {} is already stopped", i));
        }
        return n.service.stop();
    }

    size_t size() const {
        return _nodes.size();
    }
    node_address address(size_t i) const {
        return _nodes[i]->service.self();
    }
    membership_service& service(size_t i) {
        return _nodes[i]->service;
    }
    manual_health_monitor& monitor(size_t i) {
        return _nodes[i]->monitor;
    }
    recording_table_store& store(size_t i) {
        return _nodes[i]->store;
    }
    loopback_peer_directory& directory() {
        return _directory;
    }
    const counting_peer_directory& attempts() const {
        return _counting;
    }
};

} // namespace tests
