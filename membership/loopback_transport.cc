/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "log.hh"
#include "membership/exceptions.hh"
#include "membership/loopback_transport.hh"
#include "membership/membership_service.hh"

namespace membership {

static logging::logger tlogger("membership_transport");

class loopback_peer_directory::remote final : public remote_membership_service {
    loopback_peer_directory& _directory;
    node_address _target;

    // A stopped service looks like a process which has gone away.
    template <typename T>
    static seastar::future<T> translate_stopped(seastar::future<T> f) {
        try {
            co_return co_await std::move(f);
        } catch (const stopped_error& e) {
            throw transport_error(e.what());
        }
    }
public:
    remote(loopback_peer_directory& directory, node_address target) noexcept
        : _directory(directory)
        , _target(target) {
    }

    virtual seastar::future<> ping(int32_t probe_number, call_options opts) override {
        auto service = co_await _directory.deliver(_target, opts);
        co_await translate_stopped(service->ping(probe_number));
    }

    virtual seastar::future<probe_outcome> probe_indirectly(const node_address& target,
            std::chrono::milliseconds probe_timeout, int32_t probe_number, call_options opts) override {
        return do_probe_indirectly(target, probe_timeout, probe_number, opts);
    }

    virtual seastar::future<> membership_change_notification(const membership_table_snapshot& snapshot, call_options opts) override {
        return do_membership_change_notification(snapshot, opts);
    }

private:
    // Arguments are taken by value: the caller's references may not survive
    // the delivery latency.
    seastar::future<probe_outcome> do_probe_indirectly(node_address target,
            std::chrono::milliseconds probe_timeout, int32_t probe_number, call_options opts) {
        auto service = co_await _directory.deliver(_target, opts);
        co_return co_await translate_stopped(service->probe_indirectly_serve(target, probe_timeout, probe_number));
    }

    seastar::future<> do_membership_change_notification(membership_table_snapshot snapshot, call_options opts) {
        auto service = co_await _directory.deliver(_target, opts);
        co_await translate_stopped(service->membership_change_notification(std::move(snapshot)));
    }
};

seastar::future<> loopback_peer_directory::stop() {
    return _gate.close();
}

loopback_peer_directory::node_state& loopback_peer_directory::get_node(const node_address& node) {
    auto it = _nodes.find(node);
    if (it == _nodes.end()) {
        throw unknown_peer_error(node);
    }
    return it->second;
}

void loopback_peer_directory::add_node(membership_service& service) {
    _nodes[service.self()].service = &service;
    tlogger.debug("Added node {}", service.self());
}

void loopback_peer_directory::remove_node(const node_address& node) {
    get_node(node).service = nullptr;
    tlogger.debug("Removed node {}", node);
}

void loopback_peer_directory::set_unreachable(const node_address& node, bool unreachable) {
    get_node(node).unreachable = unreachable;
}

void loopback_peer_directory::set_latency(const node_address& node, std::chrono::milliseconds latency) {
    get_node(node).latency = latency;
}

uint64_t loopback_peer_directory::calls_received(const node_address& node, traffic_class traffic) const {
    auto it = _nodes.find(node);
    return it == _nodes.end() ? 0 : it->second.calls_received[static_cast<size_t>(traffic)];
}

seastar::shared_ptr<remote_membership_service> loopback_peer_directory::resolve(const node_address& node) {
    if (!_nodes.contains(node)) {
        tlogger.debug("Cannot resolve unknown peer {}", node);
        throw unknown_peer_error(node);
    }
    return seastar::make_shared<remote>(*this, node);
}

seastar::future<membership_service*> loopback_peer_directory::deliver(node_address to, call_options opts) {
    auto reachable = [this, &to, &opts] () -> node_state& {
        auto& node = get_node(to);
        if (node.unreachable || !node.service) {
            tlogger.trace("Dropping {} call to unreachable node {}", opts.traffic, to);
            throw transport_error(fmt::format("Connection to {} refused", to));
        }
        return node;
    };
    if (_gate.is_closed()) {
        throw transport_error(fmt::format("Transport is stopped, cannot reach {}", to));
    }
    auto holder = _gate.hold();
    auto latency = reachable().latency;
    if (latency.count() > 0) {
        co_await seastar::sleep(latency);
    }
    // The node may have changed while the message was on its way.
    auto& node = reachable();
    ++node.calls_received[static_cast<size_t>(opts.traffic)];
    co_return node.service;
}

} // namespace membership
