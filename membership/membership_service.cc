/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include <fmt/chrono.h>

#include <seastar/core/coroutine.hh>
#include <seastar/core/metrics.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/core/with_scheduling_group.hh>
#include <seastar/core/with_timeout.hh>
#include <seastar/coroutine/parallel_for_each.hh>

#include "log.hh"
#include "membership/exceptions.hh"
#include "membership/membership_service.hh"

namespace membership {

static logging::logger logger("membership");

membership_service::membership_service(membership_config cfg, peer_directory& peers,
        local_health_monitor& health_monitor, membership_table_store& store)
    : _cfg(std::move(cfg))
    , _peers(peers)
    , _health_monitor(health_monitor)
    , _store(store) {
}

template <typename Func>
seastar::futurize_t<std::invoke_result_t<Func>> membership_service::run_or_queue(Func&& func) {
    using futurator = seastar::futurize<std::invoke_result_t<Func>>;
    if (_gate.is_closed()) {
        return futurator::make_exception_future(stopped_error(_cfg.self));
    }
    auto holder = _gate.hold();
    return seastar::with_scheduling_group(_cfg.scheduling_group, std::forward<Func>(func)).finally([holder = std::move(holder)] {});
}

void membership_service::register_metrics() {
    namespace sm = seastar::metrics;
    auto node_label = sm::label("node");
    std::vector<sm::label_instance> labels{node_label(_cfg.self.to_sstring())};
    _metrics.add_group("membership", {
        sm::make_counter("pings_sent", _stats.pings_sent,
                sm::description("Pings sent to peers, answered or not"), labels),
        sm::make_counter("ping_failures", _stats.ping_failures,
                sm::description("Direct probes that did not get an answer"), labels),
        sm::make_counter("indirect_probes_served", _stats.indirect_probes_served,
                sm::description("Indirect probes executed on behalf of peers"), labels),
        sm::make_counter("indirect_probe_failures", _stats.indirect_probe_failures,
                sm::description("Indirect probes executed on behalf of peers which failed or timed out"), labels),
        sm::make_counter("gossip_messages_sent", _stats.gossip_messages_sent,
                sm::description("Gossip notifications delivered to partners"), labels),
        sm::make_counter("gossip_send_failures", _stats.gossip_send_failures,
                sm::description("Gossip notifications which could not be delivered"), labels),
        sm::make_counter("table_refreshes", _stats.table_refreshes,
                sm::description("Membership table reads triggered by gossip"), labels),
        sm::make_counter("table_refresh_failures", _stats.table_refresh_failures,
                sm::description("Membership table reads triggered by gossip which failed"), labels),
        sm::make_counter("snapshots_received", _stats.snapshots_received,
                sm::description("Gossiped table snapshots handed to the table store"), labels),
    });
}

seastar::future<> membership_service::start() {
    register_metrics();
    logger.info("Membership service on {} started", _cfg.self);
    return seastar::make_ready_future<>();
}

seastar::future<> membership_service::stop() {
    logger.info("Stopping membership service on {}", _cfg.self);
    co_await _gate.close();
    _metrics.clear();
    logger.info("Membership service on {} stopped", _cfg.self);
}

seastar::future<> membership_service::ping(int32_t probe_number) {
    return run_or_queue([this, probe_number] {
        logger.trace("Received ping #{} on {}", probe_number, _cfg.self);
        return seastar::make_ready_future<>();
    });
}

seastar::future<probe_outcome> membership_service::probe_direct(node_address target, int32_t probe_number) {
    return run_or_queue([this, target, probe_number] {
        return do_probe_direct(target, probe_number);
    });
}

seastar::future<probe_outcome> membership_service::probe_indirectly_request(node_address intermediary, node_address target,
        std::chrono::milliseconds probe_timeout, int32_t probe_number) {
    return run_or_queue([this, intermediary, target, probe_timeout, probe_number] {
        return do_probe_indirectly_request(intermediary, target, probe_timeout, probe_number);
    });
}

seastar::future<probe_outcome> membership_service::probe_indirectly_serve(node_address target,
        std::chrono::milliseconds probe_timeout, int32_t probe_number) {
    return run_or_queue([this, target, probe_timeout, probe_number] {
        return do_probe_indirectly_serve(target, probe_timeout, probe_number);
    });
}

seastar::future<> membership_service::gossip_to_partners(std::vector<node_address> partners, membership_table_snapshot snapshot,
        node_address updated_node, node_status updated_status) {
    return run_or_queue([this, partners = std::move(partners), snapshot = std::move(snapshot), updated_node, updated_status] () mutable {
        return do_gossip(std::move(partners), std::move(snapshot), updated_node, updated_status);
    });
}

seastar::future<> membership_service::membership_change_notification(membership_table_snapshot snapshot) {
    return run_or_queue([this, snapshot = std::move(snapshot)] () mutable {
        return do_membership_change_notification(std::move(snapshot));
    });
}

// Resolves when `target` answers. Counted as sent once the call was handed
// to the peer's handle, even if the connection is then refused; only a
// peer which can't be resolved leaves the counter alone.
//
// Nothing in here touches `this` after the first suspension, so the
// returned future may outlive the service (an abandoned timed-out probe).
seastar::future<> membership_service::send_ping(node_address target, int32_t probe_number) {
    auto remote = _peers.resolve(target);
    auto f = remote->ping(probe_number, call_options{.traffic = traffic_class::health_check});
    ++_stats.pings_sent;
    co_await std::move(f);
}

seastar::future<probe_outcome> membership_service::do_probe_direct(node_address target, int32_t probe_number) {
    auto score = _health_monitor.current_score(clock_type::now());
    auto start = clock_type::now();
    try {
        co_await send_ping(target, probe_number);
        co_return probe_outcome::success(score, clock_type::now() - start);
    } catch (...) {
        auto ex = std::current_exception();
        ++_stats.ping_failures;
        logger.debug("Probe #{} of {} failed: {}", probe_number, target, ex);
        co_return probe_outcome::failure(score, clock_type::now() - start, fmt::format("Encountered exception {}", ex));
    }
}

seastar::future<probe_outcome> membership_service::do_probe_indirectly_serve(node_address target,
        std::chrono::milliseconds probe_timeout, int32_t probe_number) {
    ++_stats.indirect_probes_served;
    probe_timeout = std::clamp(probe_timeout, std::chrono::milliseconds::zero(), max_probe_timeout);
    auto score = _health_monitor.current_score(clock_type::now());
    auto start = clock_type::now();
    seastar::sstring detail;
    try {
        co_await seastar::with_timeout(start + probe_timeout, send_ping(target, probe_number));
        co_return probe_outcome::success(score, clock_type::now() - start);
    } catch (const seastar::timed_out_error&) {
        logger.warn("Requested probe timeout {} exceeded while probing {} (probe #{})", probe_timeout, target, probe_number);
        detail = fmt::format("Requested probe timeout {} exceeded", probe_timeout);
    } catch (...) {
        detail = fmt::format("Encountered exception {}", std::current_exception());
    }
    ++_stats.indirect_probe_failures;
    co_return probe_outcome::failure(score, clock_type::now() - start, std::move(detail));
}

seastar::future<probe_outcome> membership_service::do_probe_indirectly_request(node_address intermediary, node_address target,
        std::chrono::milliseconds probe_timeout, int32_t probe_number) {
    logger.trace("Asking {} to probe {} (probe #{}, timeout {})", intermediary, target, probe_number, probe_timeout);
    probe_timeout = std::clamp(probe_timeout, std::chrono::milliseconds::zero(), max_probe_timeout);
    auto grace = std::clamp(_cfg.indirect_probe_response_grace, std::chrono::milliseconds::zero(), max_probe_timeout);
    auto remote = _peers.resolve(intermediary);
    auto deadline = clock_type::now() + probe_timeout + grace;
    auto f = remote->probe_indirectly(target, probe_timeout, probe_number, call_options{.traffic = traffic_class::health_check})
            .finally([remote] {});
    try {
        co_return co_await seastar::with_timeout(deadline, std::move(f));
    } catch (const seastar::timed_out_error&) {
        throw timeout_error(fmt::format("Intermediary {} did not answer indirect probe #{} of {} in time",
                intermediary, probe_number, target));
    }
}

seastar::future<> membership_service::do_gossip(std::vector<node_address> partners, membership_table_snapshot snapshot,
        node_address updated_node, node_status updated_status) {
    co_await seastar::coroutine::parallel_for_each(partners, [&] (const node_address& partner) {
        return gossip_to_partner(partner, snapshot, updated_node, updated_status);
    });
}

// The returned future is never exceptional.
seastar::future<> membership_service::gossip_to_partner(const node_address& partner, const membership_table_snapshot& snapshot,
        const node_address& updated_node, node_status updated_status) {
    logger.trace("Sending status update gossip notification about {}, status {}, to {}", updated_node, updated_status, partner);
    try {
        auto remote = _peers.resolve(partner);
        co_await remote->membership_change_notification(snapshot, call_options{.traffic = traffic_class::membership});
        ++_stats.gossip_messages_sent;
    } catch (...) {
        ++_stats.gossip_send_failures;
        logger.warn("Error sending gossip notification to {}: {}", partner, std::current_exception());
    }
}

seastar::future<> membership_service::do_membership_change_notification(membership_table_snapshot snapshot) {
    if (snapshot.version().is_min()) {
        logger.trace("Received gossip notification without a snapshot, going to read the table");
        co_await read_table();
        co_return;
    }
    logger.trace("Received gossip notification with table version {}", snapshot.version());
    ++_stats.snapshots_received;
    co_await _store.apply_snapshot(std::move(snapshot));
}

// Failures are not retried here; the next gossip round or detector cycle will.
seastar::future<> membership_service::read_table() {
    try {
        co_await _store.refresh();
        ++_stats.table_refreshes;
        _consecutive_refresh_failures = 0;
    } catch (...) {
        ++_stats.table_refresh_failures;
        ++_consecutive_refresh_failures;
        auto level = _consecutive_refresh_failures >= _cfg.refresh_failure_escalation_threshold
                ? logging::log_level::error : logging::log_level::warn;
        logger.log(level, "Error refreshing membership table ({} consecutive failures): {}",
                _consecutive_refresh_failures, std::current_exception());
    }
}

} // namespace membership
