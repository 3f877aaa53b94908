/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include <seastar/core/app-template.hh>
#include <seastar/core/thread.hh>
#include <seastar/util/defer.hh>

#include "log.hh"
#include "membership/config.hh"
#include "membership/exceptions.hh"
#include "membership/in_memory_table_store.hh"
#include "membership/loopback_transport.hh"
#include "membership/membership_service.hh"

namespace bpo = boost::program_options;
using namespace membership;

static logging::logger simlog("membership_sim");

// === How to run
// ./membership_sim --nodes 5 --unreachable 2 --node-address 127.0.0.1:11111@1
//
// === What to expect
//
// The first node probes every other node directly, and asks the second node to
// probe the ones it could not reach. Nodes found unreachable are marked dead in
// the membership table and the change is gossiped to the remaining nodes.
// Finally every node prints the version of its copy of the table; the
// reachable ones should all agree.

namespace {

class fixed_health_monitor final : public local_health_monitor {
    health_score _score;
public:
    explicit fixed_health_monitor(health_score score) noexcept : _score(score) {}
    virtual health_score current_score(clock_type::time_point) override {
        return _score;
    }
};

struct sim_node {
    fixed_health_monitor monitor;
    in_memory_table_store store;
    membership_service service;

    sim_node(membership_config cfg, peer_directory& peers, membership_table_source& source)
        : monitor(health_score::healthy())
        , store(source)
        , service(std::move(cfg), peers, monitor, store) {
    }
};

void run_simulation(const bpo::variables_map& config) {
    auto base = make_config(config);
    auto size = config["nodes"].as<unsigned>();
    auto unreachable = config["unreachable"].as<unsigned>();
    auto probe_timeout = std::chrono::milliseconds(config["probe-timeout-ms"].as<unsigned>());
    if (size < 2 || unreachable >= size) {
        throw std::invalid_argument(fmt::format("Need at least 2 nodes and fewer unreachable ones than nodes, got {} and {}",
                size, unreachable));
    }

    in_memory_table_source source;
    loopback_peer_directory directory;
    std::vector<std::unique_ptr<sim_node>> nodes;
    auto stop_directory = seastar::defer([&directory] () noexcept { directory.stop().get(); });
    auto stop_nodes = seastar::defer([&nodes] () noexcept {
        for (auto& n : nodes) {
            n->service.stop().get();
        }
    });

    for (unsigned i = 0; i < size; ++i) {
        auto cfg = base;
        cfg.self = node_address(base.self.ip(), base.self.port() + i, base.self.generation());
        nodes.push_back(std::make_unique<sim_node>(std::move(cfg), directory, source));
        nodes.back()->service.start().get();
        directory.add_node(nodes.back()->service);
        source.update(nodes.back()->service.self(), node_status::active);
    }
    for (auto& n : nodes) {
        n->store.refresh().get();
    }
    for (unsigned i = size - unreachable; i < size; ++i) {
        directory.set_unreachable(nodes[i]->service.self(), true);
    }

    auto& detector = nodes[0]->service;
    auto& intermediary = nodes[1]->service;
    std::vector<node_address> alive;
    std::vector<node_address> lost;
    int32_t probe_number = 0;
    for (unsigned i = 1; i < size; ++i) {
        auto target = nodes[i]->service.self();
        auto outcome = detector.probe_direct(target, ++probe_number).get();
        fmt::print("direct probe of {}: {}\n", target, outcome);
        if (!outcome.succeeded && target != intermediary.self()) {
            try {
                outcome = detector.probe_indirectly_request(intermediary.self(), target, probe_timeout, ++probe_number).get();
                fmt::print("indirect probe of {} through {}: {}\n", target, intermediary.self(), outcome);
            } catch (const membership::error& e) {
                simlog.warn("Indirect probe of {} through {} failed: {}", target, intermediary.self(), e.what());
            }
        }
        (outcome.succeeded ? alive : lost).push_back(target);
    }

    for (auto& node : lost) {
        source.update(node, node_status::dead);
    }
    nodes[0]->store.refresh().get();
    auto table = nodes[0]->store.current();
    simlog.info("Gossiping table version {} to {} nodes", table.version(), size - 1);
    std::vector<node_address> partners;
    for (unsigned i = 1; i < size; ++i) {
        partners.push_back(nodes[i]->service.self());
    }
    for (auto& node : lost) {
        detector.gossip_to_partners(partners, table, node, node_status::dead).get();
    }
    // Reachable nodes that missed the snapshot pull the table themselves.
    detector.gossip_to_partners(alive, membership_table_snapshot::empty_signal(), detector.self(), node_status::active).get();

    for (auto& n : nodes) {
        auto& stats = n->service.get_stats();
        fmt::print("{}: table version {}, {} gossip sent, {} gossip failures\n", n->service.self(), n->store.current_version(),
                stats.gossip_messages_sent, stats.gossip_send_failures);
    }
}

}

int main(int ac, char** av) {
    seastar::app_template app;
    auto opts = app.add_options();
    membership::add_options(opts);
    opts
        ("nodes", bpo::value<unsigned>()->default_value(5), "Number of nodes in the simulated cluster")
        ("unreachable", bpo::value<unsigned>()->default_value(1), "Number of nodes which refuse every call")
        ("probe-timeout-ms", bpo::value<unsigned>()->default_value(500), "Timeout of indirect probes")
        ;
    return app.run(ac, av, [&app] {
        return seastar::async([&app] {
            run_simulation(app.configuration());
            return 0;
        });
    });
}
