/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <string>

#include "membership/config.hh"

namespace bpo = boost::program_options;

namespace membership {

void add_options(bpo::options_description_easy_init& opts) {
    membership_config defaults;
    opts
        ("node-address", bpo::value<std::string>()->default_value("127.0.0.1:11111@1"),
            "Address of this node, as host:port@generation")
        ("indirect-probe-grace-ms", bpo::value<unsigned>()->default_value(defaults.indirect_probe_response_grace.count()),
            "How long past the probe timeout to wait for an intermediary's indirect probe answer")
        ("refresh-failure-escalation-threshold", bpo::value<unsigned>()->default_value(defaults.refresh_failure_escalation_threshold),
            "Consecutive membership table refresh failures before they are logged as errors")
        ;
}

membership_config make_config(const bpo::variables_map& vm) {
    membership_config cfg;
    cfg.self = node_address::from_string(vm["node-address"].as<std::string>());
    cfg.indirect_probe_response_grace = std::chrono::milliseconds(vm["indirect-probe-grace-ms"].as<unsigned>());
    cfg.refresh_failure_escalation_threshold = vm["refresh-failure-escalation-threshold"].as<unsigned>();
    return cfg;
}

} // namespace membership
