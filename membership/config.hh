/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>

#include <boost/program_options.hpp>

#include <seastar/core/scheduling.hh>

#include "membership/node_address.hh"

namespace membership {

struct membership_config {
    node_address self;
    // Every operation of the membership service runs in this group.
    seastar::scheduling_group scheduling_group = seastar::default_scheduling_group();
    // How much longer than the requested probe timeout the requester of an
    // indirect probe waits for the intermediary's answer.
    std::chrono::milliseconds indirect_probe_response_grace{1000};
    // Number of consecutive table refresh failures after which each further
    // failure is logged as an error instead of a warning.
    unsigned refresh_failure_escalation_threshold = 3;
};

void add_options(boost::program_options::options_description_easy_init& opts);

// throws std::invalid_argument on malformed values
membership_config make_config(const boost::program_options::variables_map& vm);

} // namespace membership
