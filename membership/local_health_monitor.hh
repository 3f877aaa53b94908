/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>

#include "membership/health_score.hh"

namespace membership {

// Source of this node's own health degradation score.
// How the score is computed (timer lag, queue delays, recent probe
// history) is up to the implementation.
class local_health_monitor {
public:
    using clock_type = std::chrono::steady_clock;

    virtual health_score current_score(clock_type::time_point now) = 0;

protected:
    // The monitor is not owned by the membership service and must not be
    // destroyed through this interface.
    ~local_health_monitor() = default;
};

} // namespace membership
