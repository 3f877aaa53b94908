/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <optional>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <seastar/core/sstring.hh>

#include "membership/health_score.hh"

namespace membership {

// Result of a single probe attempt.
//
// responder_health_score is the score of the node that executed the probe,
// sampled once when the probe started. It is filled in on failure too, so a
// failure reported by a degraded intermediary can be weighted accordingly.
struct probe_outcome {
    using duration = std::chrono::steady_clock::duration;

    bool succeeded = false;
    health_score responder_health_score;
    duration round_trip = duration::zero();
    std::optional<seastar::sstring> failure_detail;

    static probe_outcome success(health_score score, duration round_trip) {
        return probe_outcome{true, score, round_trip, std::nullopt};
    }

    static probe_outcome failure(health_score score, duration round_trip, seastar::sstring detail) {
        return probe_outcome{false, score, round_trip, std::move(detail)};
    }
};

} // namespace membership

template <>
struct fmt::formatter<membership::probe_outcome> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const membership::probe_outcome& o, FormatContext& ctx) const {
        auto rtt = std::chrono::duration_cast<std::chrono::microseconds>(o.round_trip);
        if (o.succeeded) {
            return fmt::format_to(ctx.out(), "{{succeeded, health_score={}, round_trip={}}}", o.responder_health_score, rtt);
        }
        return fmt::format_to(ctx.out(), "{{failed, health_score={}, round_trip={}, detail={}}}",
                o.responder_health_score, rtt, o.failure_detail.value_or("none"));
    }
};
