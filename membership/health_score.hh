/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <compare>

#include <fmt/format.h>

namespace membership {

// Self-reported degradation of a node, in [0, max_value].
// 0 is perfectly healthy; a peer reporting a high score is trusted less.
class health_score {
public:
    static constexpr float max_value = 8.0f;
private:
    float _value = 0.0f;
public:
    constexpr health_score() noexcept = default;
    // A NaN reading counts as fully degraded.
    constexpr explicit health_score(float v) noexcept : _value(v != v ? max_value : std::clamp(v, 0.0f, max_value)) {}

    static constexpr health_score healthy() noexcept {
        return health_score();
    }

    constexpr float value() const noexcept {
        return _value;
    }

    constexpr bool operator==(const health_score&) const noexcept = default;
    constexpr std::partial_ordering operator<=>(const health_score&) const noexcept = default;
};

} // namespace membership

template <>
struct fmt::formatter<membership::health_score> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const membership::health_score& h, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", h.value());
    }
};
