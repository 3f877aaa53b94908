/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <compare>
#include <cstdint>
#include <limits>

#include <fmt/format.h>

namespace membership {

// Version of the membership table. Every change to the authoritative table
// produces a strictly larger version.
//
// min() is never the version of a real table. Gossip uses it to say
// "something changed, no snapshot attached".
class membership_version {
public:
    using value_type = int64_t;
private:
    value_type _value = std::numeric_limits<value_type>::min();
public:
    constexpr membership_version() noexcept = default;
    constexpr explicit membership_version(value_type v) noexcept : _value(v) {}

    static constexpr membership_version min() noexcept {
        return membership_version();
    }

    constexpr bool is_min() const noexcept {
        return _value == std::numeric_limits<value_type>::min();
    }

    constexpr value_type value() const noexcept {
        return _value;
    }

    // Saturates at the largest representable version.
    constexpr membership_version next() const noexcept {
        if (is_min()) {
            return membership_version(0);
        }
        return membership_version(_value == std::numeric_limits<value_type>::max() ? _value : _value + 1);
    }

    constexpr bool operator==(const membership_version&) const noexcept = default;
    constexpr std::strong_ordering operator<=>(const membership_version&) const noexcept = default;
};

} // namespace membership

template <>
struct fmt::formatter<membership::membership_version> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const membership::membership_version& v, FormatContext& ctx) const {
        if (v.is_min()) {
            return fmt::format_to(ctx.out(), "min");
        }
        return fmt::format_to(ctx.out(), "{}", v.value());
    }
};
