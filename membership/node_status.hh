/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace membership {

// Liveness classification of a node as recorded in the membership table.
enum class node_status : uint8_t {
    none = 0,
    created = 1,
    joining = 2,
    active = 3,
    shutting_down = 4,
    stopping = 5,
    dead = 6,
};

// The node has started leaving the cluster, gracefully or not.
inline bool is_terminating(node_status s) noexcept {
    return s == node_status::shutting_down || s == node_status::stopping || s == node_status::dead;
}

inline bool is_unavailable(node_status s) noexcept {
    return s == node_status::none || s == node_status::dead;
}

std::string_view to_string_view(node_status s) noexcept;

// throws std::invalid_argument on an unknown name
node_status node_status_from_string(std::string_view s);

} // namespace membership

template <>
struct fmt::formatter<membership::node_status> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(membership::node_status s, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", membership::to_string_view(s));
    }
};
