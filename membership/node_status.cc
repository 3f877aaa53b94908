/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <array>
#include <stdexcept>
#include <utility>

#include "membership/node_status.hh"

namespace membership {

static constexpr std::array<std::pair<node_status, std::string_view>, 7> status_names = {{
    {node_status::none, "none"},
    {node_status::created, "created"},
    {node_status::joining, "joining"},
    {node_status::active, "active"},
    {node_status::shutting_down, "shutting_down"},
    {node_status::stopping, "stopping"},
    {node_status::dead, "dead"},
}};

std::string_view to_string_view(node_status s) noexcept {
    for (auto& [status, name] : status_names) {
        if (status == s) {
            return name;
        }
    }
    return "unknown";
}

node_status node_status_from_string(std::string_view s) {
    for (auto& [status, name] : status_names) {
        if (name == s) {
            return status;
        }
    }
    throw std::invalid_argument(fmt::format("Unknown node status '{}'", s));
}

} // namespace membership
