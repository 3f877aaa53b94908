/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "membership/membership_version.hh"
#include "membership/node_address.hh"
#include "membership/node_status.hh"

namespace membership {

struct membership_entry {
    node_address node;
    node_status status;

    bool operator==(const membership_entry&) const noexcept = default;
};

// A complete, self-consistent view of the membership table at one version.
// Never modified after construction; applying one is all-or-nothing.
class membership_table_snapshot {
    membership_version _version;
    std::vector<membership_entry> _entries;
public:
    membership_table_snapshot() noexcept = default;
    membership_table_snapshot(membership_version version, std::vector<membership_entry> entries)
        : _version(version)
        , _entries(std::move(entries)) {
    }

    // The notification sent when a peer should pull the table itself.
    static membership_table_snapshot empty_signal() {
        return membership_table_snapshot();
    }

    membership_version version() const noexcept {
        return _version;
    }
    const std::vector<membership_entry>& entries() const noexcept {
        return _entries;
    }
    size_t size() const noexcept {
        return _entries.size();
    }

    const membership_entry* find(const node_address& node) const noexcept;

    // node_status::none if the node is not in the table.
    node_status status_of(const node_address& node) const noexcept;

    std::vector<node_address> active_nodes() const;

    bool operator==(const membership_table_snapshot&) const noexcept = default;
};

} // namespace membership

template <>
struct fmt::formatter<membership::membership_entry> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const membership::membership_entry& e, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}={}", e.node, e.status);
    }
};

template <>
struct fmt::formatter<membership::membership_table_snapshot> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const membership::membership_table_snapshot& s, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{{version={}, entries=[{}]}}", s.version(), fmt::join(s.entries(), ", "));
    }
};
