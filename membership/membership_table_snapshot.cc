/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include "membership/membership_table_snapshot.hh"

namespace membership {

const membership_entry* membership_table_snapshot::find(const node_address& node) const noexcept {
    auto it = std::ranges::find(_entries, node, &membership_entry::node);
    return it == _entries.end() ? nullptr : &*it;
}

node_status membership_table_snapshot::status_of(const node_address& node) const noexcept {
    auto e = find(node);
    return e ? e->status : node_status::none;
}

std::vector<node_address> membership_table_snapshot::active_nodes() const {
    std::vector<node_address> ret;
    for (auto& e : _entries) {
        if (e.status == node_status::active) {
            ret.push_back(e.node);
        }
    }
    return ret;
}

} // namespace membership
