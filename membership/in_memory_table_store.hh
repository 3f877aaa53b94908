/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/semaphore.hh>

#include "membership/membership_table_snapshot.hh"
#include "membership/membership_table_store.hh"

namespace membership {

// The authoritative membership table, as seen by a table store.
class membership_table_source {
public:
    virtual seastar::future<membership_table_snapshot> read_table() = 0;

protected:
    ~membership_table_source() = default;
};

// A table source keeping the table in memory, for single-process clusters.
// Every update bumps the version.
class in_memory_table_source final : public membership_table_source {
    membership_table_snapshot _table;
    bool _available = true;
public:
    in_memory_table_source();

    virtual seastar::future<membership_table_snapshot> read_table() override;

    // Sets the status of `node`, adding it if needed, and returns the
    // resulting table.
    const membership_table_snapshot& update(const node_address& node, node_status status);

    const membership_table_snapshot& table() const noexcept {
        return _table;
    }

    // While unavailable, read_table() fails.
    void set_available(bool available) noexcept {
        _available = available;
    }
};

// Holds this node's copy of the membership table.
//
// apply_snapshot() adopts only snapshots strictly newer than the held one.
// refresh() adopts whatever the source reports, even if it is older than
// the held table: the source is authoritative.
// Refreshes and applies are serialized with each other.
class in_memory_table_store final : public membership_table_store {
    membership_table_source& _source;
    membership_table_snapshot _current;
    seastar::semaphore _update_sem{1};
public:
    explicit in_memory_table_store(membership_table_source& source) noexcept;

    virtual seastar::future<> refresh() override;
    virtual seastar::future<> apply_snapshot(membership_table_snapshot snapshot) override;
    virtual membership_version current_version() const noexcept override {
        return _current.version();
    }

    const membership_table_snapshot& current() const noexcept {
        return _current;
    }
};

} // namespace membership
