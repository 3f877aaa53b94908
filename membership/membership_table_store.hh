/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>

#include "membership/membership_table_snapshot.hh"

namespace membership {

// Local holder of the authoritative, versioned membership table.
// Implementations are safe to call from concurrent fibers.
class membership_table_store {
public:
    // Pull the latest table from the authoritative backend.
    // Fails with store_unavailable_error if the backend cannot be read.
    virtual seastar::future<> refresh() = 0;

    // Adopt `snapshot` if its version is strictly newer than the held one,
    // otherwise do nothing. Never adopts a snapshot partially.
    virtual seastar::future<> apply_snapshot(membership_table_snapshot snapshot) = 0;

    virtual membership_version current_version() const noexcept = 0;

protected:
    ~membership_table_store() = default;
};

} // namespace membership
