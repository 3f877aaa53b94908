/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include <seastar/core/coroutine.hh>

#include "log.hh"
#include "membership/exceptions.hh"
#include "membership/in_memory_table_store.hh"

namespace membership {

static logging::logger slogger("membership_store");

in_memory_table_source::in_memory_table_source()
    : _table(membership_version(0), {}) {
}

seastar::future<membership_table_snapshot> in_memory_table_source::read_table() {
    if (!_available) {
        return seastar::make_exception_future<membership_table_snapshot>(
                store_unavailable_error("Membership table backend is unavailable"));
    }
    return seastar::make_ready_future<membership_table_snapshot>(_table);
}

const membership_table_snapshot& in_memory_table_source::update(const node_address& node, node_status status) {
    auto entries = _table.entries();
    auto it = std::ranges::find(entries, node, &membership_entry::node);
    if (it == entries.end()) {
        entries.push_back(membership_entry{node, status});
    } else {
        it->status = status;
    }
    _table = membership_table_snapshot(_table.version().next(), std::move(entries));
    return _table;
}

in_memory_table_store::in_memory_table_store(membership_table_source& source) noexcept
    : _source(source) {
}

seastar::future<> in_memory_table_store::refresh() {
    auto units = co_await seastar::get_units(_update_sem, 1);
    membership_table_snapshot table;
    try {
        table = co_await _source.read_table();
    } catch (...) {
        log_and_throw<store_unavailable_error>(slogger, logging::log_level::debug,
                "Failed to read the membership table: {}", std::current_exception());
    }
    if (table.version().is_min()) {
        throw store_unavailable_error("Membership table backend returned a table without a version");
    }
    slogger.debug("Refreshed membership table, version {} -> {}", _current.version(), table.version());
    _current = std::move(table);
}

seastar::future<> in_memory_table_store::apply_snapshot(membership_table_snapshot snapshot) {
    auto units = co_await seastar::get_units(_update_sem, 1);
    if (snapshot.version() <= _current.version()) {
        slogger.debug("Ignoring membership snapshot version {}, already at {}", snapshot.version(), _current.version());
        co_return;
    }
    slogger.debug("Applying membership snapshot, version {} -> {}", _current.version(), snapshot.version());
    _current = std::move(snapshot);
}

} // namespace membership
