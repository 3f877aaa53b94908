/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include <seastar/testing/thread_test_case.hh>

#include "tests/membership_test_utils.hh"

using namespace tests;

namespace {

membership_table_snapshot table(int64_t version, std::initializer_list<membership_entry> entries) {
    return membership_table_snapshot(membership_version(version), std::vector<membership_entry>(entries));
}

}

SEASTAR_THREAD_TEST_CASE(test_sentinel_triggers_refresh) {
    test_cluster cluster(1);
    auto& store = cluster.store(0);
    store.version = membership_version(5);
    store.backend_version = membership_version(9);

    cluster.service(0).membership_change_notification(membership_table_snapshot::empty_signal()).get();

    BOOST_REQUIRE_EQUAL(store.refreshes, 1);
    BOOST_REQUIRE(store.applied.empty());
    BOOST_REQUIRE(store.current_version() == membership_version(9));
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().table_refreshes, 1);
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().snapshots_received, 0);
}

SEASTAR_THREAD_TEST_CASE(test_snapshot_is_applied_unmodified) {
    test_cluster cluster(1);
    auto& store = cluster.store(0);
    store.version = membership_version(5);
    auto snapshot = table(6, {
        {make_node(1), node_status::active},
        {make_node(2, 4), node_status::shutting_down},
    });

    cluster.service(0).membership_change_notification(snapshot).get();

    BOOST_REQUIRE_EQUAL(store.refreshes, 0);
    BOOST_REQUIRE_EQUAL(store.applied.size(), 1);
    BOOST_REQUIRE(store.applied.front() == snapshot);
    BOOST_REQUIRE(store.current_version() == membership_version(6));
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().snapshots_received, 1);
}

SEASTAR_THREAD_TEST_CASE(test_stale_snapshot_is_left_to_the_store) {
    test_cluster cluster(1);
    auto& store = cluster.store(0);
    store.version = membership_version(5);

    cluster.service(0).membership_change_notification(table(3, {{make_node(1), node_status::dead}})).get();

    BOOST_REQUIRE_EQUAL(store.refreshes, 0);
    BOOST_REQUIRE_EQUAL(store.applied.size(), 1);
    BOOST_REQUIRE(store.current_version() == membership_version(5));
}

SEASTAR_THREAD_TEST_CASE(test_version_zero_is_a_snapshot) {
    test_cluster cluster(1);

    cluster.service(0).membership_change_notification(table(0, {})).get();

    BOOST_REQUIRE_EQUAL(cluster.store(0).refreshes, 0);
    BOOST_REQUIRE_EQUAL(cluster.store(0).applied.size(), 1);
}

SEASTAR_THREAD_TEST_CASE(test_refresh_failure_is_swallowed) {
    test_cluster cluster(1);
    auto& store = cluster.store(0);
    store.version = membership_version(5);
    store.fail_refresh = true;

    cluster.service(0).membership_change_notification(membership_table_snapshot::empty_signal()).get();

    BOOST_REQUIRE_EQUAL(store.refreshes, 1);
    BOOST_REQUIRE(store.current_version() == membership_version(5));
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().table_refresh_failures, 1);
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().table_refreshes, 0);
}

SEASTAR_THREAD_TEST_CASE(test_repeated_refresh_failures) {
    membership_config cfg;
    cfg.refresh_failure_escalation_threshold = 2;
    test_cluster cluster(1, cfg);
    auto& store = cluster.store(0);
    store.fail_refresh = true;

    for (int i = 0; i < 4; ++i) {
        cluster.service(0).membership_change_notification(membership_table_snapshot::empty_signal()).get();
    }
    store.fail_refresh = false;
    cluster.service(0).membership_change_notification(membership_table_snapshot::empty_signal()).get();

    BOOST_REQUIRE_EQUAL(store.refreshes, 5);
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().table_refresh_failures, 4);
    BOOST_REQUIRE_EQUAL(cluster.service(0).get_stats().table_refreshes, 1);
    BOOST_REQUIRE(store.current_version() == store.backend_version);
}

SEASTAR_THREAD_TEST_CASE(test_apply_failure_reaches_the_caller) {
    test_cluster cluster(1);
    cluster.store(0).fail_apply = true;

    BOOST_REQUIRE_THROW(cluster.service(0).membership_change_notification(table(2, {})).get(), std::runtime_error);
}

SEASTAR_THREAD_TEST_CASE(test_notification_after_stop) {
    test_cluster cluster(1);
    cluster.stop_node(0);

    BOOST_REQUIRE_THROW(cluster.service(0).membership_change_notification(table(2, {})).get(), stopped_error);
    BOOST_REQUIRE(cluster.store(0).applied.empty());
}
