/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include <fmt/format.h>

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>

#include "membership/membership_table_snapshot.hh"
#include "membership/node_address.hh"
#include "membership/probe_outcome.hh"

namespace membership {

// Lets a transport tell liveness traffic apart from the rest, e.g. to send it
// over a dedicated connection so it does not queue behind bulk messages.
enum class traffic_class : uint8_t {
    membership,
    health_check,
};

// Envelope fields of an outbound peer call, set by the caller and read by
// the transport.
struct call_options {
    traffic_class traffic = traffic_class::membership;
};

// Handle to the membership service of one remote node.
//
// Any call may fail with transport_error if the peer cannot be reached.
// Values passed by reference may be freed as soon as the function returns.
class remote_membership_service {
public:
    virtual ~remote_membership_service() {}

    // Liveness acknowledgment. `probe_number` only correlates diagnostics.
    virtual seastar::future<> ping(int32_t probe_number, call_options opts) = 0;

    // Ask the remote node to probe `target` on our behalf. The remote side
    // bounds its own probe by `probe_timeout` and always answers with an
    // outcome rather than an error.
    virtual seastar::future<probe_outcome> probe_indirectly(const node_address& target,
            std::chrono::milliseconds probe_timeout, int32_t probe_number, call_options opts) = 0;

    // Deliver a gossip notification. A snapshot versioned
    // membership_version::min() asks the receiver to read the table itself.
    virtual seastar::future<> membership_change_notification(const membership_table_snapshot& snapshot, call_options opts) = 0;
};

class peer_directory {
public:
    // Fails with unknown_peer_error if `node` has never been seen.
    virtual seastar::shared_ptr<remote_membership_service> resolve(const node_address& node) = 0;

protected:
    ~peer_directory() = default;
};

std::string_view to_string_view(traffic_class t) noexcept;

} // namespace membership

template <>
struct fmt::formatter<membership::traffic_class> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(membership::traffic_class t, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", membership::to_string_view(t));
    }
};
