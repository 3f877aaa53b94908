/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <stdexcept>

#include <fmt/format.h>

#include "membership/node_address.hh"

namespace membership {

struct error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Should be thrown by a transport to signal that the peer could not be reached
// or the connection was lost. It's unspecified whether the call was executed
// on the peer.
struct transport_error : public error {
    using error::error;
};

struct unknown_peer_error : public error {
    node_address peer;

    explicit unknown_peer_error(const node_address& p)
        : error(fmt::format("Unknown peer {}", p))
        , peer(p) {}
};

// The authoritative membership table could not be read.
struct store_unavailable_error : public error {
    using error::error;
};

// The requester of an indirect probe gave up waiting for the intermediary.
struct timeout_error : public error {
    using error::error;
};

struct stopped_error : public error {
    explicit stopped_error(const node_address& self)
        : error(fmt::format("Membership service on {} is stopped", self)) {}
};

} // namespace membership
