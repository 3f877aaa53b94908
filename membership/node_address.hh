/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string_view>

#include <fmt/format.h>

#include <seastar/core/sstring.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/socket_defs.hh>

namespace membership {

// Process-restart epoch of a node. A node restarting on the same endpoint
// comes back with a larger generation.
using generation_type = int32_t;

// Identity of one cluster node: the endpoint its membership service
// listens on plus the generation of the process behind it.
class node_address {
    seastar::socket_address _endpoint;
    generation_type _generation = 0;
public:
    node_address() noexcept = default;
    node_address(seastar::socket_address endpoint, generation_type generation) noexcept
        : _endpoint(endpoint)
        , _generation(generation) {
    }
    node_address(const seastar::net::inet_address& ip, uint16_t port, generation_type generation) noexcept
        : node_address(seastar::socket_address(ip, port), generation) {
    }

    // Parses `host:port@generation`.
    // throws std::invalid_argument if the string is malformed
    static node_address from_string(std::string_view s);

    const seastar::socket_address& endpoint() const noexcept {
        return _endpoint;
    }
    seastar::net::inet_address ip() const noexcept {
        return _endpoint.addr();
    }
    uint16_t port() const noexcept {
        return _endpoint.port();
    }
    generation_type generation() const noexcept {
        return _generation;
    }

    // True if both addresses name the same endpoint, regardless of generation.
    bool matches_endpoint(const node_address& o) const noexcept {
        return _endpoint == o._endpoint;
    }

    bool operator==(const node_address& o) const noexcept {
        return _endpoint == o._endpoint && _generation == o._generation;
    }
    std::strong_ordering operator<=>(const node_address& o) const noexcept;

    seastar::sstring to_sstring() const;
};

} // namespace membership

namespace std {
template<>
struct hash<membership::node_address> {
    size_t operator()(const membership::node_address& a) const noexcept {
        return std::hash<seastar::socket_address>()(a.endpoint()) ^ (std::hash<membership::generation_type>()(a.generation()) << 1);
    }
};
}

template <>
struct fmt::formatter<membership::node_address> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const membership::node_address& a, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}@{}", a.ip(), a.port(), a.generation());
    }
};
