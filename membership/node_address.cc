/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>

#include "membership/node_address.hh"

namespace membership {

template <typename Integer>
static Integer parse_number(std::string_view s, std::string_view full, const char* what) {
    Integer value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
        throw std::invalid_argument(fmt::format("Invalid {} in node address '{}'", what, full));
    }
    return value;
}

node_address node_address::from_string(std::string_view s) {
    auto at = s.rfind('@');
    if (at == std::string_view::npos) {
        throw std::invalid_argument(fmt::format("Node address '{}' has no generation (expected host:port@generation)", s));
    }
    auto endpoint = s.substr(0, at);
    auto colon = endpoint.rfind(':');
    if (colon == std::string_view::npos) {
        throw std::invalid_argument(fmt::format("Node address '{}' has no port (expected host:port@generation)", s));
    }
    auto host = endpoint.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    auto port = parse_number<uint16_t>(endpoint.substr(colon + 1), s, "port");
    auto generation = parse_number<generation_type>(s.substr(at + 1), s, "generation");
    // seastar::net::inet_address throws std::invalid_argument on a bad host
    seastar::net::inet_address ip(host == "localhost" ? std::string("127.0.0.1") : std::string(host));
    return node_address(ip, port, generation);
}

std::strong_ordering node_address::operator<=>(const node_address& o) const noexcept {
    auto a = ip();
    auto b = o.ip();
    if (auto c = a.size() <=> b.size(); c != 0) {
        return c;
    }
    if (auto c = std::lexicographical_compare_three_way(
            static_cast<const uint8_t*>(a.data()), static_cast<const uint8_t*>(a.data()) + a.size(),
            static_cast<const uint8_t*>(b.data()), static_cast<const uint8_t*>(b.data()) + b.size()); c != 0) {
        return c;
    }
    if (auto c = port() <=> o.port(); c != 0) {
        return c;
    }
    return _generation <=> o._generation;
}

seastar::sstring node_address::to_sstring() const {
    return fmt::format("{}", *this);
}

} // namespace membership
