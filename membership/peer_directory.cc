/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "membership/peer_directory.hh"

namespace membership {

std::string_view to_string_view(traffic_class t) noexcept {
    switch (t) {
    case traffic_class::membership: return "membership";
    case traffic_class::health_check: return "health_check";
    }
    return "unknown";
}

} // namespace membership
