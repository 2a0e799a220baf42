// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_BRIDGE_CONFIG_HPP)
#define MQSAR_BRIDGE_BRIDGE_CONFIG_HPP

#include <chrono>

#include <mqsar/bridge/bridge_namespace.hpp>

MQSAR_BRIDGE_NS_BEGIN

static constexpr std::chrono::milliseconds default_receive_timeout(100);

struct bridge_config {
    // Upper bound of a single consumer receive in a forwarding task.
    // A cancelled task notices the cancellation within this time.
    std::chrono::milliseconds receive_timeout = default_receive_timeout;
};

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_BRIDGE_CONFIG_HPP
