// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_MUTEX_HPP)
#define MQSAR_BRIDGE_MUTEX_HPP

#include <shared_mutex>

#include <mqsar/bridge/bridge_namespace.hpp>

MQSAR_BRIDGE_NS_BEGIN

using mutex = std::shared_timed_mutex;

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_MUTEX_HPP
