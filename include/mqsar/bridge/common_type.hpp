// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_COMMON_TYPE_HPP)
#define MQSAR_BRIDGE_COMMON_TYPE_HPP

#include <memory>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/connection.hpp>
#include <mqsar/message.hpp>

MQSAR_BRIDGE_NS_BEGIN

using con_t = connection;
using con_sp_t = std::shared_ptr<con_t>;
using con_wp_t = std::weak_ptr<con_t>;

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_COMMON_TYPE_HPP
