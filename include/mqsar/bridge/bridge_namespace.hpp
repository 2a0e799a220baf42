// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_BRIDGE_NAMESPACE_HPP)
#define MQSAR_BRIDGE_BRIDGE_NAMESPACE_HPP

#include <mqsar/namespace.hpp>

#if __cplusplus >= 201703L

#define MQSAR_BRIDGE_NS_BEGIN namespace MQSAR_NS::bridge {
#define MQSAR_BRIDGE_NS_END }

#else  // __cplusplus >= 201703L

#define MQSAR_BRIDGE_NS_BEGIN namespace MQSAR_NS { namespace bridge {
#define MQSAR_BRIDGE_NS_END } }

#endif // __cplusplus >= 201703L

#endif // MQSAR_BRIDGE_BRIDGE_NAMESPACE_HPP
