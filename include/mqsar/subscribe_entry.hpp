// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_SUBSCRIBE_ENTRY_HPP)
#define MQSAR_SUBSCRIBE_ENTRY_HPP

#include <string>

#include <mqsar/namespace.hpp>
#include <mqsar/move.hpp>
#include <mqsar/qos.hpp>

namespace MQSAR_NS {

struct subscribe_entry {
    subscribe_entry(
        std::string topic_filter,
        qos qos_value)
        : topic_filter { force_move(topic_filter) },
          qos_value { qos_value }
        {}

    std::string topic_filter;
    qos qos_value;
};

} // namespace MQSAR_NS

#endif // MQSAR_SUBSCRIBE_ENTRY_HPP
