// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_BRIDGE_KEY_HPP)
#define MQSAR_BRIDGE_BRIDGE_KEY_HPP

#include <functional>
#include <ostream>
#include <string>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/bridge/common_type.hpp>
#include <mqsar/move.hpp>

MQSAR_BRIDGE_NS_BEGIN

/**
 * @brief Identity of one forwarding task: a live connection fed from one
 * backend topic. Connections compare by address.
 */
struct bridge_key {
    bridge_key(con_sp_t con, std::string topic)
        : con { force_move(con) },
          topic { force_move(topic) }
    {}

    con_sp_t con;
    std::string topic;
};

inline bool operator==(bridge_key const& lhs, bridge_key const& rhs) {
    return lhs.con == rhs.con && lhs.topic == rhs.topic;
}

inline bool operator!=(bridge_key const& lhs, bridge_key const& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(bridge_key const& lhs, bridge_key const& rhs) {
    if (lhs.con.get() != rhs.con.get()) return std::less<con_t const*>()(lhs.con.get(), rhs.con.get());
    return lhs.topic < rhs.topic;
}

inline std::ostream& operator<<(std::ostream& o, bridge_key const& v) {
    o << "con:" << static_cast<void const*>(v.con.get()) << " topic:" << v.topic;
    return o;
}

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_BRIDGE_KEY_HPP
