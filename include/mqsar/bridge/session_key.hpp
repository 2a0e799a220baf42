// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_SESSION_KEY_HPP)
#define MQSAR_BRIDGE_SESSION_KEY_HPP

#include <ostream>
#include <string>
#include <tuple>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/move.hpp>

MQSAR_BRIDGE_NS_BEGIN

/**
 * @brief Identity of one authenticated client session.
 */
struct session_key {
    session_key(std::string client_id, std::string username)
        : client_id { force_move(client_id) },
          username { force_move(username) }
    {}

    std::string client_id;
    std::string username;
};

inline bool operator==(session_key const& lhs, session_key const& rhs) {
    return std::tie(lhs.client_id, lhs.username) == std::tie(rhs.client_id, rhs.username);
}

inline bool operator!=(session_key const& lhs, session_key const& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(session_key const& lhs, session_key const& rhs) {
    return std::tie(lhs.client_id, lhs.username) < std::tie(rhs.client_id, rhs.username);
}

inline std::ostream& operator<<(std::ostream& o, session_key const& v) {
    o << "cid:" << v.client_id << " username:" << v.username;
    return o;
}

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_SESSION_KEY_HPP
