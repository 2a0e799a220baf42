// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_TOPIC_KEY_HPP)
#define MQSAR_BRIDGE_TOPIC_KEY_HPP

#include <ostream>
#include <string>
#include <tuple>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/bridge/session_key.hpp>
#include <mqsar/move.hpp>

MQSAR_BRIDGE_NS_BEGIN

/**
 * @brief Sharing key of one producer or one consumer.
 *
 * The session is part of the key, so two sessions on the same backend
 * topic never share a handle.
 */
struct topic_key {
    topic_key(std::string topic, session_key session)
        : topic { force_move(topic) },
          session { force_move(session) }
    {}

    std::string topic;
    session_key session;
};

inline bool operator==(topic_key const& lhs, topic_key const& rhs) {
    return std::tie(lhs.topic, lhs.session) == std::tie(rhs.topic, rhs.session);
}

inline bool operator!=(topic_key const& lhs, topic_key const& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(topic_key const& lhs, topic_key const& rhs) {
    return std::tie(lhs.topic, lhs.session) < std::tie(rhs.topic, rhs.session);
}

inline std::ostream& operator<<(std::ostream& o, topic_key const& v) {
    o << "topic:" << v.topic << " " << v.session;
    return o;
}

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_TOPIC_KEY_HPP
