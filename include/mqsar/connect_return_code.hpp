// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_CONNECT_RETURN_CODE_HPP)
#define MQSAR_CONNECT_RETURN_CODE_HPP

#include <cstdint>
#include <ostream>

#include <mqsar/namespace.hpp>

namespace MQSAR_NS {

enum class connect_return_code : std::uint8_t {

    accepted                      = 0,
    unacceptable_protocol_version = 1,
    identifier_rejected           = 2,
    server_unavailable            = 3,
    bad_user_name_or_password     = 4,
    not_authorized                = 5,

    // MQTT v5 CONNACK reason code, sent on authentication failure
    use_another_server            = 0x9c,

};

constexpr
char const* connect_return_code_to_str(connect_return_code v) {
    switch (v) {
    case connect_return_code::accepted:                      return "accepted";
    case connect_return_code::unacceptable_protocol_version: return "unacceptable_protocol_version";
    case connect_return_code::identifier_rejected:           return "identifier_rejected";
    case connect_return_code::server_unavailable:            return "server_unavailable";
    case connect_return_code::bad_user_name_or_password:     return "bad_user_name_or_password";
    case connect_return_code::not_authorized:                return "not_authorized";
    case connect_return_code::use_another_server:            return "use_another_server";
    }
    return "unknown_connect_return_code";
}

inline
std::ostream& operator<<(std::ostream& os, connect_return_code val)
{
    os << connect_return_code_to_str(val);
    return os;
}

} // namespace MQSAR_NS

#endif // MQSAR_CONNECT_RETURN_CODE_HPP
