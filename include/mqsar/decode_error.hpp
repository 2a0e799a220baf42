// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_DECODE_ERROR_HPP)
#define MQSAR_DECODE_ERROR_HPP

#include <cstdint>
#include <ostream>

#include <mqsar/namespace.hpp>

namespace MQSAR_NS {

/**
 * @brief Category of a CONNECT packet the codec could not accept.
 *
 * The first two categories have a matching CONNACK return code. Anything
 * else is reported as malformed_packet and gets no CONNACK.
 */
enum class decode_error : std::uint8_t {
    unacceptable_protocol_version,
    identifier_rejected,
    malformed_packet,
};

constexpr
char const* decode_error_to_str(decode_error v) {
    switch (v) {
    case decode_error::unacceptable_protocol_version: return "unacceptable_protocol_version";
    case decode_error::identifier_rejected:           return "identifier_rejected";
    case decode_error::malformed_packet:              return "malformed_packet";
    }
    return "unknown_decode_error";
}

inline
std::ostream& operator<<(std::ostream& os, decode_error val)
{
    os << decode_error_to_str(val);
    return os;
}

} // namespace MQSAR_NS

#endif // MQSAR_DECODE_ERROR_HPP
