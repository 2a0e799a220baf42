// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_QOS_HPP)
#define MQSAR_QOS_HPP

#include <cstdint>
#include <mqsar/namespace.hpp>

namespace MQSAR_NS {

enum class qos : std::uint8_t {

    at_most_once  = 0,
    at_least_once = 1,
    exactly_once  = 2,

    // decoder marker for a reserved or unparsable QoS value
    failure       = 0x80,

}; // enum qos

inline
char const* qos_to_str(qos v) {
    switch (v) {
    case qos::at_most_once:  return "at_most_once";
    case qos::at_least_once: return "at_least_once";
    case qos::exactly_once:  return "exactly_once";
    case qos::failure:       return "failure";
    }
    return "invalid_qos";
}

template<typename OSTREAM_T>
OSTREAM_T & operator<<(OSTREAM_T & os, qos v)
{
    return os << qos_to_str(v);
}

} // namespace MQSAR_NS

#endif // MQSAR_QOS_HPP
