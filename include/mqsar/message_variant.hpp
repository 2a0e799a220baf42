// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_MESSAGE_VARIANT_HPP)
#define MQSAR_MESSAGE_VARIANT_HPP

#include <mqsar/namespace.hpp>
#include <mqsar/message.hpp>
#include <mqsar/variant.hpp>

namespace MQSAR_NS {

// Every packet the bridge writes to a client.
using message_variant = variant<
    connack_message,
    publish_message,
    puback_message,
    suback_message,
    unsuback_message,
    pingresp_message
>;

namespace detail {

struct packet_type_visitor
#if !defined(MQSAR_STD_VARIANT)
    : boost::static_visitor<control_packet_type>
#endif // !defined(MQSAR_STD_VARIANT)
{
    template <typename T>
    control_packet_type operator()(T const&) const {
        return T::type();
    }
};

} // namespace detail

inline control_packet_type packet_type(message_variant const& msg) {
    return MQSAR_NS::visit(detail::packet_type_visitor(), msg);
}

} // namespace MQSAR_NS

#endif // MQSAR_MESSAGE_VARIANT_HPP
