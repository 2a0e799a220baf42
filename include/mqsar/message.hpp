// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_MESSAGE_HPP)
#define MQSAR_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <mqsar/namespace.hpp>
#include <mqsar/move.hpp>
#include <mqsar/optional.hpp>
#include <mqsar/qos.hpp>
#include <mqsar/connect_return_code.hpp>
#include <mqsar/control_packet_type.hpp>
#include <mqsar/decode_error.hpp>
#include <mqsar/subscribe_entry.hpp>

// Decoded MQTT v3.1.1 packets. Encoding to and from the wire belongs to
// the connection layer; the bridge only sees these structs.

namespace MQSAR_NS {

using packet_id_t = std::uint16_t;

struct connect_message {
    connect_message() = default;

    connect_message(
        std::string client_id,
        optional<std::string> user_name,
        optional<std::string> password)
        : client_id { force_move(client_id) },
          user_name { force_move(user_name) },
          password { force_move(password) }
    {}

    explicit connect_message(decode_error failure)
        : failure { failure }
    {}

    static constexpr control_packet_type type() { return control_packet_type::connect; }

    std::string client_id;
    optional<std::string> user_name;
    optional<std::string> password;
    bool clean_session = true;
    std::uint16_t keep_alive_sec = 0;

    // set by the codec when the packet was rejected while decoding
    optional<decode_error> failure;
};

struct connack_message {
    connack_message(bool session_present, connect_return_code return_code)
        : session_present { session_present },
          return_code { return_code }
    {}

    static constexpr control_packet_type type() { return control_packet_type::connack; }

    bool session_present;
    connect_return_code return_code;
};

// Used in both directions: client to bridge, and forwarding task to client.
struct publish_message {
    publish_message(
        std::string topic_name,
        std::string payload,
        qos qos_value,
        packet_id_t packet_id = 0)
        : topic_name { force_move(topic_name) },
          payload { force_move(payload) },
          qos_value { qos_value },
          packet_id { packet_id }
    {}

    static constexpr control_packet_type type() { return control_packet_type::publish; }

    std::string topic_name;
    std::string payload;
    qos qos_value;
    packet_id_t packet_id;
    bool retain = false;
    bool dup = false;
};

template <control_packet_type PacketType>
struct basic_packet_id_message {
    explicit basic_packet_id_message(packet_id_t packet_id)
        : packet_id { packet_id }
    {}

    static constexpr control_packet_type type() { return PacketType; }

    packet_id_t packet_id;
};

using puback_message = basic_packet_id_message<control_packet_type::puback>;
using pubrec_message = basic_packet_id_message<control_packet_type::pubrec>;
using pubrel_message = basic_packet_id_message<control_packet_type::pubrel>;
using pubcomp_message = basic_packet_id_message<control_packet_type::pubcomp>;
using unsuback_message = basic_packet_id_message<control_packet_type::unsuback>;

struct subscribe_message {
    subscribe_message(packet_id_t packet_id, std::vector<subscribe_entry> entries)
        : packet_id { packet_id },
          entries { force_move(entries) }
    {}

    static constexpr control_packet_type type() { return control_packet_type::subscribe; }

    packet_id_t packet_id;
    std::vector<subscribe_entry> entries;
};

struct suback_message {
    suback_message(packet_id_t packet_id, std::vector<qos> return_codes)
        : packet_id { packet_id },
          return_codes { force_move(return_codes) }
    {}

    static constexpr control_packet_type type() { return control_packet_type::suback; }

    packet_id_t packet_id;
    std::vector<qos> return_codes;
};

struct unsubscribe_message {
    unsubscribe_message(packet_id_t packet_id, std::vector<std::string> topic_filters)
        : packet_id { packet_id },
          topic_filters { force_move(topic_filters) }
    {}

    static constexpr control_packet_type type() { return control_packet_type::unsubscribe; }

    packet_id_t packet_id;
    std::vector<std::string> topic_filters;
};

template <control_packet_type PacketType>
struct basic_header_only_message {
    static constexpr control_packet_type type() { return PacketType; }
};

using pingreq_message = basic_header_only_message<control_packet_type::pingreq>;
using pingresp_message = basic_header_only_message<control_packet_type::pingresp>;
using disconnect_message = basic_header_only_message<control_packet_type::disconnect>;

} // namespace MQSAR_NS

#endif // MQSAR_MESSAGE_HPP
