// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BACKEND_HPP)
#define MQSAR_BACKEND_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>

#include <mqsar/namespace.hpp>
#include <mqsar/move.hpp>
#include <mqsar/optional.hpp>
#include <mqsar/error_code.hpp>
#include <mqsar/exception.hpp>

// Interfaces the bridge needs from a Pulsar style log-based backend.
// Transport, pooling and serialization are the client library's business.

namespace MQSAR_NS {

struct message_id {
    std::int64_t ledger_id = -1;
    std::int64_t entry_id = -1;

    friend bool operator==(message_id const& lhs, message_id const& rhs) {
        return std::tie(lhs.ledger_id, lhs.entry_id) == std::tie(rhs.ledger_id, rhs.entry_id);
    }
    friend bool operator!=(message_id const& lhs, message_id const& rhs) {
        return !(lhs == rhs);
    }
    friend bool operator<(message_id const& lhs, message_id const& rhs) {
        return std::tie(lhs.ledger_id, lhs.entry_id) < std::tie(rhs.ledger_id, rhs.entry_id);
    }
};

inline std::ostream& operator<<(std::ostream& o, message_id const& v) {
    o << v.ledger_id << ":" << v.entry_id;
    return o;
}

struct backend_message {
    backend_message(message_id id, std::string topic_name, std::string payload)
        : id { id },
          topic_name { force_move(topic_name) },
          payload { force_move(payload) }
    {}

    message_id id;
    std::string topic_name;
    std::string payload;
};

class producer {
public:
    using send_handler = std::function<void(error_code ec, message_id id)>;

    virtual ~producer() = default;

    virtual std::string const& topic() const = 0;

    /**
     * @brief Send and wait for the broker receipt.
     * @return id assigned by the backend
     * Throws backend_error on failure.
     */
    virtual message_id send(std::string payload) = 0;

    /**
     * @brief Send without blocking.
     * @param h called exactly once on some backend thread
     */
    virtual void async_send(std::string payload, send_handler h) = 0;

    /**
     * @brief Release the producer. Idempotent.
     */
    virtual void close() = 0;
};

class consumer {
public:
    virtual ~consumer() = default;

    virtual std::string const& topic() const = 0;
    virtual std::string const& subscription() const = 0;

    /**
     * @brief Wait up to timeout for the next message.
     * @return nullopt when the timeout expired
     * Throws backend_error when the consumer is closed or broken.
     */
    virtual optional<backend_message> receive(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Acknowledge one message. Unacknowledged messages are
     * redelivered after the consumer is closed and created again.
     * Throws backend_error on failure.
     */
    virtual void acknowledge(message_id const& id) = 0;

    /**
     * @brief Release the consumer. Wakes up a blocked receive(). Idempotent.
     */
    virtual void close() = 0;
};

class client {
public:
    virtual ~client() = default;

    /**
     * Throws backend_unavailable.
     */
    virtual std::shared_ptr<producer> create_producer(std::string const& topic) = 0;

    /**
     * Throws backend_unavailable.
     */
    virtual std::shared_ptr<consumer> create_consumer(
        std::string const& topic,
        std::string const& subscription) = 0;
};

} // namespace MQSAR_NS

#endif // MQSAR_BACKEND_HPP
