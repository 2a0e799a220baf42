// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_CONNECTION_HPP)
#define MQSAR_CONNECTION_HPP

#include <string>

#include <mqsar/namespace.hpp>
#include <mqsar/message_variant.hpp>

namespace MQSAR_NS {

/**
 * @brief One client network connection as seen by the bridge.
 *
 * The object identity (its address) is the connection identity. The bridge
 * keeps session attachment outside of the object, keyed by that identity.
 *
 * write() is called from protocol handlers and from forwarding tasks at the
 * same time, so implementations must serialize it. Both write() and close()
 * may be called after the peer has gone away and must then be harmless.
 */
class connection {
public:
    virtual ~connection() = default;

    /**
     * @brief Encode and send one packet to the client.
     * Throws on a broken connection.
     */
    virtual void write(message_variant msg) = 0;

    /**
     * @brief Close the underlying transport. Idempotent.
     */
    virtual void close() = 0;

    /**
     * @brief Peer address for logging, e.g. "10.0.0.7:51234".
     */
    virtual std::string remote_address() const = 0;
};

} // namespace MQSAR_NS

#endif // MQSAR_CONNECTION_HPP
