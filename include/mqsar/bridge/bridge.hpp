// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_BRIDGE_HPP)
#define MQSAR_BRIDGE_BRIDGE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/bridge/bridge_config.hpp>
#include <mqsar/bridge/bridge_key.hpp>
#include <mqsar/bridge/common_type.hpp>
#include <mqsar/bridge/forwarding_task.hpp>
#include <mqsar/bridge/resource_registry.hpp>
#include <mqsar/bridge/security.hpp>
#include <mqsar/bridge/session_key.hpp>
#include <mqsar/bridge/topic_resolver.hpp>
#include <mqsar/backend.hpp>
#include <mqsar/connect_return_code.hpp>
#include <mqsar/log.hpp>
#include <mqsar/message.hpp>
#include <mqsar/move.hpp>
#include <mqsar/optional.hpp>
#include <mqsar/qos.hpp>

MQSAR_BRIDGE_NS_BEGIN

class bridge_t {
public:
    using auth_handler = std::function<
        bool(std::string const& username, std::string const& password, std::string const& client_id)
    >;
    using topic_handler = std::function<
        std::string(std::string const& username, std::string const& client_id, std::string const& topic)
    >;

    bridge_t(client& backend, bridge_config config = bridge_config())
        :config_(force_move(config)),
         registry_(backend),
         auth_handler_(
             [this]
             (std::string const& username, std::string const& password, std::string const& client_id) {
                 return security_.authenticate(username, password, client_id);
             }
         ),
         topic_handler_(
             [this]
             (std::string const& username, std::string const& client_id, std::string const& topic) {
                 return resolver_.resolve(username, client_id, topic);
             }
         ) {}

    bridge_t(bridge_t const&) = delete;
    bridge_t& operator=(bridge_t const&) = delete;

    /**
     * @brief configure the security settings used by the default auth handler
     */
    void set_security(security&& sec) {
        security_ = force_move(sec);
    }

    security& get_security() {
        return security_;
    }

    /**
     * @brief configure the topic naming used by the default topic handler
     */
    void set_topic_resolver(topic_resolver resolver) {
        resolver_ = force_move(resolver);
    }

    /**
     * @brief replace the authentication decision
     *
     * @param h - called on every CONNECT with (username, password, client_id).
     *            The connection is refused if it returns false.
     */
    void set_auth_handler(auth_handler h) {
        auth_handler_ = force_move(h);
    }

    /**
     * @brief replace the MQTT topic to backend topic mapping
     *
     * @param h - called with (username, client_id, mqtt_topic) and returns the backend topic
     */
    void set_topic_handler(topic_handler h) {
        topic_handler_ = force_move(h);
    }

    /**
     * @brief session attached to the connection, nullopt before a successful CONNECT
     */
    optional<session_key> session(con_sp_t const& spep) const {
        return registry_.attached_session(spep);
    }

    resource_registry const& registry() const {
        return registry_;
    }

    bridge_config const& config() const {
        return config_;
    }

    /**
     * @brief connect_handler
     *
     * Authenticates the client and attaches its session to the connection.
     * An older connection of the same session is closed (session takeover).
     */
    void connect_handler(con_sp_t const& spep, connect_message const& msg) {
        try {
            MQSAR_LOG("mqsar_bridge", trace)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "connect_handler cid:" << msg.client_id
                << " remote:" << spep->remote_address();

            if (msg.failure) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "decode failure:" << *msg.failure;
                switch (*msg.failure) {
                case decode_error::unacceptable_protocol_version:
                    reject_connect(spep, connect_return_code::unacceptable_protocol_version);
                    break;
                case decode_error::identifier_rejected:
                    reject_connect(spep, connect_return_code::identifier_rejected);
                    break;
                default:
                    spep->close();
                    break;
                }
                return;
            }

            if (registry_.attached_session(spep)) {
                // [MQTT-3.1.0-2]
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "second CONNECT on the connection cid:" << msg.client_id;
                close_proc(spep);
                return;
            }

            if (is_blank(msg.client_id) || !msg.user_name || is_blank(*msg.user_name)) {
                MQSAR_LOG("mqsar_bridge", info)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "client_id or username is blank cid:" << msg.client_id;
                reject_connect(spep, connect_return_code::identifier_rejected);
                return;
            }

            std::string password = msg.password ? *msg.password : std::string();
            if (!auth_handler_(*msg.user_name, password, msg.client_id)) {
                MQSAR_LOG("mqsar_bridge", info)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "authentication failed cid:" << msg.client_id
                    << " username:" << *msg.user_name;
                reject_connect(spep, connect_return_code::use_another_server);
                return;
            }

            session_key sk(msg.client_id, *msg.user_name);
            if (auto displaced = registry_.attach_session(spep, sk)) {
                displaced->close();
            }
            MQSAR_LOG("mqsar_bridge", info)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "session attached " << sk;
            spep->write(connack_message(false, connect_return_code::accepted));
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", error)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "connect_handler failed " << e.what();
        }
    }

    /**
     * @brief publish_handler
     *
     * QoS0 is sent asynchronously and never acknowledged to the client.
     * QoS1 is sent synchronously and acknowledged with PUBACK on success.
     * QoS2 is not supported and ignored.
     */
    void publish_handler(con_sp_t const& spep, publish_message msg) {
        try {
            auto sk = registry_.attached_session(spep);
            if (!sk) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "PUBLISH without session";
                spep->close();
                return;
            }

            if (msg.qos_value != qos::at_most_once && msg.qos_value != qos::at_least_once) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "unsupported qos:" << msg.qos_value
                    << " topic:" << msg.topic_name << " " << *sk;
                return;
            }

            auto topic = topic_handler_(sk->username, sk->client_id, msg.topic_name);

            std::shared_ptr<producer> p;
            try {
                p = registry_.get_or_create_producer(*sk, topic);
            }
            catch (backend_error const& e) {
                MQSAR_LOG("mqsar_bridge", error)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "producer unavailable topic:" << topic << " " << *sk << " " << e.what();
                close_proc(spep);
                return;
            }

            if (msg.qos_value == qos::at_most_once) {
                try {
                    p->async_send(
                        force_move(msg.payload),
                        [topic]
                        (error_code ec, message_id id) {
                            if (ec) {
                                MQSAR_LOG("mqsar_bridge", warning)
                                    << "async send failed topic:" << topic << " " << ec.message();
                            }
                            else {
                                MQSAR_LOG("mqsar_bridge", trace)
                                    << "async send topic:" << topic << " id:" << id;
                            }
                        }
                    );
                }
                catch (backend_error const& e) {
                    MQSAR_LOG("mqsar_bridge", warning)
                        << MQSAR_ADD_VALUE(address, spep.get())
                        << "async send failed topic:" << topic << " " << e.what();
                }
                return;
            }

            try {
                auto id = p->send(force_move(msg.payload));
                MQSAR_LOG("mqsar_bridge", trace)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "sent topic:" << topic << " id:" << id;
            }
            catch (backend_error const& e) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "send failed topic:" << topic
                    << " packet_id:" << msg.packet_id << " " << e.what();
                return;
            }
            spep->write(puback_message(msg.packet_id));
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", error)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "publish_handler failed " << e.what();
        }
    }

    /**
     * @brief subscribe_handler
     *
     * SUBACK is written before any forwarding task starts. An entry whose
     * consumer cannot be created is skipped.
     */
    void subscribe_handler(con_sp_t const& spep, subscribe_message const& msg) {
        try {
            auto sk = registry_.attached_session(spep);
            if (!sk) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "SUBSCRIBE without session";
                spep->close();
                return;
            }

            std::vector<qos> granted;
            granted.reserve(msg.entries.size());
            for (auto const& e : msg.entries) granted.push_back(e.qos_value);
            spep->write(suback_message(msg.packet_id, force_move(granted)));

            for (auto const& e : msg.entries) {
                auto topic = topic_handler_(sk->username, sk->client_id, e.topic_filter);
                try {
                    bridge_key key(spep, topic);
                    if (auto prev = registry_.cancel_forwarding_task(key)) {
                        prev->wait();
                        // a message received by the stopped task is only
                        // redelivered on a fresh consumer
                        registry_.remove_consumer(*sk, topic);
                    }
                    auto cons = registry_.get_or_create_consumer(*sk, topic);
                    auto task = std::make_shared<forwarding_task>(
                        key,
                        e.qos_value,
                        force_move(cons),
                        config_.receive_timeout
                    );
                    if (auto displaced = registry_.register_forwarding_task(key, task)) {
                        displaced->wait();
                    }
                    task->start();
                }
                catch (std::exception const& ex) {
                    MQSAR_LOG("mqsar_bridge", error)
                        << MQSAR_ADD_VALUE(address, spep.get())
                        << "consumer unavailable topic:" << topic << " " << *sk << " " << ex.what();
                }
            }
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", error)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "subscribe_handler failed " << e.what();
        }
    }

    void unsubscribe_handler(con_sp_t const& spep, unsubscribe_message const& msg) {
        try {
            auto sk = registry_.attached_session(spep);
            if (!sk) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "UNSUBSCRIBE without session";
                spep->close();
                return;
            }

            for (auto const& topic_filter : msg.topic_filters) {
                auto topic = topic_handler_(sk->username, sk->client_id, topic_filter);
                if (auto task = registry_.cancel_forwarding_task(bridge_key(spep, topic))) {
                    task->wait();
                }
                registry_.remove_consumer(*sk, topic);
            }
            spep->write(unsuback_message(msg.packet_id));
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", error)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "unsubscribe_handler failed " << e.what();
        }
    }

    void pingreq_handler(con_sp_t const& spep) {
        try {
            spep->write(pingresp_message());
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", error)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "pingreq_handler failed " << e.what();
        }
    }

    void disconnect_handler(con_sp_t const& spep) {
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, spep.get())
            << "disconnect_handler";
        close_proc(spep);
    }

    /**
     * @brief close_handler
     *
     * Call this function when the connection layer has detected that the
     * connection is lost without DISCONNECT.
     */
    void close_handler(con_sp_t const& spep) {
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, spep.get())
            << "close_handler";
        close_proc(spep);
    }

    void puback_handler(con_sp_t const& spep, puback_message const& msg) {
        ignore_response(spep, msg.type(), msg.packet_id);
    }

    void pubrec_handler(con_sp_t const& spep, pubrec_message const& msg) {
        ignore_response(spep, msg.type(), msg.packet_id);
    }

    void pubrel_handler(con_sp_t const& spep, pubrel_message const& msg) {
        ignore_response(spep, msg.type(), msg.packet_id);
    }

    void pubcomp_handler(con_sp_t const& spep, pubcomp_message const& msg) {
        ignore_response(spep, msg.type(), msg.packet_id);
    }

private:
    static bool is_blank(std::string const& s) {
        return boost::algorithm::all(s, boost::algorithm::is_space());
    }

    static void reject_connect(con_sp_t const& spep, connect_return_code rc) {
        try {
            spep->write(connack_message(false, rc));
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", warning)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "CONNACK " << rc << " write failed " << e.what();
        }
        spep->close();
    }

    static void ignore_response(con_sp_t const& spep, control_packet_type type, packet_id_t packet_id) {
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, spep.get())
            << type << " ignored packet_id:" << packet_id;
    }

    void close_proc(con_sp_t const& spep) {
        try {
            if (auto sk = registry_.close_connection(spep)) {
                MQSAR_LOG("mqsar_bridge", info)
                    << MQSAR_ADD_VALUE(address, spep.get())
                    << "session closed " << *sk;
            }
            spep->close();
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", error)
                << MQSAR_ADD_VALUE(address, spep.get())
                << "close failed " << e.what();
        }
    }

    bridge_config config_;
    resource_registry registry_;
    security security_;
    topic_resolver resolver_;
    auth_handler auth_handler_;
    topic_handler topic_handler_;
};

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_BRIDGE_HPP
