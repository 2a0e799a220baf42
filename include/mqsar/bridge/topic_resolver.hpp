// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_TOPIC_RESOLVER_HPP)
#define MQSAR_BRIDGE_TOPIC_RESOLVER_HPP

#include <string>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/move.hpp>
#include <mqsar/string_view.hpp>

MQSAR_BRIDGE_NS_BEGIN

/**
 * @brief Maps MQTT topic names to persistent://tenant/namespace/local topics.
 *
 * The local part is the MQTT topic with every character outside the URI
 * unreserved set percent encoded.
 */
class topic_resolver {
public:
    topic_resolver(
        std::string tenant = "public",
        std::string ns = "default",
        bool per_user_namespace = false)
        :tenant_(force_move(tenant)),
         ns_(force_move(ns)),
         per_user_namespace_(per_user_namespace) {}

    // topic handler of bridge_t
    std::string resolve(std::string const& username, std::string const& /*client_id*/, std::string const& topic) const {
        std::string ret("persistent://");
        ret += tenant_;
        ret += '/';
        ret += per_user_namespace_ ? encode(username) : ns_;
        ret += '/';
        ret += encode(topic);
        return ret;
    }

    static std::string encode(string_view str) {
        static constexpr char const hex[] = "0123456789ABCDEF";
        std::string ret;
        ret.reserve(str.size());
        for (char c : str) {
            if (is_unreserved(c)) {
                ret.push_back(c);
            }
            else {
                auto uc = static_cast<unsigned char>(c);
                ret.push_back('%');
                ret.push_back(hex[uc >> 4]);
                ret.push_back(hex[uc & 0x0f]);
            }
        }
        return ret;
    }

    std::string const& tenant() const {
        return tenant_;
    }

    std::string const& get_namespace() const {
        return ns_;
    }

    bool per_user_namespace() const {
        return per_user_namespace_;
    }

private:
    static bool is_unreserved(char c) {
        return
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '.' || c == '_' || c == '~';
    }

    std::string tenant_;
    std::string ns_;
    bool per_user_namespace_;
};

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_TOPIC_RESOLVER_HPP
