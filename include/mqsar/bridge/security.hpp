// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_SECURITY_HPP)
#define MQSAR_BRIDGE_SECURITY_HPP

#include <istream>
#include <iterator>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string.hpp>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/log.hpp>
#include <mqsar/move.hpp>
#include <mqsar/optional.hpp>
#include <mqsar/string_view.hpp>

#if defined(MQSAR_USE_OPENSSL)
#include <openssl/evp.h>
#endif // defined(MQSAR_USE_OPENSSL)

MQSAR_BRIDGE_NS_BEGIN

/** Remove comments from a JSON file (comments start with # and are not inside ' ' or " ") */
inline std::string json_remove_comments(std::istream& input) {
    bool inside_comment = false;
    bool inside_single_quote = false;
    bool inside_double_quote = false;

    std::ostringstream result;

    while (true) {
        char c;
        if (input.get(c).eof()) break;

        if (!inside_double_quote && !inside_single_quote && c == '#') inside_comment = true;
        if (!inside_comment && !inside_double_quote && c == '\'') inside_single_quote = !inside_single_quote;
        if (!inside_comment && !inside_single_quote && c == '"') inside_double_quote = !inside_double_quote;
        if (c == '\n') inside_comment = false;

        if (!inside_comment) result << c;
    }

    return result.str();
}

/**
 * @brief Username/password table used to authenticate CONNECT.
 *
 * Users come from a JSON file or are added in code. A user that is not
 * in the table is rejected.
 */
struct security {

    struct authentication {
        enum class method {
            sha256,
            plain_password
        };

        authentication(
            method auth_method = method::plain_password,
            std::string digest = std::string(),
            std::string salt = std::string()
        )
            : auth_method(auth_method),
              digest(force_move(digest)),
              salt(force_move(salt))
        {
        }

        method auth_method;
        std::string digest;
        std::string salt;
    };

    template<typename T>
    static std::string to_hex(T start, T end) {
        std::string result;
        boost::algorithm::hex(start, end, std::back_inserter(result));
        return result;
    }

#if defined(MQSAR_USE_OPENSSL)
    static std::string sha256hash(string_view message) {
        std::shared_ptr<EVP_MD_CTX> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), NULL);
        EVP_DigestUpdate(mdctx.get(), message.data(), message.size());

        std::vector<unsigned char> digest(static_cast<std::size_t>(EVP_MD_size(EVP_sha256())));
        unsigned int digest_size = static_cast<unsigned int>(digest.size());

        EVP_DigestFinal_ex(mdctx.get(), digest.data(), &digest_size);
        return to_hex(digest.data(), digest.data() + digest_size);
    }
#endif // defined(MQSAR_USE_OPENSSL)

    static bool is_valid_user_name(string_view name) {
        return !name.empty() && name[0] != '@';
    }

    /**
     * @brief check the credentials of a user
     * @return the username on success, nullopt otherwise
     */
    optional<std::string> login(string_view username, string_view password) const {
        auto i = authentication_.find(std::string(username));
        if (i == authentication_.end()) return nullopt;

        switch (i->second.auth_method) {
        case authentication::method::plain_password:
            if (i->second.digest == password) return std::string(username);
            return nullopt;
        case authentication::method::sha256:
#if defined(MQSAR_USE_OPENSSL)
            if (boost::iequals(
                    i->second.digest,
                    sha256hash(i->second.salt + std::string(password))
                )
            ) {
                return std::string(username);
            }
#endif // defined(MQSAR_USE_OPENSSL)
            return nullopt;
        }
        return nullopt;
    }

    /**
     * @brief auth handler of bridge_t
     *
     * The client id does not take part in the decision.
     */
    bool authenticate(std::string const& username, std::string const& password, std::string const& client_id) const {
        auto result = login(username, password);
        if (!result) {
            MQSAR_LOG("mqsar_bridge", info)
                << "authentication failed username:" << username
                << " client_id:" << client_id;
            return false;
        }
        return true;
    }

    void add_plain_password(std::string const& name, std::string const& password) {
        if (!is_valid_user_name(name)) {
            throw std::runtime_error("An invalid username was specified: " + name);
        }
        authentication_[name] = authentication(authentication::method::plain_password, password);
    }

    void load_json(std::istream& input) {
        boost::property_tree::ptree root;

        std::istringstream input_without_comments(json_remove_comments(input));
        boost::property_tree::read_json(input_without_comments, root);

        for (auto const& i: root.get_child("authentication")) {
            std::string name = i.second.get<std::string>("name");
            if (!is_valid_user_name(name)) {
                throw std::runtime_error("An invalid username was specified: " + name);
            }

            std::string method = i.second.get<std::string>("method");

            if (method == "sha256") {
#if defined(MQSAR_USE_OPENSSL)
                std::string digest = i.second.get<std::string>("digest");
                std::string salt = i.second.get<std::string>("salt", "");
                if (salt.empty()) {
                    MQSAR_LOG("mqsar_bridge", warning)
                        << "user " << name << " has no salt specified";
                }

                authentication auth(authentication::method::sha256, digest, salt);
                authentication_[name] = auth;
#else  // defined(MQSAR_USE_OPENSSL)
                throw std::runtime_error("sha256 requires MQSAR_USE_OPENSSL, user: " + name);
#endif // defined(MQSAR_USE_OPENSSL)
            }
            else if (method == "plain_password") {
                std::string password = i.second.get<std::string>("password");

                authentication auth(authentication::method::plain_password, password);
                authentication_[name] = auth;
            }
            else {
                throw std::runtime_error("An invalid method was specified: " + method);
            }
        }
    }

    std::size_t user_count() const {
        return authentication_.size();
    }

    std::map<std::string, authentication> authentication_;
};

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_SECURITY_HPP
