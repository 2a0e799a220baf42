// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include "../common/test_main.hpp"
#include "../common/global_fixture.hpp"

#include <sstream>

#include <mqsar/bridge/security.hpp>

BOOST_AUTO_TEST_SUITE(ut_security)

namespace {

void load_config(MQSAR_NS::bridge::security& security, std::string const& value)
{
    std::stringstream input(value);
    security.load_json(input);
}

std::string json_remove_comments(std::string const& value) {
    std::stringstream value_input(value);
    return MQSAR_NS::bridge::json_remove_comments(value_input);
}

} // anonymous namespace

BOOST_AUTO_TEST_CASE(json_comments) {
    BOOST_CHECK(json_remove_comments("test") == "test");
    BOOST_CHECK(json_remove_comments("#test\ntest") == "\ntest");
    BOOST_CHECK(json_remove_comments("'#test'") == "'#test'");
    BOOST_CHECK(json_remove_comments("\"#test\"") == "\"#test\"");
    BOOST_CHECK(json_remove_comments("\"'#test'\"") == "\"'#test'\"");
    BOOST_CHECK(json_remove_comments("'\"#test\"'") == "'\"#test\"'");
    BOOST_CHECK(json_remove_comments("# it's\n\"a\"") == "\n\"a\"");
    BOOST_CHECK(json_remove_comments("") == "");
}

BOOST_AUTO_TEST_CASE(empty_table) {
    MQSAR_NS::bridge::security security;
    BOOST_TEST(!security.login("u1", "p1"));
    BOOST_TEST(!security.authenticate("u1", "p1", "cid1"));
}

BOOST_AUTO_TEST_CASE(plain_password_json) {
    MQSAR_NS::bridge::security security;

    std::string value = R"*(
        { # JSON Comment
            "authentication": [{
                "name": "u1",
                "method": "plain_password",
                "password": "mypassword"
            }, {
                "name": "u2",
                "method": "plain_password",
                "password": "#not a comment"
            }]
        }
    )*";
    load_config(security, value);

    BOOST_TEST(security.user_count() == 2);
    BOOST_TEST(security.login("u1", "mypassword").value() == "u1");
    BOOST_TEST(!security.login("u1", "other"));
    BOOST_TEST(!security.login("u3", "mypassword"));
    BOOST_TEST(security.authenticate("u2", "#not a comment", "cid1"));
    BOOST_TEST(!security.authenticate("u2", "", "cid1"));
}

BOOST_AUTO_TEST_CASE(add_plain_password) {
    MQSAR_NS::bridge::security security;
    security.add_plain_password("u1", "p1");
    BOOST_TEST(security.authenticate("u1", "p1", "any"));
    security.add_plain_password("u1", "p2");
    BOOST_TEST(!security.authenticate("u1", "p1", "any"));
    BOOST_TEST(security.authenticate("u1", "p2", "any"));
    BOOST_CHECK_THROW(security.add_plain_password("@group", "p"), std::runtime_error);
    BOOST_CHECK_THROW(security.add_plain_password("", "p"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(invalid_json) {
    {
        MQSAR_NS::bridge::security security;
        std::string value = R"*(
            { "authentication": [{ "name": "@u1", "method": "plain_password", "password": "p" }] }
        )*";
        BOOST_CHECK_THROW(load_config(security, value), std::runtime_error);
    }
    {
        MQSAR_NS::bridge::security security;
        std::string value = R"*(
            { "authentication": [{ "name": "u1", "method": "client_cert" }] }
        )*";
        BOOST_CHECK_THROW(load_config(security, value), std::runtime_error);
    }
    {
        MQSAR_NS::bridge::security security;
        std::string value = R"*(
            { "authentication": [{ "name": "u1", "method": "plain_password" }] }
        )*";
        BOOST_CHECK_THROW(load_config(security, value), std::exception);
    }
    {
        MQSAR_NS::bridge::security security;
        BOOST_CHECK_THROW(load_config(security, "{ not json"), std::exception);
    }
}

#if defined(MQSAR_USE_OPENSSL)

BOOST_AUTO_TEST_CASE(sha256_json) {
    MQSAR_NS::bridge::security security;

    // sha256("salt" + "mypassword")
    std::string digest = MQSAR_NS::bridge::security::sha256hash("saltmypassword");
    std::string value =
        R"*({ "authentication": [{ "name": "u1", "method": "sha256", "salt": "salt", "digest": ")*" +
        boost::algorithm::to_lower_copy(digest) +
        R"*(" }] })*";
    load_config(security, value);

    BOOST_TEST(security.login("u1", "mypassword").value() == "u1");
    BOOST_TEST(!security.login("u1", "saltmypassword"));
}

BOOST_AUTO_TEST_CASE(sha256_known_digest) {
    BOOST_TEST(
        MQSAR_NS::bridge::security::sha256hash("abc") ==
        "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"
    );
}

#else  // defined(MQSAR_USE_OPENSSL)

BOOST_AUTO_TEST_CASE(sha256_unavailable) {
    MQSAR_NS::bridge::security security;
    std::string value = R"*(
        { "authentication": [{ "name": "u1", "method": "sha256", "digest": "00" }] }
    )*";
    BOOST_CHECK_THROW(load_config(security, value), std::runtime_error);
}

#endif // defined(MQSAR_USE_OPENSSL)

BOOST_AUTO_TEST_SUITE_END()
