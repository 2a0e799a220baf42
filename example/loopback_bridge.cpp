// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

// Runs the bridge against the in-process backend. One client subscribes,
// another one publishes, and every packet the bridge writes is printed.

#include <mqsar/config.hpp>
#include <mqsar/setup_log.hpp>
#include <mqsar/memory_backend.hpp>
#include <mqsar/bridge/bridge.hpp>
#include <boost/program_options.hpp>
#include <boost/format.hpp>

#include <condition_variable>
#include <fstream>
#include <mutex>

#include "locked_cout.hpp"

namespace mb = MQSAR_NS::bridge;

class console_connection : public MQSAR_NS::connection {
public:
    explicit console_connection(std::string name)
        :name_(MQSAR_NS::force_move(name)) {}

    void write(MQSAR_NS::message_variant msg) override {
        auto type = MQSAR_NS::packet_type(msg);
        if (type == MQSAR_NS::control_packet_type::publish) {
            auto const& p = MQSAR_NS::variant_get<MQSAR_NS::publish_message>(msg);
            locked_cout()
                << "[" << name_ << "] publish"
                << " topic:" << p.topic_name
                << " qos:" << p.qos_value
                << " payload:" << p.payload
                << std::endl;
            std::lock_guard<std::mutex> g(mtx_);
            ++received_;
            cv_.notify_all();
        }
        else {
            locked_cout() << "[" << name_ << "] " << type << std::endl;
        }
    }

    void close() override {
        locked_cout() << "[" << name_ << "] close" << std::endl;
    }

    std::string remote_address() const override {
        return "loopback:" + name_;
    }

    bool wait_received(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&] { return received_ >= n; });
    }

private:
    std::string name_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::size_t received_ = 0;
};

void run_loopback(boost::program_options::variables_map const& vm) {
    try {
        MQSAR_NS::memory_backend backend;

        mb::bridge_config config;
        config.receive_timeout = std::chrono::milliseconds(vm["receive_timeout_ms"].as<unsigned int>());
        mb::bridge_t b(backend, config);

        b.set_topic_resolver(
            mb::topic_resolver(
                vm["pulsar.tenant"].as<std::string>(),
                vm["pulsar.namespace"].as<std::string>(),
                vm["pulsar.per_user_namespace"].as<bool>()
            )
        );

        std::string auth_file = vm["auth_file"].as<std::string>();
        std::ifstream input(auth_file);
        if (!auth_file.empty() && input) {
            MQSAR_LOG("mqsar_bridge", info)
                << "auth_file:" << auth_file;
            b.get_security().load_json(input);
        }
        else {
            MQSAR_LOG("mqsar_bridge", warning)
                << "auth_file '" << auth_file << "' not found, every client is accepted";
            b.set_auth_handler(
                [](std::string const&, std::string const&, std::string const&) {
                    return true;
                }
            );
        }

        auto username = vm["username"].as<std::string>();
        auto password = vm["password"].as<std::string>();
        auto topic = vm["topic"].as<std::string>();
        auto messages = vm["messages"].as<std::size_t>();

        auto sub = std::make_shared<console_connection>("sub");
        auto pub = std::make_shared<console_connection>("pub");

        b.connect_handler(sub, MQSAR_NS::connect_message("loopback_sub", username, password));
        b.connect_handler(pub, MQSAR_NS::connect_message("loopback_pub", username, password));
        if (!b.session(sub) || !b.session(pub)) {
            locked_cout() << "connect refused" << std::endl;
            return;
        }

        std::vector<MQSAR_NS::subscribe_entry> entries {
            MQSAR_NS::subscribe_entry(topic, MQSAR_NS::qos::at_least_once)
        };
        b.subscribe_handler(sub, MQSAR_NS::subscribe_message(1, entries));

        for (std::size_t i = 0; i != messages; ++i) {
            b.publish_handler(
                pub,
                MQSAR_NS::publish_message(
                    topic,
                    "message " + std::to_string(i),
                    i % 2 == 0 ? MQSAR_NS::qos::at_least_once : MQSAR_NS::qos::at_most_once,
                    static_cast<MQSAR_NS::packet_id_t>(i + 1)
                )
            );
        }

        if (!sub->wait_received(messages, std::chrono::seconds(5))) {
            locked_cout() << "timeout" << std::endl;
        }

        b.disconnect_handler(pub);
        b.disconnect_handler(sub);
    }
    catch (std::exception const& e) {
        MQSAR_LOG("mqsar_bridge", error) << e.what();
    }
}

int main(int argc, char **argv) {
    try {
        boost::program_options::options_description desc;

        boost::program_options::options_description general_desc("General options");
        general_desc.add_options()
            ("help", "produce help message")
            (
                "cfg",
                boost::program_options::value<std::string>()->default_value("bridge.conf"),
                "Load configuration file"
            )
            (
                "verbose",
                boost::program_options::value<unsigned int>()->default_value(1),
                "set verbose level, possible values:\n 0 - Fatal\n 1 - Error\n 2 - Warning\n 3 - Info\n 4 - Debug\n 5 - Trace"
            )
            (
                "auth_file",
                boost::program_options::value<std::string>()->default_value("auth.json"),
                "Authentication file"
            )
            (
                "receive_timeout_ms",
                boost::program_options::value<unsigned int>()->default_value(100),
                "Upper bound of one backend receive in a forwarding task"
            )
            ;

        boost::program_options::options_description pulsar_desc("Pulsar topic options");
        pulsar_desc.add_options()
            ("pulsar.tenant", boost::program_options::value<std::string>()->default_value("public"), "tenant of resolved topics")
            ("pulsar.namespace", boost::program_options::value<std::string>()->default_value("default"), "namespace of resolved topics")
            ("pulsar.per_user_namespace", boost::program_options::value<bool>()->default_value(false), "use the username as namespace")
            ;

        boost::program_options::options_description demo_desc("Demo options");
        demo_desc.add_options()
            ("username", boost::program_options::value<std::string>()->default_value("demo"), "username of both clients")
            ("password", boost::program_options::value<std::string>()->default_value("demo"), "password of both clients")
            ("topic", boost::program_options::value<std::string>()->default_value("demo/topic"), "MQTT topic")
            ("messages", boost::program_options::value<std::size_t>()->default_value(4), "number of messages to publish")
            ;

        desc.add(general_desc).add(pulsar_desc).add(demo_desc);

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc), vm);

        std::string config_file = vm["cfg"].as<std::string>();
        if (!config_file.empty()) {
            std::ifstream input(vm["cfg"].as<std::string>());
            if (input.good()) {
                boost::program_options::store(boost::program_options::parse_config_file(input, desc), vm);
            }
            else
            {
                std::cerr << "Configuration file '" << config_file << "' not found, bridge doesn't use configuration file." << std::endl;
            }
        }

        boost::program_options::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 1;
        }

        std::cout << "Set options:" << std::endl;
        for (auto const& e : vm) {
            std::cout << boost::format("%-28s") % e.first.c_str() << " : ";
            if (auto p = boost::any_cast<std::string>(&e.second.value())) {
                std::cout << *p;
            }
            else if (auto p = boost::any_cast<std::size_t>(&e.second.value())) {
                std::cout << *p;
            }
            else if (auto p = boost::any_cast<unsigned int>(&e.second.value())) {
                std::cout << *p;
            }
            else if (auto p = boost::any_cast<bool>(&e.second.value())) {
                std::cout << std::boolalpha << *p;
            }
            std::cout << std::endl;
        }

#if defined(MQSAR_USE_LOG)
        switch (vm["verbose"].as<unsigned int>()) {
        case 5:
            MQSAR_NS::setup_log(MQSAR_NS::severity_level::trace);
            break;
        case 4:
            MQSAR_NS::setup_log(MQSAR_NS::severity_level::debug);
            break;
        case 3:
            MQSAR_NS::setup_log(MQSAR_NS::severity_level::info);
            break;
        case 2:
            MQSAR_NS::setup_log(MQSAR_NS::severity_level::warning);
            break;
        default:
            MQSAR_NS::setup_log(MQSAR_NS::severity_level::error);
            break;
        case 0:
            MQSAR_NS::setup_log(MQSAR_NS::severity_level::fatal);
            break;
        }
#else
        MQSAR_NS::setup_log();
#endif

        run_loopback(vm);
    } catch(std::exception &e) {
        std::cerr << e.what() << std::endl;
    }
}
