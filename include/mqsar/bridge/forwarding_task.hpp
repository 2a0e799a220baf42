// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_FORWARDING_TASK_HPP)
#define MQSAR_BRIDGE_FORWARDING_TASK_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/bridge/bridge_key.hpp>
#include <mqsar/bridge/common_type.hpp>
#include <mqsar/backend.hpp>
#include <mqsar/log.hpp>
#include <mqsar/message_variant.hpp>
#include <mqsar/move.hpp>
#include <mqsar/optional.hpp>
#include <mqsar/qos.hpp>

MQSAR_BRIDGE_NS_BEGIN

/**
 * @brief Moves messages of one backend consumer to one client connection.
 *
 * Each iteration receives one message, writes it to the connection as a
 * PUBLISH and then acknowledges it to the backend. The task runs on its own
 * thread from start() until it is cancelled (stopped) or the consumer
 * fails (failed). It is never restarted.
 */
class forwarding_task : public std::enable_shared_from_this<forwarding_task> {
public:
    enum class state {
        running,
        stopped,
        failed
    };

    forwarding_task(
        bridge_key key,
        qos qos_value,
        std::shared_ptr<consumer> cons,
        std::chrono::milliseconds receive_timeout)
        :key_(force_move(key)),
         qos_value_(qos_value),
         consumer_(force_move(cons)),
         receive_timeout_(receive_timeout) {}

    forwarding_task(forwarding_task const&) = delete;
    forwarding_task& operator=(forwarding_task const&) = delete;

    ~forwarding_task() {
        cancel();
        if (thread_.joinable()) {
            // The last reference can be released by the task thread itself.
            if (thread_.get_id() == std::this_thread::get_id()) {
                thread_.detach();
            }
            else {
                thread_.join();
            }
        }
    }

    /**
     * @brief Spawn the task thread. Call once.
     *
     * The thread keeps the task alive until the loop has exited.
     */
    void start() {
        std::lock_guard<std::mutex> g(mtx_thread_);
        thread_ = std::thread(
            [self = shared_from_this()] {
                self->run();
            }
        );
    }

    /**
     * @brief Request the loop to exit. Idempotent and non-blocking.
     */
    void cancel() {
        cancelled_ = true;
    }

    /**
     * @brief Block until the loop has exited.
     *
     * Returns immediately when called from the task thread.
     */
    void wait() {
        std::lock_guard<std::mutex> g(mtx_thread_);
        if (!thread_.joinable()) return;
        if (thread_.get_id() == std::this_thread::get_id()) return;
        thread_.join();
    }

    state get_state() const {
        return state_;
    }

    bool cancelled() const {
        return cancelled_;
    }

    bridge_key const& key() const {
        return key_;
    }

    qos get_qos() const {
        return qos_value_;
    }

private:
    void run() {
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "forwarding start " << key_ << " qos:" << qos_value_;
        while (!cancelled_) {
            optional<backend_message> msg;
            try {
                msg = consumer_->receive(receive_timeout_);
            }
            catch (std::exception const& e) {
                if (cancelled_) break;
                MQSAR_LOG("mqsar_bridge", error)
                    << MQSAR_ADD_VALUE(address, this)
                    << "receive failed " << key_ << " " << e.what();
                state_ = state::failed;
                return;
            }
            if (!msg) continue;
            // the message stays unacknowledged and the owner of the consumer
            // closes it so that the backend redelivers it
            if (cancelled_) break;

            try {
                key_.con->write(
                    publish_message(
                        msg->topic_name,
                        msg->payload,
                        qos_value_,
                        0
                    )
                );
            }
            catch (std::exception const& e) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, this)
                    << "deliver failed " << key_ << " id:" << msg->id << " " << e.what();
            }

            try {
                consumer_->acknowledge(msg->id);
            }
            catch (std::exception const& e) {
                MQSAR_LOG("mqsar_bridge", warning)
                    << MQSAR_ADD_VALUE(address, this)
                    << "acknowledge failed " << key_ << " id:" << msg->id << " " << e.what();
            }
        }
        state_ = state::stopped;
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "forwarding stopped " << key_;
    }

    bridge_key key_;
    qos qos_value_;
    std::shared_ptr<consumer> consumer_;
    std::chrono::milliseconds receive_timeout_;
    std::atomic<bool> cancelled_ { false };
    std::atomic<state> state_ { state::running };
    std::mutex mtx_thread_;
    std::thread thread_;
};

inline
char const* forwarding_task_state_to_str(forwarding_task::state v) {
    switch (v) {
    case forwarding_task::state::running: return "running";
    case forwarding_task::state::stopped: return "stopped";
    case forwarding_task::state::failed:  return "failed";
    }
    return "unknown_state";
}

inline
std::ostream& operator<<(std::ostream& os, forwarding_task::state val)
{
    os << forwarding_task_state_to_str(val);
    return os;
}

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_FORWARDING_TASK_HPP
