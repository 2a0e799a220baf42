// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_MEMORY_BACKEND_HPP)
#define MQSAR_MEMORY_BACKEND_HPP

#include <mqsar/config.hpp>

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>

#include <mqsar/namespace.hpp>
#include <mqsar/backend.hpp>
#include <mqsar/log.hpp>
#include <mqsar/move.hpp>

namespace MQSAR_NS {

namespace as = boost::asio;

namespace detail {

struct memory_subscription {
    std::size_t cursor = 0;
    std::set<std::int64_t> unacked;
};

struct memory_topic {
    explicit memory_topic(std::int64_t ledger_id)
        :ledger_id(ledger_id) {}

    std::int64_t ledger_id;
    std::vector<std::string> entries;
    std::map<std::string, memory_subscription> subscriptions;
};

struct memory_state {
    memory_topic& get_topic(std::string const& name) {
        auto it = topics.find(name);
        if (it == topics.end()) {
            it = topics.emplace(name, memory_topic(static_cast<std::int64_t>(topics.size()))).first;
        }
        return it->second;
    }

    std::mutex mtx;
    std::condition_variable cv;
    bool available = true;
    std::map<std::string, memory_topic> topics;
    std::size_t producers_created = 0;
    std::size_t consumers_created = 0;
};

class memory_producer : public producer, public std::enable_shared_from_this<memory_producer> {
public:
    memory_producer(
        std::shared_ptr<memory_state> state,
        as::thread_pool::executor_type exec,
        std::string topic)
        :state_(force_move(state)),
         exec_(force_move(exec)),
         topic_(force_move(topic)) {}

    std::string const& topic() const override {
        return topic_;
    }

    message_id send(std::string payload) override {
        message_id id;
        {
            std::lock_guard<std::mutex> g(state_->mtx);
            if (closed_) throw backend_error("producer already closed: " + topic_);
            if (!state_->available) throw backend_unavailable("cannot send to " + topic_);
            auto& t = state_->get_topic(topic_);
            t.entries.push_back(force_move(payload));
            id.ledger_id = t.ledger_id;
            id.entry_id = static_cast<std::int64_t>(t.entries.size() - 1);
        }
        state_->cv.notify_all();
        return id;
    }

    void async_send(std::string payload, send_handler h) override {
        as::post(
            exec_,
            [self = shared_from_this(), payload = force_move(payload), h = force_move(h)]
            () mutable {
                error_code ec;
                message_id id;
                try {
                    id = self->send(force_move(payload));
                }
                catch (backend_error const& e) {
                    MQSAR_LOG("mqsar_backend", warning)
                        << MQSAR_ADD_VALUE(address, self.get())
                        << e.what();
                    ec = boost::system::errc::make_error_code(boost::system::errc::not_connected);
                }
                h(ec, id);
            }
        );
    }

    void close() override {
        std::lock_guard<std::mutex> g(state_->mtx);
        closed_ = true;
    }

private:
    std::shared_ptr<memory_state> state_;
    as::thread_pool::executor_type exec_;
    std::string topic_;
    bool closed_ = false; // guarded by state_->mtx
};

class memory_consumer : public consumer {
public:
    memory_consumer(
        std::shared_ptr<memory_state> state,
        std::string topic,
        std::string subscription)
        :state_(force_move(state)),
         topic_(force_move(topic)),
         subscription_(force_move(subscription)) {}

    std::string const& topic() const override {
        return topic_;
    }

    std::string const& subscription() const override {
        return subscription_;
    }

    optional<backend_message> receive(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lk(state_->mtx);
        auto& t = state_->get_topic(topic_);
        auto& s = t.subscriptions[subscription_];
        state_->cv.wait_for(
            lk,
            timeout,
            [&] {
                return closed_ || !state_->available || s.cursor < t.entries.size();
            }
        );
        if (closed_) throw backend_error("consumer already closed: " + topic_);
        if (!state_->available) throw backend_unavailable("cannot receive from " + topic_);
        if (s.cursor >= t.entries.size()) return nullopt;

        auto entry = s.cursor++;
        s.unacked.insert(static_cast<std::int64_t>(entry));
        message_id id;
        id.ledger_id = t.ledger_id;
        id.entry_id = static_cast<std::int64_t>(entry);
        return backend_message(id, topic_, t.entries[entry]);
    }

    void acknowledge(message_id const& id) override {
        std::lock_guard<std::mutex> g(state_->mtx);
        if (closed_) throw backend_error("consumer already closed: " + topic_);
        if (!state_->available) throw backend_unavailable("cannot acknowledge on " + topic_);
        state_->get_topic(topic_).subscriptions[subscription_].unacked.erase(id.entry_id);
    }

    void close() override {
        {
            std::lock_guard<std::mutex> g(state_->mtx);
            if (closed_) return;
            closed_ = true;
            // rewind so that unacknowledged messages are delivered again
            auto& s = state_->get_topic(topic_).subscriptions[subscription_];
            if (!s.unacked.empty()) {
                s.cursor = std::min(s.cursor, static_cast<std::size_t>(*s.unacked.begin()));
                s.unacked.clear();
            }
        }
        state_->cv.notify_all();
    }

private:
    std::shared_ptr<memory_state> state_;
    std::string topic_;
    std::string subscription_;
    bool closed_ = false; // guarded by state_->mtx
};

} // namespace detail

/**
 * @brief In-process backend with Pulsar-like topic and subscription semantics.
 *
 * Topics are append-only logs. A subscription is created at the latest
 * position when its first consumer is created, and keeps its cursor when
 * consumers come and go. Closing a consumer rewinds the cursor to the oldest
 * unacknowledged message.
 *
 * async_send completions run on an internal thread pool. The backend must
 * outlive every producer and consumer it created.
 */
class memory_backend : public client {
public:
    memory_backend()
        :state_(std::make_shared<detail::memory_state>()),
         pool_(1) {}

    ~memory_backend() override {
        pool_.join();
    }

    std::shared_ptr<producer> create_producer(std::string const& topic) override {
        std::lock_guard<std::mutex> g(state_->mtx);
        if (!state_->available) throw backend_unavailable("cannot create producer for " + topic);
        state_->get_topic(topic);
        ++state_->producers_created;
        MQSAR_LOG("mqsar_backend", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "create producer topic:" << topic;
        return std::make_shared<detail::memory_producer>(state_, pool_.get_executor(), topic);
    }

    std::shared_ptr<consumer> create_consumer(
        std::string const& topic,
        std::string const& subscription) override {
        std::lock_guard<std::mutex> g(state_->mtx);
        if (!state_->available) throw backend_unavailable("cannot create consumer for " + topic);
        auto& t = state_->get_topic(topic);
        if (t.subscriptions.find(subscription) == t.subscriptions.end()) {
            t.subscriptions[subscription].cursor = t.entries.size();
        }
        ++state_->consumers_created;
        MQSAR_LOG("mqsar_backend", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "create consumer topic:" << topic << " subscription:" << subscription;
        return std::make_shared<detail::memory_consumer>(state_, topic, subscription);
    }

    // [begin] for test setting
    /**
     * @brief simulate an outage
     *
     * @param b - if false, creation, send, receive and acknowledge fail
     *            with backend_unavailable.
     */
    void set_available(bool b) {
        {
            std::lock_guard<std::mutex> g(state_->mtx);
            state_->available = b;
        }
        state_->cv.notify_all();
    }

    std::size_t producers_created() const {
        std::lock_guard<std::mutex> g(state_->mtx);
        return state_->producers_created;
    }

    std::size_t consumers_created() const {
        std::lock_guard<std::mutex> g(state_->mtx);
        return state_->consumers_created;
    }

    std::size_t message_count(std::string const& topic) const {
        std::lock_guard<std::mutex> g(state_->mtx);
        auto it = state_->topics.find(topic);
        if (it == state_->topics.end()) return 0;
        return it->second.entries.size();
    }
    // [end] for test setting

private:
    std::shared_ptr<detail::memory_state> state_;
    as::thread_pool pool_;
};

} // namespace MQSAR_NS

#endif // MQSAR_MEMORY_BACKEND_HPP
