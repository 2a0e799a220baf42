// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_TEST_MOCK_BACKEND_HPP)
#define MQSAR_TEST_MOCK_BACKEND_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/system/error_code.hpp>

#include <mqsar/backend.hpp>
#include <mqsar/exception.hpp>

#include "event_journal.hpp"

// Scripted backend. Messages are pushed per topic by the test and handed to
// any consumer of the topic. Every call is written to the journal.
class mock_backend : public MQSAR_NS::client {
    struct state {
        std::shared_ptr<event_journal> journal;
        std::mutex mtx;
        std::condition_variable cv;

        std::map<std::string, std::deque<MQSAR_NS::backend_message>> queues;
        std::map<MQSAR_NS::message_id, std::string> payloads;
        std::vector<std::pair<std::string, std::string>> sent;
        std::vector<std::string> acked;
        std::int64_t next_entry = 0;

        std::size_t producers_created = 0;
        std::size_t consumers_created = 0;
        std::size_t producer_close_calls = 0;
        std::size_t consumer_close_calls = 0;

        bool unavailable = false;
        std::set<std::string> unavailable_topics;
        bool fail_send = false;
        bool fail_receive = false;
        bool fail_ack = false;
        bool fail_close = false;
        bool foreign_errors = false;
        std::chrono::milliseconds create_delay { 0 };

        void record(std::string ev) {
            if (journal) journal->push(std::move(ev));
        }

        // failure of an adapter that does not map its errors to backend_error
        [[noreturn]] void fail(char const* what) const {
            if (foreign_errors) throw std::runtime_error(what);
            throw MQSAR_NS::backend_error(what);
        }
    };

    class mock_producer : public MQSAR_NS::producer {
    public:
        mock_producer(std::shared_ptr<state> st, std::string topic)
            :st_(std::move(st)), topic_(std::move(topic)) {}

        std::string const& topic() const override { return topic_; }

        MQSAR_NS::message_id send(std::string payload) override {
            std::lock_guard<std::mutex> g(st_->mtx);
            if (st_->fail_send) {
                st_->record("send_failed:" + payload);
                throw MQSAR_NS::backend_error("send failed");
            }
            st_->record("send:" + payload);
            st_->sent.emplace_back(topic_, std::move(payload));
            st_->cv.notify_all();
            return MQSAR_NS::message_id { 0, st_->next_entry++ };
        }

        void async_send(std::string payload, send_handler h) override {
            MQSAR_NS::error_code ec;
            MQSAR_NS::message_id id;
            {
                std::lock_guard<std::mutex> g(st_->mtx);
                if (st_->fail_send) {
                    st_->record("async_send_failed:" + payload);
                    ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
                }
                else {
                    st_->record("async_send:" + payload);
                    st_->sent.emplace_back(topic_, std::move(payload));
                    id = MQSAR_NS::message_id { 0, st_->next_entry++ };
                    st_->cv.notify_all();
                }
            }
            h(ec, id);
        }

        void close() override {
            std::lock_guard<std::mutex> g(st_->mtx);
            ++st_->producer_close_calls;
            st_->record("producer_close:" + topic_);
            if (st_->fail_close) throw MQSAR_NS::backend_error("close failed");
        }

    private:
        std::shared_ptr<state> st_;
        std::string topic_;
    };

    class mock_consumer : public MQSAR_NS::consumer {
    public:
        mock_consumer(std::shared_ptr<state> st, std::string topic, std::string subscription)
            :st_(std::move(st)), topic_(std::move(topic)), subscription_(std::move(subscription)) {}

        std::string const& topic() const override { return topic_; }
        std::string const& subscription() const override { return subscription_; }

        MQSAR_NS::optional<MQSAR_NS::backend_message> receive(std::chrono::milliseconds timeout) override {
            std::unique_lock<std::mutex> lk(st_->mtx);
            auto& q = st_->queues[topic_];
            st_->cv.wait_for(
                lk,
                timeout,
                [&] { return closed_ || st_->fail_receive || !q.empty(); }
            );
            if (closed_) throw MQSAR_NS::backend_error("consumer closed");
            if (st_->fail_receive) st_->fail("receive failed");
            if (q.empty()) return MQSAR_NS::nullopt;
            auto msg = q.front();
            q.pop_front();
            st_->record("receive:" + msg.payload);
            return msg;
        }

        void acknowledge(MQSAR_NS::message_id const& id) override {
            std::lock_guard<std::mutex> g(st_->mtx);
            auto const& payload = st_->payloads[id];
            if (st_->fail_ack) {
                st_->record("ack_failed:" + payload);
                st_->fail("acknowledge failed");
            }
            st_->record("ack:" + payload);
            st_->acked.push_back(payload);
            st_->cv.notify_all();
        }

        void close() override {
            std::lock_guard<std::mutex> g(st_->mtx);
            closed_ = true;
            ++st_->consumer_close_calls;
            st_->record("consumer_close:" + topic_);
            st_->cv.notify_all();
            if (st_->fail_close) throw MQSAR_NS::backend_error("close failed");
        }

    private:
        std::shared_ptr<state> st_;
        std::string topic_;
        std::string subscription_;
        bool closed_ = false;
    };

public:
    explicit mock_backend(std::shared_ptr<event_journal> journal = nullptr)
        :st_(std::make_shared<state>()) {
        st_->journal = std::move(journal);
    }

    std::shared_ptr<MQSAR_NS::producer> create_producer(std::string const& topic) override {
        delay();
        std::lock_guard<std::mutex> g(st_->mtx);
        if (st_->unavailable || st_->unavailable_topics.count(topic)) {
            throw MQSAR_NS::backend_unavailable(topic);
        }
        ++st_->producers_created;
        st_->record("create_producer:" + topic);
        return std::make_shared<mock_producer>(st_, topic);
    }

    std::shared_ptr<MQSAR_NS::consumer> create_consumer(
        std::string const& topic,
        std::string const& subscription) override {
        delay();
        std::lock_guard<std::mutex> g(st_->mtx);
        if (st_->unavailable || st_->unavailable_topics.count(topic)) {
            throw MQSAR_NS::backend_unavailable(topic);
        }
        ++st_->consumers_created;
        st_->record("create_consumer:" + topic + ":" + subscription);
        return std::make_shared<mock_consumer>(st_, topic, subscription);
    }

    // make a message available to the consumers of the topic
    void push(std::string const& topic, std::string const& payload) {
        std::lock_guard<std::mutex> g(st_->mtx);
        MQSAR_NS::message_id id { 1, st_->next_entry++ };
        st_->payloads[id] = payload;
        st_->queues[topic].emplace_back(id, topic, payload);
        st_->cv.notify_all();
    }

    std::size_t pending(std::string const& topic) const {
        std::lock_guard<std::mutex> g(st_->mtx);
        auto it = st_->queues.find(topic);
        if (it == st_->queues.end()) return 0;
        return it->second.size();
    }

    bool wait_acked(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        std::unique_lock<std::mutex> lk(st_->mtx);
        return st_->cv.wait_for(lk, timeout, [&] { return st_->acked.size() >= n; });
    }

    bool wait_sent(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        std::unique_lock<std::mutex> lk(st_->mtx);
        return st_->cv.wait_for(lk, timeout, [&] { return st_->sent.size() >= n; });
    }

    std::vector<std::pair<std::string, std::string>> sent() const {
        std::lock_guard<std::mutex> g(st_->mtx);
        return st_->sent;
    }

    std::vector<std::string> acked() const {
        std::lock_guard<std::mutex> g(st_->mtx);
        return st_->acked;
    }

    std::size_t producers_created() const { return get(&state::producers_created); }
    std::size_t consumers_created() const { return get(&state::consumers_created); }
    std::size_t producer_close_calls() const { return get(&state::producer_close_calls); }
    std::size_t consumer_close_calls() const { return get(&state::consumer_close_calls); }

    void set_unavailable(bool b) { set(&state::unavailable, b); }
    void set_fail_send(bool b) { set(&state::fail_send, b); }
    void set_fail_receive(bool b) {
        set(&state::fail_receive, b);
        st_->cv.notify_all();
    }
    void set_fail_ack(bool b) { set(&state::fail_ack, b); }
    void set_fail_close(bool b) { set(&state::fail_close, b); }
    void set_foreign_errors(bool b) { set(&state::foreign_errors, b); }
    void set_create_delay(std::chrono::milliseconds d) { set(&state::create_delay, d); }

    void set_unavailable_topic(std::string const& topic) {
        std::lock_guard<std::mutex> g(st_->mtx);
        st_->unavailable_topics.insert(topic);
    }

private:
    template <typename T>
    T get(T state::* m) const {
        std::lock_guard<std::mutex> g(st_->mtx);
        return (*st_).*m;
    }

    template <typename T>
    void set(T state::* m, T v) {
        std::lock_guard<std::mutex> g(st_->mtx);
        (*st_).*m = v;
    }

    void delay() {
        auto d = get(&state::create_delay);
        if (d.count() > 0) std::this_thread::sleep_for(d);
    }

    std::shared_ptr<state> st_;
};

#endif // MQSAR_TEST_MOCK_BACKEND_HPP
