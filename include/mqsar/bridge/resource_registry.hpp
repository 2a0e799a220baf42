// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_BRIDGE_RESOURCE_REGISTRY_HPP)
#define MQSAR_BRIDGE_RESOURCE_REGISTRY_HPP

#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/member.hpp>

#include <mqsar/bridge/bridge_namespace.hpp>
#include <mqsar/bridge/bridge_key.hpp>
#include <mqsar/bridge/common_type.hpp>
#include <mqsar/bridge/forwarding_task.hpp>
#include <mqsar/bridge/mutex.hpp>
#include <mqsar/bridge/session_key.hpp>
#include <mqsar/bridge/tags.hpp>
#include <mqsar/bridge/topic_key.hpp>
#include <mqsar/bridge/topic_resolver.hpp>
#include <mqsar/backend.hpp>
#include <mqsar/log.hpp>
#include <mqsar/move.hpp>
#include <mqsar/optional.hpp>

MQSAR_BRIDGE_NS_BEGIN

namespace mi = boost::multi_index;

/**
 * @brief backend subscription name of a session
 *
 * Both parts are percent encoded so '@' separates them unambiguously.
 */
inline std::string subscription_name(session_key const& sk) {
    return topic_resolver::encode(sk.client_id) + '@' + topic_resolver::encode(sk.username);
}

/**
 * @brief Owner of every backend handle and forwarding task of the bridge.
 *
 * All maps are guarded by one shared_timed_mutex. Every mutation, including
 * the whole check-then-create sequence of get_or_create_*, holds it
 * exclusively. Handles and tasks removed from the maps are closed and joined
 * after the lock is released.
 */
class resource_registry {
public:
    explicit resource_registry(client& backend)
        :backend_(backend) {}

    resource_registry(resource_registry const&) = delete;
    resource_registry& operator=(resource_registry const&) = delete;

    ~resource_registry() {
        std::vector<session_key> sessions;
        {
            std::lock_guard<mutex> g(mtx_);
            for (auto const& e : session_producers_) sessions.push_back(e.first);
            for (auto const& e : session_consumers_) sessions.push_back(e.first);
        }
        for (auto const& sk : sessions) close_session(sk);
    }

    /**
     * @brief attach a session to a connection and start its empty binding sets
     *
     * If the session is attached to another connection, that connection's
     * tasks and the session's handles are released first (session takeover).
     *
     * @return the connection the session was taken over from, or nullptr
     */
    con_sp_t attach_session(con_sp_t const& con, session_key const& sk) {
        con_sp_t displaced;
        released_resources r;
        {
            std::lock_guard<mutex> g(mtx_);

            auto& con_idx = attachments_.get<tag_con>();
            auto con_it = con_idx.find(con);
            if (con_it != con_idx.end() && con_it->session != sk) {
                auto prev = con_it->session;
                r.merge(extract_session_no_lock(prev));
            }

            auto& sess_idx = attachments_.get<tag_session>();
            auto sess_it = sess_idx.find(sk);
            if (sess_it != sess_idx.end() && sess_it->con != con) {
                displaced = sess_it->con;
                r.merge(extract_session_no_lock(sk));
            }

            if (attachments_.get<tag_con>().find(con) == attachments_.get<tag_con>().end()) {
                attachments_.emplace(con, sk);
            }
            session_producers_[sk];
            session_consumers_[sk];
        }
        if (displaced) {
            MQSAR_LOG("mqsar_bridge", info)
                << MQSAR_ADD_VALUE(address, this)
                << "session taken over " << sk
                << " from con:" << static_cast<void const*>(displaced.get());
        }
        release(force_move(r));
        return displaced;
    }

    optional<session_key> attached_session(con_sp_t const& con) const {
        std::shared_lock<mutex> g(mtx_);
        auto& idx = attachments_.get<tag_con>();
        auto it = idx.find(con);
        if (it == idx.end()) return nullopt;
        return it->session;
    }

    /**
     * @brief get the producer of (session, topic), creating it on first use
     *
     * Throws backend_unavailable when the backend cannot create it.
     */
    std::shared_ptr<producer> get_or_create_producer(session_key const& sk, std::string const& topic) {
        std::lock_guard<mutex> g(mtx_);
        topic_key key(topic, sk);
        auto it = producers_.find(key);
        if (it != producers_.end()) return it->second;

        auto p = backend_.create_producer(topic);
        session_producers_[sk].insert(key);
        producers_.emplace(key, p);
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "producer created " << key;
        return p;
    }

    /**
     * @brief get the consumer of (session, topic), creating it on first use
     *
     * The backend subscription is named by subscription_name(sk).
     * Throws backend_unavailable when the backend cannot create it.
     */
    std::shared_ptr<consumer> get_or_create_consumer(session_key const& sk, std::string const& topic) {
        std::lock_guard<mutex> g(mtx_);
        topic_key key(topic, sk);
        auto it = consumers_.find(key);
        if (it != consumers_.end()) {
            session_consumers_[sk].insert(key);
            return it->second;
        }

        auto c = backend_.create_consumer(topic, subscription_name(sk));
        session_consumers_[sk].insert(key);
        consumers_.emplace(key, c);
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "consumer created " << key;
        return c;
    }

    /**
     * @brief forget and close the consumer of (session, topic)
     * @return true if there was one
     */
    bool remove_consumer(session_key const& sk, std::string const& topic) {
        std::shared_ptr<consumer> c;
        {
            std::lock_guard<mutex> g(mtx_);
            topic_key key(topic, sk);
            auto sit = session_consumers_.find(sk);
            if (sit != session_consumers_.end()) sit->second.erase(key);
            auto it = consumers_.find(key);
            if (it == consumers_.end()) return false;
            c = force_move(it->second);
            consumers_.erase(it);
        }
        close_handle(c, "consumer");
        return true;
    }

    /**
     * @brief register the task of a subscription
     *
     * A task already registered under the key is replaced. It is cancelled
     * and returned so that the caller can wait() for it.
     * If the connection of the key is no longer attached to a session, the
     * task is cancelled instead of being registered.
     */
    std::shared_ptr<forwarding_task> register_forwarding_task(
        bridge_key const& key,
        std::shared_ptr<forwarding_task> task) {
        std::lock_guard<mutex> g(mtx_);
        auto& idx = attachments_.get<tag_con>();
        if (idx.find(key.con) == idx.end()) {
            task->cancel();
            return nullptr;
        }
        auto& slot = tasks_[key];
        auto prev = force_move(slot);
        slot = force_move(task);
        if (prev && prev != slot) {
            prev->cancel();
            return prev;
        }
        return nullptr;
    }

    /**
     * @brief signal cancellation to the task of a subscription and forget it
     * @return the cancelled task, nullptr if none was registered
     */
    std::shared_ptr<forwarding_task> cancel_forwarding_task(bridge_key const& key) {
        std::lock_guard<mutex> g(mtx_);
        auto it = tasks_.find(key);
        if (it == tasks_.end()) return nullptr;
        auto task = force_move(it->second);
        tasks_.erase(it);
        task->cancel();
        return task;
    }

    /**
     * @brief release everything the session owns
     *
     * Stops the tasks of the attached connection, closes every producer and
     * consumer of the session and removes the session from all maps.
     * Unknown sessions are ignored.
     */
    void close_session(session_key const& sk) {
        released_resources r;
        {
            std::lock_guard<mutex> g(mtx_);
            r = extract_session_no_lock(sk);
        }
        MQSAR_LOG("mqsar_bridge", trace)
            << MQSAR_ADD_VALUE(address, this)
            << "close session " << sk
            << " tasks:" << r.tasks.size()
            << " producers:" << r.producers.size()
            << " consumers:" << r.consumers.size();
        release(force_move(r));
    }

    /**
     * @brief release the session attached to the connection
     *
     * Same as close_session() but looks the session up by connection under
     * the same lock, so a session that has been taken over by another
     * connection is left alone.
     *
     * @return the released session, nullopt if the connection had none
     */
    optional<session_key> close_connection(con_sp_t const& con) {
        optional<session_key> sk;
        released_resources r;
        {
            std::lock_guard<mutex> g(mtx_);
            auto& idx = attachments_.get<tag_con>();
            auto it = idx.find(con);
            if (it != idx.end()) {
                sk.emplace(it->session);
                r = extract_session_no_lock(*sk);
            }
        }
        if (sk) {
            MQSAR_LOG("mqsar_bridge", trace)
                << MQSAR_ADD_VALUE(address, this)
                << "close connection " << *sk
                << " tasks:" << r.tasks.size()
                << " producers:" << r.producers.size()
                << " consumers:" << r.consumers.size();
        }
        release(force_move(r));
        return sk;
    }

    std::set<topic_key> producer_topics(session_key const& sk) const {
        std::shared_lock<mutex> g(mtx_);
        auto it = session_producers_.find(sk);
        if (it == session_producers_.end()) return {};
        return it->second;
    }

    std::set<topic_key> consumer_topics(session_key const& sk) const {
        std::shared_lock<mutex> g(mtx_);
        auto it = session_consumers_.find(sk);
        if (it == session_consumers_.end()) return {};
        return it->second;
    }

    std::shared_ptr<forwarding_task> find_forwarding_task(bridge_key const& key) const {
        std::shared_lock<mutex> g(mtx_);
        auto it = tasks_.find(key);
        if (it == tasks_.end()) return nullptr;
        return it->second;
    }

    bool has_session(session_key const& sk) const {
        std::shared_lock<mutex> g(mtx_);
        return
            session_producers_.find(sk) != session_producers_.end() ||
            session_consumers_.find(sk) != session_consumers_.end() ||
            attachments_.get<tag_session>().find(sk) != attachments_.get<tag_session>().end();
    }

    std::size_t producer_count() const {
        std::shared_lock<mutex> g(mtx_);
        return producers_.size();
    }

    std::size_t consumer_count() const {
        std::shared_lock<mutex> g(mtx_);
        return consumers_.size();
    }

    std::size_t task_count() const {
        std::shared_lock<mutex> g(mtx_);
        return tasks_.size();
    }

private:
    struct attachment {
        attachment(con_sp_t con, session_key session)
            : con { force_move(con) },
              session { force_move(session) }
        {}

        con_sp_t con;
        session_key session;
    };

    using attachments = mi::multi_index_container<
        attachment,
        mi::indexed_by<
            mi::ordered_unique<
                mi::tag<tag_con>,
                BOOST_MULTI_INDEX_MEMBER(attachment, con_sp_t, con)
            >,
            mi::ordered_unique<
                mi::tag<tag_session>,
                BOOST_MULTI_INDEX_MEMBER(attachment, session_key, session)
            >
        >
    >;

    struct released_resources {
        void merge(released_resources other) {
            tasks.insert(tasks.end(), other.tasks.begin(), other.tasks.end());
            producers.insert(producers.end(), other.producers.begin(), other.producers.end());
            consumers.insert(consumers.end(), other.consumers.begin(), other.consumers.end());
        }

        std::vector<std::shared_ptr<forwarding_task>> tasks;
        std::vector<std::shared_ptr<producer>> producers;
        std::vector<std::shared_ptr<consumer>> consumers;
    };

    // mtx_ must be held exclusively
    released_resources extract_session_no_lock(session_key const& sk) {
        released_resources r;

        auto& idx = attachments_.get<tag_session>();
        auto it = idx.find(sk);
        if (it != idx.end()) {
            // tasks_ is ordered by connection first, then topic
            auto con = it->con;
            auto tit = tasks_.lower_bound(bridge_key(con, std::string()));
            while (tit != tasks_.end() && tit->first.con == con) {
                tit->second->cancel();
                r.tasks.push_back(force_move(tit->second));
                tit = tasks_.erase(tit);
            }
            idx.erase(it);
        }

        auto pit = session_producers_.find(sk);
        if (pit != session_producers_.end()) {
            for (auto const& key : pit->second) {
                auto hit = producers_.find(key);
                if (hit == producers_.end()) continue;
                r.producers.push_back(force_move(hit->second));
                producers_.erase(hit);
            }
            session_producers_.erase(pit);
        }

        auto cit = session_consumers_.find(sk);
        if (cit != session_consumers_.end()) {
            for (auto const& key : cit->second) {
                auto hit = consumers_.find(key);
                if (hit == consumers_.end()) continue;
                r.consumers.push_back(force_move(hit->second));
                consumers_.erase(hit);
            }
            session_consumers_.erase(cit);
        }
        return r;
    }

    // mtx_ must not be held
    void release(released_resources r) {
        for (auto& t : r.tasks) t->cancel();
        for (auto& t : r.tasks) t->wait();
        for (auto& p : r.producers) close_handle(p, "producer");
        for (auto& c : r.consumers) close_handle(c, "consumer");
    }

    template <typename Handle>
    void close_handle(std::shared_ptr<Handle> const& h, char const* kind) {
        try {
            h->close();
        }
        catch (std::exception const& e) {
            MQSAR_LOG("mqsar_bridge", warning)
                << MQSAR_ADD_VALUE(address, this)
                << kind << " close failed topic:" << h->topic() << " " << e.what();
        }
    }

    client& backend_;

    mutable mutex mtx_;
    attachments attachments_;
    std::map<session_key, std::set<topic_key>> session_producers_;
    std::map<session_key, std::set<topic_key>> session_consumers_;
    std::map<topic_key, std::shared_ptr<producer>> producers_;
    std::map<topic_key, std::shared_ptr<consumer>> consumers_;
    std::map<bridge_key, std::shared_ptr<forwarding_task>> tasks_;
};

MQSAR_BRIDGE_NS_END

#endif // MQSAR_BRIDGE_RESOURCE_REGISTRY_HPP
