// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_SETUP_LOG_HPP)
#define MQSAR_SETUP_LOG_HPP

// Typical console logging setup for the bridge.
// Applications that already configure Boost.Log can skip setup_log() and
// filter on mqsar::channel / mqsar::severity_level themselves.

#include <map>
#include <string>

#include <mqsar/namespace.hpp>
#include <mqsar/log.hpp>

#if defined(MQSAR_USE_LOG)

#include <iomanip>
#include <iostream>

#include <mqsar/move.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>

#endif // defined(MQSAR_USE_LOG)

namespace MQSAR_NS {

#if defined(MQSAR_USE_LOG)

static constexpr char const* log_color_table[] {
    "\033[0m", // trace
    "\033[36m", // debug
    "\033[32m", // info
    "\033[33m", // warning
    "\033[35m", // error
    "\033[31m", // fatal
};

/**
 * @brief Setup logging
 * @param threshold
 *        Set threshold severity_level by channel
 *        If the log severity_level >= threshold then log message outputs.
 */
inline
void setup_log(std::map<std::string, severity_level> threshold) {
    auto fmt =
        [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
            if (auto v = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
                strm.imbue(
                    std::locale(
                        strm.getloc(),
                        new boost::posix_time::time_facet("%H:%M:%s") // ownership is moved here
                    )
                );
                strm << v.get() << " ";
            }
            if (auto v = boost::log::extract<boost::log::thread_id>("ThreadID", rec)) {
                strm << "T:" << v.get() << " ";
            }
            if (auto v = boost::log::extract<severity_level>("Severity", rec)) {
                strm << log_color_table[static_cast<std::size_t>(v.get())];
                strm << "S:" << std::setw(7) << std::left << v.get() << " ";
            }
            if (auto v = boost::log::extract<channel>("Channel", rec)) {
                strm << "C:" << std::setw(13) << std::left << v.get() << " ";
            }
            if (auto v = boost::log::extract<std::string>("MqsarFile", rec)) {
                strm << boost::filesystem::path(v.get()).filename().string() << ":";
            }
            if (auto v = boost::log::extract<unsigned int>("MqsarLine", rec)) {
                strm << v.get() << " ";
            }
            if (auto v = boost::log::extract<void const*>("MqsarAddress", rec)) {
                strm << "A:" << v.get() << " ";
            }
            strm << rec[boost::log::expressions::smessage];
            strm << "\033[0m";
        };

    boost::shared_ptr<std::ostream> stream(&std::clog, boost::null_deleter());

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    auto sink = boost::make_shared<text_sink>();
    sink->locked_backend()->add_stream(stream);
    sink->set_formatter(fmt);

    auto fil =
        [threshold = force_move(threshold)]
        (boost::log::attribute_value_set const& avs) {
            auto chan = boost::log::extract<channel>("Channel", avs);
            auto sev = boost::log::extract<severity_level>("Severity", avs);
            if (chan && sev) {
                auto it = threshold.find(chan.get());
                if (it == threshold.end()) return false;
                return sev.get() >= it->second;
            }
            return true;
        };

    boost::log::core::get()->set_filter(fil);
    boost::log::core::get()->add_sink(sink);

    boost::log::add_common_attributes();
}

/**
 * @brief Setup logging
 * @param threshold
 *        Set threshold severity_level for all channels
 *        If the log severity_level >= threshold then log message outputs.
 */
inline
void setup_log(severity_level threshold = severity_level::warning) {
    setup_log(
        {
            { "mqsar_bridge", threshold },
            { "mqsar_backend", threshold },
            { "mqsar_test", threshold },
        }
    );
}

#else  // defined(MQSAR_USE_LOG)

template <typename... Params>
void setup_log(Params&&...) {}

#endif // defined(MQSAR_USE_LOG)

} // namespace MQSAR_NS

#endif // MQSAR_SETUP_LOG_HPP
