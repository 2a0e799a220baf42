// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_LOG_HPP)
#define MQSAR_LOG_HPP

#include <cstddef>
#include <ostream>
#include <string>

#if defined(MQSAR_USE_LOG)

#include <boost/log/core.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/preprocessor/if.hpp>
#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/comparison/greater_equal.hpp>

#endif // defined(MQSAR_USE_LOG)

#include <mqsar/namespace.hpp>

namespace MQSAR_NS {

struct channel : std::string {
    using std::string::string;
};

enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

inline std::ostream& operator<<(std::ostream& o, severity_level sev) {
    constexpr char const* const str[] {
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "fatal"
    };
    o << str[static_cast<std::size_t>(sev)];
    return o;
}

namespace detail {

struct null_log {
    template <typename... Params>
    constexpr null_log(Params&&...) {}
};

template <typename T>
inline constexpr null_log const& operator<<(null_log const& o, T const&) { return o; }

} // namespace detail

#if defined(MQSAR_USE_LOG)

// filter and formatter can distinguish mqsar's channel and severity by their types
using global_logger_t = boost::log::sources::severity_channel_logger<severity_level, channel>;
inline global_logger_t& logger() {
    thread_local global_logger_t l;
    return l;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(file, "MqsarFile", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(line, "MqsarLine", unsigned int)
BOOST_LOG_ATTRIBUTE_KEYWORD(function, "MqsarFunction", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(address, "MqsarAddress", void const*)


// Take any filterable parameters (FP)
#define MQSAR_LOG_FP(chan, sev)                                         \
    BOOST_LOG_STREAM_CHANNEL_SEV(MQSAR_NS::logger(), MQSAR_NS::channel(chan), sev) \
    << boost::log::add_value(MQSAR_NS::file, __FILE__)                  \
    << boost::log::add_value(MQSAR_NS::line, __LINE__)                  \
    << boost::log::add_value(MQSAR_NS::function, BOOST_CURRENT_FUNCTION)

#define MQSAR_GET_LOG_SEV_NUM(lv) BOOST_PP_CAT(MQSAR_, lv)

// -DMQSAR_LOG_SEV=info drops trace and debug records at compile time.
#if !defined(MQSAR_LOG_SEV)
#define MQSAR_LOG_SEV trace
#endif // !defined(MQSAR_LOG_SEV)

#define MQSAR_trace   0
#define MQSAR_debug   1
#define MQSAR_info    2
#define MQSAR_warning 3
#define MQSAR_error   4
#define MQSAR_fatal   5

#if !defined(MQSAR_LOG)

#define MQSAR_LOG(chan, sev)                                            \
    BOOST_PP_IF(                                                        \
        BOOST_PP_GREATER_EQUAL(MQSAR_GET_LOG_SEV_NUM(sev), MQSAR_GET_LOG_SEV_NUM(MQSAR_LOG_SEV)), \
        MQSAR_LOG_FP(chan, MQSAR_NS::severity_level::sev),              \
        MQSAR_NS::detail::null_log(chan, MQSAR_NS::severity_level::sev) \
    )

#endif // !defined(MQSAR_LOG)

#if !defined(MQSAR_ADD_VALUE)

#define MQSAR_ADD_VALUE(name, val) boost::log::add_value((MQSAR_NS::name), (val))

#endif // !defined(MQSAR_ADD_VALUE)

#else  // defined(MQSAR_USE_LOG)

#if !defined(MQSAR_LOG)

#define MQSAR_LOG(chan, sev) MQSAR_NS::detail::null_log(chan, MQSAR_NS::severity_level::sev)

#endif // !defined(MQSAR_LOG)

#if !defined(MQSAR_ADD_VALUE)

#define MQSAR_ADD_VALUE(name, val) val

#endif // !defined(MQSAR_ADD_VALUE)

#endif // defined(MQSAR_USE_LOG)

} // namespace MQSAR_NS

#endif // MQSAR_LOG_HPP
