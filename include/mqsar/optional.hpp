// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_OPTIONAL_HPP)
#define MQSAR_OPTIONAL_HPP

#if defined(MQSAR_STD_OPTIONAL)

#include <optional>

#else  // defined(MQSAR_STD_OPTIONAL)

#include <boost/optional.hpp>

#endif // defined(MQSAR_STD_OPTIONAL)

#include <mqsar/namespace.hpp>

namespace MQSAR_NS {

#if defined(MQSAR_STD_OPTIONAL)

using std::optional;
using std::nullopt_t;
static constexpr auto nullopt = std::nullopt;

#else  // defined(MQSAR_STD_OPTIONAL)

using boost::optional;
using nullopt_t = boost::none_t;
static const auto nullopt = boost::none;

#endif // defined(MQSAR_STD_OPTIONAL)

} // namespace MQSAR_NS

#endif // MQSAR_OPTIONAL_HPP
