// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_STRING_VIEW_HPP)
#define MQSAR_STRING_VIEW_HPP

#include <mqsar/namespace.hpp>

#ifdef MQSAR_STD_STRING_VIEW

#include <string_view>

namespace MQSAR_NS {

using std::string_view;

} // namespace MQSAR_NS

#else  // MQSAR_STD_STRING_VIEW

#include <boost/utility/string_view.hpp>

namespace MQSAR_NS {

using string_view = boost::string_view;

} // namespace MQSAR_NS

#endif // !defined(MQSAR_STD_STRING_VIEW)

#endif // MQSAR_STRING_VIEW_HPP
