// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_ERROR_CODE_HPP)
#define MQSAR_ERROR_CODE_HPP

#include <mqsar/namespace.hpp>

#include <boost/system/error_code.hpp>

namespace MQSAR_NS {

using error_code = boost::system::error_code;

} // namespace MQSAR_NS

#endif // MQSAR_ERROR_CODE_HPP
