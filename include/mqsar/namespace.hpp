// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_NAMESPACE_HPP)
#define MQSAR_NAMESPACE_HPP

#if !defined(MQSAR_NS)
#define MQSAR_NS mqsar
#endif // !defined(MQSAR_NS)

#endif // MQSAR_NAMESPACE_HPP
