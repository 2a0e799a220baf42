// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_CONFIG_HPP)
#define MQSAR_CONFIG_HPP

// Determine Boost Asio version
#include <boost/asio/version.hpp>

// memory_backend posts completions with standard executors
#if BOOST_ASIO_VERSION < 101800
#error Boost Asio version 1.18.0 required for no TS-style executors
#endif // BOOST_ASIO_VERSION < 101800

#endif // MQSAR_CONFIG_HPP
