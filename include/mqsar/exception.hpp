// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_EXCEPTION_HPP)
#define MQSAR_EXCEPTION_HPP

#include <exception>
#include <string>

#include <mqsar/namespace.hpp>
#include <mqsar/move.hpp>

namespace MQSAR_NS {

struct backend_error : std::exception {
    explicit backend_error(std::string msg)
        :msg(force_move(msg)) {}
    char const* what() const noexcept override {
        return msg.data();
    }
    std::string msg;
};

// The backend could not create a producer or consumer, or is not reachable.
struct backend_unavailable : backend_error {
    explicit backend_unavailable(std::string const& detail)
        :backend_error("backend unavailable: " + detail) {}
};

} // namespace MQSAR_NS

#endif // MQSAR_EXCEPTION_HPP
