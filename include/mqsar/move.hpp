// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_MOVE_HPP)
#define MQSAR_MOVE_HPP

#include <utility>
#include <type_traits>

#include <mqsar/namespace.hpp>

namespace MQSAR_NS {

// std::move that refuses to silently copy a const argument.
template <typename T>
constexpr
typename std::remove_reference_t<T>&&
force_move(T&& t) {
    static_assert(!std::is_const<std::remove_reference_t<T>>::value, "T is const. Fallback to copy.");
    return std::move(t);
}

} // namespace MQSAR_NS

#endif // MQSAR_MOVE_HPP
