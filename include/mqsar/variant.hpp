// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_VARIANT_HPP)
#define MQSAR_VARIANT_HPP

#include <mqsar/namespace.hpp>

#if defined(MQSAR_STD_VARIANT)

#include <variant>

namespace MQSAR_NS {

using std::variant;

template<typename T, typename U>
decltype(auto) variant_get(U && arg)
{
    return std::get<T>(std::forward<U>(arg));
}

template<typename T>
decltype(auto) variant_idx(T const& arg)
{
    return arg.index();
}

using std::visit;

} // namespace MQSAR_NS

#else  // defined(MQSAR_STD_VARIANT)

#include <boost/variant.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/apply_visitor.hpp>

namespace MQSAR_NS {

using boost::variant;

template<typename T, typename U>
decltype(auto) variant_get(U && arg)
{
    return boost::get<T>(std::forward<U>(arg));
}

template<typename T>
decltype(auto) variant_idx(T const& arg)
{
    return arg.which();
}

template <typename Visitor, typename... Variants>
constexpr decltype(auto) visit(Visitor&& vis, Variants&&... vars)
{
    return boost::apply_visitor(std::forward<Visitor>(vis), std::forward<Variants>(vars)...);
}

} // namespace MQSAR_NS

#endif // defined(MQSAR_STD_VARIANT)

#endif // MQSAR_VARIANT_HPP
