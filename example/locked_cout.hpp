// Copyright The mqsar_cpp Authors 2026
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#if !defined(MQSAR_LOCKED_COUT_HPP)
#define MQSAR_LOCKED_COUT_HPP

#include <mutex>
#include <iostream>

// Serializes whole output statements of forwarding task threads and the main thread.
class locked_stream {
public:
    locked_stream(std::ostream& stream)
        :lock_(mtx()),
         stream_(stream) {}

    friend
    locked_stream&& operator<<(locked_stream&& s, std::ostream& (*arg)(std::ostream&)) {
        s.stream_ << arg;
        return std::move(s);
    }

    template <typename Arg>
    friend
    locked_stream&& operator<<(locked_stream&& s, Arg&& arg) {
        s.stream_ << std::forward<Arg>(arg);
        return std::move(s);
    }

private:
    static std::mutex& mtx() {
        static std::mutex m;
        return m;
    }

    std::unique_lock<std::mutex> lock_;
    std::ostream& stream_;
};

inline
locked_stream locked_cout() {
    return locked_stream(std::cout);
}

#endif // MQSAR_LOCKED_COUT_HPP
