/**
 * part of fm-index
 *
 * MIT License
 *
 * Copyright (c) the fm-index authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>

// ############################# TIME #############################

inline std::chrono::steady_clock::time_point now()
{
    return std::chrono::steady_clock::now();
}

inline uint64_t time_diff_ns(std::chrono::steady_clock::time_point t1, std::chrono::steady_clock::time_point t2)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t2 - t1).count();
}

/**
 * @brief formats a duration given in nanoseconds as a human readable string
 * @param ns duration in nanoseconds
 * @return formatted string (e.g. "1.5 ms")
 */
inline std::string format_time(uint64_t ns)
{
    std::stringstream ss;
    ss << std::setprecision(4);

    if (ns < 1000) {
        ss << ns << " ns";
    } else if (ns < 1000000) {
        ss << ns / 1000.0 << " us";
    } else if (ns < 1000000000) {
        ss << ns / 1000000.0 << " ms";
    } else {
        ss << ns / 1000000000.0 << " s";
    }

    return ss.str();
}

/**
 * @brief prints the time elapsed since time and returns the current time
 * @param time point in time at which the logged phase started
 * @return current time
 */
inline std::chrono::steady_clock::time_point log_runtime(std::chrono::steady_clock::time_point time)
{
    auto time_now = now();
    std::cout << " (" << format_time(time_diff_ns(time, time_now)) << ")" << std::endl;
    return time_now;
}

// ############################# FORMATTING #############################

/**
 * @brief formats a size given in bytes as a human readable string
 * @param size_in_bytes size in bytes
 * @return formatted string (e.g. "3.2 KiB")
 */
inline std::string format_size(uint64_t size_in_bytes)
{
    std::stringstream ss;
    ss << std::setprecision(4);

    if (size_in_bytes < 1024) {
        ss << size_in_bytes << " B";
    } else if (size_in_bytes < 1024 * 1024) {
        ss << size_in_bytes / 1024.0 << " KiB";
    } else if (size_in_bytes < 1024 * 1024 * 1024) {
        ss << size_in_bytes / (1024.0 * 1024.0) << " MiB";
    } else {
        ss << size_in_bytes / (1024.0 * 1024.0 * 1024.0) << " GiB";
    }

    return ss.str();
}

inline std::string format_threads(uint16_t p)
{
    return std::to_string(p) + (p == 1 ? " thread" : " threads");
}

// ############################# MISC #############################

template <typename T>
constexpr T div_ceil(T x, T y)
{
    return x == 0 ? 0 : 1 + (x - 1) / y;
}

template <bool condition, typename T>
struct constexpr_case {
    static constexpr bool value = condition;
    using type = T;
};

/**
 * @brief selects the type of the first case whose condition is true; the last
 * argument is the default type
 */
template <typename... cases>
struct constexpr_switch;

template <typename default_t>
struct constexpr_switch<default_t> {
    using type = default_t;
};

template <bool condition, typename T, typename... cases>
struct constexpr_switch<constexpr_case<condition, T>, cases...> {
    using type = std::conditional_t<condition, T, typename constexpr_switch<cases...>::type>;
};

template <typename... cases>
using constexpr_switch_t = typename constexpr_switch<cases...>::type;
