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

#include <concepts>
#include <cstdint>

/**
 * @brief representation of the BWT inside an fm_index
 */
enum fm_index_backend : uint8_t {
    _plain = 0, // wavelet matrix over the BWT, count table over the BWT
    _run_length = 1 // wavelet matrix over the BWT run heads, run-boundary bit vectors, count table over the run heads
};

/**
 * @brief operations the search engine needs from a BWT representation; all positions are BWT indices in [0, size())
 * and all symbols are internal codes (0 is the terminator)
 */
template <typename bwt_t, typename pos_t>
concept bwt_backend = requires(const bwt_t& bwt, pos_t i, uint64_t c) {
    { bwt.size() } -> std::convertible_to<uint64_t>;
    { bwt.alphabet_size() } -> std::convertible_to<uint64_t>;
    { bwt.access(i) } -> std::convertible_to<uint64_t>;
    { bwt.rank(c, i) } -> std::convertible_to<pos_t>;
    { bwt.select(c, i) } -> std::convertible_to<pos_t>;
    { bwt.C(c) } -> std::convertible_to<pos_t>;
    { bwt.LF(i) } -> std::convertible_to<pos_t>;
    { bwt.LF(c, i) } -> std::convertible_to<pos_t>;
    { bwt.F(i) } -> std::convertible_to<uint64_t>;
    { bwt.FL(i) } -> std::convertible_to<pos_t>;
    { bwt.num_bwt_runs() } -> std::convertible_to<pos_t>;
    { bwt.size_in_bytes() } -> std::convertible_to<uint64_t>;
};
