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

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include <sdsl/int_vector.hpp>

#include <misc/errors.hpp>

/**
 * @brief marks an unoccupied suffix array slot during induced sorting
 */
template <typename pos_t>
constexpr pos_t sais_empty = std::numeric_limits<pos_t>::max();

/**
 * @brief computes the suffix array of T with SA-IS (Nong, Zhang and Chan)
 * @tparam pos_t unsigned position type
 * @tparam text_t unsigned symbol type
 * @param T the text; T[n - 1] must be 0 and 0 must not occur anywhere else in T
 * @param SA output array with n slots
 * @param n length of T (including the terminating 0), 1 <= n < sais_empty<pos_t>
 * @param sigma alphabet size; every symbol in T must be smaller than sigma
 */
template <typename pos_t, typename text_t>
void sais(const text_t* T, pos_t* SA, pos_t n, pos_t sigma)
{
    static_assert(std::is_unsigned_v<pos_t>);
    constexpr pos_t EMPTY = sais_empty<pos_t>;

    if (n == 1) {
        SA[0] = 0;
        return;
    }

    // t[i] = 1 <=> suffix i is S-type; the terminator is S-type
    sdsl::bit_vector t(n, 0);
    t[n - 1] = 1;

    for (pos_t i = n - 1; i > 0; i--) {
        t[i - 1] = T[i - 1] < T[i] || (T[i - 1] == T[i] && t[i]);
    }

    auto is_lms = [&](pos_t i){return i > 0 && i != EMPTY && t[i] && !t[i - 1];};

    // bkt[c] = start of the bucket of c, bkt[sigma] = n
    std::vector<pos_t> bkt(sigma + 1, 0);
    std::vector<pos_t> ptr(sigma);
    for (pos_t i = 0; i < n; i++) bkt[T[i] + 1]++;
    for (pos_t c = 1; c <= sigma; c++) bkt[c] += bkt[c - 1];

    auto bucket_starts = [&]{for (pos_t c = 0; c < sigma; c++) ptr[c] = bkt[c];};
    auto bucket_ends = [&]{for (pos_t c = 0; c < sigma; c++) ptr[c] = bkt[c + 1];};

    // induces the L-type suffixes from left to right and the S-type suffixes from right to left
    auto induce = [&]{
        bucket_starts();

        for (pos_t i = 0; i < n; i++) {
            pos_t j = SA[i];
            if (j != EMPTY && j > 0 && !t[j - 1]) SA[ptr[T[j - 1]]++] = j - 1;
        }

        bucket_ends();

        for (pos_t i = n; i > 0; i--) {
            pos_t j = SA[i - 1];
            if (j != EMPTY && j > 0 && t[j - 1]) SA[--ptr[T[j - 1]]] = j - 1;
        }
    };

    // stage 1: sort the LMS-substrings
    std::fill(SA, SA + n, EMPTY);
    bucket_ends();

    for (pos_t i = 1; i < n; i++) {
        if (is_lms(i)) SA[--ptr[T[i]]] = i;
    }

    induce();

    // move the sorted LMS-substrings to the front of SA
    pos_t n1 = 0;

    for (pos_t i = 0; i < n; i++) {
        if (is_lms(SA[i])) SA[n1++] = SA[i];
    }

    // name the LMS-substrings; names are stored at SA[n1 + pos / 2], since LMS-positions are at least 2 apart
    std::fill(SA + n1, SA + n, EMPTY);
    pos_t name = 0;
    pos_t prev = EMPTY;

    for (pos_t i = 0; i < n1; i++) {
        pos_t pos = SA[i];
        bool diff = false;

        for (pos_t d = 0;; d++) {
            if (prev == EMPTY || T[pos + d] != T[prev + d] || t[pos + d] != t[prev + d]) {
                diff = true;
                break;
            }

            if (d > 0 && (is_lms(pos + d) || is_lms(prev + d))) break;
        }

        if (diff) {
            name++;
            prev = pos;
        }

        SA[n1 + pos / 2] = name - 1;
    }

    // gather the names in text order into the reduced string s1 = SA[n - n1, n)
    for (pos_t i = n, j = n; i > n1; i--) {
        if (SA[i - 1] != EMPTY) SA[--j] = SA[i - 1];
    }

    pos_t* s1 = SA + (n - n1);
    pos_t* SA1 = SA;

    // stage 2: sort the LMS-suffixes, recursing if the names are not unique
    if (name < n1) {
        sais<pos_t, pos_t>(s1, SA1, n1, name);
    } else {
        for (pos_t i = 0; i < n1; i++) SA1[s1[i]] = i;
    }

    // stage 3: induce SA from the sorted LMS-suffixes
    for (pos_t i = 1, j = 0; i < n; i++) {
        if (is_lms(i)) s1[j++] = i;
    }

    for (pos_t i = 0; i < n1; i++) SA1[i] = s1[SA1[i]];
    std::fill(SA + n1, SA + n, EMPTY);
    bucket_ends();

    for (pos_t i = n1; i > 0; i--) {
        pos_t j = SA[i - 1];
        SA[i - 1] = EMPTY;
        SA[--ptr[T[j]]] = j;
    }

    induce();
}

/**
 * @brief computes the suffix array of a text followed by a virtual terminator that is smaller than every symbol
 * @tparam pos_t unsigned position type
 * @tparam sym_t unsigned symbol type
 * @param text the text (without terminator); every symbol must be smaller than sigma
 * @param sigma alphabet size of the text
 * @return the suffix array, a permutation of [0, text.size()]; its first entry is text.size()
 */
template <typename pos_t, typename sym_t>
std::vector<pos_t> build_suffix_array(const std::vector<sym_t>& text, uint64_t sigma)
{
    uint64_t n = text.size() + 1;

    if (n >= sais_empty<pos_t> || sigma + 1 >= sais_empty<pos_t>) {
        throw construction_error("the input of size " + std::to_string(text.size()) +
            " is too large for a " + std::to_string(8 * sizeof(pos_t)) + "-bit suffix array");
    }

    // shift every symbol by one to make room for the terminator 0
    std::vector<pos_t> T(n);

    for (uint64_t i = 0; i < n - 1; i++) {
        if (text[i] >= sigma) [[unlikely]] {
            throw construction_error("symbol " + std::to_string(text[i]) + " at position " +
                std::to_string(i) + " is outside the alphabet [0, " + std::to_string(sigma) + ")");
        }

        T[i] = pos_t(text[i]) + 1;
    }

    T[n - 1] = 0;
    std::vector<pos_t> SA(n);
    sais<pos_t, pos_t>(T.data(), SA.data(), n, sigma + 1);
    return SA;
}
