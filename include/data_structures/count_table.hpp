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
#include <vector>

#include <omp.h>

/**
 * @brief cumulative symbol frequencies of a sequence over the alphabet [0, sigma)
 * @tparam pos_t unsigned position type
 *
 * C[c] is the number of positions whose symbol is smaller than c; C[sigma] is the length of the sequence.
 */
template <typename pos_t>
class count_table {
protected:
    std::vector<pos_t> C; // [0 .. sigma] exclusive prefix sums of the symbol frequencies

public:
    count_table() : C(1, 0) {}

    /**
     * @brief builds the count table of a sequence
     * @param seq the sequence; every symbol must be smaller than sigma
     * @param sigma alphabet size
     * @param p number of threads to use for counting
     */
    template <typename sym_t>
    count_table(const std::vector<sym_t>& seq, uint64_t sigma, uint16_t p = 1)
    {
        uint64_t n = seq.size();
        C.assign(sigma + 1, 0);

        if (p > 1 && sigma * p <= n) {
            std::vector<std::vector<pos_t>> freq_thr(p, std::vector<pos_t>(sigma, 0));

            #pragma omp parallel for num_threads(p)
            for (uint64_t i = 0; i < n; i++) {
                freq_thr[omp_get_thread_num()][seq[i]]++;
            }

            for (uint16_t i_p = 0; i_p < p; i_p++) {
                for (uint64_t c = 0; c < sigma; c++) {
                    C[c + 1] += freq_thr[i_p][c];
                }
            }
        } else {
            for (uint64_t i = 0; i < n; i++) {
                C[seq[i] + 1]++;
            }
        }

        for (uint64_t c = 1; c <= sigma; c++) {
            C[c] += C[c - 1];
        }
    }

    /**
     * @brief returns the number of positions whose symbol is smaller than c
     * @param c a symbol, 0 <= c <= alphabet_size()
     */
    inline pos_t operator[](uint64_t c) const
    {
        return C[c];
    }

    inline uint64_t alphabet_size() const
    {
        return C.size() - 1;
    }

    // length of the underlying sequence
    inline pos_t total() const
    {
        return C.back();
    }

    // number of occurrences of c
    inline pos_t occ(uint64_t c) const
    {
        return C[c + 1] - C[c];
    }

    /**
     * @brief returns the symbol c with C[c] <= i < C[c + 1], i.e. the i-th symbol of the sorted sequence
     * @param i position, 0 <= i < total()
     */
    inline uint64_t symbol_of(pos_t i) const
    {
        return (std::upper_bound(C.begin(), C.end(), i) - C.begin()) - 1;
    }

    uint64_t size_in_bytes() const
    {
        return sizeof(*this) + C.size() * sizeof(pos_t);
    }
};
