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

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <data_structures/count_table.hpp>
#include <data_structures/wavelet_matrix.hpp>
#include <misc/errors.hpp>
#include <misc/utils.hpp>

/**
 * @brief BWT stored as a wavelet matrix, size O(n log sigma) bits
 * @tparam pos_t unsigned position type
 */
template <typename pos_t>
class plain_bwt {
protected:
    wavelet_matrix<uint32_t> L; // the BWT
    count_table<pos_t> C_; // count table over the BWT
    pos_t r = 0; // number of runs in the BWT

public:
    plain_bwt() = default;

    /**
     * @brief builds the plain representation of a BWT
     * @param bwt the BWT; it contains the terminator 0 exactly once
     * @param sigma alphabet size (including the terminator)
     * @param p number of threads to use
     * @param log whether to log the progress
     */
    plain_bwt(const std::vector<uint32_t>& bwt, uint64_t sigma, uint16_t p = 1, bool log = false)
    {
        auto time = now();

        if (log) std::cout << "building C" << std::flush;
        C_ = count_table<pos_t>(bwt, sigma, p);
        if (log) time = log_runtime(time);

        if (log) std::cout << "building wavelet matrix of L" << std::flush;
        L = wavelet_matrix<uint32_t>(bwt, sigma);

        for (uint64_t i = 0; i < bwt.size(); i++) {
            if (i == 0 || bwt[i] != bwt[i - 1]) r++;
        }

        if (log) time = log_runtime(time);
    }

    inline uint64_t size() const
    {
        return L.size();
    }

    inline uint64_t alphabet_size() const
    {
        return L.alphabet_size();
    }

    inline pos_t num_bwt_runs() const
    {
        return r;
    }

    // L[i]
    inline uint64_t access(pos_t i) const
    {
        return L.access(i);
    }

    // number of occurrences of c in L[0, i)
    inline pos_t rank(uint64_t c, pos_t i) const
    {
        return L.rank(c, i);
    }

    // position of the (k+1)-th occurrence of c in L
    inline pos_t select(uint64_t c, pos_t k) const
    {
        return L.select(c, k);
    }

    // number of symbols in L smaller than c
    inline pos_t C(uint64_t c) const
    {
        return C_[c];
    }

    inline pos_t LF(uint64_t c, pos_t i) const
    {
        return C_[c] + rank(c, i);
    }

    inline pos_t LF(pos_t i) const
    {
        return LF(access(i), i);
    }

    // F[i], the i-th symbol in the sorted BWT
    inline uint64_t F(pos_t i) const
    {
        if (i >= size()) [[unlikely]] {
            throw out_of_range_error("F(" + std::to_string(i) + ") on a BWT of size " + std::to_string(size()));
        }

        return C_.symbol_of(i);
    }

    // LF^{-1}(i)
    inline pos_t FL(pos_t i) const
    {
        uint64_t c = F(i);
        return select(c, i - C_[c]);
    }

    uint64_t size_in_bytes() const
    {
        return L.size_in_bytes() + C_.size_in_bytes() + sizeof(r);
    }

    void log_data_structure_sizes() const
    {
        std::cout << "L: " << format_size(L.size_in_bytes()) << std::endl;
        std::cout << "C: " << format_size(C_.size_in_bytes()) << std::endl;
    }
};
