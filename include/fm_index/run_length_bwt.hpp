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

#include <sdsl/int_vector.hpp>

#include <data_structures/count_table.hpp>
#include <data_structures/rank_select_bit_vector.hpp>
#include <data_structures/wavelet_matrix.hpp>
#include <misc/errors.hpp>
#include <misc/utils.hpp>

/**
 * @brief run-length compressed BWT, size O(r log sigma + n) bits, where r is the number of runs in the BWT
 * @tparam pos_t unsigned position type
 *
 * The BWT L is split into its r maximal runs of equal symbols. H stores the head symbol of every run. B marks the
 * starts of the runs in L. If the runs are stably sorted by their head symbols and concatenated (which yields F),
 * B_F marks the starts of the runs in F. C_H is the count table over H, so the runs with head c occupy the
 * (sorted) run indices [C_H[c], C_H[c + 1]).
 */
template <typename pos_t>
class run_length_bwt {
protected:
    pos_t n = 0; // length of the BWT
    pos_t r = 0; // number of runs in the BWT

    wavelet_matrix<uint32_t> H; // run heads
    rank_select_bit_vector B; // run starts in L
    rank_select_bit_vector B_F; // run starts in F
    count_table<pos_t> C_H; // count table over H

    /**
     * @brief returns the position in F of the start of the (k+1)-th run with head c, or n if it does not exist and
     * there are no runs with larger heads
     */
    inline pos_t run_start_F(uint64_t c, pos_t k) const
    {
        pos_t x = C_H[c] + k;
        return x < r ? B_F.select1(x) : n;
    }

    // index of the run in L containing position i
    inline pos_t run_of(pos_t i) const
    {
        return B.rank1(i + 1) - 1;
    }

public:
    run_length_bwt() = default;

    /**
     * @brief builds the run-length compressed representation of a BWT
     * @param bwt the BWT; it contains the terminator 0 exactly once
     * @param sigma alphabet size (including the terminator)
     * @param p number of threads to use
     * @param log whether to log the progress
     */
    run_length_bwt(const std::vector<uint32_t>& bwt, uint64_t sigma, uint16_t p = 1, bool log = false)
    {
        auto time = now();
        n = bwt.size();

        if (log) std::cout << "computing the runs of L" << std::flush;

        std::vector<uint32_t> heads;
        std::vector<pos_t> lengths;
        sdsl::bit_vector B_bits(n, 0);

        for (pos_t i = 0; i < n; i++) {
            if (i == 0 || bwt[i] != bwt[i - 1]) {
                B_bits[i] = 1;
                heads.emplace_back(bwt[i]);
                lengths.emplace_back(1);
            } else {
                lengths.back()++;
            }
        }

        r = heads.size();
        if (log) time = log_runtime(time);

        if (log) std::cout << "building C over L and H" << std::flush;
        count_table<pos_t> C_L(bwt, sigma, p);
        C_H = count_table<pos_t>(heads, sigma, p);
        if (log) time = log_runtime(time);

        if (log) std::cout << "building B_F" << std::flush;

        // runs with head c are laid out in F in their order in L, starting at C_L[c]
        sdsl::bit_vector B_F_bits(n, 0);
        std::vector<pos_t> pos_F(sigma);
        for (uint64_t c = 0; c < sigma; c++) pos_F[c] = C_L[c];

        for (pos_t j = 0; j < r; j++) {
            B_F_bits[pos_F[heads[j]]] = 1;
            pos_F[heads[j]] += lengths[j];
        }

        B = rank_select_bit_vector(std::move(B_bits));
        B_F = rank_select_bit_vector(std::move(B_F_bits));
        if (log) time = log_runtime(time);

        if (log) std::cout << "building wavelet matrix of H" << std::flush;
        H = wavelet_matrix<uint32_t>(heads, sigma);
        if (log) time = log_runtime(time);
    }

    inline uint64_t size() const
    {
        return n;
    }

    inline uint64_t alphabet_size() const
    {
        return C_H.alphabet_size();
    }

    inline pos_t num_bwt_runs() const
    {
        return r;
    }

    // L[i]
    inline uint64_t access(pos_t i) const
    {
        if (i >= n) [[unlikely]] {
            throw out_of_range_error("access(" + std::to_string(i) + ") on a BWT of size " + std::to_string(n));
        }

        return H.access(run_of(i));
    }

    // number of symbols in L smaller than c
    inline pos_t C(uint64_t c) const
    {
        return c >= alphabet_size() ? n : run_start_F(c, 0);
    }

    // number of occurrences of c in L[0, i)
    pos_t rank(uint64_t c, pos_t i) const
    {
        if (i > n) [[unlikely]] {
            throw out_of_range_error("rank position " + std::to_string(i) + " exceeds the BWT size " + std::to_string(n));
        }

        if (i == 0 || c >= alphabet_size()) return 0;

        pos_t j = run_of(i - 1);
        pos_t k = H.rank(c, j);
        pos_t occ = run_start_F(c, k) - run_start_F(c, 0);

        if (H.access(j) == c) {
            occ += i - B.select1(j);
        }

        return occ;
    }

    // position of the (k+1)-th occurrence of c in L
    pos_t select(uint64_t c, pos_t k) const
    {
        if (c >= alphabet_size() || k >= C(c + 1) - C(c)) [[unlikely]] {
            throw not_found_error("there is no occurrence of symbol " + std::to_string(c) +
                " with rank " + std::to_string(k) + " in the BWT");
        }

        pos_t i_F = C(c) + k;
        pos_t x = B_F.rank1(i_F + 1) - 1;
        pos_t j = H.select(c, x - C_H[c]);
        return B.select1(j) + (i_F - B_F.select1(x));
    }

    inline pos_t LF(uint64_t c, pos_t i) const
    {
        return C(c) + rank(c, i);
    }

    // moves whole runs: the offset of i in its run is kept in the run's image in F
    pos_t LF(pos_t i) const
    {
        if (i >= n) [[unlikely]] {
            throw out_of_range_error("LF(" + std::to_string(i) + ") on a BWT of size " + std::to_string(n));
        }

        pos_t j = run_of(i);
        uint64_t c = H.access(j);
        return run_start_F(c, H.rank(c, j)) + (i - B.select1(j));
    }

    // F[i], the i-th symbol in the sorted BWT
    inline uint64_t F(pos_t i) const
    {
        if (i >= n) [[unlikely]] {
            throw out_of_range_error("F(" + std::to_string(i) + ") on a BWT of size " + std::to_string(n));
        }

        return C_H.symbol_of(B_F.rank1(i + 1) - 1);
    }

    // LF^{-1}(i)
    inline pos_t FL(pos_t i) const
    {
        uint64_t c = F(i);
        return select(c, i - C(c));
    }

    uint64_t size_in_bytes() const
    {
        return H.size_in_bytes() + B.size_in_bytes() + B_F.size_in_bytes() + C_H.size_in_bytes() + sizeof(n) + sizeof(r);
    }

    void log_data_structure_sizes() const
    {
        std::cout << "H: " << format_size(H.size_in_bytes()) << std::endl;
        std::cout << "B: " << format_size(B.size_in_bytes()) << std::endl;
        std::cout << "B_F: " << format_size(B_F.size_in_bytes()) << std::endl;
        std::cout << "C_H: " << format_size(C_H.size_in_bytes()) << std::endl;
    }
};
