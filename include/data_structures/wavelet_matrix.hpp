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
#include <bit>
#include <cassert>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include <data_structures/rank_select_bit_vector.hpp>

/**
 * @brief wavelet matrix over a sequence of integer symbols in [0, sigma)
 * @tparam sym_t unsigned integer type of the symbols
 *
 * Level l stores the (l+1)-th most significant of the bit_width(sigma - 1) bits of every symbol, in the order that
 * results from stably partitioning the sequence by the bits of all previous levels (0-bits first).
 */
template <typename sym_t = uint32_t>
class wavelet_matrix {
protected:
    static_assert(std::is_unsigned_v<sym_t>);

    uint64_t n = 0; // length of the sequence
    uint64_t sigma = 0; // alphabet size
    uint8_t levels = 0; // number of levels

    std::vector<rank_select_bit_vector> bvs; // [0 .. levels - 1] bit vectors of the levels
    std::vector<uint64_t> zeros; // [0 .. levels - 1] number of 0-bits in each level

    inline bool bit_at(sym_t c, uint8_t l) const
    {
        return (c >> (levels - 1 - l)) & 1;
    }

    /**
     * @brief maps the range [b, e) on level 0 to the range of the occurrences of c in it on the last level
     */
    inline void narrow(sym_t c, uint64_t& b, uint64_t& e) const
    {
        for (uint8_t l = 0; l < levels; l++) {
            const rank_select_bit_vector& bv = bvs[l];

            if (bit_at(c, l)) {
                b = zeros[l] + bv.rank1(b);
                e = zeros[l] + bv.rank1(e);
            } else {
                b = bv.rank0(b);
                e = bv.rank0(e);
            }
        }
    }

public:
    wavelet_matrix() = default;

    /**
     * @brief builds the wavelet matrix of a sequence
     * @param seq the sequence; every symbol must be smaller than sigma
     * @param sigma alphabet size
     */
    wavelet_matrix(const std::vector<sym_t>& seq, uint64_t sigma)
    {
        n = seq.size();
        this->sigma = sigma;
        levels = sigma <= 1 ? 0 : std::bit_width(sigma - 1);
        bvs.reserve(levels);
        zeros.reserve(levels);

        std::vector<sym_t> cur(seq);
        std::vector<sym_t> ones_buf;

        for (uint8_t l = 0; l < levels; l++) {
            sdsl::bit_vector bv(n, 0);
            uint64_t num_zeros = 0;
            ones_buf.clear();

            // record the bits of this level and stably move the symbols with a 1-bit to the back
            for (uint64_t i = 0; i < n; i++) {
                sym_t c = cur[i];
                assert(c < sigma);

                if (bit_at(c, l)) {
                    bv[i] = 1;
                    ones_buf.emplace_back(c);
                } else {
                    cur[num_zeros++] = c;
                }
            }

            std::copy(ones_buf.begin(), ones_buf.end(), cur.begin() + num_zeros);
            zeros.emplace_back(num_zeros);
            bvs.emplace_back(std::move(bv));
        }
    }

    inline uint64_t size() const
    {
        return n;
    }

    inline uint64_t alphabet_size() const
    {
        return sigma;
    }

    inline uint8_t num_levels() const
    {
        return levels;
    }

    /**
     * @brief returns the symbol at position i
     * @param i position, 0 <= i < size()
     */
    sym_t access(uint64_t i) const
    {
        if (i >= n) [[unlikely]] {
            throw out_of_range_error("access(" + std::to_string(i) + ") on a wavelet matrix of size " + std::to_string(n));
        }

        sym_t c = 0;

        for (uint8_t l = 0; l < levels; l++) {
            const rank_select_bit_vector& bv = bvs[l];
            c <<= 1;

            if (bv[i]) {
                c |= 1;
                i = zeros[l] + bv.rank1(i);
            } else {
                i = bv.rank0(i);
            }
        }

        return c;
    }

    /**
     * @brief returns the number of occurrences of c in [0, i)
     * @param c a symbol
     * @param i position, 0 <= i <= size()
     */
    uint64_t rank(sym_t c, uint64_t i) const
    {
        if (i > n) [[unlikely]] {
            throw out_of_range_error("rank position " + std::to_string(i) + " exceeds the wavelet matrix size " + std::to_string(n));
        }

        if (c >= sigma) return 0;
        uint64_t b = 0;
        narrow(c, b, i);
        return i - b;
    }

    /**
     * @brief returns the position of the (k+1)-th occurrence of c
     * @param c a symbol
     * @param k number of occurrences of c before the searched one
     */
    uint64_t select(sym_t c, uint64_t k) const
    {
        uint64_t b = 0;
        uint64_t e = n;
        if (c < sigma) narrow(c, b, e);

        if (c >= sigma || k >= e - b) [[unlikely]] {
            throw not_found_error("there is no occurrence of symbol " + std::to_string(c) +
                " with rank " + std::to_string(k) + " in the wavelet matrix");
        }

        uint64_t i = b + k;

        for (int16_t l = int16_t{levels} - 1; l >= 0; l--) {
            if (bit_at(c, l)) {
                i = bvs[l].select1(i - zeros[l]);
            } else {
                i = bvs[l].select0(i);
            }
        }

        return i;
    }

    /**
     * @brief returns the size of the data structure in bytes
     * @return size of the data structure in bytes
     */
    uint64_t size_in_bytes() const
    {
        uint64_t size = sizeof(*this) + zeros.size() * sizeof(uint64_t);

        for (const rank_select_bit_vector& bv : bvs) {
            size += bv.size_in_bytes();
        }

        return size;
    }
};
