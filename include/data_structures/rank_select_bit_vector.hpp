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
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <sdsl/bits.hpp>
#include <sdsl/int_vector.hpp>

#include <misc/errors.hpp>
#include <misc/utils.hpp>

/**
 * @brief static bit vector supporting rank and select queries
 *
 * The bits are stored in an sdsl::bit_vector. Rank queries are answered with one lookup into an array of absolute
 * superblock ranks (every 512 bits), one lookup into an array of relative block ranks (every 64-bit word) and one
 * popcount. Select queries use sampled superblock indices (every 4096-th 0-/1-bit) to narrow down the superblock,
 * then scan the at most 8 block ranks in the superblock and finish with an in-word select.
 */
class rank_select_bit_vector {
protected:
    static constexpr uint64_t word_width = 64;
    static constexpr uint64_t words_per_superblock = 8;
    static constexpr uint64_t superblock_width = word_width * words_per_superblock;
    static constexpr uint64_t select_sample_rate = 4096;

    sdsl::bit_vector bits;
    uint64_t ones = 0; // number of 1-bits

    // [0 .. num_words / 8] number of 1-bits before each superblock
    std::vector<uint64_t> superblock_ranks;

    // [0 .. num_words] number of 1-bits before each word within its superblock
    std::vector<uint16_t> block_ranks;

    // superblocks containing every select_sample_rate-th 1-bit/0-bit
    std::vector<uint64_t> select1_samples;
    std::vector<uint64_t> select0_samples;

    inline uint64_t num_words() const
    {
        return div_ceil<uint64_t>(bits.size(), word_width);
    }

    inline uint64_t word(uint64_t w) const
    {
        return w < num_words() ? bits.data()[w] : 0;
    }

    inline uint64_t zeros_before_superblock(uint64_t sb) const
    {
        return sb * superblock_width - superblock_ranks[sb];
    }

    inline uint64_t zeros_before_word_in_superblock(uint64_t w) const
    {
        return (w % words_per_superblock) * word_width - block_ranks[w];
    }

    void build()
    {
        uint64_t w_max = num_words();
        superblock_ranks.assign(w_max / words_per_superblock + 1, 0);
        block_ranks.assign(w_max + 1, 0);
        ones = 0;

        for (uint64_t w = 0; w <= w_max; w++) {
            if (w % words_per_superblock == 0) {
                superblock_ranks[w / words_per_superblock] = ones;
            }

            block_ranks[w] = ones - superblock_ranks[w / words_per_superblock];
            if (w < w_max) ones += std::popcount(bits.data()[w]);
        }

        uint64_t num_superblocks = superblock_ranks.size();
        uint64_t zeros = bits.size() - ones;
        select1_samples.clear();
        select0_samples.clear();

        for (uint64_t sb = 0, k = 0; k < ones; k += select_sample_rate) {
            while (sb + 1 < num_superblocks && superblock_ranks[sb + 1] <= k) sb++;
            select1_samples.emplace_back(sb);
        }

        for (uint64_t sb = 0, k = 0; k < zeros; k += select_sample_rate) {
            while (sb + 1 < num_superblocks && zeros_before_superblock(sb + 1) <= k) sb++;
            select0_samples.emplace_back(sb);
        }

        select1_samples.emplace_back(num_superblocks - 1);
        select0_samples.emplace_back(num_superblocks - 1);
    }

    /**
     * @brief finds the position of the (k+1)-th 0-/1-bit
     * @tparam bit 0 or 1
     * @param k rank of the bit (0-based), must be smaller than the number of such bits
     */
    template <bool bit>
    uint64_t select_impl(uint64_t k) const
    {
        const std::vector<uint64_t>& samples = bit ? select1_samples : select0_samples;
        auto before_sb = [&](uint64_t sb){return bit ? superblock_ranks[sb] : zeros_before_superblock(sb);};
        auto before_w = [&](uint64_t w){return bit ? block_ranks[w] : zeros_before_word_in_superblock(w);};

        // binary search for the last superblock in [l, r] with at most k such bits before it
        uint64_t l = samples[k / select_sample_rate];
        uint64_t r = samples[k / select_sample_rate + 1];

        while (l < r) {
            uint64_t m = l + (r - l + 1) / 2;

            if (before_sb(m) <= k) {
                l = m;
            } else {
                r = m - 1;
            }
        }

        k -= before_sb(l);
        uint64_t w = l * words_per_superblock;
        uint64_t w_end = std::min<uint64_t>(w + words_per_superblock, num_words());

        while (w + 1 < w_end && before_w(w + 1) <= k) w++;

        k -= before_w(w);
        uint64_t val = bit ? word(w) : ~word(w);
        return w * word_width + sdsl::bits::sel(val, k + 1);
    }

public:
    rank_select_bit_vector()
    {
        build();
    }

    /**
     * @brief builds rank and select support for the bits in bv
     * @param bv a bit vector
     */
    explicit rank_select_bit_vector(sdsl::bit_vector&& bv) : bits(std::move(bv))
    {
        build();
    }

    /**
     * @brief builds rank and select support for a copy of the bits in b
     * @param b a vector of bools
     */
    explicit rank_select_bit_vector(const std::vector<bool>& b) : bits(b.size(), 0)
    {
        for (uint64_t i = 0; i < b.size(); i++) {
            if (b[i]) bits[i] = 1;
        }

        build();
    }

    inline uint64_t size() const
    {
        return bits.size();
    }

    inline bool empty() const
    {
        return bits.empty();
    }

    inline uint64_t num_ones() const
    {
        return ones;
    }

    inline uint64_t num_zeros() const
    {
        return bits.size() - ones;
    }

    /**
     * @brief returns the bit at position i
     * @param i position, 0 <= i < size()
     */
    inline bool operator[](uint64_t i) const
    {
        return bits[i];
    }

    /**
     * @brief returns the number of 1-bits in [0, i)
     * @param i position, 0 <= i <= size()
     */
    inline uint64_t rank1(uint64_t i) const
    {
        if (i > bits.size()) [[unlikely]] {
            throw out_of_range_error("rank position " + std::to_string(i) +
                " exceeds the bit vector size " + std::to_string(bits.size()));
        }

        uint64_t w = i / word_width;
        uint64_t r = superblock_ranks[w / words_per_superblock] + block_ranks[w];
        uint64_t o = i % word_width;
        return o == 0 ? r : r + std::popcount(word(w) << (word_width - o));
    }

    /**
     * @brief returns the number of 0-bits in [0, i)
     * @param i position, 0 <= i <= size()
     */
    inline uint64_t rank0(uint64_t i) const
    {
        return i - rank1(i);
    }

    /**
     * @brief returns the position of the (k+1)-th 1-bit
     * @param k number of 1-bits before the searched one, 0 <= k < num_ones()
     */
    inline uint64_t select1(uint64_t k) const
    {
        if (k >= ones) [[unlikely]] {
            throw out_of_range_error("select1(" + std::to_string(k) + ") on a bit vector with " +
                std::to_string(ones) + " 1-bits");
        }

        return select_impl<true>(k);
    }

    /**
     * @brief returns the position of the (k+1)-th 0-bit
     * @param k number of 0-bits before the searched one, 0 <= k < num_zeros()
     */
    inline uint64_t select0(uint64_t k) const
    {
        if (k >= num_zeros()) [[unlikely]] {
            throw out_of_range_error("select0(" + std::to_string(k) + ") on a bit vector with " +
                std::to_string(num_zeros()) + " 0-bits");
        }

        return select_impl<false>(k);
    }

    // shortcut for select1
    inline uint64_t select(uint64_t k) const
    {
        return select1(k);
    }

    // shortcut for rank1
    inline uint64_t rank(uint64_t i) const
    {
        return rank1(i);
    }

    /**
     * @brief returns the size of the data structure in bytes
     * @return size of the data structure in bytes
     */
    uint64_t size_in_bytes() const
    {
        return sizeof(*this) + sdsl::size_in_bytes(bits) +
            superblock_ranks.size() * sizeof(uint64_t) +
            block_ranks.size() * sizeof(uint16_t) +
            (select1_samples.size() + select0_samples.size()) * sizeof(uint64_t);
    }
};
