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
#include <iostream>
#include <string>
#include <vector>

#include <sdsl/int_vector.hpp>

#include <data_structures/rank_select_bit_vector.hpp>
#include <misc/utils.hpp>

/**
 * @brief suffix array samples at every text position that is a multiple of 2^level; the remaining suffix array
 * values are recovered by walking along LF until a sampled BWT index is reached (at most 2^level - 1 steps)
 * @tparam pos_t unsigned position type
 */
template <typename pos_t>
class sampled_sa {
protected:
    uint8_t level = 0; // sampling level
    rank_select_bit_vector sampled; // marks the sampled BWT indices (empty if level = 0)
    sdsl::int_vector<> samples; // SA[i] / 2^level for every sampled BWT index i, in BWT order

public:
    sampled_sa() = default;

    /**
     * @brief samples a suffix array
     * @param sa the suffix array
     * @param level sampling level, smaller than the bit width of pos_t
     * @param log whether to log the progress
     */
    sampled_sa(const std::vector<pos_t>& sa, uint8_t level, bool log = false) : level(level)
    {
        auto time = now();
        uint64_t n = sa.size();
        pos_t mask = (pos_t{1} << level) - 1;
        uint8_t width = std::max<uint8_t>(1, std::bit_width(uint64_t{n >> level}));

        if (log) std::cout << "sampling SA (level " << std::to_string(level) << ")" << std::flush;

        if (level == 0) {
            samples = sdsl::int_vector<>(n, 0, width);

            for (uint64_t i = 0; i < n; i++) {
                samples[i] = sa[i];
            }
        } else {
            sdsl::bit_vector sampled_bits(n, 0);
            uint64_t num_samples = 0;

            for (uint64_t i = 0; i < n; i++) {
                if ((sa[i] & mask) == 0) {
                    sampled_bits[i] = 1;
                    num_samples++;
                }
            }

            samples = sdsl::int_vector<>(num_samples, 0, width);

            for (uint64_t i = 0, j = 0; i < n; i++) {
                if (sampled_bits[i]) {
                    samples[j++] = sa[i] >> level;
                }
            }

            sampled = rank_select_bit_vector(std::move(sampled_bits));
        }

        if (log) time = log_runtime(time);
    }

    inline uint8_t sampling_level() const
    {
        return level;
    }

    inline uint64_t num_samples() const
    {
        return samples.size();
    }

    /**
     * @brief returns SA[i]
     * @param i BWT index
     * @param bwt the BWT the suffix array belongs to; it must provide LF
     */
    template <typename bwt_t>
    pos_t lookup(pos_t i, const bwt_t& bwt) const
    {
        if (level == 0) return samples[i];
        pos_t steps = 0;

        // SA[LF(i)] = SA[i] - 1, and SA[i] = 0 is always sampled
        while (!sampled[i]) {
            i = bwt.LF(i);
            steps++;
        }

        return (pos_t(samples[sampled.rank1(i)]) << level) + steps;
    }

    uint64_t size_in_bytes() const
    {
        return sizeof(*this) + sdsl::size_in_bytes(samples) + (level == 0 ? 0 : sampled.size_in_bytes());
    }
};
