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

#include <random>
#include <vector>

#include <gtest/gtest.h>
#include <data_structures/wavelet_matrix.hpp>

std::random_device rd;
std::mt19937 gen(rd());
std::uniform_int_distribution<uint64_t> size_distrib(1, 20000);

void check_against_scan(const std::vector<uint32_t>& seq, uint64_t sigma)
{
    wavelet_matrix<uint32_t> wm(seq, sigma);
    uint64_t n = seq.size();

    ASSERT_EQ(wm.size(), n);
    EXPECT_EQ(wm.alphabet_size(), sigma);

    std::vector<uint64_t> occ(sigma, 0);
    std::vector<std::vector<uint64_t>> positions(sigma);
    std::uniform_int_distribution<uint32_t> sym_distrib(0, sigma - 1);

    for (uint64_t i = 0; i < n; i++) {
        EXPECT_EQ(wm.access(i), seq[i]);

        // rank of the symbol at i and of one random symbol
        EXPECT_EQ(wm.rank(seq[i], i), occ[seq[i]]);
        uint32_t c = sym_distrib(gen);
        EXPECT_EQ(wm.rank(c, i), occ[c]);

        occ[seq[i]]++;
        positions[seq[i]].emplace_back(i);
    }

    for (uint32_t c = 0; c < sigma; c++) {
        EXPECT_EQ(wm.rank(c, n), occ[c]);

        for (uint64_t k = 0; k < positions[c].size(); k++) {
            EXPECT_EQ(wm.select(c, k), positions[c][k]);
        }

        EXPECT_THROW(wm.select(c, occ[c]), not_found_error);
    }

    EXPECT_EQ(wm.rank(sigma, n), 0);
    EXPECT_THROW(wm.select(sigma, 0), not_found_error);
    EXPECT_THROW(wm.access(n), out_of_range_error);
    EXPECT_THROW(wm.rank(0, n + 1), out_of_range_error);
}

TEST(test_wavelet_matrix, small)
{
    // 3 1 0 2 1 1 3
    std::vector<uint32_t> seq = {3, 1, 0, 2, 1, 1, 3};
    wavelet_matrix<uint32_t> wm(seq, 4);

    EXPECT_EQ(wm.num_levels(), 2);
    EXPECT_EQ(wm.access(3), 2);
    EXPECT_EQ(wm.rank(1, 5), 2);
    EXPECT_EQ(wm.rank(3, 7), 2);
    EXPECT_EQ(wm.select(1, 2), 5);
    EXPECT_EQ(wm.select(3, 1), 6);
    EXPECT_THROW(wm.select(0, 1), not_found_error);
    check_against_scan(seq, 4);
}

TEST(test_wavelet_matrix, single_symbol)
{
    std::vector<uint32_t> seq(1000, 0);
    wavelet_matrix<uint32_t> wm(seq, 1);

    EXPECT_EQ(wm.num_levels(), 0);
    EXPECT_EQ(wm.access(999), 0);
    EXPECT_EQ(wm.rank(0, 500), 500);
    EXPECT_EQ(wm.select(0, 123), 123);
    check_against_scan(seq, 1);
}

TEST(test_wavelet_matrix, empty)
{
    wavelet_matrix<uint32_t> wm(std::vector<uint32_t>{}, 5);
    EXPECT_EQ(wm.size(), 0);
    EXPECT_EQ(wm.rank(2, 0), 0);
    EXPECT_THROW(wm.select(2, 0), not_found_error);
    EXPECT_THROW(wm.access(0), out_of_range_error);
}

TEST(test_wavelet_matrix, random)
{
    // powers of two, non-powers of two and alphabets larger than the sequence
    for (uint64_t sigma : {2, 3, 4, 5, 7, 16, 100, 256, 1000, 70000}) {
        uint64_t n = size_distrib(gen);
        std::uniform_int_distribution<uint32_t> sym_distrib(0, sigma - 1);
        std::vector<uint32_t> seq(n);

        for (uint64_t i = 0; i < n; i++) {
            seq[i] = sym_distrib(gen);
        }

        check_against_scan(seq, sigma);
    }
}
