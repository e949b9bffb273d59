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

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <ips4o.hpp>
#include <fm_index/fm_index.hpp>

std::random_device rd;
std::mt19937 gen(rd());
std::uniform_real_distribution<double> prob_distrib(0.0, 1.0);
std::uniform_int_distribution<char> char_distrib('a', 'h');

// concatenates mutated copies of a random block
std::string repetitive_input(uint32_t block_size, uint32_t num_copies, double mutation_prob)
{
    std::string block;
    for (uint32_t i = 0; i < block_size; i++) block.push_back(char_distrib(gen));
    std::string input;

    for (uint32_t j = 0; j < num_copies; j++) {
        for (char c : block) {
            input.push_back(prob_distrib(gen) < mutation_prob ? char_distrib(gen) : c);
        }
    }

    return input;
}

std::string random_input(uint32_t size)
{
    std::string input;
    for (uint32_t i = 0; i < size; i++) input.push_back(char_distrib(gen));
    return input;
}

/**
 * @brief compares access, rank, select, LF, F and FL of both backends at every BWT index
 */
void compare_backends(const std::string& input)
{
    fm_index<_plain> index_plain(input);
    fm_index<_run_length> index_rl(input);
    const auto& plain = index_plain.bwt_structure();
    const auto& rl = index_rl.bwt_structure();

    ASSERT_EQ(plain.size(), rl.size());
    ASSERT_EQ(plain.alphabet_size(), rl.alphabet_size());
    EXPECT_EQ(plain.num_bwt_runs(), rl.num_bwt_runs());

    uint32_t size = plain.size();
    uint64_t sigma = plain.alphabet_size();

    for (uint64_t c = 0; c <= sigma; c++) {
        EXPECT_EQ(plain.C(c), rl.C(c));
    }

    std::vector<uint32_t> occ(sigma, 0);

    for (uint32_t i = 0; i < size; i++) {
        uint64_t c = plain.access(i);
        EXPECT_EQ(rl.access(i), c);
        EXPECT_EQ(rl.rank(c, i), plain.rank(c, i));
        EXPECT_EQ(rl.select(c, occ[c]), i);
        EXPECT_EQ(rl.LF(i), plain.LF(i));
        EXPECT_EQ(rl.F(i), plain.F(i));
        EXPECT_EQ(rl.FL(i), plain.FL(i));
        occ[c]++;
    }

    for (uint64_t c = 0; c < sigma; c++) {
        EXPECT_EQ(rl.rank(c, size), occ[c]);
        EXPECT_THROW(rl.select(c, occ[c]), not_found_error);
    }

    EXPECT_THROW(rl.select(sigma, 0), not_found_error);
    EXPECT_THROW(rl.access(size), out_of_range_error);
}

/**
 * @brief compares count, locate and the character iterators of both backends for patterns from the input
 */
void compare_queries(const std::string& input, uint32_t num_queries)
{
    fm_index<_plain> index_plain(input, {.sampling_level = 0});
    fm_index<_run_length> index_rl(input, {.sampling_level = 3});
    std::uniform_int_distribution<uint32_t> pos_distrib(0, input.size() - 1);
    std::uniform_int_distribution<uint32_t> length_distrib(1, 30);

    for (uint32_t q = 0; q < num_queries; q++) {
        std::string pattern = input.substr(pos_distrib(gen), length_distrib(gen));
        auto search_plain = index_plain.search_backward(pattern);
        auto search_rl = index_rl.search_backward(pattern);

        ASSERT_EQ(search_rl.count(), search_plain.count());
        EXPECT_EQ(search_rl.sa_interval(), search_plain.sa_interval());
        EXPECT_EQ(search_rl.locate(), search_plain.locate());

        uint32_t k = std::uniform_int_distribution<uint32_t>(0, search_plain.count() - 1)(gen);
        EXPECT_EQ(search_rl.iter_forward(k).take(40), search_plain.iter_forward(k).take(40));
        EXPECT_EQ(search_rl.iter_backward(k).take(40), search_plain.iter_backward(k).take(40));
    }
}

TEST(test_run_length_bwt, banana)
{
    fm_index<_run_length> index("banana");

    // annb$aa
    EXPECT_EQ(index.num_bwt_runs(), 5);
    EXPECT_EQ(index.count("ana"), 2);

    std::vector<uint32_t> occ = index.locate("ana");
    ips4o::sort(occ.begin(), occ.end());
    EXPECT_EQ(occ, std::vector<uint32_t>({1, 3}));
    compare_backends("banana");
}

TEST(test_run_length_bwt, single_run)
{
    std::string input(1000, 'a');
    fm_index<_run_length> index(input);

    // a^1000 $
    EXPECT_EQ(index.num_bwt_runs(), 2);
    EXPECT_EQ(index.count("aaa"), 998);

    // the k-th occurrence in BWT order is the k-th smallest suffix starting with "a", i.e. the one at 999 - k
    auto search = index.search_backward("a");
    std::vector<uint32_t> occ = search.locate();
    ASSERT_EQ(occ.size(), 1000);

    for (uint32_t k = 0; k < occ.size(); k++) {
        uint32_t p = occ[k];
        EXPECT_EQ(p, 999 - k);
        EXPECT_EQ(search.iter_forward(k).take(5), input.substr(p + 1, 5));
        EXPECT_EQ(search.iter_backward(k).take(5).size(), std::min<uint32_t>(p, 5));
    }

    compare_backends(input);
}

TEST(test_run_length_bwt, backend_operations)
{
    compare_backends("mississippi");
    compare_backends(random_input(5000));
    compare_backends(repetitive_input(200, 30, 0.01));
}

TEST(test_run_length_bwt, random_inputs)
{
    for (uint32_t round = 0; round < 5; round++) {
        compare_queries(random_input(10000), 300);
    }
}

TEST(test_run_length_bwt, repetitive_inputs)
{
    for (double mutation_prob : {0.0, 0.0005, 0.002}) {
        std::string input = repetitive_input(500, 100, mutation_prob);
        fm_index<_plain> index_plain(input);
        fm_index<_run_length> index_rl(input);

        // few runs and a smaller index than the plain one
        EXPECT_LT(index_rl.num_bwt_runs(), input.size() / 10);
        EXPECT_LT(index_rl.bwt_structure().size_in_bytes(), index_plain.bwt_structure().size_in_bytes());

        compare_queries(input, 300);
    }
}

TEST(test_run_length_bwt, count_only)
{
    std::string input = repetitive_input(100, 50, 0.005);
    fm_index<_run_length> index(input, {.sampling_level = std::nullopt});
    fm_index<_plain> index_plain(input, {.sampling_level = std::nullopt});

    EXPECT_THROW(index.locate("ab"), unsupported_operation);
    EXPECT_EQ(index.count("abc"), index_plain.count("abc"));
    EXPECT_LT(index.size_in_bytes(), index_plain.size_in_bytes());
}
