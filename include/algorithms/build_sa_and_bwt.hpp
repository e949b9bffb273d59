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

#include <iostream>
#include <tuple>
#include <vector>

#include <omp.h>

#include <algorithms/sais.hpp>
#include <misc/utils.hpp>

/**
 * @brief builds the suffix array of T with SA-IS and (optionally) derives the BWT from it
 * @tparam pos_t unsigned position type
 * @tparam sym_t unsigned symbol type
 * @param T the text; its last symbol must be the terminator 0, which must not occur anywhere else
 * @param sigma alphabet size of T (including the terminator)
 * @param build_bwt whether to derive the BWT
 * @param p number of threads to use for deriving the BWT
 * @param log whether to log the progress
 * @return the suffix array and the BWT (empty if build_bwt is false)
 */
template <typename pos_t, typename sym_t>
std::tuple<std::vector<pos_t>, std::vector<sym_t>> build_sa_and_bwt(
    const std::vector<sym_t>& T, uint64_t sigma, bool build_bwt = true, uint16_t p = 1, bool log = false)
{
    auto time = now();
    uint64_t n = T.size();

    std::vector<pos_t> sa(n);
    std::vector<sym_t> bwt;

    if (log) std::cout << "building Suffix Array using SA-IS" << std::flush;
    sais<pos_t, sym_t>(T.data(), sa.data(), n, sigma);
    if (log) time = log_runtime(time);

    if (build_bwt) {
        if (log) std::cout << "building BWT" << std::flush;
        bwt.resize(n);

        #pragma omp parallel for num_threads(p)
        for (uint64_t i = 0; i < n; i++) {
            if (sa[i] == 0) [[unlikely]] {
                bwt[i] = T[n - 1];
            } else {
                bwt[i] = T[sa[i] - 1];
            }
        }

        if (log) time = log_runtime(time);
    }

    return { sa, bwt };
}
