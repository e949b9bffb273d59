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
#include <iostream>
#include <ips4o.hpp>
#include <fm_index/fm_index.hpp>

int main()
{
    // build an index
    fm_index<> index("This is a test string");

    // build a 64-bit run-length index with only count support, restrict the
    // alphabet to lower case letters and use at most 8 threads
    fm_index<_run_length, char, uint64_t> index_2("alargestring", range_converter<char>('a', 'z'),
        { .sampling_level = std::nullopt, .num_threads = 8 });

    // print the number of bwt runs in the input string
    std::cout << index.num_bwt_runs() << std::endl;

    // print the index size
    std::cout << format_size(index.size_in_bytes()) << std::endl;

    // print the number of occurences of a pattern
    std::cout << index.count("test") << std::endl;
    std::cout << index_2.count("rge") << std::endl;

    // store all occurences of a pattern in a vector and sort them
    auto Occ = index.locate("is");
    ips4o::sort(Occ.begin(), Occ.end());
    for (auto o : Occ) std::cout << o << ", ";
    std::cout << std::endl;

    // build an index for an integer vector with a sampling level of 2,
    // which keeps every fourth suffix array value
    fm_index<_plain, int32_t> index_3({ 2, -1, 5, -1, 7, 2, -1 },
        range_converter<int32_t>(-1, 7), { .sampling_level = 2 });

    // search [2,-1] in two steps (from right to left) and print the
    // number of occurrences after each step
    auto search = index_3.search_backward({ -1 });
    std::cout << search.count() << std::endl;
    search = search.search_backward({ 2 });
    std::cout << search.count() << std::endl;

    // print the suffix-array interval [b,e) of [2,-1]
    std::cout << "b = " << search.sa_interval().first
            << ", e = " << search.sa_interval().second << std::endl;

    // lazily locate the occurrences of [2,-1] in the input vector
    auto occurrences = search.occurrences();
    while (auto occ = occurrences.next()) {
        std::cout << *occ << ", " << std::flush;
    }

    std::cout << std::endl;

    // print the text surrounding the occurrence of "test"
    auto search_2 = index.search_backward("test");
    std::string before = search_2.iter_backward(0).take(5);
    std::reverse(before.begin(), before.end());
    std::cout << before << "[test]" << search_2.iter_forward(0).take(5) << std::endl;
}
