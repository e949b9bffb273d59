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
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <omp.h>

#include <algorithms/build_sa_and_bwt.hpp>
#include <fm_index/bwt_backend.hpp>
#include <fm_index/converter.hpp>
#include <fm_index/plain_bwt.hpp>
#include <fm_index/run_length_bwt.hpp>
#include <fm_index/sampled_sa.hpp>
#include <misc/errors.hpp>
#include <misc/utils.hpp>

/**
 * @brief construction parameters
 */
struct fm_index_params {
    // sampling level L: every SA-value that is a multiple of 2^L is kept; std::nullopt disables locate support
    std::optional<uint8_t> sampling_level = 0;
    uint16_t num_threads = omp_get_max_threads(); // maximum number of threads to use during the construction
    bool log = false; // controls, whether to print log messages
};

/**
 * @brief FM-index supporting count, locate and character iteration around occurrences
 * @tparam backend representation of the BWT (_plain or _run_length)
 * @tparam sym_t value type (default: char for strings)
 * @tparam pos_t index integer type (use uint32_t if input size < UINT_MAX, else uint64_t)
 * @tparam converter_t maps the symbols of the input to a dense range of codes and back
 */
template <
    fm_index_backend backend = _plain,
    typename sym_t = char,
    typename pos_t = uint32_t,
    typename converter_t = range_converter<sym_t>>
requires symbol_converter<converter_t, sym_t>
class fm_index {
    static_assert(std::is_same_v<pos_t, uint32_t> || std::is_same_v<pos_t, uint64_t>);

public:
    static constexpr bool str_input = std::is_same_v<sym_t, char>; // true <=> the input is a string

    using inp_t = std::conditional_t<str_input, std::string, std::vector<sym_t>>; // input container type

    using bwt_t = constexpr_switch_t< // BWT representation
        constexpr_case<backend == _run_length, run_length_bwt<pos_t>>,
     /* constexpr_case<backend == _plain, */   plain_bwt<pos_t>>;

    static_assert(bwt_backend<bwt_t, pos_t>);

    class search_t;
    class backward_iterator;
    class forward_iterator;
    class occurrence_iterator;

protected:
    // ############################# INDEX DATA STRUCTURES #############################

    converter_t conv; // input symbol <-> code mapping; internal code = code + 1, 0 is the terminator
    pos_t n = 0; // input size (without the terminator)
    uint64_t sigma = 0; // internal alphabet size (including the terminator)
    bwt_t bwt; // the BWT of the input
    std::optional<sampled_sa<pos_t>> ssa; // suffix array samples, if locate is supported

    // ############################# INTERNAL METHODS #############################

    /**
     * @brief maps a symbol to its internal code
     * @param sym a symbol
     * @return internal code of sym, in [1, sigma)
     */
    inline uint64_t encode(sym_t sym) const
    {
        return uint64_t(conv.encode(sym)) + 1;
    }

    /**
     * @brief maps an internal code in [1, sigma) back to its symbol
     */
    inline sym_t decode(uint64_t c) const
    {
        return conv.decode(c - 1);
    }

    /**
     * @brief constructs the index of the input
     * @param input the input
     * @param params construction parameters
     */
    void build(const inp_t& input, fm_index_params params)
    {
        auto time = now();
        auto time_start = time;
        bool log = params.log;
        uint16_t p = std::max<uint16_t>(1, params.num_threads);

        if (input.size() + 1 >= sais_empty<pos_t>) {
            throw construction_error("the input of size " + std::to_string(input.size()) +
                " does not fit into a " + std::to_string(8 * sizeof(pos_t)) + "-bit index");
        }

        sigma = uint64_t(conv.alphabet_size()) + 1;

        if (sigma > std::numeric_limits<uint32_t>::max() || sigma + 1 >= sais_empty<pos_t>) {
            throw construction_error("the alphabet of size " + std::to_string(sigma - 1) + " is too large");
        }

        if (params.sampling_level.has_value() && *params.sampling_level >= 8 * sizeof(pos_t)) {
            throw construction_error("the sampling level " + std::to_string(*params.sampling_level) +
                " must be smaller than " + std::to_string(8 * sizeof(pos_t)));
        }

        n = input.size();

        if (log) {
            std::cout << "building FM-index (n = " << n << ", sigma = " << sigma << ") using "
                << format_threads(p) << std::endl;
            std::cout << "preprocessing T" << std::flush;
        }

        std::vector<uint32_t> T(n + 1);

        for (uint64_t i = 0; i < n; i++) {
            T[i] = encode(input[i]);
        }

        T[n] = 0;
        if (log) time = log_runtime(time);

        auto [sa, L] = build_sa_and_bwt<pos_t, uint32_t>(T, sigma, true, p, log);
        T.clear();
        T.shrink_to_fit();

        bwt = bwt_t(L, sigma, p, log);
        L.clear();
        L.shrink_to_fit();

        if (params.sampling_level.has_value()) {
            ssa.emplace(sa, *params.sampling_level, log);
        }

        if (log) {
            std::cout << "overall construction time: " << format_time(time_diff_ns(time_start, now())) << std::endl;
            std::cout << "index size: " << format_size(size_in_bytes()) << std::endl;
        }
    }

    // ############################# CONSTRUCTORS #############################

public:
    fm_index() = default;

    /**
     * @brief constructs an FM-index of the input
     * @param input the input
     * @param conv converter for the symbols of the input
     * @param params construction parameters
     */
    fm_index(const inp_t& input, const converter_t& conv, fm_index_params params = {}) : conv(conv)
    {
        build(input, params);
    }

    /**
     * @brief constructs an FM-index of the input with a default-constructed converter
     * @param input the input
     * @param params construction parameters
     */
    fm_index(const inp_t& input, fm_index_params params = {})
    requires std::is_default_constructible_v<converter_t>
    : fm_index(input, converter_t(), params) {}

    // ############################# MISC PUBLIC METHODS #############################

    // length of the input
    inline pos_t input_size() const
    {
        return n;
    }

    // length of the BWT (input size + 1)
    inline pos_t bwt_size() const
    {
        return n + 1;
    }

    // number of symbols supported by the converter
    inline uint64_t alphabet_size() const
    {
        return sigma - 1;
    }

    inline pos_t num_bwt_runs() const
    {
        return bwt.num_bwt_runs();
    }

    inline bool supports_locate() const
    {
        return ssa.has_value();
    }

    inline std::optional<uint8_t> sampling_level() const
    {
        if (!ssa.has_value()) return std::nullopt;
        return ssa->sampling_level();
    }

    inline const converter_t& converter() const
    {
        return conv;
    }

    /**
     * @brief returns the BWT representation; its symbols are internal codes (code + 1, 0 is the terminator)
     */
    inline const bwt_t& bwt_structure() const
    {
        return bwt;
    }

    /**
     * @brief returns the size of the data structure in bytes
     * @return size of the data structure in bytes
     */
    uint64_t size_in_bytes() const
    {
        return sizeof(*this) + bwt.size_in_bytes() + (ssa.has_value() ? ssa->size_in_bytes() : 0);
    }

    /**
     * @brief logs the index data structure sizes to cout
     */
    void log_data_structure_sizes(bool print_index_size = true) const
    {
        if (print_index_size) std::cout << "index size: " << format_size(size_in_bytes()) << std::endl;

        bwt.log_data_structure_sizes();

        if (ssa.has_value()) {
            std::cout << "SA samples (level " << std::to_string(ssa->sampling_level()) << "): "
                << format_size(ssa->size_in_bytes()) << std::endl;
        }
    }

    // ############################# QUERY METHODS #############################

    /**
     * @brief lazily yields the symbols preceding an occurrence, from right to left
     */
    class backward_iterator {
    protected:
        const fm_index* idx; // index to query
        pos_t i; // BWT index of the suffix starting right after the next symbol to report
        bool done = false;

    public:
        backward_iterator(const fm_index& idx, pos_t i) : idx(&idx), i(i) {}

        /**
         * @brief returns the next symbol to the left, or std::nullopt if the start of the input has been reached
         */
        std::optional<sym_t> next()
        {
            if (done) return std::nullopt;
            uint64_t c = idx->bwt.access(i);

            if (c == 0) {
                done = true;
                return std::nullopt;
            }

            i = idx->bwt.LF(c, i);
            return idx->decode(c);
        }

        /**
         * @brief returns the next (at most) k symbols in the order they are reported
         */
        inp_t take(uint64_t k)
        {
            inp_t res;

            for (uint64_t j = 0; j < k; j++) {
                std::optional<sym_t> sym = next();
                if (!sym.has_value()) break;
                res.push_back(*sym);
            }

            return res;
        }
    };

    /**
     * @brief lazily yields the symbols following an occurrence of the matched pattern, from left to right
     */
    class forward_iterator {
    protected:
        const fm_index* idx; // index to query
        pos_t i; // BWT index of the suffix starting with the next symbol to report
        bool done = false;

    public:
        /**
         * @brief creates an iterator starting m symbols after the suffix at BWT index i
         */
        forward_iterator(const fm_index& idx, pos_t i, pos_t m) : idx(&idx), i(i)
        {
            for (pos_t j = 0; j < m; j++) {
                this->i = idx.bwt.FL(this->i);
            }
        }

        /**
         * @brief returns the next symbol to the right, or std::nullopt if the end of the input has been reached
         */
        std::optional<sym_t> next()
        {
            if (done) return std::nullopt;
            uint64_t c = idx->bwt.F(i);

            if (c == 0) {
                done = true;
                return std::nullopt;
            }

            i = idx->bwt.FL(i);
            return idx->decode(c);
        }

        /**
         * @brief returns the next (at most) k symbols in the order they are reported
         */
        inp_t take(uint64_t k)
        {
            inp_t res;

            for (uint64_t j = 0; j < k; j++) {
                std::optional<sym_t> sym = next();
                if (!sym.has_value()) break;
                res.push_back(*sym);
            }

            return res;
        }
    };

    /**
     * @brief lazily resolves the occurrences of a pattern to their positions in the input (in BWT order)
     */
    class occurrence_iterator {
    protected:
        const fm_index* idx; // index to query
        pos_t i; // BWT index of the next occurrence to report
        pos_t e; // end of the SA-interval

    public:
        occurrence_iterator(const fm_index& idx, pos_t b, pos_t e) : idx(&idx), i(b), e(e) {}

        // number of occurrences not yet reported
        inline pos_t num_occ_rem() const
        {
            return e > i ? e - i : 0;
        }

        /**
         * @brief returns the position of the next occurrence, or std::nullopt if all have been reported
         */
        std::optional<pos_t> next()
        {
            if (i >= e) return std::nullopt;
            return idx->ssa->lookup(i++, idx->bwt);
        }
    };

    /**
     * @brief an SA-interval [b, e) together with the pattern whose occurrences it contains; extending it returns
     * a new search and leaves this one unchanged
     */
    class search_t {
    protected:
        const fm_index* idx; // index to query
        pos_t b; // start of the SA-interval
        pos_t e; // end of the SA-interval (exclusive)
        inp_t P; // the matched pattern

        // the empty pattern's interval contains the suffix consisting only of the terminator, which is skipped
        inline pos_t first() const
        {
            return b == 0 ? 1 : b;
        }

        inline void check_occurrence(pos_t k) const
        {
            if (k >= count()) [[unlikely]] {
                throw out_of_range_error("occurrence " + std::to_string(k) + " does not exist, there are only " +
                    std::to_string(count()) + " occurrences");
            }
        }

        inline void check_locate() const
        {
            if (!idx->supports_locate()) [[unlikely]] {
                throw unsupported_operation("locate is not supported by an index without SA samples");
            }
        }

    public:
        /**
         * @brief creates a search for the empty pattern
         * @param idx an index
         */
        search_t(const fm_index& idx) : idx(&idx), b(0), e(idx.bwt_size()) {}

        /**
         * @brief returns the search for the pattern + the currently matched pattern
         * @param pattern the pattern to prepend
         */
        search_t search_backward(const inp_t& pattern) const
        {
            std::vector<uint64_t> codes;
            codes.reserve(pattern.size());

            for (const sym_t& sym : pattern) {
                codes.emplace_back(idx->encode(sym));
            }

            search_t res = *this;

            for (uint64_t j = codes.size(); j > 0 && res.b < res.e; j--) {
                res.b = idx->bwt.LF(codes[j - 1], res.b);
                res.e = idx->bwt.LF(codes[j - 1], res.e);
            }

            res.P = pattern;
            res.P.insert(res.P.end(), P.begin(), P.end());
            return res;
        }

        // the matched pattern
        inline const inp_t& pattern() const
        {
            return P;
        }

        /**
         * @brief returns the SA-interval [b, e) of the matched pattern
         */
        inline std::pair<pos_t, pos_t> sa_interval() const
        {
            return std::make_pair(b, e);
        }

        /**
         * @brief returns the number of occurrences of the matched pattern
         */
        inline pos_t count() const
        {
            pos_t f = first();
            return e > f ? e - f : 0;
        }

        /**
         * @brief appends the positions of all occurrences of the matched pattern to occ (in BWT order)
         */
        void locate(std::vector<pos_t>& occ) const
        {
            check_locate();
            occ.reserve(occ.size() + count());

            for (pos_t i = first(); i < e; i++) {
                occ.emplace_back(idx->ssa->lookup(i, idx->bwt));
            }
        }

        /**
         * @brief returns the positions of all occurrences of the matched pattern (in BWT order)
         */
        std::vector<pos_t> locate() const
        {
            std::vector<pos_t> occ;
            locate(occ);
            return occ;
        }

        /**
         * @brief returns a lazy iterator over the positions of all occurrences of the matched pattern
         */
        occurrence_iterator occurrences() const
        {
            check_locate();
            return occurrence_iterator(*idx, first(), std::max(first(), e));
        }

        /**
         * @brief returns an iterator over the symbols preceding the k-th occurrence (in BWT order)
         * @param k occurrence index, 0 <= k < count()
         */
        backward_iterator iter_backward(pos_t k) const
        {
            check_occurrence(k);
            return backward_iterator(*idx, first() + k);
        }

        /**
         * @brief returns an iterator over the symbols following the k-th occurrence (in BWT order)
         * @param k occurrence index, 0 <= k < count()
         */
        forward_iterator iter_forward(pos_t k) const
        {
            check_occurrence(k);
            return forward_iterator(*idx, first() + k, P.size());
        }
    };

    /**
     * @brief returns a search for the empty pattern
     */
    inline search_t query() const
    {
        return search_t(*this);
    }

    /**
     * @brief searches a pattern
     * @param pattern the pattern
     */
    inline search_t search_backward(const inp_t& pattern) const
    {
        return query().search_backward(pattern);
    }

    /**
     * @brief returns the number of occurrences of the pattern in the input
     */
    inline pos_t count(const inp_t& pattern) const
    {
        return search_backward(pattern).count();
    }

    /**
     * @brief returns the positions of all occurrences of the pattern in the input (in BWT order)
     */
    inline std::vector<pos_t> locate(const inp_t& pattern) const
    {
        return search_backward(pattern).locate();
    }
};
