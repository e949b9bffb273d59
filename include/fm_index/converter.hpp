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

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <misc/errors.hpp>

/**
 * @brief maps raw input symbols to a dense code range [0, alphabet_size()) and back
 */
template <typename conv_t, typename sym_t>
concept symbol_converter = requires(const conv_t& conv, sym_t sym, uint64_t code) {
    { conv.encode(sym) } -> std::convertible_to<uint64_t>;
    { conv.decode(code) } -> std::convertible_to<sym_t>;
    { conv.alphabet_size() } -> std::convertible_to<uint64_t>;
};

/**
 * @brief maps the contiguous symbol range [min, max] to the codes [0, max - min]
 * @tparam sym_t symbol type (char or an integer type)
 */
template <typename sym_t = char>
class range_converter {
protected:
    using usym_t = std::make_unsigned_t<sym_t>;

    sym_t min = 0;
    sym_t max = 0;

public:
    /**
     * @brief creates a converter for the symbol range [min, max]
     * @param min smallest supported symbol
     * @param max largest supported symbol
     */
    range_converter(sym_t min, sym_t max) : min(min), max(max)
    {
        if (min > max) {
            throw std::invalid_argument("range_converter: min must not be larger than max");
        }
    }

    // the printable ASCII range
    range_converter() requires std::is_same_v<sym_t, char> : range_converter(' ', '~') {}

    inline uint64_t alphabet_size() const
    {
        return uint64_t{usym_t(usym_t(max) - usym_t(min))} + 1;
    }

    inline uint64_t encode(sym_t sym) const
    {
        if (sym < min || sym > max) [[unlikely]] {
            throw invalid_symbol("symbol " + std::to_string(sym) + " is outside of the range [" +
                std::to_string(min) + ", " + std::to_string(max) + "]");
        }

        return usym_t(usym_t(sym) - usym_t(min));
    }

    inline sym_t decode(uint64_t code) const
    {
        return sym_t(usym_t(usym_t(min) + usym_t(code)));
    }
};

/**
 * @brief maps every value of a symbol type with at most 16 bits to its unsigned value
 */
template <typename sym_t = char>
requires (sizeof(sym_t) <= 2)
class id_converter {
protected:
    using usym_t = std::make_unsigned_t<sym_t>;

public:
    inline uint64_t alphabet_size() const
    {
        return uint64_t{std::numeric_limits<usym_t>::max()} + 1;
    }

    inline uint64_t encode(sym_t sym) const
    {
        return usym_t(sym);
    }

    inline sym_t decode(uint64_t code) const
    {
        return sym_t(usym_t(code));
    }
};
