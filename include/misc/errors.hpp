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

#include <stdexcept>
#include <string>

/**
 * @brief base class of all errors reported by the index and its data structures
 */
class fm_index_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// a symbol lies outside of the range supported by the converter
class invalid_symbol : public fm_index_error {
public:
    using fm_index_error::fm_index_error;
};

// the operation is not supported by the index configuration (e.g. locate without SA-samples)
class unsupported_operation : public fm_index_error {
public:
    using fm_index_error::fm_index_error;
};

// a position or rank argument exceeds the size of the queried structure
class out_of_range_error : public fm_index_error {
public:
    using fm_index_error::fm_index_error;
};

// a select query asks for an occurrence that does not exist
class not_found_error : public fm_index_error {
public:
    using fm_index_error::fm_index_error;
};

// the index cannot be built for the given input and parameters
class construction_error : public fm_index_error {
public:
    using fm_index_error::fm_index_error;
};
