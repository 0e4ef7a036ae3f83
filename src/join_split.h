// Copyright 2026 The numtext Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "alphabet.h"
#include "decimal_text.h"
#include "float_bits.h"
#include "format_digits.h"
#include "radix.h"
#include "status.h"
#include "strtod.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Delimited text for arrays of numbers: v1<D>v2<D>...<D>vn.
//
// The element format is chosen by a codec. A codec is a function object with
//  void Append(std::string& out, T value) const;
//  DecodeResult Decode(const char* next, const char* last, T& value) const;

namespace numtext {

//==================================================================================================
// Element codecs
//==================================================================================================

template <typename Int>
class SignedCodec
{
    const Alphabet* alphabet_;

public:
    using value_type = Int;

    explicit SignedCodec(const Alphabet& alphabet = Base10()) : alphabet_(&alphabet) {}

    void Append(std::string& out, Int value) const { AppendSigned(out, value, *alphabet_); }
    DecodeResult Decode(const char* next, const char* last, Int& value) const { return DecodeSigned(next, last, *alphabet_, value); }
};

template <typename Int>
class UnsignedCodec
{
    const Alphabet* alphabet_;

public:
    using value_type = Int;

    explicit UnsignedCodec(const Alphabet& alphabet = Base16()) : alphabet_(&alphabet) {}

    void Append(std::string& out, Int value) const { AppendUnsigned(out, value, *alphabet_); }
    DecodeResult Decode(const char* next, const char* last, Int& value) const { return DecodeUnsigned(next, last, *alphabet_, value); }
};

// Exact bit patterns (see EncodeBits).
template <typename Float>
class BitsCodec
{
    const Alphabet* alphabet_;

public:
    using value_type = Float;

    explicit BitsCodec(const Alphabet& alphabet = Base16()) : alphabet_(&alphabet) {}

    void Append(std::string& out, Float value) const { AppendBits(out, value, *alphabet_); }
    DecodeResult Decode(const char* next, const char* last, Float& value) const { return DecodeBits(next, last, *alphabet_, value); }
};

// Exact bit patterns, short for round numbers (see EncodeBitsCompact).
template <typename Float>
class CompactBitsCodec
{
    const Alphabet* alphabet_;

public:
    using value_type = Float;

    explicit CompactBitsCodec(const Alphabet& alphabet = Base64()) : alphabet_(&alphabet) {}

    void Append(std::string& out, Float value) const { AppendBitsCompact(out, value, *alphabet_); }
    DecodeResult Decode(const char* next, const char* last, Float& value) const { return DecodeBitsCompact(next, last, *alphabet_, value); }
};

// Shortest decimal text, spelled with the symbols of an alphabet (see EncodeDecimal).
template <typename Float>
class DecimalCodec
{
    const Alphabet* alphabet_;
    FormatOptions options_;

public:
    using value_type = Float;

    explicit DecimalCodec(const Alphabet& alphabet, const FormatOptions& options = {})
        : alphabet_(&alphabet)
        , options_(options)
    {
    }

    void Append(std::string& out, Float value) const { AppendDecimal(out, value, *alphabet_, options_); }
    DecodeResult Decode(const char* next, const char* last, Float& value) const { return DecodeDecimal(next, last, *alphabet_, value); }
};

// Shortest decimal text in plain ASCII.
template <typename Float>
class PlainDecimalCodec
{
    FormatOptions options_;

public:
    using value_type = Float;

    explicit PlainDecimalCodec(const FormatOptions& options = {}) : options_(options) {}

    void Append(std::string& out, Float value) const
    {
        char buf[MaxFormattedLength];
        out.append(buf, Format(buf, value, options_));
    }

    DecodeResult Decode(const char* next, const char* last, Float& value) const { return ParseFloat(next, last, value); }
};

//==================================================================================================
// 1D
//==================================================================================================

namespace impl {

// Returns the first occurrence of delimiter in [next, last), or last.
const char* FindDelimiter(const char* next, const char* last, const std::string& delimiter);

// Returns next + delimiter.size() if [next, last) starts with delimiter, next otherwise.
const char* SkipDelimiter(const char* next, const char* last, const std::string& delimiter);

void LogSplitFailure(DecodeStatus status, size_t index, const char* next, const char* last);

// Throws std::invalid_argument if the delimiters are empty or equal.
void CheckGridDelimiters(const std::string& row_delimiter, const std::string& element_delimiter);

} // namespace impl

template <typename T, typename Codec>
void AppendJoined(std::string& out, const std::string& delimiter, const std::vector<T>& values, const Codec& codec)
{
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (i != 0)
            out += delimiter;
        codec.Append(out, values[i]);
    }
}

// Returns v1<D>v2<D>...<D>vn, or the empty string for an empty array.
template <typename T, typename Codec>
std::string Join(const std::string& delimiter, const std::vector<T>& values, const Codec& codec)
{
    std::string out;
    AppendJoined(out, delimiter, values, codec);
    return out;
}

namespace impl {

// Decodes the elements in [first, last) into result. An empty range gives no elements.
// On failure, returns the status and sets index to the offending element.
template <typename T, typename Codec>
DecodeStatus SplitElements(const char* first, const char* last, const std::string& delimiter, const Codec& codec,
                           std::vector<T>& result, size_t& index)
{
    if (first == last)
        return DecodeStatus::ok;

    for (index = 0; ; ++index)
    {
        const char* const element_last = FindDelimiter(first, last, delimiter);

        T value;
        const auto res = codec.Decode(first, element_last, value);
        if (res.status != DecodeStatus::ok || res.next != element_last)
        {
            const auto status = res.status != DecodeStatus::ok ? res.status : DecodeStatus::invalid_character;
            LogSplitFailure(status, index, first, element_last);
            return status;
        }

        result.push_back(value);

        if (element_last == last)
            return DecodeStatus::ok;
        first = element_last + delimiter.size();
    }
}

} // namespace impl

// Decodes the (clamped) window [start, start + length) of text, which holds elements separated
// by delimiter. A delimiter at the start of the window is skipped. An empty window gives an
// empty array.
//
// On failure, returns the status and the index of the offending element, and leaves values
// unchanged. An empty delimiter gives DecodeStatus::invalid_delimiter.
template <typename T, typename Codec>
SplitResult Split(const std::string& text, const std::string& delimiter, const Codec& codec, std::vector<T>& values,
                  size_t start = 0, size_t length = std::string::npos)
{
    if (delimiter.empty())
        return {DecodeStatus::invalid_delimiter, 0};

    const char* first;
    const char* last;
    ClampWindow(text, start, length, first, last);

    first = impl::SkipDelimiter(first, last, delimiter);

    std::vector<T> result;
    size_t index = 0;
    const auto status = impl::SplitElements(first, last, delimiter, codec, result, index);
    if (status != DecodeStatus::ok)
        return {status, index};

    values = std::move(result);
    return {DecodeStatus::ok, 0};
}

//==================================================================================================
// 2D
//==================================================================================================

enum class GridShape {
    ragged,      // rows may differ in length
    rectangular, // all rows must have the same length
};

// Returns <R>row1<R>row2<R>...<R>rowN, where each row is joined with element_delimiter.
// Every row starts with the row delimiter, so empty rows survive a round trip through Split2D.
// Throws std::invalid_argument if a delimiter is empty or both are equal.
template <typename T, typename Codec>
std::string Join2D(const std::string& row_delimiter, const std::string& element_delimiter,
                   const std::vector<std::vector<T>>& rows, const Codec& codec)
{
    impl::CheckGridDelimiters(row_delimiter, element_delimiter);

    std::string out;
    for (const auto& row : rows)
    {
        out += row_delimiter;
        AppendJoined(out, element_delimiter, row, codec);
    }

    return out;
}

// Decodes the output of Join2D. The text is a sequence of rows separated by row_delimiter; a
// row delimiter at the start of the window opens the first row. An empty window gives no rows,
// and a window holding just the row delimiter gives one empty row. Unlike Split, a row must not
// start with element_delimiter.
//
// On failure, returns the status and the index of the offending row, and leaves rows
// unchanged. Empty or equal delimiters give DecodeStatus::invalid_delimiter. With
// GridShape::rectangular, rows of different length give DecodeStatus::malformed_grid.
template <typename T, typename Codec>
SplitResult Split2D(const std::string& text, const std::string& row_delimiter, const std::string& element_delimiter,
                    const Codec& codec, std::vector<std::vector<T>>& rows, GridShape shape = GridShape::ragged,
                    size_t start = 0, size_t length = std::string::npos)
{
    if (row_delimiter.empty() || element_delimiter.empty() || row_delimiter == element_delimiter)
        return {DecodeStatus::invalid_delimiter, 0};

    const char* first;
    const char* last;
    ClampWindow(text, start, length, first, last);

    const char* const rows_first = impl::SkipDelimiter(first, last, row_delimiter);
    const bool has_leading_delimiter = (rows_first != first);
    first = rows_first;

    std::vector<std::vector<T>> result;
    if (first != last || has_leading_delimiter)
    {
        for (size_t index = 0; ; ++index)
        {
            const char* const row_last = impl::FindDelimiter(first, last, row_delimiter);

            std::vector<T> row;
            size_t element_index = 0;
            const auto status = impl::SplitElements(first, row_last, element_delimiter, codec, row, element_index);
            if (status != DecodeStatus::ok)
                return {status, index};

            if (shape == GridShape::rectangular && !result.empty() && row.size() != result.front().size())
            {
                impl::LogSplitFailure(DecodeStatus::malformed_grid, index, first, row_last);
                return {DecodeStatus::malformed_grid, index};
            }

            result.push_back(std::move(row));

            if (row_last == last)
                break;
            first = row_last + row_delimiter.size();
        }
    }

    rows = std::move(result);
    return {DecodeStatus::ok, 0};
}

} // namespace numtext
