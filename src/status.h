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

#include <cstddef>
#include <stdexcept>
#include <string>

namespace numtext {

// Thrown when an alphabet cannot be constructed, or cannot serve the requested conversion.
class InvalidAlphabet : public std::invalid_argument
{
public:
    explicit InvalidAlphabet(const std::string& what) : std::invalid_argument(what) {}
};

enum class DecodeStatus {
    ok,
    empty,             // no digits in the input
    invalid_character, // a character which is not part of the number
    malformed,         // a sign without digits, a decimal point without digits, ...
    overflow,          // the value does not fit into the target integer
    invalid_delimiter, // empty or ambiguous delimiter(s)
    malformed_grid,    // rows of different length where a rectangular grid was required
};

const char* ToString(DecodeStatus status);

struct DecodeResult {
    const char* next;
    DecodeStatus status;

    explicit operator bool() const noexcept { return status == DecodeStatus::ok; }
};

struct SplitResult {
    DecodeStatus status;
    size_t index; // index of the offending element (or row), if status != ok

    explicit operator bool() const noexcept { return status == DecodeStatus::ok; }
};

// Returns the [first, last) character range of the window [start, start + length) of text.
// The window is clamped to the text: a window reaching past the end is cut at the end, and a
// window starting past the end is empty.
inline void ClampWindow(const std::string& text, size_t start, size_t length, const char*& first, const char*& last)
{
    const size_t size = text.size();
    if (start > size)
        start = size;
    if (length > size - start)
        length = size - start;

    first = text.data() + start;
    last = first + length;
}

} // namespace numtext
