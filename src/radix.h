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
#include "status.h"

#include <cstddef>
#include <cstdint>
#include <string>

// Positional notation for the fixed-width integer types.
//
// Int must be one of int8_t, uint8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t.

namespace numtext {

// 64 binary digits and a sign.
static constexpr int MaxEncodedIntegerLength = 65;

// Writes exactly alphabet.FixedWidth(bits of Int) digits, zero-padded.
// Signed values are written as their two's complement bit pattern, so -1 is all max-digits.
// Returns a pointer to the end of the digits. The buffer must hold at least
// MaxEncodedIntegerLength characters.
template <typename Int>
char* EncodeUnsigned(char* buffer, Int value, const Alphabet& alphabet);

// Writes the negative sign (if value < 0) and the minimal digit sequence of |value|.
// Returns a pointer to the end of the digits.
template <typename Int>
char* EncodeSigned(char* buffer, Int value, const Alphabet& alphabet);

// Decodes the complete range [next, last), which must not contain anything but the number.
//
// DecodeUnsigned accepts an optional positive sign, then the digits. The value must fit into
// the unsigned type of the same width as Int; for signed Int the result is the two's complement
// reinterpretation.
//
// DecodeSigned accepts an optional negative or positive sign, then the digits. A run of exactly
// FixedWidth digits without a sign is read as the two's complement bit pattern written by
// EncodeUnsigned. Any other run must fit into Int.
//
// On success, value is set and result.next == last. On failure, value is left unchanged and
// result.next points at the offending character.
template <typename Int>
DecodeResult DecodeUnsigned(const char* next, const char* last, const Alphabet& alphabet, Int& value);

template <typename Int>
DecodeResult DecodeSigned(const char* next, const char* last, const Alphabet& alphabet, Int& value);

//==================================================================================================
// std::string helpers
//==================================================================================================

template <typename Int>
void AppendUnsigned(std::string& out, Int value, const Alphabet& alphabet)
{
    char buf[MaxEncodedIntegerLength];
    char* const end = EncodeUnsigned(buf, value, alphabet);
    out.append(buf, end);
}

template <typename Int>
void AppendSigned(std::string& out, Int value, const Alphabet& alphabet)
{
    char buf[MaxEncodedIntegerLength];
    char* const end = EncodeSigned(buf, value, alphabet);
    out.append(buf, end);
}

template <typename Int>
std::string EncodeUnsigned(Int value, const Alphabet& alphabet)
{
    std::string out;
    AppendUnsigned(out, value, alphabet);
    return out;
}

template <typename Int>
std::string EncodeSigned(Int value, const Alphabet& alphabet)
{
    std::string out;
    AppendSigned(out, value, alphabet);
    return out;
}

// Decodes the (clamped) window of text, which must contain the number and nothing else.
template <typename Int>
DecodeStatus DecodeUnsigned(const std::string& text, const Alphabet& alphabet, Int& value,
                            size_t start = 0, size_t length = std::string::npos)
{
    const char* first;
    const char* last;
    ClampWindow(text, start, length, first, last);
    return DecodeUnsigned(first, last, alphabet, value).status;
}

template <typename Int>
DecodeStatus DecodeSigned(const std::string& text, const Alphabet& alphabet, Int& value,
                          size_t start = 0, size_t length = std::string::npos)
{
    const char* first;
    const char* last;
    ClampWindow(text, start, length, first, last);
    return DecodeSigned(first, last, alphabet, value).status;
}

} // namespace numtext
