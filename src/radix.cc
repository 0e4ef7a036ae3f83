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

#include "radix.h"

#include <limits>
#include <type_traits>

using numtext::Alphabet;
using numtext::DecodeResult;
using numtext::DecodeStatus;

//==================================================================================================
//
//==================================================================================================

template <typename Int>
using UnsignedOf = typename std::make_unsigned<Int>::type;

template <typename Int>
static inline bool IsNegative(Int value, std::true_type /*is_signed*/)
{
    return value < 0;
}

template <typename Int>
static inline bool IsNegative(Int /*value*/, std::false_type /*is_signed*/)
{
    return false;
}

template <typename Int>
static inline bool IsNegative(Int value)
{
    return IsNegative(value, std::is_signed<Int>{});
}

// Parses the digits in [next, last) into value.
// Fails if the range is empty, contains a non-digit, or the value does not fit into UInt.
template <typename UInt>
static DecodeResult ParseDigits(const char* next, const char* last, const Alphabet& alphabet, UInt& value)
{
    static_assert(std::is_unsigned<UInt>::value, "internal error");

    if (next == last)
        return {next, DecodeStatus::empty};

    const UInt radix = static_cast<UInt>(alphabet.Radix());
    const UInt max_div = std::numeric_limits<UInt>::max() / radix;
    const UInt max_rem = std::numeric_limits<UInt>::max() % radix;

    UInt v = 0;
    for ( ; next != last; ++next)
    {
        const int d = alphabet.DigitValue(*next);
        if (d < 0)
            return {next, DecodeStatus::invalid_character};

        const UInt digit = static_cast<UInt>(d);
        if (v > max_div || (v == max_div && digit > max_rem))
            return {next, DecodeStatus::overflow};

        v = static_cast<UInt>(v * radix + digit);
    }

    value = v;
    return {next, DecodeStatus::ok};
}

//==================================================================================================
// Encode
//==================================================================================================

template <typename Int>
char* numtext::EncodeUnsigned(char* buffer, Int value, const Alphabet& alphabet)
{
    using UInt = UnsignedOf<Int>;

    const int width = alphabet.FixedWidth(std::numeric_limits<UInt>::digits);
    const UInt radix = static_cast<UInt>(alphabet.Radix());

    UInt v = static_cast<UInt>(value);
    for (int i = width - 1; i >= 0; --i)
    {
        buffer[i] = alphabet.Digit(static_cast<int>(v % radix));
        v = static_cast<UInt>(v / radix);
    }

    return buffer + width;
}

template <typename Int>
char* numtext::EncodeSigned(char* buffer, Int value, const Alphabet& alphabet)
{
    using UInt = UnsignedOf<Int>;

    // |value| in the unsigned type: the minimum has no positive counterpart in Int.
    UInt v = static_cast<UInt>(value);
    if (IsNegative(value))
    {
        *buffer++ = alphabet.NegativeSign();
        v = static_cast<UInt>(UInt{0} - v);
    }

    const UInt radix = static_cast<UInt>(alphabet.Radix());

    int num_digits = 0;
    for (UInt t = v; ; )
    {
        ++num_digits;
        t = static_cast<UInt>(t / radix);
        if (t == 0)
            break;
    }

    char* const end = buffer + num_digits;
    for (char* p = end; p != buffer; )
    {
        *--p = alphabet.Digit(static_cast<int>(v % radix));
        v = static_cast<UInt>(v / radix);
    }

    return end;
}

//==================================================================================================
// Decode
//==================================================================================================

template <typename Int>
DecodeResult numtext::DecodeUnsigned(const char* next, const char* last, const Alphabet& alphabet, Int& value)
{
    using UInt = UnsignedOf<Int>;

    if (next == last)
        return {next, DecodeStatus::empty};

    if (*next == alphabet.PositiveSign())
    {
        ++next;
        if (next == last)
            return {next, DecodeStatus::malformed};
    }

    UInt v;
    const auto res = ParseDigits(next, last, alphabet, v);
    if (res.status != DecodeStatus::ok)
        return res;

    value = static_cast<Int>(v);
    return res;
}

template <typename Int>
DecodeResult numtext::DecodeSigned(const char* next, const char* last, const Alphabet& alphabet, Int& value)
{
    using UInt = UnsignedOf<Int>;

    if (next == last)
        return {next, DecodeStatus::empty};

    const bool has_sign = (*next == alphabet.NegativeSign() || *next == alphabet.PositiveSign());
    const bool is_negative = (*next == alphabet.NegativeSign());
    if (has_sign)
    {
        ++next;
        if (next == last)
            return {next, DecodeStatus::malformed};
    }

    const char* const digits = next;

    UInt magnitude;
    const auto res = ParseDigits(next, last, alphabet, magnitude);
    if (res.status != DecodeStatus::ok)
        return res;

    static constexpr int Bits = std::numeric_limits<UInt>::digits;
    static constexpr UInt MaxPositive = static_cast<UInt>(std::numeric_limits<Int>::max());

    if (is_negative)
    {
        // For signed Int: |min| = 2^(Bits-1) = MaxPositive + 1.
        // For unsigned Int: only -0 is representable.
        const UInt max_magnitude = std::is_signed<Int>::value ? static_cast<UInt>(MaxPositive + 1) : UInt{0};
        if (magnitude > max_magnitude)
            return {digits, DecodeStatus::overflow};

        value = static_cast<Int>(static_cast<UInt>(UInt{0} - magnitude));
        return res;
    }

    if (magnitude > MaxPositive)
    {
        // The unsigned (fixed-width) form of a negative number.
        if (has_sign || last - digits != alphabet.FixedWidth(Bits))
            return {digits, DecodeStatus::overflow};
    }

    value = static_cast<Int>(magnitude);
    return res;
}

//==================================================================================================
//
//==================================================================================================

#define NUMTEXT_INSTANTIATE_RADIX(T) \
    template char* numtext::EncodeUnsigned<T>(char*, T, const Alphabet&); \
    template char* numtext::EncodeSigned<T>(char*, T, const Alphabet&); \
    template DecodeResult numtext::DecodeUnsigned<T>(const char*, const char*, const Alphabet&, T&); \
    template DecodeResult numtext::DecodeSigned<T>(const char*, const char*, const Alphabet&, T&);

NUMTEXT_INSTANTIATE_RADIX(int8_t)
NUMTEXT_INSTANTIATE_RADIX(uint8_t)
NUMTEXT_INSTANTIATE_RADIX(int16_t)
NUMTEXT_INSTANTIATE_RADIX(uint16_t)
NUMTEXT_INSTANTIATE_RADIX(int32_t)
NUMTEXT_INSTANTIATE_RADIX(uint32_t)
NUMTEXT_INSTANTIATE_RADIX(int64_t)
NUMTEXT_INSTANTIATE_RADIX(uint64_t)

#undef NUMTEXT_INSTANTIATE_RADIX
