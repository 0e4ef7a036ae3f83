// Copyright 2019 Alexander Bolz
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

#include "format_digits.h"
#include "ieee.h"

#include <cstring>

using numtext::FloatFormat;
using numtext::FloatingDecimal;
using numtext::FormatOptions;
using numtext::IEEE;

//==================================================================================================
//
//==================================================================================================

static inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    NUMTEXT_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2 * digits], 2 * sizeof(char));
    return buf + 2;
}

static inline void Utoa_8Digits(char* buf, uint32_t digits)
{
    NUMTEXT_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_2Digits(buf + 0, q / 100);
    Utoa_2Digits(buf + 2, q % 100);
    Utoa_2Digits(buf + 4, r / 100);
    Utoa_2Digits(buf + 6, r % 100);
}

// Writes the decimal digits of output into [buf - DecimalLength(output), buf).
static inline void PrintDecimalDigitsBackwards(char* buf, uint64_t output)
{
    // We prefer 32-bit operations, even on 64-bit platforms.
    // If output doesn't fit into uint32_t, we cut off 8 digits at a time.
    while (static_cast<uint32_t>(output >> 32) != 0)
    {
        const uint64_t q = output / 100000000;
        const uint32_t r = static_cast<uint32_t>(output % 100000000);
        output = q;
        buf -= 8;
        Utoa_8Digits(buf, r);
    }

    uint32_t output2 = static_cast<uint32_t>(output);

    while (output2 >= 100)
    {
        const uint32_t q = output2 / 100;
        const uint32_t r = output2 % 100;
        output2 = q;
        buf -= 2;
        Utoa_2Digits(buf, r);
    }

    if (output2 >= 10)
    {
        buf -= 2;
        Utoa_2Digits(buf, output2);
    }
    else
    {
        *--buf = static_cast<char>('0' + output2);
    }
}

static inline int32_t ExponentLength(int32_t k)
{
    const uint32_t a = static_cast<uint32_t>(k < 0 ? -k : k);
    return (k < 0) + (a < 10 ? 1 : a < 100 ? 2 : 3);
}

// Length of digits * 10^(decimal_point - num_digits) without an exponent.
static inline int32_t DecimalFormLength(int32_t num_digits, int32_t decimal_point, bool force_trailing_dot_zero)
{
    if (decimal_point <= 0)
        return 2 + (-decimal_point) + num_digits;
    if (decimal_point < num_digits)
        return num_digits + 1;
    return decimal_point + (force_trailing_dot_zero ? 2 : 0);
}

static inline int32_t ScientificFormLength(int32_t num_digits, int32_t scientific_exponent, bool force_trailing_dot_zero)
{
    const int32_t mantissa = num_digits > 1 ? num_digits + 1 : (force_trailing_dot_zero ? 3 : 1);
    return mantissa + 1 + ExponentLength(scientific_exponent);
}

static char* WriteDecimalForm(char* buffer, uint64_t digits, int32_t num_digits, int32_t decimal_point, bool force_trailing_dot_zero)
{
    if (decimal_point <= 0)
    {
        // 0.[000]digits
        const int32_t num_zeros = -decimal_point;
        buffer[0] = '0';
        buffer[1] = '.';
        std::memset(buffer + 2, '0', static_cast<size_t>(num_zeros));
        char* const end = buffer + 2 + num_zeros + num_digits;
        PrintDecimalDigitsBackwards(end, digits);
        return end;
    }

    if (decimal_point < num_digits)
    {
        // dig.its
        char* const end = buffer + num_digits + 1;
        PrintDecimalDigitsBackwards(end - 1, digits);
        std::memmove(buffer + decimal_point + 1, buffer + decimal_point, static_cast<size_t>(num_digits - decimal_point));
        buffer[decimal_point] = '.';
        return end;
    }

    // digits[000]
    PrintDecimalDigitsBackwards(buffer + num_digits, digits);
    std::memset(buffer + num_digits, '0', static_cast<size_t>(decimal_point - num_digits));
    buffer += decimal_point;
    if (force_trailing_dot_zero)
    {
        *buffer++ = '.';
        *buffer++ = '0';
    }
    return buffer;
}

static char* WriteScientificForm(char* buffer, uint64_t digits, int32_t num_digits, int32_t scientific_exponent, bool force_trailing_dot_zero)
{
    // buffer = ?ddddd ==> d.dddd
    PrintDecimalDigitsBackwards(buffer + 1 + num_digits, digits);
    buffer[0] = buffer[1];

    if (num_digits == 1)
    {
        // dE123
        buffer += 1;
        if (force_trailing_dot_zero)
        {
            *buffer++ = '.';
            *buffer++ = '0';
        }
    }
    else
    {
        // d.igitsE123
        buffer[1] = '.';
        buffer += 1 + num_digits;
    }

    *buffer++ = 'E';

    int32_t k = scientific_exponent;
    if (k < 0)
    {
        k = -k;
        *buffer++ = '-';
    }

    const uint32_t e = static_cast<uint32_t>(k);
    if (e < 10)
    {
        *buffer++ = static_cast<char>('0' + e);
    }
    else if (e < 100)
    {
        buffer = Utoa_2Digits(buffer, e);
    }
    else
    {
        *buffer++ = static_cast<char>('0' + e / 100);
        buffer = Utoa_2Digits(buffer, e % 100);
    }

    return buffer;
}

template <typename Float>
static inline char* FormatImpl(char* buffer, Float value, const FormatOptions& options)
{
    const IEEE<Float> ieee_value(value);

    if (ieee_value.IsNaN())
    {
        std::memcpy(buffer, "NaN", 3);
        return buffer + 3;
    }

    if (ieee_value.IsInf())
    {
        if (ieee_value.SignBit())
            *buffer++ = '-';
        std::memcpy(buffer, "Infinity", 8);
        return buffer + 8;
    }

    const auto dec = numtext::RoundToDigits(numtext::ToDecimal(value), options.max_digits);
    return numtext::FormatDecimal(buffer, dec, options);
}

//==================================================================================================
//
//==================================================================================================

FloatingDecimal numtext::RoundToDigits(FloatingDecimal dec, int max_digits)
{
    if (max_digits <= 0)
        return dec;

    const int32_t num_digits = dec.NumDigits();
    if (num_digits <= max_digits)
        return dec;

    const int32_t removed = num_digits - max_digits;
    NUMTEXT_ASSERT(removed <= 19);

    uint64_t pow10 = 1;
    for (int32_t i = 0; i < removed; ++i)
        pow10 *= 10;

    const uint64_t r = dec.digits % pow10;
    uint64_t q = dec.digits / pow10;
    q += (r >= pow10 - r); // r >= pow10 / 2

    dec.digits = q;
    dec.exponent += removed;

    // q >= 10^(max_digits - 1) >= 1.
    while (dec.digits % 10 == 0)
    {
        dec.digits /= 10;
        ++dec.exponent;
    }

    return dec;
}

char* numtext::FormatDecimal(char* buffer, const FloatingDecimal& dec, const FormatOptions& options)
{
    if (dec.sign)
        *buffer++ = '-';

    const int32_t num_digits = dec.NumDigits();
    const int32_t decimal_point = num_digits + dec.exponent;
    const int32_t scientific_exponent = decimal_point - 1;
    const bool force = options.force_trailing_dot_zero;

    bool use_decimal;
    switch (options.format)
    {
    case FloatFormat::decimal:
        use_decimal = true;
        break;
    case FloatFormat::scientific:
        use_decimal = false;
        break;
    case FloatFormat::friendly:
        use_decimal = (-10 <= scientific_exponent && scientific_exponent < 10);
        break;
    case FloatFormat::general:
    default:
        use_decimal = DecimalFormLength(num_digits, decimal_point, force) <= ScientificFormLength(num_digits, scientific_exponent, force);
        break;
    }

    if (use_decimal)
        return WriteDecimalForm(buffer, dec.digits, num_digits, decimal_point, force);
    else
        return WriteScientificForm(buffer, dec.digits, num_digits, scientific_exponent, force);
}

char* numtext::Format(char* buffer, double value, const FormatOptions& options)
{
    return FormatImpl(buffer, value, options);
}

char* numtext::Format(char* buffer, float value, const FormatOptions& options)
{
    return FormatImpl(buffer, value, options);
}

char* numtext::Dtoa(char* buffer, double value)
{
    return FormatImpl(buffer, value, FormatOptions{});
}

char* numtext::Ftoa(char* buffer, float value)
{
    return FormatImpl(buffer, value, FormatOptions{});
}

std::string numtext::ToString(double value, const FormatOptions& options)
{
    char buf[MaxFormattedLength];
    return std::string(buf, Format(buf, value, options));
}

std::string numtext::ToString(float value, const FormatOptions& options)
{
    char buf[MaxFormattedLength];
    return std::string(buf, Format(buf, value, options));
}
