// Copyright 2019 Ulf Adams
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

#include "strtod.h"
#include "ieee.h"
#include "logging.h"
#include "pow5_tables.h"

#include <climits>
#include <cstdlib>
#include <limits>
#include <string>

using numtext::DecodeResult;
using numtext::DecodeStatus;
using numtext::IEEE;

using namespace numtext::pow5;

//==================================================================================================
// ToBinary
//==================================================================================================

namespace {

template <typename Float> struct ParseParams;

template <>
struct ParseParams<float>
{
    // Maximum number of decimal digits in the significand the fast ToBinary method can handle.
    static constexpr int32_t MaxDecimalDigits = 9;
    // Any input <= 10^MinDecimalExponent is interpreted as 0.
    // Any input >  10^MaxDecimalExponent is interpreted as +Infinity.
    static constexpr int32_t MinDecimalExponent = -46; // denorm_min / 2 =  7.00649232e-46 >=  1 * 10^-46
    static constexpr int32_t MaxDecimalExponent =  39; //            max = 3.402823466e+38 <= 10 * 10^+38
    static constexpr int32_t BitsPerPow5 = BitsPerPow5_Single;
    // 12 = floor(log_5(2^30)), 30 = ceil(log_2(10^9))
    static constexpr int32_t MaxPow5Factor = 12;

    static uint64_t ComputePow5(int32_t k) { return ComputePow5_Single(k); }

    static float StrToFloat(const char* str, char** str_end) { return std::strtof(str, str_end); }
};

template <>
struct ParseParams<double>
{
    static constexpr int32_t MaxDecimalDigits = 17;
    static constexpr int32_t MinDecimalExponent = -324; // denorm_min / 2 = 2.4703282292062327e-324 >= 10^-324
    static constexpr int32_t MaxDecimalExponent =  309; //            max = 1.7976931348623158e+308 <= 10^+309
    static constexpr int32_t BitsPerPow5 = BitsPerPow5_Double;
    // 24 = floor(log_5(2^57)), 57 = ceil(log_2(10^17))
    static constexpr int32_t MaxPow5Factor = 24;

    static uint64x2 ComputePow5(int32_t k) { return ComputePow5_Double(k); }

    static double StrToFloat(const char* str, char** str_end) { return std::strtod(str, str_end); }
};

} // namespace

static inline int32_t Max(int32_t x, int32_t y)
{
    return y < x ? x : y;
}

static inline int32_t ExtractBit(uint64_t x, int32_t n)
{
    NUMTEXT_ASSERT(n >= 0);
    NUMTEXT_ASSERT(n <= 63);
    return (x & (uint64_t{1} << n)) != 0;
}

template <typename Float>
static inline Float ToBinary(uint64_t m10, int32_t e10)
{
    using Ieee = IEEE<Float>;
    using Params = ParseParams<Float>;
    using bits_type = typename Ieee::bits_type;

    static constexpr int32_t MantissaBits = Ieee::MantissaBits;
    static constexpr int32_t ExponentBias = Ieee::ExponentBias - MantissaBits;

    NUMTEXT_ASSERT(m10 > 0);

    // Convert to binary float m2 * 2^e2, while retaining information about whether the conversion
    // was exact.

    const auto log2_m10 = FloorLog2(m10);

    // The length of m10 * 10^e10 in bits is: log2(m10 * 10^e10) = log2(m10) + log2(10^e10).
    // We want to compute the (MantissaBits + 1) top-most bits (+1 for the implicit leading
    // one in IEEE format). We therefore choose a binary output exponent of
    //   e2 = log2(m10 * 10^e10) - (MantissaBits + 1).
    //
    // We use floor(log2(5^e10)) so that we get at least this many bits; better to have an
    // additional bit than to not have enough bits.
    //
    // With b = floor(log_2(m10)) the shift amount is
    //  j = b + BitsPerPow5 - MantissaBits - 2,
    // i.e. 39 <= j <= 68 (single), 74 <= j <= 130 (double).

    const auto log2_10_e10 = FloorLog2Pow10(e10);
    const auto e2 = log2_m10 + log2_10_e10 - (MantissaBits + 1);

    const auto pow5 = Params::ComputePow5(e10);
    const auto j = log2_m10 + (Params::BitsPerPow5 - MantissaBits - 2);
    const uint64_t m2 = MulShift(m10, pow5, j);

    const auto log2_m2 = FloorLog2(m2);
    NUMTEXT_ASSERT(log2_m2 >= MantissaBits + 1);
    NUMTEXT_ASSERT(log2_m2 <= MantissaBits + 2);

    // We also compute if the result is exact, i.e., [m10 * 10^e10 / 2^e2] == m10 * 10^e10 / 2^e2.
    //  (See: Ryu Revisited, Section 4.3)
    //
    // is_exact
    //  <==>   (e2 <= e10   OR   p2(m10) >= e2 - e10)   AND   (e10 >= 0   OR   p5(m10) >= -e10)

    bool is_exact = (e2 <= e10) || (e2 - e10 < 64 && MultipleOfPow2(m10, e2 - e10));
    if (e10 < 0)
    {
        is_exact = is_exact && (-e10 <= Params::MaxPow5Factor && MultipleOfPow5(m10, -e10));
    }

    // Compute the final IEEE exponent.
    int32_t ieee_e2 = Max(0, log2_m2 + e2 + ExponentBias);
    if (ieee_e2 >= Ieee::MaxIeeeExponent)
    {
        // Overflow:
        // Final IEEE exponent is larger than the maximum representable.
        return std::numeric_limits<Float>::infinity();
    }

    // We need to figure out how much we need to shift m2.
    // The tricky part is that we need to take the final IEEE exponent into account, so we need to
    // reverse the bias and also special-case the value 0.
    const int32_t shift = (ieee_e2 == 0 ? 1 : ieee_e2) - e2 - (ExponentBias + MantissaBits);
    NUMTEXT_ASSERT(shift > 0);
    NUMTEXT_ASSERT(shift < 64);

    // We need to round up if the exact value is more than 0.5 above the value we computed. That's
    // equivalent to checking if the last removed bit was 1 and either the value was not just
    // trailing zeros or the result would otherwise be odd.
    const auto trailing_zeros
        = is_exact && MultipleOfPow2(m2, shift - 1);
    const auto last_removed_bit
        = ExtractBit(m2, shift - 1);
    const auto round_up
        = last_removed_bit != 0 && (!trailing_zeros || ExtractBit(m2, shift) != 0);

    uint64_t significand = (m2 >> shift) + round_up;
    NUMTEXT_ASSERT(significand <= 2 * uint64_t{Ieee::HiddenBit}); // significand <= 2^p

    significand &= Ieee::SignificandMask;

    // Rounding up may cause overflow...
    if (significand == 0 && round_up)
    {
        // Rounding up did overflow the p-bit significand.
        // Move a trailing zero of the significand into the exponent.
        // Due to how the IEEE represents +/-Infinity, we don't need to check for overflow here.
        ++ieee_e2;
    }

    NUMTEXT_ASSERT(ieee_e2 <= Ieee::MaxIeeeExponent);
    const auto ieee = static_cast<bits_type>(static_cast<uint64_t>(ieee_e2) << MantissaBits | significand);
    return IEEE<Float>(ieee).Value();
}

// Converts inputs with too many significant digits for ToBinary.
// [next, last) is the unsigned mantissa with its (optional) decimal point.
template <typename Float>
static NUMTEXT_NEVER_INLINE Float ToBinarySlow(const char* next, const char* last, int64_t parsed_exponent)
{
    using Params = ParseParams<Float>;

    // std::strtod expects null-terminated inputs. So we need to make a copy and null-terminate the
    // input. The copy is written as digits[e[-]exponent] without a decimal point, which makes the
    // result independent of the current locale.
    std::string inp;
    inp.reserve(static_cast<size_t>(last - next) + 24);

    int64_t exponent = parsed_exponent;
    bool in_fraction = false;
    for ( ; next != last; ++next)
    {
        if (*next == '.')
        {
            in_fraction = true;
            continue;
        }

        exponent -= in_fraction;
        if (inp.empty() && *next == '0')
            continue;
        inp.push_back(*next);
    }

    NUMTEXT_ASSERT(!inp.empty());
    inp.push_back('e');
    inp += std::to_string(exponent);

    numtext::Logger().trace("slow-path conversion of {} significant digits", inp.size());

    const char* const ptr = inp.c_str();
    char* end;
    const Float flt = Params::StrToFloat(ptr, &end);

    // std::strtod should have consumed all of the input.
    NUMTEXT_ASSERT(static_cast<size_t>(end - ptr) == inp.size());
    static_cast<void>(end);

    return flt;
}

//==================================================================================================
// Strtod
//==================================================================================================

static inline bool IsDigit(char ch)
{
    return static_cast<unsigned>(ch - '0') <= 9u;
}

static inline int32_t DigitValue(char ch)
{
    NUMTEXT_ASSERT(IsDigit(ch));
    return ch - '0';
}

static inline bool IsLowerASCII(char ch)
{
    return 'a' <= ch && ch <= 'z';
}

static inline bool IsUpperASCII(char ch)
{
    return 'A' <= ch && ch <= 'Z';
}

static inline char ToLowerASCII(char ch)
{
    return IsUpperASCII(ch) ? static_cast<char>(ch - 'A' + 'a') : ch;
}

static inline bool StartsWith(const char* next, const char* last, const char* lower_case_prefix)
{
    for ( ; next != last && *lower_case_prefix != '\0'; ++next, ++lower_case_prefix)
    {
        NUMTEXT_ASSERT(IsLowerASCII(*lower_case_prefix));
        if (ToLowerASCII(*next) != *lower_case_prefix)
            return false;
    }

    return *lower_case_prefix == '\0';
}

static inline DecodeResult ParseInfinity(const char* next, const char* last)
{
    NUMTEXT_ASSERT(*next == 'i' || *next == 'I');

    if (!StartsWith(next + 1, last, "nf"))
        return {next, DecodeStatus::invalid_character};

    next += 3;
    if (StartsWith(next, last, "inity"))
        next += 5;

    return {next, DecodeStatus::ok};
}

static inline bool IsNaNSequenceChar(char ch)
{
    return ch == '_' || IsDigit(ch) || IsUpperASCII(ch) || IsLowerASCII(ch);
}

// The nan-sequence is consumed but does not select a payload.
static inline DecodeResult ParseNaN(const char* next, const char* last)
{
    NUMTEXT_ASSERT(*next == 'n' || *next == 'N');

    if (!StartsWith(next + 1, last, "an"))
        return {next, DecodeStatus::invalid_character};

    next += 3;
    if (next != last && *next == '(')
    {
        for (const char* p = next + 1; p != last; ++p)
        {
            if (*p == ')')
                return {p + 1, DecodeStatus::ok};

            if (!IsNaNSequenceChar(*p))
                break; // invalid/incomplete nan-sequence
        }
    }

    return {next, DecodeStatus::ok};
}

template <typename Float>
static NUMTEXT_NEVER_INLINE DecodeResult ParseSpecial(bool is_negative, const char* next, const char* last, Float& value)
{
    if (*next == 'i' || *next == 'I')
    {
        const auto res = ParseInfinity(next, last);
        if (res.status == DecodeStatus::ok)
        {
            value = is_negative ? -std::numeric_limits<Float>::infinity() : std::numeric_limits<Float>::infinity();
        }
        return res;
    }

    if (*next == 'n' || *next == 'N')
    {
        const auto res = ParseNaN(next, last);
        if (res.status == DecodeStatus::ok)
        {
            value = std::numeric_limits<Float>::quiet_NaN();
        }
        return res;
    }

    return {next, DecodeStatus::invalid_character};
}

template <typename Float>
static inline DecodeResult StrtodImpl(const char* next, const char* last, Float& value)
{
    using Params = ParseParams<Float>;

    if (next == last)
        return {next, DecodeStatus::empty};

    // Decompose the input into the form significand * 10^exponent,
    // where significand has num_digits decimal digits.

    uint64_t significand = 0; // only valid iff num_digits <= 19
    int64_t  num_digits  = 0; // 64-bit to avoid overflow...
    int64_t  exponent    = 0; // 64-bit to avoid overflow...

// [-]

    const bool is_negative = (*next == '-');
    if (is_negative || *next == '+')
    {
        ++next;
        if (next == last)
            return {next, DecodeStatus::malformed};
    }

// int

    const char* const start = next;

    const bool has_leading_zero = (*next == '0');
    const bool has_leading_dot  = (*next == '.');

    if (has_leading_zero)
    {
        for (;;)
        {
            ++next;
            if (next == last || *next != '0')
                break;
        }
    }

    if (next != last && IsDigit(*next)) // non-0
    {
        const char* const p = next;

        significand = static_cast<uint64_t>(DigitValue(*next));
        ++next;
        while (next != last && IsDigit(*next))
        {
            significand = 10 * significand + static_cast<uint64_t>(DigitValue(*next));
            ++next;
        }

        num_digits = next - p;
    }
    else if (!has_leading_zero && !has_leading_dot)
    {
        return ParseSpecial(is_negative, next, last, value);
    }

// frac

    if (has_leading_dot || (next != last && *next == '.'))
    {
        ++next; // skip '.'
        if (next != last && IsDigit(*next))
        {
            const char* const p = next;

            significand = 10 * significand + static_cast<uint64_t>(DigitValue(*next));
            ++next;
            while (next != last && IsDigit(*next))
            {
                significand = 10 * significand + static_cast<uint64_t>(DigitValue(*next));
                ++next;
            }

            const char* nz = p;
            if (num_digits == 0)
            {
                // Number is of the form "0.xxx...".
                // Move the leading zeros in the fractional part into the exponent.
                while (nz != next && *nz == '0')
                    ++nz;
            }

            num_digits += next - nz;
            exponent = -(next - p);
        }
        else
        {
            // No digits in the fractional part.
            // But at least one digit must appear in either the integral or the fractional part.
            if (has_leading_dot)
                return {next, DecodeStatus::malformed};
        }
    }

    const char* const mantissa_end = next;

// exp

    // Exponents larger than this limit will be treated as +Infinity.
    // But we must still scan all the digits if this happens to be the case.
    static constexpr int32_t MaxExp = 999999;
    static_assert(MaxExp >= 999, "invalid parameter");
    static_assert(MaxExp <= (INT_MAX - 9) / 10, "invalid parameter");

    int32_t parsed_exponent = 0;
    if (next != last && (*next == 'e' || *next == 'E'))
    {
        // Possibly the start of an exponent...
        // We accept (and ignore!) invalid or incomplete exponents.
        // The 'next' pointer is updated if and only if a valid exponent has been found.
        const char* p = next;

        ++p; // skip 'e' or 'E'
        if (p != last)
        {
            const bool parsed_exponent_is_negative = (*p == '-');
            if (parsed_exponent_is_negative || *p == '+')
                ++p;

            if (p != last && IsDigit(*p))
            {
                next = p; // Found a valid exponent.

                parsed_exponent = DigitValue(*next);
                ++next;
                while (next != last && IsDigit(*next))
                {
                    if (parsed_exponent <= MaxExp)
                        parsed_exponent = 10 * parsed_exponent + DigitValue(*next);
                    ++next;
                }

                parsed_exponent = parsed_exponent_is_negative ? -parsed_exponent : parsed_exponent;
                exponent += parsed_exponent;
            }
        }
    }

    NUMTEXT_ASSERT(num_digits >= 0);

    Float flt;
    if (num_digits == 0)
    {
        flt = 0;
    }
    else if (parsed_exponent < -MaxExp || exponent + num_digits <= Params::MinDecimalExponent)
    {
        // input = x * 10^-inf = 0
        // or
        // input < 10^MinDecimalExponent, which rounds to +-0.
        flt = 0;
    }
    else if (parsed_exponent > +MaxExp || exponent + num_digits > Params::MaxDecimalExponent)
    {
        // input = x * 10^+inf = +inf
        // or
        // input >= 10^MaxDecimalExponent, which rounds to +-infinity.
        flt = std::numeric_limits<Float>::infinity();
    }
    else if (num_digits <= Params::MaxDecimalDigits)
    {
        NUMTEXT_ASSERT(exponent >= INT_MIN);
        NUMTEXT_ASSERT(exponent <= INT_MAX);
        flt = ToBinary<Float>(significand, static_cast<int32_t>(exponent));
    }
    else
    {
        // The input is too long for ToBinary.
        flt = ToBinarySlow<Float>(start, mantissa_end, parsed_exponent);
    }

    value = is_negative ? -flt : flt;
    return {next, DecodeStatus::ok};
}

template <typename Float>
static inline DecodeStatus ParseDecimalImpl(const std::string& text, Float& value, size_t start, size_t length)
{
    const char* first;
    const char* last;
    numtext::ClampWindow(text, start, length, first, last);

    Float flt;
    const auto res = StrtodImpl(first, last, flt);
    if (res.status != DecodeStatus::ok)
        return res.status;
    if (res.next != last)
        return DecodeStatus::invalid_character;

    value = flt;
    return DecodeStatus::ok;
}

//==================================================================================================
//
//==================================================================================================

DecodeResult numtext::Strtod(const char* next, const char* last, double& value)
{
    return StrtodImpl(next, last, value);
}

DecodeResult numtext::Strtof(const char* next, const char* last, float& value)
{
    return StrtodImpl(next, last, value);
}

DecodeStatus numtext::ParseDecimal(const std::string& text, double& value, size_t start, size_t length)
{
    return ParseDecimalImpl(text, value, start, length);
}

DecodeStatus numtext::ParseDecimal(const std::string& text, float& value, size_t start, size_t length)
{
    return ParseDecimalImpl(text, value, start, length);
}
