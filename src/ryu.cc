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

#include "ryu.h"
#include "ieee.h"
#include "pow5_tables.h"

using numtext::FloatingDecimal;
using numtext::IEEE;

using namespace numtext::pow5;

//==================================================================================================
//
//==================================================================================================

namespace {

template <typename Float> struct RyuParams;

template <>
struct RyuParams<float>
{
    static constexpr int32_t BitsPerPow5 = BitsPerPow5_Single;
    // floor(log_5(2^24))
    static constexpr int32_t MaxPow5Factor = 10;

    static uint64_t ComputePow5(int32_t k) { return ComputePow5_Single(k); }
};

template <>
struct RyuParams<double>
{
    static constexpr int32_t BitsPerPow5 = BitsPerPow5_Double;
    // floor(log_5(2^53))
    static constexpr int32_t MaxPow5Factor = 22;

    static uint64x2 ComputePow5(int32_t k) { return ComputePow5_Double(k); }
};

} // namespace

template <typename Float>
static inline void MulPow5DivPow2(uint64_t u, uint64_t v, uint64_t w, int32_t e5, int32_t e2, uint64_t& a, uint64_t& b, uint64_t& c)
{
    using Params = RyuParams<Float>;

    // j >= BitsPerPow5 - 7 and m has at most p + 2 bits.
    // The product along with the subsequent shift therefore requires
    // p + 2 + 7 bits.

    const auto k = FloorLog2Pow5(e5) + 1 - Params::BitsPerPow5;
    const auto j = e2 - k;
    NUMTEXT_ASSERT(j >= Params::BitsPerPow5 - 7);
    NUMTEXT_ASSERT(j <= Params::BitsPerPow5 - 1);

    const auto pow5 = Params::ComputePow5(e5);

    a = MulShift(u, pow5, j);
    b = MulShift(v, pow5, j);
    c = MulShift(w, pow5, j);
}

// Requires a positive finite value.
template <typename Float>
static inline FloatingDecimal ToDecimalImpl(uint64_t ieee_significand, uint32_t ieee_exponent)
{
    using Ieee = IEEE<Float>;
    using Params = RyuParams<Float>;

    //
    // Step 1:
    // Decode the floating point number, and unify normalized and subnormal cases.
    //

    uint64_t m2;
    int32_t e2;
    if (ieee_exponent == 0)
    {
        m2 = ieee_significand;
        e2 = 1 - Ieee::ExponentBias;
    }
    else
    {
        m2 = Ieee::HiddenBit | ieee_significand;
        e2 = static_cast<int32_t>(ieee_exponent) - Ieee::ExponentBias;

        if /*unlikely*/ ((0 <= -e2 && -e2 < Ieee::SignificandSize) && MultipleOfPow2(m2, -e2))
        {
            // Since 2^(p-1) <= m2 < 2^p and 0 <= -e2 <= p-1:
            //  1 <= value = m2 / 2^-e2 < 2^p.
            // Since m2 is divisible by 2^-e2, value is an integer.
            return {m2 >> -e2, 0, false};
        }
    }

    const bool is_even = (m2 % 2) == 0;
    const bool accept_lower = is_even;
    const bool accept_upper = is_even;

    //
    // Step 2:
    // Determine the interval of valid decimal representations.
    //

    const uint32_t lower_boundary_is_closer = (ieee_significand == 0 && ieee_exponent > 1);

    e2 -= 2;
    const uint64_t u = 4 * m2 - 2 + lower_boundary_is_closer;
    const uint64_t v = 4 * m2;
    const uint64_t w = 4 * m2 + 2;

    //
    // Step 3:
    // Convert to a decimal power base.
    //

    int32_t e10;

    bool za = false; // a[0, ..., i-1] == 0
    bool zb = false; // b[0, ..., i-1] == 0
    bool zc = false; // c[0, ..., i-1] == 0

    if (e2 >= 0)
    {
        // We need
        //  (a,b,c) = (u,v,w) * 2^e2
        // and we need to remove at least q' = log_10(2^e2) digits from the
        // scaled values a,b,c, i.e. we want to compute
        //  (a,b,c) = (u,v,w) * 2^e2 / 10^(q')
        //          = (u,v,w) * 5^(-e10) / 2^(e10 - e2)
        //
        // To correctly round the result we need to know the value of the last
        // removed digit. We therefore remove only q = q' - 1 digits here, and
        // the loop below runs at least once.

        const int32_t q = FloorLog10Pow2(e2) - (e2 > 3); // == max(0, q' - 1)
        NUMTEXT_ASSERT(q >= 0);

        e10 = q;
        NUMTEXT_ASSERT(e10 >= 0);
        NUMTEXT_ASSERT(e10 - e2 <= 0);

        // The removed digits are all 0 iff x % 5^q == 0.
        if (q <= Params::MaxPow5Factor)
        {
            za = MultipleOfPow5(u, q);
            zb = MultipleOfPow5(v, q);
            zc = MultipleOfPow5(w, q);
        }
    }
    else
    {
        // We need
        //  (a,b,c) = (u,v,w) * 2^e2 / 10^(e2 + q')
        //          = (u,v,w) * 5^(-e10) / 2^(e10 - e2)
        // with q' = log_10(5^-e2).

        const int32_t q = FloorLog10Pow5(-e2) - (-e2 > 1); // == max(0, q' - 1)
        NUMTEXT_ASSERT(q >= 0);

        e10 = q + e2;
        NUMTEXT_ASSERT(e10 < 0);
        NUMTEXT_ASSERT(e10 - e2 >= 0);

        // The removed digits are all 0 iff x % 2^q == 0.
        if (q <= Ieee::SignificandSize + 2)
        {
            za = MultipleOfPow2(u, q);
            zb = MultipleOfPow2(v, q);
            zc = MultipleOfPow2(w, q);
        }
    }

    uint64_t aq;
    uint64_t bq;
    uint64_t cq;
    MulPow5DivPow2<Float>(u, v, w, -e10, e10 - e2, aq, bq, cq);

    //
    // Step 4:
    // Find the shortest decimal representation in the interval of valid representations.
    //

    cq -= !accept_upper && zc;

    // mask = 10^(number of digits removed),
    // i.e., (bq % mask) contains the actual digits removed from bq.
    // c < 2^62, which has 19 decimal digits, so mask fits into 64 bits.
    uint64_t mask = 1;

    uint64_t a = aq;
    uint64_t b = bq;
    uint64_t c = cq;

    while (a / 10000 < c / 10000)
    {
        mask *= 10000;
        a /= 10000;
        b /= 10000;
        c /= 10000;
        e10 += 4;
    }

    if (a / 100 < c / 100)
    {
        mask *= 100;
        a /= 100;
        b /= 100;
        c /= 100;
        e10 += 2;
    }

    if (a / 10 < c / 10)
    {
        mask *= 10;
        a /= 10;
        b /= 10;
        ++e10;
    }

    if /*likely*/ (!za && !zb)
    {
        const uint64_t br = bq - b * mask; // Digits removed from bq
        const uint64_t half = mask / 2;

        b += (a == b || br >= half);
    }
    else
    {
        // za only tells whether the first q removed digits were all 0's.
        // The digits removed in the loops above must be 0 as well.
        const bool can_use_lower = accept_lower && za && (aq - a * mask == 0);
        if (can_use_lower)
        {
            // We only remove 0's from a, so ar and za don't change.
            NUMTEXT_ASSERT(a != 0);
            for (;;)
            {
                const uint64_t q = a / 10;
                const uint32_t r = Lo32(a) - 10 * Lo32(q); // = a % 10
                if (r != 0)
                    break;
                mask *= 10;
                a = q;
                b = q;
                ++e10;
            }
        }

        const uint64_t br = bq - b * mask; // Digits removed from bq
        const uint64_t half = mask / 2;

        // A return value of b is valid if and only if a != b or za == true.
        // A return value of b + 1 is valid if and only if b + 1 <= c.
        const bool round_up = (a == b && !can_use_lower) // out of range
            || (br > half)
            || (br == half && (!zb || b % 2 != 0));

        b += round_up;
    }

    return {b, e10, false};
}

template <typename Float>
static inline FloatingDecimal ToDecimalFinite(Float value)
{
    const IEEE<Float> ieee_value(value);
    NUMTEXT_ASSERT(ieee_value.IsFinite());

    if (ieee_value.IsZero())
        return {0, 0, ieee_value.SignBit()};

    auto dec = ToDecimalImpl<Float>(ieee_value.PhysicalSignificand(), static_cast<uint32_t>(ieee_value.PhysicalExponent()));
    dec.sign = ieee_value.SignBit();

    NUMTEXT_ASSERT(dec.digits != 0);
    while (dec.digits % 10 == 0)
    {
        dec.digits /= 10;
        ++dec.exponent;
    }

    return dec;
}

//==================================================================================================
//
//==================================================================================================

int32_t numtext::DecimalLength(uint64_t v)
{
    if (v >= 10000000000000000000ull) { return 20; }
    if (v >= 1000000000000000000ull) { return 19; }
    if (v >= 100000000000000000ull) { return 18; }
    if (v >= 10000000000000000ull) { return 17; }
    if (v >= 1000000000000000ull) { return 16; }
    if (v >= 100000000000000ull) { return 15; }
    if (v >= 10000000000000ull) { return 14; }
    if (v >= 1000000000000ull) { return 13; }
    if (v >= 100000000000ull) { return 12; }
    if (v >= 10000000000ull) { return 11; }
    if (v >= 1000000000ull) { return 10; }
    if (v >= 100000000ull) { return 9; }
    if (v >= 10000000ull) { return 8; }
    if (v >= 1000000ull) { return 7; }
    if (v >= 100000ull) { return 6; }
    if (v >= 10000ull) { return 5; }
    if (v >= 1000ull) { return 4; }
    if (v >= 100ull) { return 3; }
    if (v >= 10ull) { return 2; }
    return 1;
}

int32_t FloatingDecimal::NumDigits() const
{
    return numtext::DecimalLength(digits);
}

FloatingDecimal numtext::ToDecimal(double value)
{
    return ToDecimalFinite(value);
}

FloatingDecimal numtext::ToDecimal(float value)
{
    return ToDecimalFinite(value);
}
