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

#pragma once

#include "macros.h"

#include <cstdint>
#if _MSC_VER
#include <intrin.h>
#endif

namespace numtext {
namespace pow5 {

struct uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

// Returns floor(x / 2^n).
inline int32_t FloorDivPow2(int32_t x, int32_t n)
{
    // Technically, right-shift of negative integers is implementation defined...
    // Should easily be optimized into SAR (or equivalent) instruction.
    return x >> n;
}

inline int32_t FloorLog2Pow5(int32_t e)
{
    NUMTEXT_ASSERT(e >= -1764);
    NUMTEXT_ASSERT(e <=  1763);
    return FloorDivPow2(e * 1217359, 19);
}

inline int32_t FloorLog10Pow2(int32_t e)
{
    NUMTEXT_ASSERT(e >= -2620);
    NUMTEXT_ASSERT(e <=  2620);
    return FloorDivPow2(e * 315653, 20);
}

inline int32_t FloorLog10Pow5(int32_t e)
{
    NUMTEXT_ASSERT(e >= -2620);
    NUMTEXT_ASSERT(e <=  2620);
    return FloorDivPow2(e * 732923, 20);
}

inline int32_t FloorLog2Pow10(int32_t e)
{
    NUMTEXT_ASSERT(e >= -1233);
    NUMTEXT_ASSERT(e <=  1233);
    return FloorDivPow2(e * 1741647, 19);
}

// Single-precision table, k in [-54, 47].
// Let e = FloorLog2Pow5(k) + 1 - 64
// For k <  0, returns 5^k in the form: ceil(2^-e / 5^-k)
// For k >= 0, returns 5^k in the form: ceil(5^k / 2^e)
static constexpr int32_t BitsPerPow5_Single = 64;
static constexpr int32_t MinDecExp_Single = -54;
static constexpr int32_t MaxDecExp_Single =  47;

uint64_t ComputePow5_Single(int32_t k);

// Double-precision table, k in [-340, 325].
// Let e = FloorLog2Pow5(k) + 1 - 128
// For k <  0, returns 5^k in the form: ceil(2^-e / 5^-k)
// For k >= 0, returns 5^k in the form: floor(5^k / 2^e)
static constexpr int32_t BitsPerPow5_Double = 128;
static constexpr int32_t MinDecExp_Double = -340;
static constexpr int32_t MaxDecExp_Double =  325;

uint64x2 ComputePow5_Double(int32_t k);

//==================================================================================================
// Fixed-point arithmetic on the table entries
//==================================================================================================

inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x & 0xFFFFFFFFu);
}

inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

inline int32_t FloorLog2(uint64_t x)
{
    NUMTEXT_ASSERT(x != 0);

#if defined(__GNUC__) || defined(__clang__)
    return 63 - __builtin_clzll(x);
#elif defined(_MSC_VER) && defined(_M_X64)
    unsigned long index;
    _BitScanReverse64(&index, x);
    return static_cast<int32_t>(index);
#else
    int32_t l2 = 0;
    for (;;)
    {
        x >>= 1;
        if (x == 0)
            break;
        ++l2;
    }
    return l2;
#endif
}

// Returns whether value is divisible by 2^e2
inline bool MultipleOfPow2(uint64_t value, int32_t e2)
{
    NUMTEXT_ASSERT(e2 >= 0);
    NUMTEXT_ASSERT(e2 <= 63);

    return (value & ((uint64_t{1} << e2) - 1)) == 0;
}

// Returns whether value is divisible by 5^e5
inline bool MultipleOfPow5(uint64_t value, int32_t e5)
{
    struct MulCmp {
        uint64_t mul;
        uint64_t cmp;
    };

    // mul = 5^-e5 mod 2^64, cmp = floor((2^64 - 1) / 5^e5)
    static constexpr MulCmp Mod5[] = {
        {0x0000000000000001u, 0xFFFFFFFFFFFFFFFFu}, // 5^0
        {0xCCCCCCCCCCCCCCCDu, 0x3333333333333333u}, // 5^1
        {0x8F5C28F5C28F5C29u, 0x0A3D70A3D70A3D70u}, // 5^2
        {0x1CAC083126E978D5u, 0x020C49BA5E353F7Cu}, // 5^3
        {0xD288CE703AFB7E91u, 0x0068DB8BAC710CB2u}, // 5^4
        {0x5D4E8FB00BCBE61Du, 0x0014F8B588E368F0u}, // 5^5
        {0x790FB65668C26139u, 0x000431BDE82D7B63u}, // 5^6
        {0xE5032477AE8D46A5u, 0x0000D6BF94D5E57Au}, // 5^7
        {0xC767074B22E90E21u, 0x00002AF31DC46118u}, // 5^8
        {0x8E47CE423A2E9C6Du, 0x0000089705F4136Bu}, // 5^9
        {0x4FA7F60D3ED61F49u, 0x000001B7CDFD9D7Bu}, // 5^10
        {0x0FEE64690C913975u, 0x00000057F5FF85E5u}, // 5^11
        {0x3662E0E1CF503EB1u, 0x000000119799812Du}, // 5^12
        {0xA47A2CF9F6433FBDu, 0x0000000384B84D09u}, // 5^13
        {0x54186F653140A659u, 0x00000000B424DC35u}, // 5^14
        {0x7738164770402145u, 0x0000000024075F3Du}, // 5^15
        {0xE4A4D1417CD9A041u, 0x000000000734ACA5u}, // 5^16
        {0xC75429D9E5C5200Du, 0x000000000170EF54u}, // 5^17
        {0xC1773B91FAC10669u, 0x000000000049C977u}, // 5^18
        {0x26B172506559CE15u, 0x00000000000EC1E4u}, // 5^19
        {0xD489E3A9ADDEC2D1u, 0x000000000002F394u}, // 5^20
        {0x90E860BB892C8D5Du, 0x000000000000971Du}, // 5^21
        {0x502E79BF1B6F4F79u, 0x0000000000001E39u}, // 5^22
        {0xDCD618596BE30FE5u, 0x000000000000060Bu}, // 5^23
        {0x2C2AD1AB7BFA3661u, 0x0000000000000135u}, // 5^24
    };

    NUMTEXT_ASSERT(e5 >= 0);
    NUMTEXT_ASSERT(e5 <= 24);
    const auto m5 = Mod5[static_cast<unsigned>(e5)];

    return value * m5.mul <= m5.cmp;
}

// Returns floor(m * mul / 2^j) for a 64-bit table entry.
// Requires m < 2^32.
inline uint64_t MulShift(uint64_t m, uint64_t mul, int32_t j)
{
    NUMTEXT_ASSERT(Hi32(m) == 0);
    NUMTEXT_ASSERT(j >= 32);
    NUMTEXT_ASSERT(j <= 95);

#if defined(__SIZEOF_INT128__)
    __extension__ using uint128_t = unsigned __int128;
    return static_cast<uint64_t>((uint128_t{mul} * m) >> j);
#else
    const uint64_t bits0 = m * Lo32(mul);
    const uint64_t bits1 = m * Hi32(mul);
    const uint64_t sum = bits1 + Hi32(bits0);

    return sum >> (j - 32);
#endif
}

#if !defined(__SIZEOF_INT128__)
inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
}
#endif

// Returns floor(m * mul / 2^j) for a 128-bit table entry, ignoring the lowest 64 bits of m * mul.lo.
inline uint64_t MulShift(uint64_t m, const uint64x2& mul, int32_t j)
{
    NUMTEXT_ASSERT(j >= 64 + 1);
    NUMTEXT_ASSERT(j <= 64 + 127);

    const int32_t shift = j - 64;

#if defined(__SIZEOF_INT128__)
    __extension__ using uint128_t = unsigned __int128;

    const uint128_t b0 = uint128_t{m} * mul.lo;
    const uint128_t b2 = uint128_t{m} * mul.hi;

    return static_cast<uint64_t>((b2 + static_cast<uint64_t>(b0 >> 64)) >> shift);
#else
    const auto b0 = Mul128(m, mul.lo);
    auto b2 = Mul128(m, mul.hi);

    // b2 + (b0 >> 64)
    b2.lo += b0.hi;
    b2.hi += b2.lo < b0.hi;

    if (shift >= 64)
        return b2.hi >> (shift - 64);
    return (b2.hi << (64 - shift)) | (b2.lo >> shift);
#endif
}

} // namespace pow5
} // namespace numtext
