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

#include "pow5_tables.h"
#include "logging.h"

#include <cstddef>
#include <vector>

using namespace numtext::pow5;

//==================================================================================================
// Minimal arbitrary precision unsigned integer.
// Only used to build the tables below, once.
//==================================================================================================

namespace {
class BigUnsigned
{
    std::vector<uint32_t> limbs_; // little-endian, no leading zero limbs

public:
    explicit BigUnsigned(uint32_t value)
    {
        if (value != 0)
            limbs_.push_back(value);
    }

    static BigUnsigned Pow2(int32_t n)
    {
        NUMTEXT_ASSERT(n >= 0);

        BigUnsigned x(0);
        x.limbs_.assign(static_cast<size_t>(n / 32 + 1), 0);
        x.limbs_.back() = uint32_t{1} << (n % 32);
        return x;
    }

    static BigUnsigned Pow5(int32_t n)
    {
        NUMTEXT_ASSERT(n >= 0);

        BigUnsigned x(1);
        for (int32_t i = 0; i < n; ++i)
            x.MulSmall(5);
        return x;
    }

    bool IsZero() const { return limbs_.empty(); }

    int32_t BitLength() const
    {
        if (limbs_.empty())
            return 0;

        int32_t len = 32 * static_cast<int32_t>(limbs_.size() - 1);
        for (uint32_t top = limbs_.back(); top != 0; top >>= 1)
            ++len;
        return len;
    }

    // Returns bit n, for any n (bits below 0 are 0).
    uint32_t Bit(int32_t n) const
    {
        if (n < 0)
            return 0;

        const auto index = static_cast<size_t>(n / 32);
        if (index >= limbs_.size())
            return 0;
        return (limbs_[index] >> (n % 32)) & 1;
    }

    void MulSmall(uint32_t m)
    {
        uint64_t carry = 0;
        for (auto& limb : limbs_)
        {
            const uint64_t p = uint64_t{limb} * m + carry;
            limb = static_cast<uint32_t>(p);
            carry = p >> 32;
        }
        if (carry != 0)
            limbs_.push_back(static_cast<uint32_t>(carry));
    }

    void ShiftLeft1()
    {
        uint32_t carry = 0;
        for (auto& limb : limbs_)
        {
            const uint32_t next_carry = limb >> 31;
            limb = (limb << 1) | carry;
            carry = next_carry;
        }
        if (carry != 0)
            limbs_.push_back(carry);
    }

    // Requires *this >= other.
    void Subtract(const BigUnsigned& other)
    {
        NUMTEXT_ASSERT(Compare(*this, other) >= 0);

        uint32_t borrow = 0;
        for (size_t i = 0; i < limbs_.size(); ++i)
        {
            const uint64_t rhs = uint64_t{i < other.limbs_.size() ? other.limbs_[i] : 0u} + borrow;
            borrow = limbs_[i] < rhs ? 1 : 0;
            limbs_[i] = static_cast<uint32_t>(uint64_t{limbs_[i]} + (uint64_t{borrow} << 32) - rhs);
        }
        NUMTEXT_ASSERT(borrow == 0);

        while (!limbs_.empty() && limbs_.back() == 0)
            limbs_.pop_back();
    }

    friend int Compare(const BigUnsigned& lhs, const BigUnsigned& rhs)
    {
        if (lhs.limbs_.size() != rhs.limbs_.size())
            return lhs.limbs_.size() < rhs.limbs_.size() ? -1 : 1;

        for (size_t i = lhs.limbs_.size(); i-- > 0; )
        {
            if (lhs.limbs_[i] != rhs.limbs_[i])
                return lhs.limbs_[i] < rhs.limbs_[i] ? -1 : 1;
        }

        return 0;
    }
};
}

static inline uint64x2 ShiftIn(uint64x2 x, uint32_t bit)
{
    return {(x.hi << 1) | (x.lo >> 63), (x.lo << 1) | bit};
}

static inline uint64x2 Increment(uint64x2 x)
{
    const uint64_t lo = x.lo + 1;
    return {x.hi + (lo == 0 ? 1 : 0), lo};
}

// Returns 5^k in the fixed-point form described in pow5_tables.h, using `bits` (<= 128) bits.
// For k >= 0 the result is rounded up if round_up_positive is true and truncated otherwise.
// For k < 0 the result is always rounded up.
static uint64x2 ComputePow5(int32_t k, int32_t bits, bool round_up_positive)
{
    const int32_t e = FloorLog2Pow5(k) + 1 - bits;

    uint64x2 result = {0, 0};
    if (k >= 0)
    {
        // floor(5^k / 2^e): the top `bits` bits of 5^k (shifted left if e < 0).
        const auto x = BigUnsigned::Pow5(k);
        NUMTEXT_ASSERT(x.BitLength() == e + bits);

        for (int32_t i = e + bits - 1; i >= e; --i)
            result = ShiftIn(result, x.Bit(i));

        bool inexact = false;
        for (int32_t i = 0; i < e; ++i)
            inexact = inexact || x.Bit(i) != 0;

        if (inexact && round_up_positive)
            result = Increment(result);
    }
    else
    {
        // ceil(2^-e / 5^-k) by binary long division.
        // The quotient has exactly `bits` bits, so 2^(-e - bits) < 5^-k is the first partial
        // remainder.
        const auto divisor = BigUnsigned::Pow5(-k);
        auto r = BigUnsigned::Pow2(-e - bits);
        NUMTEXT_ASSERT(Compare(r, divisor) < 0);

        for (int32_t i = 0; i < bits; ++i)
        {
            r.ShiftLeft1();
            uint32_t bit = 0;
            if (Compare(r, divisor) >= 0)
            {
                r.Subtract(divisor);
                bit = 1;
            }
            result = ShiftIn(result, bit);
        }

        if (!r.IsZero())
            result = Increment(result);
    }

    return result;
}

//==================================================================================================
//
//==================================================================================================

static std::vector<uint64_t> BuildSingleTable()
{
    numtext::Logger().debug("building single-precision power-of-5 table");

    std::vector<uint64_t> table;
    table.reserve(MaxDecExp_Single - MinDecExp_Single + 1);
    for (int32_t k = MinDecExp_Single; k <= MaxDecExp_Single; ++k)
    {
        const auto pow5 = ComputePow5(k, BitsPerPow5_Single, /*round_up_positive*/ true);
        NUMTEXT_ASSERT(pow5.hi == 0);
        table.push_back(pow5.lo);
    }

    return table;
}

static std::vector<uint64x2> BuildDoubleTable()
{
    numtext::Logger().debug("building double-precision power-of-5 table");

    std::vector<uint64x2> table;
    table.reserve(MaxDecExp_Double - MinDecExp_Double + 1);
    for (int32_t k = MinDecExp_Double; k <= MaxDecExp_Double; ++k)
    {
        table.push_back(ComputePow5(k, BitsPerPow5_Double, /*round_up_positive*/ false));
    }

    return table;
}

uint64_t numtext::pow5::ComputePow5_Single(int32_t k)
{
    static const std::vector<uint64_t> Pow5 = BuildSingleTable();

    NUMTEXT_ASSERT(k >= MinDecExp_Single);
    NUMTEXT_ASSERT(k <= MaxDecExp_Single);
    return Pow5[static_cast<unsigned>(k - MinDecExp_Single)];
}

uint64x2 numtext::pow5::ComputePow5_Double(int32_t k)
{
    static const std::vector<uint64x2> Pow5 = BuildDoubleTable();

    NUMTEXT_ASSERT(k >= MinDecExp_Double);
    NUMTEXT_ASSERT(k <= MaxDecExp_Double);
    return Pow5[static_cast<unsigned>(k - MinDecExp_Double)];
}
