#include <catch2/catch.hpp>

#include "pow5_tables.h"

#include <cstdint>

using namespace numtext::pow5;

static uint64_t Pow5(int k)
{
    uint64_t p = 1;
    for (int i = 0; i < k; ++i)
        p *= 5;
    return p;
}

TEST_CASE("Pow5 - FloorLog")
{
    CHECK(FloorLog2Pow5(0) == 0);
    CHECK(FloorLog2Pow5(1) == 2);
    CHECK(FloorLog2Pow5(-1) == -3);
    CHECK(FloorLog2Pow5(27) == 62);
    CHECK(FloorLog10Pow2(0) == 0);
    CHECK(FloorLog10Pow2(10) == 3);
    CHECK(FloorLog10Pow2(-1) == -1);
    CHECK(FloorLog10Pow5(2) == 1);
    CHECK(FloorLog10Pow5(-1) == -1);
    CHECK(FloorLog2Pow10(1) == 3);
    CHECK(FloorLog2Pow10(-1) == -4);

    CHECK(FloorLog2(1) == 0);
    CHECK(FloorLog2(2) == 1);
    CHECK(FloorLog2(3) == 1);
    CHECK(FloorLog2(UINT64_MAX) == 63);
}

TEST_CASE("Pow5 - MultipleOf")
{
    for (int k = 0; k <= 24; ++k)
    {
        CAPTURE(k);
        const uint64_t p = Pow5(k);
        CHECK(MultipleOfPow5(p, k));
        CHECK(MultipleOfPow5(3 * p, k));
        if (k > 0)
        {
            CHECK(!MultipleOfPow5(p - 1, k));
            CHECK(!MultipleOfPow5(p + 1, k));
            CHECK(!MultipleOfPow5(p / 5, k));
        }
    }

    CHECK(MultipleOfPow5(0, 24));

    CHECK(MultipleOfPow2(0, 63));
    CHECK(MultipleOfPow2(8, 3));
    CHECK(!MultipleOfPow2(12, 3));
    CHECK(MultipleOfPow2(uint64_t{1} << 63, 63));
}

TEST_CASE("Pow5 - Single")
{
    // All entries are normalized.
    for (int32_t k = MinDecExp_Single; k <= MaxDecExp_Single; ++k)
    {
        CAPTURE(k);
        CHECK(FloorLog2(ComputePow5_Single(k)) == BitsPerPow5_Single - 1);
    }

    CHECK(ComputePow5_Single(  0) == 0x8000000000000000u);
    CHECK(ComputePow5_Single(  1) == 0xA000000000000000u);
    CHECK(ComputePow5_Single( 10) == 0x9502F90000000000u);
    CHECK(ComputePow5_Single( 47) == 0x8C213D9DA502DE46u);
    CHECK(ComputePow5_Single( -1) == 0xCCCCCCCCCCCCCCCDu);
    CHECK(ComputePow5_Single(-54) == 0xC428D05AA4751E4Du);

    // Exact for 5^k < 2^64.
    for (int32_t k = 0; k <= 27; ++k)
    {
        CAPTURE(k);
        const uint64_t p = Pow5(k);
        CHECK(ComputePow5_Single(k) == p << (63 - FloorLog2(p)));
    }
}

TEST_CASE("Pow5 - Double")
{
    for (int32_t k = MinDecExp_Double; k <= MaxDecExp_Double; ++k)
    {
        CAPTURE(k);
        CHECK(FloorLog2(ComputePow5_Double(k).hi) == 63);
    }

    const auto p0 = ComputePow5_Double(0);
    CHECK(p0.hi == 0x8000000000000000u);
    CHECK(p0.lo == 0);

    const auto p22 = ComputePow5_Double(22);
    CHECK(p22.hi == 0x878678326EAC9000u);
    CHECK(p22.lo == 0);

    const auto p325 = ComputePow5_Double(325);
    CHECK(p325.hi == 0xC5A05277621BE293u);
    CHECK(p325.lo == 0xC7098B7305241885u);

    const auto m1 = ComputePow5_Double(-1);
    CHECK(m1.hi == 0xCCCCCCCCCCCCCCCCu);
    CHECK(m1.lo == 0xCCCCCCCCCCCCCCCDu);

    const auto m340 = ComputePow5_Double(-340);
    CHECK(m340.hi == 0xBAAEE17FA23EBF76u);
    CHECK(m340.lo == 0x5D79BCF00D2DF64Au);

    for (int32_t k = 0; k <= 27; ++k)
    {
        CAPTURE(k);
        const uint64_t p = Pow5(k);
        const auto entry = ComputePow5_Double(k);
        CHECK(entry.hi == p << (63 - FloorLog2(p)));
        CHECK(entry.lo == 0);
    }
}

TEST_CASE("Pow5 - MulShift")
{
    // 10 * 2^63 / 2^64 = 5
    CHECK(MulShift(10, uint64_t{1} << 63, 64) == 5);
    CHECK(MulShift(0xFFFFFFFFu, UINT64_MAX, 64) == 0xFFFFFFFEu);
    CHECK(MulShift(0xFFFFFFFFu, UINT64_MAX, 95) == 1);

    // 3 * 2^127 / 2^128 = 1.5
    const uint64x2 mul = {0x8000000000000000u, 0x0000000000000000u};
    CHECK(MulShift(3, mul, 128) == 1);
    CHECK(MulShift(3, mul, 127) == 3);
    CHECK(MulShift(UINT64_MAX, uint64x2{UINT64_MAX, UINT64_MAX}, 130) == 0x3FFFFFFFFFFFFFFFu);
    CHECK(MulShift(UINT64_MAX, uint64x2{UINT64_MAX, UINT64_MAX}, 191) == 1);
}
