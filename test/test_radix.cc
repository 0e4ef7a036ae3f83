#include <catch2/catch.hpp>

#include "radix.h"

#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

using numtext::Alphabet;
using numtext::DecodeStatus;

static std::vector<Alphabet> TestAlphabets()
{
    std::vector<Alphabet> alphabets = {
        numtext::Base2(),
        numtext::Base8(),
        numtext::Base10(),
        numtext::Base16(),
        numtext::Base36(),
        numtext::Base64(),
        numtext::UriSafe(),
        numtext::Simple64(),
        numtext::Base86(),
        Alphabet::Make("012", '-', 'E'),
        numtext::Base16().Scramble(7),
    };

    for (uint64_t seed = 0; seed < 4; ++seed)
        alphabets.push_back(Alphabet::Scrambled(seed));

    return alphabets;
}

template <typename Int>
static Int DecodeUnsignedOrZero(const std::string& text, const Alphabet& alphabet, DecodeStatus expected = DecodeStatus::ok)
{
    Int value = 0;
    CHECK(numtext::DecodeUnsigned(text, alphabet, value) == expected);
    return value;
}

template <typename Int>
static Int DecodeSignedOrZero(const std::string& text, const Alphabet& alphabet, DecodeStatus expected = DecodeStatus::ok)
{
    Int value = 0;
    CHECK(numtext::DecodeSigned(text, alphabet, value) == expected);
    return value;
}

template <typename Int>
static void CheckRoundTrip(Int value, const Alphabet& alphabet)
{
    CAPTURE(alphabet.Serialize());
    CAPTURE(+value);

    const std::string u = numtext::EncodeUnsigned(value, alphabet);
    CHECK(static_cast<int>(u.size()) == alphabet.FixedWidth(std::numeric_limits<Int>::digits + std::numeric_limits<Int>::is_signed));
    CHECK(DecodeUnsignedOrZero<Int>(u, alphabet) == value);

    const std::string s = numtext::EncodeSigned(value, alphabet);
    CHECK(DecodeSignedOrZero<Int>(s, alphabet) == value);

    // The unsigned form decodes as signed, too.
    CHECK(DecodeSignedOrZero<Int>(u, alphabet) == value);
}

template <typename Int>
static void CheckRoundTrips(const Alphabet& alphabet)
{
    CheckRoundTrip<Int>(0, alphabet);
    CheckRoundTrip<Int>(1, alphabet);
    CheckRoundTrip<Int>(static_cast<Int>(-1), alphabet);
    CheckRoundTrip<Int>(std::numeric_limits<Int>::min(), alphabet);
    CheckRoundTrip<Int>(std::numeric_limits<Int>::max(), alphabet);
    CheckRoundTrip<Int>(static_cast<Int>(std::numeric_limits<Int>::min() + 1), alphabet);
    CheckRoundTrip<Int>(static_cast<Int>(std::numeric_limits<Int>::max() - 1), alphabet);

    std::mt19937_64 engine(alphabet.Radix());
    for (int i = 0; i < 200; ++i)
        CheckRoundTrip<Int>(static_cast<Int>(engine()), alphabet);
}

//==================================================================================================
// Encode
//==================================================================================================

TEST_CASE("Radix - EncodeUnsigned")
{
    const auto& b16 = numtext::Base16();

    CHECK(numtext::EncodeUnsigned(uint32_t{0xFFFFFFFF}, b16) == "FFFFFFFF");
    CHECK(numtext::EncodeUnsigned(int32_t{-1}, b16) == "FFFFFFFF");
    CHECK(numtext::EncodeUnsigned(int8_t{-1}, b16) == "FF");
    CHECK(numtext::EncodeUnsigned(int8_t{-128}, b16) == "80");
    CHECK(numtext::EncodeUnsigned(uint16_t{0xABC}, b16) == "0ABC");
    CHECK(numtext::EncodeUnsigned(uint64_t{0}, b16) == "0000000000000000");
    CHECK(numtext::EncodeUnsigned(int64_t{1}, b16) == "0000000000000001");

    CHECK(numtext::EncodeUnsigned(uint8_t{5}, numtext::Base2()) == "00000101");
    CHECK(numtext::EncodeUnsigned(uint8_t{255}, numtext::Base10()) == "255");
    CHECK(numtext::EncodeUnsigned(uint8_t{7}, numtext::Base10()) == "007");
    CHECK(numtext::EncodeUnsigned(uint32_t{4294967295u}, numtext::Base10()) == "4294967295");
    CHECK(numtext::EncodeUnsigned(uint8_t{255}, numtext::Base64()) == "D/");
    CHECK(numtext::EncodeUnsigned(uint64_t{35}, numtext::Base36()) == "000000000000Z");
}

TEST_CASE("Radix - EncodeSigned")
{
    const auto& b10 = numtext::Base10();
    const auto& b16 = numtext::Base16();

    CHECK(numtext::EncodeSigned(int32_t{0}, b10) == "0");
    CHECK(numtext::EncodeSigned(int32_t{7}, b10) == "7");
    CHECK(numtext::EncodeSigned(int32_t{-7}, b10) == "-7");
    CHECK(numtext::EncodeSigned(int32_t{1234567}, b10) == "1234567");
    CHECK(numtext::EncodeSigned(int8_t{-128}, b10) == "-128");
    CHECK(numtext::EncodeSigned(int8_t{-128}, b16) == "-80");
    CHECK(numtext::EncodeSigned(int8_t{127}, b16) == "7F");
    CHECK(numtext::EncodeSigned(int64_t{INT64_MIN}, b10) == "-9223372036854775808");
    CHECK(numtext::EncodeSigned(int64_t{INT64_MAX}, b10) == "9223372036854775807");
    CHECK(numtext::EncodeSigned(uint64_t{UINT64_MAX}, b10) == "18446744073709551615");
    CHECK(numtext::EncodeSigned(uint8_t{200}, b16) == "C8");

    // Custom negative sign
    CHECK(numtext::EncodeSigned(int16_t{-255}, numtext::UriSafe()) == "!D-");
}

TEST_CASE("Radix - Append")
{
    std::string out = "x=";
    numtext::AppendSigned(out, int32_t{-42}, numtext::Base10());
    out += ",y=";
    numtext::AppendUnsigned(out, uint8_t{42}, numtext::Base16());
    CHECK(out == "x=-42,y=2A");

    char buf[numtext::MaxEncodedIntegerLength];
    char* const end = numtext::EncodeUnsigned(buf, uint64_t{UINT64_MAX}, numtext::Base2());
    CHECK(end - buf == 64);
    CHECK(std::string(buf, end) == std::string(64, '1'));
}

//==================================================================================================
// Decode
//==================================================================================================

TEST_CASE("Radix - DecodeUnsigned")
{
    const auto& b16 = numtext::Base16();

    CHECK(DecodeUnsignedOrZero<uint32_t>("FFFFFFFF", b16) == 0xFFFFFFFFu);
    CHECK(DecodeUnsignedOrZero<uint32_t>("ffffffff", b16) == 0xFFFFFFFFu);
    CHECK(DecodeUnsignedOrZero<uint32_t>("1", b16) == 1u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("+1", b16) == 1u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("0000000000000001", b16) == 1u);
    CHECK(DecodeUnsignedOrZero<int32_t>("FFFFFFFF", b16) == -1);
    CHECK(DecodeUnsignedOrZero<int8_t>("80", b16) == -128);

    CHECK(DecodeUnsignedOrZero<uint32_t>("", b16, DecodeStatus::empty) == 0u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("+", b16, DecodeStatus::malformed) == 0u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("-1", b16, DecodeStatus::invalid_character) == 0u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("++1", b16, DecodeStatus::invalid_character) == 0u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("12G4", b16, DecodeStatus::invalid_character) == 0u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("1 ", b16, DecodeStatus::invalid_character) == 0u);
    CHECK(DecodeUnsignedOrZero<uint32_t>("100000000", b16, DecodeStatus::overflow) == 0u);
    CHECK(DecodeUnsignedOrZero<uint8_t>("256", numtext::Base10(), DecodeStatus::overflow) == 0u);
    CHECK(DecodeUnsignedOrZero<uint8_t>("255", numtext::Base10()) == 255u);
    CHECK(DecodeUnsignedOrZero<uint64_t>("18446744073709551615", numtext::Base10()) == UINT64_MAX);
    CHECK(DecodeUnsignedOrZero<uint64_t>("18446744073709551616", numtext::Base10(), DecodeStatus::overflow) == 0u);
}

TEST_CASE("Radix - DecodeUnsigned - next")
{
    const std::string input = "12G4";

    uint32_t value = 99;
    const auto res = numtext::DecodeUnsigned(input.data(), input.data() + input.size(), numtext::Base16(), value);
    CHECK(!res);
    CHECK(res.status == DecodeStatus::invalid_character);
    CHECK(res.next == input.data() + 2);
    CHECK(value == 99u);
}

TEST_CASE("Radix - DecodeSigned")
{
    const auto& b10 = numtext::Base10();
    const auto& b16 = numtext::Base16();

    CHECK(DecodeSignedOrZero<int32_t>("FFFFFFFF", b16) == -1);
    CHECK(DecodeSignedOrZero<int32_t>("ffffffff", b16) == -1);
    CHECK(DecodeSignedOrZero<int32_t>("80000000", b16) == INT32_MIN);
    CHECK(DecodeSignedOrZero<int32_t>("-80000000", b16) == INT32_MIN);
    CHECK(DecodeSignedOrZero<int32_t>("7FFFFFFF", b16) == INT32_MAX);
    CHECK(DecodeSignedOrZero<int32_t>("+7FFFFFFF", b16) == INT32_MAX);
    CHECK(DecodeSignedOrZero<int32_t>("-1", b16) == -1);
    CHECK(DecodeSignedOrZero<int32_t>("-0", b16) == 0);
    CHECK(DecodeSignedOrZero<int8_t>("-128", b10) == -128);
    CHECK(DecodeSignedOrZero<int8_t>("127", b10) == 127);
    CHECK(DecodeSignedOrZero<int8_t>("255", b10) == -1);  // fixed width
    CHECK(DecodeSignedOrZero<int8_t>("200", b10) == -56); // fixed width
    CHECK(DecodeSignedOrZero<int64_t>("-9223372036854775808", b10) == INT64_MIN);
    CHECK(DecodeSignedOrZero<int64_t>("18446744073709551615", b10) == -1);

    CHECK(DecodeSignedOrZero<int32_t>("", b16, DecodeStatus::empty) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("-", b16, DecodeStatus::malformed) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("+", b16, DecodeStatus::malformed) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("--1", b16, DecodeStatus::invalid_character) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("1-", b16, DecodeStatus::invalid_character) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("-80000001", b16, DecodeStatus::overflow) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("+80000000", b16, DecodeStatus::overflow) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("080000000", b16, DecodeStatus::overflow) == 0);  // not the fixed width
    CHECK(DecodeSignedOrZero<int32_t>("100000000", b16, DecodeStatus::overflow) == 0);
    CHECK(DecodeSignedOrZero<int8_t>("-129", b10, DecodeStatus::overflow) == 0);
    CHECK(DecodeSignedOrZero<int8_t>("256", b10, DecodeStatus::overflow) == 0);
    CHECK(DecodeSignedOrZero<int8_t>("0255", b10, DecodeStatus::overflow) == 0);

    // Unsigned targets only accept -0.
    CHECK(DecodeSignedOrZero<uint8_t>("-0", b10) == 0u);
    CHECK(DecodeSignedOrZero<uint8_t>("-1", b10, DecodeStatus::overflow) == 0u);
    CHECK(DecodeSignedOrZero<uint8_t>("255", b10) == 255u);
}

TEST_CASE("Radix - DecodeSigned - custom signs")
{
    const auto a = Alphabet::Make("0123456789", '~', 'E', '#');

    CHECK(numtext::EncodeSigned(int32_t{-5}, a) == "~5");
    CHECK(DecodeSignedOrZero<int32_t>("~5", a) == -5);
    CHECK(DecodeSignedOrZero<int32_t>("#5", a) == 5);
    CHECK(DecodeSignedOrZero<int32_t>("-5", a, DecodeStatus::invalid_character) == 0);
    CHECK(DecodeSignedOrZero<int32_t>("+5", a, DecodeStatus::invalid_character) == 0);
}

TEST_CASE("Radix - case rules")
{
    CHECK(DecodeUnsignedOrZero<uint16_t>("zz", numtext::Base36()) == 36u * 36u - 1u);
    CHECK(DecodeUnsignedOrZero<uint16_t>("ZZ", numtext::Base36()) == 36u * 36u - 1u);
    CHECK(DecodeUnsignedOrZero<uint16_t>("zZ", numtext::Base36()) == 36u * 36u - 1u);

    // Base64 is case-sensitive
    CHECK(DecodeUnsignedOrZero<uint16_t>("AB", numtext::Base64()) == 1u);
    CHECK(DecodeUnsignedOrZero<uint16_t>("Ab", numtext::Base64()) == 27u);
    CHECK(DecodeUnsignedOrZero<uint16_t>("ab", numtext::Base64()) == 26u * 64u + 27u);
}

TEST_CASE("Radix - windows")
{
    const auto& b10 = numtext::Base10();
    const std::string text = "xx123yy";

    int32_t value = 0;
    CHECK(numtext::DecodeSigned(text, b10, value, 2, 3) == DecodeStatus::ok);
    CHECK(value == 123);

    // The window is clamped to the text.
    const std::string digits = "123";
    CHECK(numtext::DecodeSigned(digits, b10, value, 1, 100) == DecodeStatus::ok);
    CHECK(value == 23);
    CHECK(numtext::DecodeSigned(digits, b10, value, 1) == DecodeStatus::ok);
    CHECK(value == 23);

    value = 77;
    CHECK(numtext::DecodeSigned(digits, b10, value, 3, 1) == DecodeStatus::empty);
    CHECK(numtext::DecodeSigned(digits, b10, value, 100, 1) == DecodeStatus::empty);
    CHECK(numtext::DecodeSigned(digits, b10, value, 0, 0) == DecodeStatus::empty);
    CHECK(numtext::DecodeSigned(text, b10, value, 2, 4) == DecodeStatus::invalid_character);
    CHECK(value == 77);

    uint8_t u = 0;
    CHECK(numtext::DecodeUnsigned(text, numtext::Base16(), u, 2, 2) == DecodeStatus::ok);
    CHECK(u == 0x12);
}

//==================================================================================================
// Round trips
//==================================================================================================

TEST_CASE("Radix - round trip")
{
    for (const auto& alphabet : TestAlphabets())
    {
        CheckRoundTrips<int8_t>(alphabet);
        CheckRoundTrips<uint8_t>(alphabet);
        CheckRoundTrips<int16_t>(alphabet);
        CheckRoundTrips<uint16_t>(alphabet);
        CheckRoundTrips<int32_t>(alphabet);
        CheckRoundTrips<uint32_t>(alphabet);
        CheckRoundTrips<int64_t>(alphabet);
        CheckRoundTrips<uint64_t>(alphabet);
    }
}

TEST_CASE("Radix - round trip - all 16-bit values")
{
    const auto scrambled = Alphabet::Scrambled(12345);

    for (uint32_t i = 0; i <= 0xFFFF; ++i)
    {
        const auto value = static_cast<int16_t>(static_cast<uint16_t>(i));

        int16_t decoded = 0;
        if (numtext::DecodeSigned(numtext::EncodeSigned(value, scrambled), scrambled, decoded) != DecodeStatus::ok || decoded != value)
        {
            CAPTURE(i);
            FAIL("round trip failed");
        }
    }
}
