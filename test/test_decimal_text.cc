#include <catch2/catch.hpp>

#include "decimal_text.h"
#include "ieee.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

using numtext::Alphabet;
using numtext::DecodeStatus;
using numtext::FloatFormat;
using numtext::FormatOptions;
using numtext::ReinterpretBits;

static std::vector<Alphabet> DecimalAlphabets()
{
    std::vector<Alphabet> alphabets = {
        numtext::Base10(),
        numtext::Base16(),
        numtext::Base36(),
        numtext::Base64(),
        numtext::UriSafe(),
        numtext::Simple64(),
        numtext::Base86(),
    };

    for (uint64_t seed = 0; seed < 8; ++seed)
    {
        auto scrambled = Alphabet::Scrambled(seed);
        if (scrambled.CanCarryDecimal())
            alphabets.push_back(std::move(scrambled));
    }

    return alphabets;
}

template <typename Float>
static void CheckRoundTrip(Float value, const Alphabet& alphabet, const FormatOptions& options = {})
{
    using bits_type = typename numtext::IEEE<Float>::bits_type;

    CAPTURE(alphabet.Serialize());
    CAPTURE(value);

    const std::string text = numtext::EncodeDecimal(value, alphabet, options);
    CAPTURE(text);

    Float decoded = 0;
    const auto res = numtext::DecodeDecimal(text.data(), text.data() + text.size(), alphabet, decoded);
    CHECK(res.status == DecodeStatus::ok);
    CHECK(res.next == text.data() + text.size());

    if (std::isnan(value))
        CHECK(std::isnan(decoded));
    else
        CHECK(ReinterpretBits<bits_type>(decoded) == ReinterpretBits<bits_type>(value));
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("DecimalText - Base10")
{
    const auto& b10 = numtext::Base10();

    CHECK(numtext::EncodeDecimal(1.5, b10) == "1.5");
    CHECK(numtext::EncodeDecimal(-1e22, b10) == "-1E22");
    CHECK(numtext::EncodeDecimal(0.1f, b10) == "0.1");

    // Same as the plain formatter.
    std::mt19937_64 engine(3);
    for (int i = 0; i < 1000; ++i)
    {
        const double d = ReinterpretBits<double>(engine());
        CHECK(numtext::EncodeDecimal(d, b10) == numtext::ToString(d));
    }
}

TEST_CASE("DecimalText - Base64")
{
    const auto& b64 = numtext::Base64();

    // 0..9 are 'A'..'J'
    CHECK(numtext::EncodeDecimal(1.5, b64) == "B.F");
    CHECK(numtext::EncodeDecimal(-1e22, b64) == "-B=CC");
    CHECK(numtext::EncodeDecimal(0.001, b64) == "B=-D");
    CHECK(numtext::EncodeDecimal(0.0, b64) == "A");
    CHECK(numtext::EncodeDecimal(-0.0, b64) == "-A");
    CHECK(numtext::EncodeDecimal(120.0f, b64) == "BCA");

    double d = 0;
    CHECK(numtext::DecodeDecimal("B.F", b64, d) == DecodeStatus::ok);
    CHECK(d == 1.5);
    CHECK(numtext::DecodeDecimal("*B=C", b64, d) == DecodeStatus::ok);
    CHECK(d == 100.0);
    CHECK(numtext::DecodeDecimal("-B=-D", b64, d) == DecodeStatus::ok);
    CHECK(d == -0.001);

    // Plain decimal digits are not part of this alphabet's decimal text.
    CHECK(numtext::DecodeDecimal("1.5", b64, d) == DecodeStatus::invalid_character);
    // 'K' is digit 10
    CHECK(numtext::DecodeDecimal("BK", b64, d) == DecodeStatus::invalid_character);
}

TEST_CASE("DecimalText - Base16")
{
    const auto& b16 = numtext::Base16();

    CHECK(numtext::EncodeDecimal(1e22, b16) == "1p22");
    CHECK(numtext::EncodeDecimal(-2.5e-7, b16) == "-2.5p-7");

    double d = 0;
    CHECK(numtext::DecodeDecimal("1P22", b16, d) == DecodeStatus::ok);
    CHECK(d == 1e22);

    // 'E' is a digit here, so the number ends before it.
    const std::string text = "1E22";
    const auto res = numtext::DecodeDecimal(text.data(), text.data() + text.size(), b16, d);
    CHECK(res.status == DecodeStatus::ok);
    CHECK(res.next == text.data() + 1);
    CHECK(d == 1.0);
}

TEST_CASE("DecimalText - UriSafe")
{
    const auto& uri = numtext::UriSafe();

    CHECK(numtext::EncodeDecimal(-12.5, uri) == "!BC.F");
    CHECK(numtext::EncodeDecimal(-std::numeric_limits<double>::infinity(), uri) == "!Infinity");

    double d = 0;
    CHECK(numtext::DecodeDecimal("!Infinity", uri, d) == DecodeStatus::ok);
    CHECK(d == -std::numeric_limits<double>::infinity());
    CHECK(numtext::DecodeDecimal("*Infinity", uri, d) == DecodeStatus::ok);
    CHECK(d == std::numeric_limits<double>::infinity());
}

TEST_CASE("DecimalText - Special tokens")
{
    for (const auto& alphabet : DecimalAlphabets())
    {
        CAPTURE(alphabet.Serialize());

        const std::string neg(1, alphabet.NegativeSign());

        CHECK(numtext::EncodeDecimal(std::numeric_limits<double>::quiet_NaN(), alphabet) == "NaN");
        CHECK(numtext::EncodeDecimal(std::numeric_limits<float>::infinity(), alphabet) == "Infinity");
        CHECK(numtext::EncodeDecimal(-std::numeric_limits<double>::infinity(), alphabet) == neg + "Infinity");

        double d = 0;
        CHECK(numtext::DecodeDecimal("NaN", alphabet, d) == DecodeStatus::ok);
        CHECK(std::isnan(d));
        CHECK(numtext::DecodeDecimal("Infinity", alphabet, d) == DecodeStatus::ok);
        CHECK(d == std::numeric_limits<double>::infinity());
        CHECK(numtext::DecodeDecimal(neg + "Infinity", alphabet, d) == DecodeStatus::ok);
        CHECK(d == -std::numeric_limits<double>::infinity());

        // The tokens are case-sensitive and must be complete.
        d = 42.0;
        CHECK(numtext::DecodeDecimal("Infinit", alphabet, d) != DecodeStatus::ok);
        CHECK(numtext::DecodeDecimal("NaN ", alphabet, d) == DecodeStatus::invalid_character);
        CHECK(d == 42.0);
    }
}

static void CheckInfinities(const Alphabet& alphabet)
{
    CAPTURE(alphabet.Serialize());

    const double inf = std::numeric_limits<double>::infinity();

    for (const double value : {inf, -inf})
    {
        const std::string text = numtext::EncodeDecimal(value, alphabet);
        CAPTURE(text);

        double d = 0;
        CHECK(numtext::DecodeDecimal(text, alphabet, d) == DecodeStatus::ok);
        CHECK(d == value);

        float f = 0;
        CHECK(numtext::DecodeDecimal(text, alphabet, f) == DecodeStatus::ok);
        CHECK(f == static_cast<float>(value));
    }
}

TEST_CASE("DecimalText - Infinity with sign 'I'")
{
    const auto neg_i = Alphabet::Make("0123456789", 'I', 'E');
    REQUIRE(neg_i.CanCarryDecimal());
    CheckInfinities(neg_i);

    double d = 0;
    CHECK(numtext::DecodeDecimal("Infinity", neg_i, d) == DecodeStatus::ok);
    CHECK(d == std::numeric_limits<double>::infinity());
    CHECK(numtext::DecodeDecimal("IInfinity", neg_i, d) == DecodeStatus::ok);
    CHECK(d == -std::numeric_limits<double>::infinity());
    CHECK(numtext::DecodeDecimal("I12", neg_i, d) == DecodeStatus::ok);
    CHECK(d == -12.0);

    const auto pos_i = Alphabet::Make("0123456789", '-', 'E', 'I');
    REQUIRE(pos_i.CanCarryDecimal());
    CheckInfinities(pos_i);
    CHECK(numtext::DecodeDecimal("IInfinity", pos_i, d) == DecodeStatus::ok);
    CHECK(d == std::numeric_limits<double>::infinity());

    int found = 0;
    for (uint64_t seed = 0; seed < 2000; ++seed)
    {
        const auto a = Alphabet::Scrambled(seed);
        if (a.NegativeSign() != 'I' && a.PositiveSign() != 'I' && a.ExponentSign() != 'I')
            continue;
        if (!a.CanCarryDecimal())
            continue;

        ++found;
        CheckInfinities(a);
    }
    CHECK(found > 0);
}

TEST_CASE("DecimalText - errors")
{
    const auto& b10 = numtext::Base10();

    double d = 42.0;
    CHECK(numtext::DecodeDecimal("", b10, d) == DecodeStatus::empty);
    CHECK(numtext::DecodeDecimal("-", b10, d) == DecodeStatus::malformed);
    CHECK(numtext::DecodeDecimal(".", b10, d) == DecodeStatus::malformed);
    CHECK(numtext::DecodeDecimal("x", b10, d) == DecodeStatus::invalid_character);
    CHECK(numtext::DecodeDecimal("1.5x", b10, d) == DecodeStatus::invalid_character);
    CHECK(numtext::DecodeDecimal("1 ", b10, d) == DecodeStatus::invalid_character);
    CHECK(d == 42.0);

    const std::string text = "1.5x";
    const auto res = numtext::DecodeDecimal(text.data(), text.data() + text.size(), b10, d);
    CHECK(res.status == DecodeStatus::ok);
    CHECK(res.next == text.data() + 3);
    CHECK(d == 1.5);
}

TEST_CASE("DecimalText - windows")
{
    const auto& b64 = numtext::Base64();
    const std::string text = "[B.F][-C]";

    double d = 0;
    CHECK(numtext::DecodeDecimal(text, b64, d, 1, 3) == DecodeStatus::ok);
    CHECK(d == 1.5);
    CHECK(numtext::DecodeDecimal(text, b64, d, 6, 2) == DecodeStatus::ok);
    CHECK(d == -2.0);
    CHECK(numtext::DecodeDecimal(text, b64, d, 6) == DecodeStatus::invalid_character);
    CHECK(numtext::DecodeDecimal(text, b64, d, 100) == DecodeStatus::empty);
    CHECK(numtext::DecodeDecimal(text, b64, d, 1, 0) == DecodeStatus::empty);
}

TEST_CASE("DecimalText - invalid alphabet")
{
    double d = 0;
    char buf[numtext::MaxFormattedLength];

    for (const auto* alphabet : {&numtext::Base2(), &numtext::Base8()})
    {
        CHECK_THROWS_AS(numtext::EncodeDecimal(1.0, *alphabet), numtext::InvalidAlphabet);
        CHECK_THROWS_AS(numtext::EncodeDecimal(buf, 1.0f, *alphabet), numtext::InvalidAlphabet);
        CHECK_THROWS_AS(numtext::DecodeDecimal("1", *alphabet, d), numtext::InvalidAlphabet);
    }

    const auto dotted = Alphabet::Make("0123456789.", '-', 'E');
    CHECK_THROWS_AS(numtext::EncodeDecimal(1.0, dotted), numtext::InvalidAlphabet);
}

TEST_CASE("DecimalText - Options")
{
    const auto& b64 = numtext::Base64();

    FormatOptions options;
    options.force_trailing_dot_zero = true;
    CHECK(numtext::EncodeDecimal(1.0, b64, options) == "B.A");

    options.force_trailing_dot_zero = false;
    options.format = FloatFormat::scientific;
    CHECK(numtext::EncodeDecimal(123.0, b64, options) == "B.CD=C");

    options.format = FloatFormat::general;
    options.max_digits = 2;
    CHECK(numtext::EncodeDecimal(1.25, b64, options) == "B.D");

    std::string out = "x";
    numtext::AppendDecimal(out, 2.0, b64);
    CHECK(out == "xC");
}

TEST_CASE("DecimalText - Round trip")
{
    const FormatOptions formats[] = {
        {FloatFormat::general, 0, false},
        {FloatFormat::decimal, 0, false},
        {FloatFormat::scientific, 0, true},
        {FloatFormat::friendly, 0, true},
    };

    std::mt19937_64 engine(99);

    for (const auto& alphabet : DecimalAlphabets())
    {
        for (const auto& options : formats)
        {
            CheckRoundTrip(0.0, alphabet, options);
            CheckRoundTrip(-0.0, alphabet, options);
            CheckRoundTrip(std::numeric_limits<double>::max(), alphabet, options);
            CheckRoundTrip(std::numeric_limits<double>::denorm_min(), alphabet, options);
            CheckRoundTrip(std::numeric_limits<float>::lowest(), alphabet, options);
            CheckRoundTrip(std::numeric_limits<double>::infinity(), alphabet, options);
            CheckRoundTrip(std::numeric_limits<double>::quiet_NaN(), alphabet, options);

            for (int i = 0; i < 200; ++i)
            {
                const uint64_t bits = engine();
                CheckRoundTrip(ReinterpretBits<double>(bits), alphabet, options);
                CheckRoundTrip(ReinterpretBits<float>(static_cast<uint32_t>(bits)), alphabet, options);
            }
        }
    }
}
