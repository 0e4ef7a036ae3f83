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

#include "alphabet.h"
#include "logging.h"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <random>
#include <utility>

using numtext::Alphabet;
using numtext::CaseRule;
using numtext::InvalidAlphabet;

//==================================================================================================
//
//==================================================================================================

static inline bool IsPrintableASCII(char ch)
{
    return 0x21 <= ch && ch <= 0x7E;
}

static inline bool IsLowerASCII(char ch)
{
    return 'a' <= ch && ch <= 'z';
}

static inline bool IsUpperASCII(char ch)
{
    return 'A' <= ch && ch <= 'Z';
}

static inline char ToUpperASCII(char ch)
{
    return IsLowerASCII(ch) ? static_cast<char>(ch - 'a' + 'A') : ch;
}

static inline char ToLowerASCII(char ch)
{
    return IsUpperASCII(ch) ? static_cast<char>(ch - 'A' + 'a') : ch;
}

[[noreturn]] static void Fail(const std::string& message)
{
    numtext::Logger().debug("invalid alphabet: {}", message);
    throw InvalidAlphabet(message);
}

static std::string Quote(char ch)
{
    return std::string("'") + ch + "'";
}

// Returns the smallest n with radix^n >= 2^bits.
static int ComputeFixedWidth(int radix, int bits)
{
    NUMTEXT_ASSERT(radix >= 2);
    NUMTEXT_ASSERT(bits >= 1 && bits <= 64);

    const uint64_t max_value = bits == 64 ? UINT64_MAX : (uint64_t{1} << bits) - 1;
    const uint64_t r = static_cast<uint64_t>(radix);

    // p = radix^n, stop as soon as p > max_value.
    int n = 0;
    uint64_t p = 1;
    for (;;)
    {
        ++n;
        if (p > max_value / r)
            break;
        p *= r;
    }

    return n;
}

// Returns a uniformly distributed integer in [0, n).
// The sequence only depends on the engine state, not on the standard library implementation.
static uint32_t NextBelow(std::mt19937_64& engine, uint32_t n)
{
    NUMTEXT_ASSERT(n > 0);

    const uint64_t limit = UINT64_MAX - UINT64_MAX % n; // a multiple of n
    for (;;)
    {
        const uint64_t x = engine();
        if (x < limit)
            return static_cast<uint32_t>(x % n);
    }
}

static void Shuffle(std::string& symbols, uint64_t seed)
{
    std::mt19937_64 engine(seed);

    for (size_t i = symbols.size() - 1; i > 0; --i)
    {
        const auto j = NextBelow(engine, static_cast<uint32_t>(i + 1));
        std::swap(symbols[i], symbols[j]);
    }
}

//==================================================================================================
// Alphabet
//==================================================================================================

Alphabet Alphabet::Make(const std::string& symbols,
                        char negative_sign,
                        char exponent_sign,
                        char positive_sign,
                        CaseRule case_rule)
{
    const auto radix = static_cast<int>(symbols.size());
    if (radix < MinRadix)
        Fail("an alphabet needs at least 2 symbols");
    if (radix > MaxRadix)
        Fail("an alphabet can have at most 94 symbols");

    const bool fold = case_rule == CaseRule::insensitive;
    const auto key = [fold](char ch) { return fold ? ToUpperASCII(ch) : ch; };

    bool seen[128] = {};
    for (const char ch : symbols)
    {
        if (!IsPrintableASCII(ch))
            Fail("symbols must be printable ASCII characters");

        const auto k = static_cast<unsigned char>(key(ch));
        if (seen[k])
            Fail("duplicate symbol " + Quote(ch));
        seen[k] = true;
    }

    const char signs[] = {negative_sign, positive_sign, exponent_sign};
    for (const char sign : signs)
    {
        if (!IsPrintableASCII(sign))
            Fail("signs must be printable ASCII characters");
        if (seen[static_cast<unsigned char>(key(sign))])
            Fail("sign " + Quote(sign) + " is also a digit symbol");
    }

    if (negative_sign == positive_sign || negative_sign == exponent_sign || positive_sign == exponent_sign)
        Fail("negative, positive and exponent signs must be distinct");

    Alphabet alphabet;
    alphabet.case_rule_ = case_rule;
    alphabet.negative_sign_ = negative_sign;
    alphabet.positive_sign_ = positive_sign;
    alphabet.exponent_sign_ = exponent_sign;
    alphabet.Init(symbols);

    return alphabet;
}

void Alphabet::Init(const std::string& symbols)
{
    radix_ = static_cast<int>(symbols.size());

    std::fill(std::begin(values_), std::end(values_), int8_t{-1});

    const bool fold = case_rule_ == CaseRule::insensitive;
    for (int i = 0; i < radix_; ++i)
    {
        const char ch = symbols[static_cast<size_t>(i)];

        upper_[i] = fold ? ToUpperASCII(ch) : ch;
        lower_[i] = fold ? ToLowerASCII(ch) : ch;
        values_[static_cast<unsigned char>(upper_[i])] = static_cast<int8_t>(i);
        values_[static_cast<unsigned char>(lower_[i])] = static_cast<int8_t>(i);
    }

    fixed_width_[0] = static_cast<int8_t>(ComputeFixedWidth(radix_,  8));
    fixed_width_[1] = static_cast<int8_t>(ComputeFixedWidth(radix_, 16));
    fixed_width_[2] = static_cast<int8_t>(ComputeFixedWidth(radix_, 32));
    fixed_width_[3] = static_cast<int8_t>(ComputeFixedWidth(radix_, 64));

    // A token is ambiguous if each of its characters may occur in decimal text of this alphabet:
    // digits < 10, signs and the exponent sign. ("NaN" may read as 3E3.)
    const auto is_number = [this, fold](const char* token) {
        for ( ; *token != '\0'; ++token)
        {
            const char ch = *token;
            const int d = DigitValue(ch);
            if (d >= 10)
                return false;
            if (d >= 0 || ch == negative_sign_ || ch == positive_sign_)
                continue;
            if (ch == exponent_sign_ || (fold && ToUpperASCII(ch) == ToUpperASCII(exponent_sign_)))
                continue;
            return false;
        }
        return true;
    };

    can_carry_decimal_ = radix_ >= 10
        && !IsDigit('.')
        && negative_sign_ != '.' && positive_sign_ != '.' && exponent_sign_ != '.'
        && !is_number("NaN")
        && !is_number("Infinity");
}

int Alphabet::FixedWidth(int bits) const
{
    switch (bits)
    {
    case 8:
        return fixed_width_[0];
    case 16:
        return fixed_width_[1];
    case 32:
        return fixed_width_[2];
    default:
        NUMTEXT_ASSERT(bits == 64);
        return fixed_width_[3];
    }
}

Alphabet Alphabet::Scramble(uint64_t seed) const
{
    std::string symbols(upper_, upper_ + radix_);
    Shuffle(symbols, seed);

    Alphabet alphabet(*this);
    alphabet.Init(symbols);

    return alphabet;
}

Alphabet Alphabet::Scrambled(uint64_t seed)
{
    static constexpr int Radix = 72;

    std::string options = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789?!@#$%^&*-|=+;";
    Shuffle(options, seed);

    NUMTEXT_ASSERT(options.size() == Radix + 4);
    const char exponent_sign = options[options.size() - 3];
    const char positive_sign = options[options.size() - 2];
    const char negative_sign = options[options.size() - 1];
    options.resize(Radix);

    return Make(options, negative_sign, exponent_sign, positive_sign, CaseRule::sensitive);
}

std::string Alphabet::Serialize() const
{
    std::string data(upper_, upper_ + radix_);

    data += CaseInsensitive() ? '1' : '0';
    data += exponent_sign_;
    data += positive_sign_;
    data += negative_sign_;

    return data;
}

Alphabet Alphabet::Deserialize(const std::string& data)
{
    const size_t len = data.size();
    if (len < MinRadix + 4)
        Fail("the given data does not store a serialized alphabet");

    const char flag = data[len - 4];
    if (flag != '0' && flag != '1')
        Fail("the given data does not store a serialized alphabet");

    return Make(data.substr(0, len - 4),
                data[len - 1],
                data[len - 3],
                data[len - 2],
                flag == '1' ? CaseRule::insensitive : CaseRule::sensitive);
}

bool numtext::operator==(const Alphabet& lhs, const Alphabet& rhs)
{
    return lhs.radix_ == rhs.radix_
        && lhs.case_rule_ == rhs.case_rule_
        && lhs.negative_sign_ == rhs.negative_sign_
        && lhs.positive_sign_ == rhs.positive_sign_
        && lhs.exponent_sign_ == rhs.exponent_sign_
        && std::memcmp(lhs.upper_, rhs.upper_, static_cast<size_t>(lhs.radix_)) == 0;
}

//==================================================================================================
// Predefined alphabets
//==================================================================================================

const Alphabet& numtext::Base2()
{
    static const Alphabet alphabet = Alphabet::Make("01", '-', 'E');
    return alphabet;
}

const Alphabet& numtext::Base8()
{
    static const Alphabet alphabet = Alphabet::Make("01234567", '-', 'E');
    return alphabet;
}

const Alphabet& numtext::Base10()
{
    static const Alphabet alphabet = Alphabet::Make("0123456789", '-', 'E');
    return alphabet;
}

const Alphabet& numtext::Base16()
{
    static const Alphabet alphabet = Alphabet::Make("0123456789ABCDEF", '-', 'p');
    return alphabet;
}

const Alphabet& numtext::Base36()
{
    static const Alphabet alphabet = Alphabet::Make("0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ", '-', '$');
    return alphabet;
}

const Alphabet& numtext::Base64()
{
    static const Alphabet alphabet = Alphabet::Make(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/", '-', '=', '*', CaseRule::sensitive);
    return alphabet;
}

const Alphabet& numtext::UriSafe()
{
    static const Alphabet alphabet = Alphabet::Make(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+-", '!', '$', '*', CaseRule::sensitive);
    return alphabet;
}

const Alphabet& numtext::Simple64()
{
    static const Alphabet alphabet = Alphabet::Make(
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz!?", '-', '$', '+', CaseRule::sensitive);
    return alphabet;
}

const Alphabet& numtext::Base86()
{
    static const Alphabet alphabet = Alphabet::Make(
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz'/!@#$%^&*()[]{}<>:?;|_=", '-', '\\', '+', CaseRule::sensitive);
    return alphabet;
}
