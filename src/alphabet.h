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

#pragma once

#include "macros.h"
#include "status.h"

#include <cstdint>
#include <string>

namespace numtext {

enum class CaseRule {
    insensitive, // 'a' and 'A' denote the same digit; output uses the upper-case form
    sensitive,
};

// An immutable digit table for positional notation: digit value <-> symbol, plus the sign
// characters used by the signed and scientific formats.
//
// Symbols and signs are printable ASCII characters (0x21...0x7E).
class Alphabet
{
public:
    static constexpr int MinRadix = 2;
    static constexpr int MaxRadix = 94;

    // Throws InvalidAlphabet if
    //  - there are less than 2 (or more than MaxRadix) symbols,
    //  - a symbol or sign is not a printable ASCII character,
    //  - two symbols are equal (ignoring case, if case_rule is insensitive),
    //  - a sign is equal to a symbol, or two signs are equal.
    static Alphabet Make(const std::string& symbols,
                         char negative_sign,
                         char exponent_sign,
                         char positive_sign = '+',
                         CaseRule case_rule = CaseRule::insensitive);

    // A case-sensitive base-72 alphabet with randomly chosen digits and signs, drawn from
    //  ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789?!@#$%^&*-|=+;
    // The signs are taken from the 4 symbols left over after choosing the digits.
    static Alphabet Scrambled(uint64_t seed);

    // Restores an alphabet from the output of Serialize().
    // Throws InvalidAlphabet on malformed input.
    static Alphabet Deserialize(const std::string& data);

    // Returns a copy of this alphabet with the digit symbols randomly permuted.
    // The result only depends on the seed (and this alphabet), on all platforms.
    Alphabet Scramble(uint64_t seed) const;

    // symbols + case flag ('1' = case-insensitive) + exponent sign + positive sign + negative sign
    std::string Serialize() const;

    int Radix() const { return radix_; }
    bool CaseInsensitive() const { return case_rule_ == CaseRule::insensitive; }
    char NegativeSign() const { return negative_sign_; }
    char PositiveSign() const { return positive_sign_; }
    char ExponentSign() const { return exponent_sign_; }

    // Canonical (upper-case) symbol for the given digit value.
    char Digit(int value) const {
        NUMTEXT_ASSERT(value >= 0 && value < radix_);
        return upper_[value];
    }

    char LowerDigit(int value) const {
        NUMTEXT_ASSERT(value >= 0 && value < radix_);
        return lower_[value];
    }

    // Returns the digit value of ch, or -1 if ch is not a digit of this alphabet.
    int DigitValue(char ch) const {
        const auto uc = static_cast<unsigned char>(ch);
        return uc < 128 ? values_[uc] : -1;
    }

    bool IsDigit(char ch) const { return DigitValue(ch) >= 0; }

    // Number of digits EncodeUnsigned produces for an integer with the given number of bits,
    // i.e. ceil(bits / log2(radix)), for bits = 8, 16, 32 or 64.
    int FixedWidth(int bits) const;

    // Whether this alphabet can carry text produced by the decimal float formatter:
    // it needs ten decimal digits, the decimal point '.' must be neither a digit nor a sign,
    // and neither "NaN" nor "Infinity" may be readable as a number.
    bool CanCarryDecimal() const { return can_carry_decimal_; }

    friend bool operator==(const Alphabet& lhs, const Alphabet& rhs);

private:
    Alphabet() = default;

    void Init(const std::string& symbols);

    int radix_ = 0;
    CaseRule case_rule_ = CaseRule::insensitive;
    char negative_sign_ = '-';
    char positive_sign_ = '+';
    char exponent_sign_ = 'E';
    bool can_carry_decimal_ = false;
    int8_t fixed_width_[4] = {}; // 8, 16, 32, 64 bits
    char upper_[MaxRadix] = {};
    char lower_[MaxRadix] = {};
    int8_t values_[128] = {};
};

bool operator==(const Alphabet& lhs, const Alphabet& rhs);

inline bool operator!=(const Alphabet& lhs, const Alphabet& rhs) { return !(lhs == rhs); }

//==================================================================================================
// Predefined alphabets
//==================================================================================================

// "01", case-insensitive, '-', '+', 'E'
const Alphabet& Base2();
// "01234567", case-insensitive, '-', '+', 'E'
const Alphabet& Base8();
// "0123456789", case-insensitive, '-', '+', 'E'
const Alphabet& Base10();
// "0123456789ABCDEF", case-insensitive, '-', '+', 'p'
const Alphabet& Base16();
// "0-9A-Z", case-insensitive, '-', '+', '$'
const Alphabet& Base36();
// "A-Za-z0-9+/", case-sensitive, '-', '*', '='
const Alphabet& Base64();
// "A-Za-z0-9+-", case-sensitive, '!', '*', '$'
const Alphabet& UriSafe();
// "0-9A-Za-z!?", case-sensitive, '-', '+', '$'
const Alphabet& Simple64();
// "0-9A-Za-z'/!@#$%^&*()[]{}<>:?;|_=", case-sensitive, '-', '+', '\'
const Alphabet& Base86();

} // namespace numtext
