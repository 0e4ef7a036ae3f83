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

#include "decimal_text.h"
#include "ieee.h"
#include "logging.h"
#include "strtod.h"

#include <cstring>
#include <limits>

using numtext::Alphabet;
using numtext::DecodeResult;
using numtext::DecodeStatus;
using numtext::FormatOptions;
using numtext::IEEE;
using numtext::InvalidAlphabet;

//==================================================================================================
//
//==================================================================================================

static void RequireDecimalAlphabet(const Alphabet& alphabet)
{
    if (alphabet.CanCarryDecimal())
        return;

    numtext::Logger().debug("alphabet '{}' cannot carry decimal text", alphabet.Serialize());
    throw InvalidAlphabet("the alphabet cannot carry decimal float text");
}

static inline char ToLowerASCII(char ch)
{
    return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

static inline bool IsExponentSign(char ch, const Alphabet& alphabet)
{
    const char e = alphabet.ExponentSign();
    return ch == e || (alphabet.CaseInsensitive() && ToLowerASCII(ch) == ToLowerASCII(e));
}

// Returns the plain ASCII form of ch, or '\0' if ch cannot occur in decimal text.
static inline char ToPlainASCII(char ch, const Alphabet& alphabet)
{
    if (ch == '.')
        return '.';

    const int d = alphabet.DigitValue(ch);
    if (d >= 0)
        return d < 10 ? static_cast<char>('0' + d) : '\0';

    if (ch == alphabet.NegativeSign())
        return '-';
    if (ch == alphabet.PositiveSign())
        return '+';
    if (IsExponentSign(ch, alphabet))
        return 'E';

    return '\0';
}

static inline bool StartsWith(const char* next, const char* last, const char* token)
{
    const size_t len = std::strlen(token);
    return static_cast<size_t>(last - next) >= len && std::memcmp(next, token, len) == 0;
}

template <typename Float>
static inline char* EncodeDecimalImpl(char* buffer, Float value, const Alphabet& alphabet, const FormatOptions& options)
{
    RequireDecimalAlphabet(alphabet);

    char* const end = numtext::Format(buffer, value, options);

    if (!IEEE<Float>(value).IsFinite())
    {
        if (buffer[0] == '-')
            buffer[0] = alphabet.NegativeSign();
        return end;
    }

    for (char* p = buffer; p != end; ++p)
    {
        const char ch = *p;
        if ('0' <= ch && ch <= '9')
            *p = alphabet.Digit(ch - '0');
        else if (ch == '-')
            *p = alphabet.NegativeSign();
        else if (ch == 'E')
            *p = alphabet.ExponentSign();
        else
            NUMTEXT_ASSERT(ch == '.');
    }

    return end;
}

template <typename Float>
static inline DecodeResult DecodeDecimalImpl(const char* next, const char* last, const Alphabet& alphabet, Float& value)
{
    RequireDecimalAlphabet(alphabet);

    if (next == last)
        return {next, DecodeStatus::empty};

    // The special tokens take precedence.
    if (StartsWith(next, last, "NaN"))
    {
        value = std::numeric_limits<Float>::quiet_NaN();
        return {next + 3, DecodeStatus::ok};
    }

    // A sign may itself be 'I', so the unsigned token is tried first.
    if (StartsWith(next, last, "Infinity"))
    {
        value = std::numeric_limits<Float>::infinity();
        return {next + 8, DecodeStatus::ok};
    }

    const bool has_sign = (*next == alphabet.NegativeSign() || *next == alphabet.PositiveSign());
    if (has_sign && StartsWith(next + 1, last, "Infinity"))
    {
        const bool is_negative = (*next == alphabet.NegativeSign());
        value = is_negative ? -std::numeric_limits<Float>::infinity() : std::numeric_limits<Float>::infinity();
        return {next + 9, DecodeStatus::ok};
    }

    // Translate the longest prefix which consists of decimal text symbols.
    std::string plain;
    plain.reserve(static_cast<size_t>(last - next));
    for (const char* p = next; p != last; ++p)
    {
        const char ch = ToPlainASCII(*p, alphabet);
        if (ch == '\0')
            break;
        plain.push_back(ch);
    }

    if (plain.empty())
        return {next, DecodeStatus::invalid_character};

    const char* const plain_first = plain.data();
    const char* const plain_last = plain_first + plain.size();

    Float flt;
    const auto res = numtext::ParseFloat(plain_first, plain_last, flt);

    // The translation is one-to-one, so offsets carry over.
    const char* const res_next = next + (res.next - plain_first);
    if (res.status != DecodeStatus::ok)
        return {res_next, res.status};

    value = flt;
    return {res_next, DecodeStatus::ok};
}

template <typename Float>
static inline DecodeStatus DecodeDecimalWindow(const std::string& text, const Alphabet& alphabet, Float& value, size_t start, size_t length)
{
    const char* first;
    const char* last;
    numtext::ClampWindow(text, start, length, first, last);

    Float flt;
    const auto res = DecodeDecimalImpl(first, last, alphabet, flt);
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

char* numtext::EncodeDecimal(char* buffer, double value, const Alphabet& alphabet, const FormatOptions& options)
{
    return EncodeDecimalImpl(buffer, value, alphabet, options);
}

char* numtext::EncodeDecimal(char* buffer, float value, const Alphabet& alphabet, const FormatOptions& options)
{
    return EncodeDecimalImpl(buffer, value, alphabet, options);
}

void numtext::AppendDecimal(std::string& out, double value, const Alphabet& alphabet, const FormatOptions& options)
{
    char buf[MaxFormattedLength];
    out.append(buf, EncodeDecimal(buf, value, alphabet, options));
}

void numtext::AppendDecimal(std::string& out, float value, const Alphabet& alphabet, const FormatOptions& options)
{
    char buf[MaxFormattedLength];
    out.append(buf, EncodeDecimal(buf, value, alphabet, options));
}

DecodeResult numtext::DecodeDecimal(const char* next, const char* last, const Alphabet& alphabet, double& value)
{
    return DecodeDecimalImpl(next, last, alphabet, value);
}

DecodeResult numtext::DecodeDecimal(const char* next, const char* last, const Alphabet& alphabet, float& value)
{
    return DecodeDecimalImpl(next, last, alphabet, value);
}

DecodeStatus numtext::DecodeDecimal(const std::string& text, const Alphabet& alphabet, double& value, size_t start, size_t length)
{
    return DecodeDecimalWindow(text, alphabet, value, start, length);
}

DecodeStatus numtext::DecodeDecimal(const std::string& text, const Alphabet& alphabet, float& value, size_t start, size_t length)
{
    return DecodeDecimalWindow(text, alphabet, value, start, length);
}
