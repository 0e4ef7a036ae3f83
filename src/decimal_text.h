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

#include "alphabet.h"
#include "format_digits.h"
#include "status.h"

#include <cstddef>
#include <string>

// Decimal float text spelled with the symbols of an alphabet.
//
// The decimal digit d is written as alphabet.Digit(d), '-' as the negative sign and 'E' as the
// exponent sign; '.' is kept. "NaN" and "Infinity" are written verbatim (with the negative sign
// in front of -Infinity).
//
// All functions throw InvalidAlphabet if !alphabet.CanCarryDecimal().

namespace numtext {

// The buffer must hold at least MaxFormattedLength characters.
char* EncodeDecimal(char* buffer, double value, const Alphabet& alphabet, const FormatOptions& options = {});
char* EncodeDecimal(char* buffer, float value, const Alphabet& alphabet, const FormatOptions& options = {});

void AppendDecimal(std::string& out, double value, const Alphabet& alphabet, const FormatOptions& options = {});
void AppendDecimal(std::string& out, float value, const Alphabet& alphabet, const FormatOptions& options = {});

template <typename Float>
std::string EncodeDecimal(Float value, const Alphabet& alphabet, const FormatOptions& options = {})
{
    std::string out;
    AppendDecimal(out, value, alphabet, options);
    return out;
}

// Reads the number at the start of [next, last), like Strtod does for plain decimal text.
// The positive sign is accepted in front of the number and its exponent. For case-insensitive
// alphabets the exponent sign is matched ignoring case.
DecodeResult DecodeDecimal(const char* next, const char* last, const Alphabet& alphabet, double& value);
DecodeResult DecodeDecimal(const char* next, const char* last, const Alphabet& alphabet, float& value);

// Decodes the (clamped) window of text, which must contain the number and nothing else.
DecodeStatus DecodeDecimal(const std::string& text, const Alphabet& alphabet, double& value,
                           size_t start = 0, size_t length = std::string::npos);
DecodeStatus DecodeDecimal(const std::string& text, const Alphabet& alphabet, float& value,
                           size_t start = 0, size_t length = std::string::npos);

} // namespace numtext
