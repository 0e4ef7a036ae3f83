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

#include "ryu.h"

#include <string>

namespace numtext {

enum class FloatFormat {
    general,    // the shorter of decimal and scientific, decimal on a tie
    decimal,    // 0.00039954273149628435
    scientific, // 3.9954273149628435E-4
    friendly,   // decimal if the scientific exponent is in [-10, 10), scientific otherwise
};

struct FormatOptions
{
    FloatFormat format = FloatFormat::general;
    // If > 0, round the shortest digits to at most this many significant digits (half up).
    int max_digits = 0;
    // Print integral mantissas as 1.0, 1.0E22, ...
    bool force_trailing_dot_zero = false;
};

// Sign, 309 integer digits of DBL_MAX and ".0", or sign, "0." and 323 zeros before
// the 17 digits of the smallest doubles.
constexpr int MaxFormattedLength = 352;

// Rounds dec to at most max_digits significant digits (round half up) and strips the
// trailing zeros. Returns dec unchanged if max_digits <= 0 or dec is short enough.
FloatingDecimal RoundToDigits(FloatingDecimal dec, int max_digits);

// char* output_end = FormatDecimal(buffer, dec, options);
//
// Prints the (already rounded) decimal number. options.max_digits is ignored.
// The buffer must hold at least MaxFormattedLength characters.
// The output is _not_ null-terminated.
char* FormatDecimal(char* buffer, const FloatingDecimal& dec, const FormatOptions& options);

// char* output_end = Format(buffer, value, options);
//
// Converts the given number into decimal form: the shortest digits which round back to value
// (unless options.max_digits says otherwise), printed as options.format requests.
// Non-finite values print as "NaN", "Infinity" and "-Infinity".
//
// The buffer must hold at least MaxFormattedLength characters.
// The output is _not_ null-terminated.
char* Format(char* buffer, double value, const FormatOptions& options = {});
char* Format(char* buffer, float value, const FormatOptions& options = {});

// Shortest digits in general format.
char* Dtoa(char* buffer, double value);
char* Ftoa(char* buffer, float value);

std::string ToString(double value, const FormatOptions& options = {});
std::string ToString(float value, const FormatOptions& options = {});

} // namespace numtext
