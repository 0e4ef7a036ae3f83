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

#include <cstdint>

namespace numtext {

// value = (sign ? -1 : 1) * digits * 10^exponent
struct FloatingDecimal
{
    uint64_t digits;  // at most 17 (9) decimal digits, no trailing zeros; 0 only for +-0
    int32_t exponent;
    bool sign;

    // Number of decimal digits in `digits` (1 for zero).
    int32_t NumDigits() const;

    // Exponent of the first digit, i.e. the exponent in d.dddE<n> notation.
    int32_t ScientificExponent() const { return exponent + NumDigits() - 1; }
};

// Returns the number of decimal digits in v (1 for v == 0).
int32_t DecimalLength(uint64_t v);

// Computes the shortest decimal representation of the given finite number.
//
// The result is optimal, i.e. it
//  1. rounds back to the input number when read in (using round-to-nearest-even),
//  2. has as few digits as possible,
//  3. is as close to the input number as possible.
//
// Trailing zeros are removed from the digits: ToDecimal(100.0) = {1, 2, false}.
FloatingDecimal ToDecimal(double value);
FloatingDecimal ToDecimal(float value);

} // namespace numtext
