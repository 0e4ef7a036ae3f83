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

#include "status.h"

#include <cstddef>
#include <string>

namespace numtext {

// DecodeResult res = Strtod(next, last, value);
//
// Converts the decimal floating-point number at the start of [next, last) into the nearest
// binary floating-point number (round-to-nearest-even).
//
// Accepted:
//  [+-] digits [. digits] [(e|E) [+-] digits]
//  [+-] . digits [(e|E) [+-] digits]
//  [+-] (inf | infinity | nan | nan(chars))   case-insensitive
//
// An incomplete exponent ("1e", "1e+") is not consumed: res.next points at the 'e'.
// Inputs too large for the target type give +-infinity, inputs too small give +-0.
//
// On success, value is set and res.next points past the number. On failure, value is left
// unchanged and res.next points at the offending character.
//
// Note:
// Always converts the output of Dtoa (Ftoa) back into the original binary number.
DecodeResult Strtod(const char* next, const char* last, double& value);
DecodeResult Strtof(const char* next, const char* last, float& value);

inline DecodeResult ParseFloat(const char* next, const char* last, double& value)
{
    return Strtod(next, last, value);
}

inline DecodeResult ParseFloat(const char* next, const char* last, float& value)
{
    return Strtof(next, last, value);
}

// Parses the (clamped) window of text, which must contain the number and nothing else.
DecodeStatus ParseDecimal(const std::string& text, double& value,
                          size_t start = 0, size_t length = std::string::npos);
DecodeStatus ParseDecimal(const std::string& text, float& value,
                          size_t start = 0, size_t length = std::string::npos);

} // namespace numtext
