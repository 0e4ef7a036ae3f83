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
#include "status.h"

#include <cstddef>
#include <string>

// Bit-exact text forms of float and double.
// Every bit pattern survives the round trip, including signed zeros and NaN payloads.

namespace numtext {

// The bit pattern as a fixed-width unsigned integer (see EncodeUnsigned).
char* EncodeBits(char* buffer, float value, const Alphabet& alphabet);
char* EncodeBits(char* buffer, double value, const Alphabet& alphabet);

DecodeResult DecodeBits(const char* next, const char* last, const Alphabet& alphabet, float& value);
DecodeResult DecodeBits(const char* next, const char* last, const Alphabet& alphabet, double& value);

// The byte-reversed bit pattern as a signed integer (see EncodeSigned).
// Values with few significant mantissa bits, like 1.0 or 0.5, have short encodings.
char* EncodeBitsCompact(char* buffer, float value, const Alphabet& alphabet);
char* EncodeBitsCompact(char* buffer, double value, const Alphabet& alphabet);

DecodeResult DecodeBitsCompact(const char* next, const char* last, const Alphabet& alphabet, float& value);
DecodeResult DecodeBitsCompact(const char* next, const char* last, const Alphabet& alphabet, double& value);

//==================================================================================================
// std::string helpers
//==================================================================================================

void AppendBits(std::string& out, float value, const Alphabet& alphabet);
void AppendBits(std::string& out, double value, const Alphabet& alphabet);
void AppendBitsCompact(std::string& out, float value, const Alphabet& alphabet);
void AppendBitsCompact(std::string& out, double value, const Alphabet& alphabet);

template <typename Float>
std::string EncodeBits(Float value, const Alphabet& alphabet)
{
    std::string out;
    AppendBits(out, value, alphabet);
    return out;
}

template <typename Float>
std::string EncodeBitsCompact(Float value, const Alphabet& alphabet)
{
    std::string out;
    AppendBitsCompact(out, value, alphabet);
    return out;
}

// Decodes the (clamped) window of text.
DecodeStatus DecodeBits(const std::string& text, const Alphabet& alphabet, float& value,
                        size_t start = 0, size_t length = std::string::npos);
DecodeStatus DecodeBits(const std::string& text, const Alphabet& alphabet, double& value,
                        size_t start = 0, size_t length = std::string::npos);

} // namespace numtext
