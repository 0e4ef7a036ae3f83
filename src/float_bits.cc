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

#include "float_bits.h"
#include "ieee.h"
#include "radix.h"

#include <type_traits>

using numtext::Alphabet;
using numtext::DecodeResult;
using numtext::DecodeStatus;
using numtext::IEEE;

//==================================================================================================
//
//==================================================================================================

static inline uint32_t ReverseBytes(uint32_t x)
{
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap32(x);
#else
    return (x >> 24)
         | ((x >> 8) & 0x0000FF00u)
         | ((x << 8) & 0x00FF0000u)
         | (x << 24);
#endif
}

static inline uint64_t ReverseBytes(uint64_t x)
{
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap64(x);
#else
    return uint64_t{ReverseBytes(static_cast<uint32_t>(x))} << 32 | ReverseBytes(static_cast<uint32_t>(x >> 32));
#endif
}

template <typename Float>
using SignedBitsOf = typename std::make_signed<typename IEEE<Float>::bits_type>::type;

template <typename Float>
static inline char* EncodeBitsImpl(char* buffer, Float value, const Alphabet& alphabet)
{
    return numtext::EncodeUnsigned(buffer, IEEE<Float>(value).bits, alphabet);
}

template <typename Float>
static inline DecodeResult DecodeBitsImpl(const char* next, const char* last, const Alphabet& alphabet, Float& value)
{
    typename IEEE<Float>::bits_type bits;
    const auto res = numtext::DecodeUnsigned(next, last, alphabet, bits);
    if (res.status == DecodeStatus::ok)
        value = IEEE<Float>(bits).Value();
    return res;
}

template <typename Float>
static inline char* EncodeBitsCompactImpl(char* buffer, Float value, const Alphabet& alphabet)
{
    const auto reversed = ReverseBytes(IEEE<Float>(value).bits);
    return numtext::EncodeSigned(buffer, static_cast<SignedBitsOf<Float>>(reversed), alphabet);
}

template <typename Float>
static inline DecodeResult DecodeBitsCompactImpl(const char* next, const char* last, const Alphabet& alphabet, Float& value)
{
    SignedBitsOf<Float> reversed;
    const auto res = numtext::DecodeSigned(next, last, alphabet, reversed);
    if (res.status == DecodeStatus::ok)
    {
        using bits_type = typename IEEE<Float>::bits_type;
        value = IEEE<Float>(ReverseBytes(static_cast<bits_type>(reversed))).Value();
    }
    return res;
}

//==================================================================================================
//
//==================================================================================================

char* numtext::EncodeBits(char* buffer, float value, const Alphabet& alphabet)
{
    return EncodeBitsImpl(buffer, value, alphabet);
}

char* numtext::EncodeBits(char* buffer, double value, const Alphabet& alphabet)
{
    return EncodeBitsImpl(buffer, value, alphabet);
}

DecodeResult numtext::DecodeBits(const char* next, const char* last, const Alphabet& alphabet, float& value)
{
    return DecodeBitsImpl(next, last, alphabet, value);
}

DecodeResult numtext::DecodeBits(const char* next, const char* last, const Alphabet& alphabet, double& value)
{
    return DecodeBitsImpl(next, last, alphabet, value);
}

char* numtext::EncodeBitsCompact(char* buffer, float value, const Alphabet& alphabet)
{
    return EncodeBitsCompactImpl(buffer, value, alphabet);
}

char* numtext::EncodeBitsCompact(char* buffer, double value, const Alphabet& alphabet)
{
    return EncodeBitsCompactImpl(buffer, value, alphabet);
}

DecodeResult numtext::DecodeBitsCompact(const char* next, const char* last, const Alphabet& alphabet, float& value)
{
    return DecodeBitsCompactImpl(next, last, alphabet, value);
}

DecodeResult numtext::DecodeBitsCompact(const char* next, const char* last, const Alphabet& alphabet, double& value)
{
    return DecodeBitsCompactImpl(next, last, alphabet, value);
}

void numtext::AppendBits(std::string& out, float value, const Alphabet& alphabet)
{
    char buf[MaxEncodedIntegerLength];
    out.append(buf, EncodeBits(buf, value, alphabet));
}

void numtext::AppendBits(std::string& out, double value, const Alphabet& alphabet)
{
    char buf[MaxEncodedIntegerLength];
    out.append(buf, EncodeBits(buf, value, alphabet));
}

void numtext::AppendBitsCompact(std::string& out, float value, const Alphabet& alphabet)
{
    char buf[MaxEncodedIntegerLength];
    out.append(buf, EncodeBitsCompact(buf, value, alphabet));
}

void numtext::AppendBitsCompact(std::string& out, double value, const Alphabet& alphabet)
{
    char buf[MaxEncodedIntegerLength];
    out.append(buf, EncodeBitsCompact(buf, value, alphabet));
}

DecodeStatus numtext::DecodeBits(const std::string& text, const Alphabet& alphabet, float& value, size_t start, size_t length)
{
    const char* first;
    const char* last;
    ClampWindow(text, start, length, first, last);
    return DecodeBits(first, last, alphabet, value).status;
}

DecodeStatus numtext::DecodeBits(const std::string& text, const Alphabet& alphabet, double& value, size_t start, size_t length)
{
    const char* first;
    const char* last;
    ClampWindow(text, start, length, first, last);
    return DecodeBits(first, last, alphabet, value).status;
}
