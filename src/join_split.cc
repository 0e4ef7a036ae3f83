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

#include "join_split.h"
#include "logging.h"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <stdexcept>

using numtext::DecodeStatus;

const char* numtext::impl::FindDelimiter(const char* next, const char* last, const std::string& delimiter)
{
    NUMTEXT_ASSERT(!delimiter.empty());

    if (delimiter.size() == 1)
        return std::find(next, last, delimiter[0]);

    return std::search(next, last, delimiter.begin(), delimiter.end());
}

const char* numtext::impl::SkipDelimiter(const char* next, const char* last, const std::string& delimiter)
{
    const size_t len = delimiter.size();
    if (static_cast<size_t>(last - next) >= len && std::memcmp(next, delimiter.data(), len) == 0)
        return next + len;

    return next;
}

void numtext::impl::LogSplitFailure(DecodeStatus status, size_t index, const char* next, const char* last)
{
    // Keep the message short for huge elements.
    static constexpr ptrdiff_t MaxShown = 40;
    const ptrdiff_t len = std::min(last - next, MaxShown);

    Logger().debug("split failed at element {}: {} (\"{}{}\")",
        index, ToString(status), std::string(next, next + len), last - next > MaxShown ? "..." : "");
}

void numtext::impl::CheckGridDelimiters(const std::string& row_delimiter, const std::string& element_delimiter)
{
    if (row_delimiter.empty() || element_delimiter.empty())
        throw std::invalid_argument("grid delimiters must not be empty");
    if (row_delimiter == element_delimiter)
        throw std::invalid_argument("row and element delimiters must differ");
}
