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

#include "status.h"

const char* numtext::ToString(DecodeStatus status)
{
    switch (status)
    {
    case DecodeStatus::ok:
        return "ok";
    case DecodeStatus::empty:
        return "empty input";
    case DecodeStatus::invalid_character:
        return "invalid character";
    case DecodeStatus::malformed:
        return "malformed number";
    case DecodeStatus::overflow:
        return "value out of range";
    case DecodeStatus::invalid_delimiter:
        return "invalid delimiter";
    case DecodeStatus::malformed_grid:
        return "rows differ in length";
    }

    return "unknown status";
}
