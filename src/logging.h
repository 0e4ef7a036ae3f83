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

#include <spdlog/spdlog.h>

namespace numtext {

// The library logger ("numtext", stderr).
// Created on first use. The initial level is taken from the NUMTEXT_LOG_LEVEL environment
// variable (trace, debug, info, warn, error, critical, off) and defaults to warn.
// If a logger named "numtext" is already registered with spdlog, that logger is used instead.
spdlog::logger& Logger();

void SetLogLevel(spdlog::level::level_enum level);

} // namespace numtext
