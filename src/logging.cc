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

#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>

static spdlog::level::level_enum InitialLevel()
{
    const char* env = std::getenv("NUMTEXT_LOG_LEVEL");
    if (env == nullptr || *env == '\0')
        return spdlog::level::warn;

    // Unknown names map to "off".
    return spdlog::level::from_str(env);
}

static std::shared_ptr<spdlog::logger> CreateLogger()
{
    // Share a logger another module registered under this name.
    if (auto existing = spdlog::get("numtext"))
        return existing;

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    auto logger = std::make_shared<spdlog::logger>("numtext", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    logger->set_level(InitialLevel());
    logger->flush_on(spdlog::level::warn);

    try
    {
        spdlog::register_logger(logger);
    }
    catch (const spdlog::spdlog_ex&)
    {
        // Registered concurrently by someone else.
        auto existing = spdlog::get(logger->name());
        if (existing == nullptr)
            throw;
        return existing;
    }

    return logger;
}

spdlog::logger& numtext::Logger()
{
    static const std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return *logger;
}

void numtext::SetLogLevel(spdlog::level::level_enum level)
{
    Logger().set_level(level);
}
