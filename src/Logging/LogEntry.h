/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once

#include <chrono>
#include <source_location>
#include <string>
#include <thread>
#include <utility>

#include "LogLevel.h"

namespace TransitEngine::Core::Logging {

/**
 * @brief One formatted log record as handed to every sink
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
    std::thread::id threadId;
    std::source_location location;

    LogEntry(LogLevel lvl, std::string cat, std::string msg,
             std::source_location loc = std::source_location::current())
        : timestamp(std::chrono::system_clock::now())
        , level(lvl)
        , category(std::move(cat))
        , message(std::move(msg))
        , threadId(std::this_thread::get_id())
        , location(loc) {}
};

} // namespace TransitEngine::Core::Logging
