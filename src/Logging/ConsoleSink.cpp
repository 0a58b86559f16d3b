/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "ConsoleSink.h"

#include <ctime>
#include <iomanip>
#include <iostream>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace TransitEngine::Core::Logging {

namespace {
    const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Info:    return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:   return "\033[31m";
            case LogLevel::Fatal:   return "\033[1;31m";
            default:                return "";
        }
    }

    bool isTerminal(std::ostream& os) {
#if defined(__unix__) || defined(__APPLE__)
        if (&os == &std::cout) return ::isatty(STDOUT_FILENO) != 0;
        if (&os == &std::cerr) return ::isatty(STDERR_FILENO) != 0;
#else
        (void)os;
#endif
        return false;
    }
}

ConsoleSink::ConsoleSink(bool useColor, bool showLocation)
    : _useColor(useColor)
    , _showLocation(showLocation) {
}

void ConsoleSink::write(const LogEntry& entry) {
    if (!shouldLog(entry.level)) return;

    std::ostream& os = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
    const bool color = _useColor && isTerminal(os);

    auto tt = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif

    std::lock_guard<std::mutex> lock(_mutex);
    os << '[' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count() << "] ";
    if (color) os << colorFor(entry.level);
    os << '[' << toString(entry.level) << ']';
    if (color) os << "\033[0m";
    if (!entry.category.empty()) os << " [" << entry.category << ']';
    os << ' ' << entry.message;
    if (_showLocation) {
        os << " (" << entry.location.file_name() << ':' << entry.location.line() << ')';
    }
    os << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::cout.flush();
    std::cerr.flush();
}

} // namespace TransitEngine::Core::Logging
