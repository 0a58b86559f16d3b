/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once

#include <atomic>

#include "LogEntry.h"

namespace TransitEngine::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks are shared between loggers and may be called from several threads at once;
 * implementations serialize their own output.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }

    bool shouldLog(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= minLevel();
    }

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Trace};
};

} // namespace TransitEngine::Core::Logging
