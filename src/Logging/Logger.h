/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger fans each entry out to its sinks after a cheap level check. Use the
 * TRANSIT_LOG_* macros rather than calling log() directly so that call sites
 * record their source location.
 *
 * @code
 * Logger::global().setMinLevel(LogLevel::Debug);
 * TRANSIT_LOG_DEBUG_CAT("TransferEngine", "Copy started: " + src);
 * @endcode
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogEntry.h"
#include "LogLevel.h"

namespace TransitEngine::Core::Logging {

class Logger {
public:
    explicit Logger(std::string name);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Shared logger used by the TRANSIT_LOG_* macros
     *
     * Created on first use with a ConsoleSink attached. Its minimum level is taken
     * from TRANSIT_LOG_LEVEL when set (trace, debug, info, warn, error, fatal, off),
     * otherwise Info.
     */
    static Logger& global();

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    size_t sinkCount() const;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= minLevel();
    }

    void log(LogLevel level, std::string_view category, std::string_view message,
             std::source_location location = std::source_location::current());

    void trace(std::string_view message) { log(LogLevel::Trace, _name, message); }
    void debug(std::string_view message) { log(LogLevel::Debug, _name, message); }
    void info(std::string_view message) { log(LogLevel::Info, _name, message); }
    void warning(std::string_view message) { log(LogLevel::Warning, _name, message); }
    void error(std::string_view message) { log(LogLevel::Error, _name, message); }
    void fatal(std::string_view message) { log(LogLevel::Fatal, _name, message); }

    void flush();

    const std::string& name() const noexcept { return _name; }

private:
    std::string _name;
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace TransitEngine::Core::Logging

#ifndef TRANSIT_LOG_CATEGORY_DEFAULT
#define TRANSIT_LOG_CATEGORY_DEFAULT __func__
#endif

#define TRANSIT_LOG_AT(level, cat, msg) \
    do { \
        auto& _transitLogger = ::TransitEngine::Core::Logging::Logger::global(); \
        if (_transitLogger.isEnabled(level)) { _transitLogger.log((level), (cat), (msg)); } \
    } while (0)

#define TRANSIT_LOG_TRACE(msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Trace, TRANSIT_LOG_CATEGORY_DEFAULT, msg)
#define TRANSIT_LOG_DEBUG(msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Debug, TRANSIT_LOG_CATEGORY_DEFAULT, msg)
#define TRANSIT_LOG_INFO(msg)    TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Info, TRANSIT_LOG_CATEGORY_DEFAULT, msg)
#define TRANSIT_LOG_WARNING(msg) TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Warning, TRANSIT_LOG_CATEGORY_DEFAULT, msg)
#define TRANSIT_LOG_ERROR(msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Error, TRANSIT_LOG_CATEGORY_DEFAULT, msg)
#define TRANSIT_LOG_FATAL(msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Fatal, TRANSIT_LOG_CATEGORY_DEFAULT, msg)

#define TRANSIT_LOG_TRACE_CAT(cat, msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Trace, cat, msg)
#define TRANSIT_LOG_DEBUG_CAT(cat, msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Debug, cat, msg)
#define TRANSIT_LOG_INFO_CAT(cat, msg)    TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Info, cat, msg)
#define TRANSIT_LOG_WARNING_CAT(cat, msg) TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Warning, cat, msg)
#define TRANSIT_LOG_ERROR_CAT(cat, msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Error, cat, msg)
#define TRANSIT_LOG_FATAL_CAT(cat, msg)   TRANSIT_LOG_AT(::TransitEngine::Core::Logging::LogLevel::Fatal, cat, msg)
