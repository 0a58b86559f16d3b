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
 * @file CoreCommon.h
 * @brief Core common utilities and debugging macros for TransitCore
 *
 * Debug assertions, build configuration flags and small helpers shared by
 * every TransitCore module.
 */

#include <cassert>
#include <cstdlib>
#include <optional>
#include <string>

#ifdef TransitDebug
#undef NDEBUG
#define TRANSIT_ASSERT(condition, message) assert(condition)
#else
#define TRANSIT_ASSERT(condition, message) ((void)0)
#endif

namespace TransitEngine {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        // required includes the null terminator
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }

    // Parses an unsigned integer environment variable; nullopt if unset or malformed.
    inline std::optional<unsigned long long> safeGetEnvUnsigned(const char* name) {
        auto v = safeGetEnv(name);
        if (!v || v->empty()) return std::nullopt;
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(v->c_str(), &end, 10);
        if (end == v->c_str() || *end != '\0') return std::nullopt;
        return parsed;
    }
} // namespace Core
}
