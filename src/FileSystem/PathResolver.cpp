/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "PathResolver.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace TransitEngine::Core::IO {

namespace {
    constexpr char kSeparator = '/';

    bool isTrimmable(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    bool isBlank(std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        });
    }

    bool isStrictInvalidChar(char c) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20) return true;
        switch (c) {
            case '<': case '>': case '"': case '|': case '?': case '*':
                return true;
            default:
                return false;
        }
    }

    void stripTrailingSeparators(std::string& s) {
        while (s.size() > 1 && s.back() == kSeparator) s.pop_back();
    }
}

PathResolver::PathResolver(Config cfg)
    : _cfg(std::move(cfg)) {
}

bool PathResolver::hasLongPathPrefix(std::string_view path) noexcept {
    return path.substr(0, kLongPathPrefix.size()) == kLongPathPrefix;
}

std::string PathResolver::toNativePath(std::string_view path) {
    if (hasLongPathPrefix(path)) path.remove_prefix(kLongPathPrefix.size());
    return std::string(path);
}

bool PathResolver::isReservedDeviceName(std::string_view name) noexcept {
    // Device names are reserved with any extension and with trailing spaces
    auto dot = name.find('.');
    std::string_view stem = name.substr(0, dot);
    while (!stem.empty() && stem.back() == ' ') stem.remove_suffix(1);
    if (stem.size() != 3 && stem.size() != 4) return false;

    std::array<char, 4> up{};
    for (size_t i = 0; i < stem.size(); ++i) {
        up[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(stem[i])));
    }
    std::string_view u(up.data(), stem.size());

    if (u == "CON" || u == "PRN" || u == "AUX" || u == "NUL") return true;
    if (u.size() == 4 && (u.substr(0, 3) == "COM" || u.substr(0, 3) == "LPT")) {
        return u[3] >= '1' && u[3] <= '9';
    }
    return false;
}

FileErrorInfo PathResolver::validate(std::string_view path) const {
    if (path.find('\0') != std::string_view::npos) {
        return FileErrorInfo::make(FileError::InvalidArgument, "Path contains an embedded NUL character");
    }
    if (!_cfg.strict) return {};

    for (char c : path) {
        if (isStrictInvalidChar(c)) {
            return FileErrorInfo::make(FileError::InvalidArgument,
                                       std::string("Path contains an invalid character (0x") +
                                       std::to_string(static_cast<unsigned>(static_cast<unsigned char>(c))) + ")",
                                       std::string(path));
        }
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(kSeparator, start);
        if (end == std::string_view::npos) end = path.size();
        auto segment = path.substr(start, end - start);
        if (!segment.empty() && isReservedDeviceName(segment)) {
            return FileErrorInfo::make(FileError::InvalidArgument,
                                       "Path contains a reserved device name: " + std::string(segment),
                                       std::string(path));
        }
        start = end + 1;
    }
    return {};
}

FileResult<ResolvedPath> PathResolver::resolve(std::string_view raw, PathFormat format) const {
    using Result = FileResult<ResolvedPath>;

    if (raw.empty() || isBlank(raw)) {
        return Result::failure(FileErrorInfo::make(FileError::InvalidArgument, "Path is empty or whitespace"));
    }

    std::string s(raw);
    if (hasLongPathPrefix(s)) s.erase(0, kLongPathPrefix.size());

    if (format != PathFormat::AlreadyCanonical && _cfg.trimTrailingWhitespace) {
        while (!s.empty() && isTrimmable(s.back())) s.pop_back();
    }
    if (s.empty() || isBlank(s)) {
        return Result::failure(FileErrorInfo::make(FileError::InvalidArgument, "Path is empty or whitespace",
                                                   std::string(raw)));
    }

    if (auto err = validate(s); !err.ok()) {
        if (err.path.empty()) err.path = std::string(raw);
        return Result::failure(std::move(err));
    }

    // Exactly one separator is the caller's trailing slash; lexical
    // normalization takes care of anything left over.
    if (s.size() > 1 && s.back() == kSeparator) s.pop_back();

    std::filesystem::path p(s);
    if (format == PathFormat::AlreadyCanonical || format == PathFormat::AbsoluteShort) {
        if (!p.is_absolute()) {
            return Result::failure(FileErrorInfo::make(FileError::InvalidArgument,
                                                       "Path is not absolute", std::string(raw)));
        }
    }

    ResolvedPath out;
    if (format == PathFormat::AlreadyCanonical) {
        out.canonical = std::move(s);
    } else {
        if (!p.is_absolute()) {
            std::filesystem::path base;
            if (!_cfg.baseDirectory.empty()) {
                base = std::filesystem::path(toNativePath(_cfg.baseDirectory));
            } else {
                std::error_code ec;
                base = std::filesystem::current_path(ec);
                if (ec) {
                    return Result::failure(FileErrorInfo::make(mapErrnoToFileError(ec.value()),
                                                               "Cannot determine working directory",
                                                               std::string(raw), ec));
                }
            }
            p = base / p;
        }
        out.canonical = p.lexically_normal().generic_string();
    }

    stripTrailingSeparators(out.canonical);
    if (format != PathFormat::AlreadyCanonical && _cfg.trimTrailingWhitespace) {
        // Normalization can expose whitespace that ended an inner segment
        while (!out.canonical.empty() && isTrimmable(out.canonical.back())) {
            while (!out.canonical.empty() && isTrimmable(out.canonical.back())) out.canonical.pop_back();
            stripTrailingSeparators(out.canonical);
        }
    }
    out.extended = out.canonical.size() > _cfg.longPathThreshold
        ? std::string(kLongPathPrefix) + out.canonical
        : out.canonical;
    return Result::success(std::move(out));
}

} // namespace TransitEngine::Core::IO
