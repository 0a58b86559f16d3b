/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file PathResolver.h
 * @brief Canonicalizes raw path input into an absolute, length-safe form
 *
 * Every path that reaches the transfer engine or the metadata cache goes through
 * PathResolver first. Resolution is purely lexical: no filesystem probing happens
 * apart from reading the process working directory for relative input.
 */
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include "FileError.h"

namespace TransitEngine::Core::IO {

/**
 * @brief Declares how a raw path string should be interpreted
 * @param Relative May be relative; resolved against the configured base directory
 * @param AbsoluteShort Must already be absolute; still normalized and validated
 * @param AlreadyCanonical Trusted canonical form; validated and taken verbatim
 */
enum class PathFormat { Relative, AbsoluteShort, AlreadyCanonical };

struct ResolvedPath {
    std::string canonical;  // absolute, separator-normalized, no trailing separator
    std::string extended;   // canonical, or long-path-escaped when over the threshold

    bool isExtended() const noexcept { return extended.size() != canonical.size(); }

    friend bool operator==(const ResolvedPath& a, const ResolvedPath& b) noexcept {
        return a.canonical == b.canonical && a.extended == b.extended;
    }
    friend bool operator!=(const ResolvedPath& a, const ResolvedPath& b) noexcept { return !(a == b); }
};

class PathResolver {
public:
    struct Config {
        bool strict;                    // reject < > " | ? *, control chars and reserved device names
        bool trimTrailingWhitespace;    // trim spaces, tabs, CR and LF from the end of non-canonical input
        size_t longPathThreshold;       // canonical lengths above this get the long-path escape
        std::string baseDirectory;      // context for relative input; empty => process working directory

        Config()
            : strict(false)
            , trimTrailingWhitespace(true)
            , longPathThreshold(260)
            , baseDirectory() {}
    };

    // Long-path escape marker. The native layer strips it before any syscall.
    static constexpr std::string_view kLongPathPrefix = "\\\\?\\";

    explicit PathResolver(Config cfg = {});

    /**
     * @brief Resolves a raw path into canonical and extended forms
     *
     * Steps, in order: strip an existing long-path marker, trim trailing whitespace,
     * validate characters (and reserved names when strict), strip one trailing
     * separator, anchor relative input at the base directory, collapse "." and "..",
     * trim whitespace the collapse left at the end, and re-apply the long-path marker when the result exceeds the threshold.
     *
     * Idempotent for a fixed format: resolve(resolve(p).canonical) == resolve(p).
     *
     * @param raw Raw path text (UTF-8)
     * @param format How to interpret raw
     * @return ResolvedPath, or InvalidArgument for empty/whitespace/invalid input
     */
    FileResult<ResolvedPath> resolve(std::string_view raw, PathFormat format = PathFormat::Relative) const;

    /**
     * @brief Strips the long-path marker so the string can be passed to the OS
     */
    static std::string toNativePath(std::string_view path);
    static bool hasLongPathPrefix(std::string_view path) noexcept;

    // True if name (a single path segment) is a reserved device name such as CON or com1.txt
    static bool isReservedDeviceName(std::string_view name) noexcept;

    const Config& config() const noexcept { return _cfg; }

private:
    FileErrorInfo validate(std::string_view path) const;

    Config _cfg;
};

} // namespace TransitEngine::Core::IO
