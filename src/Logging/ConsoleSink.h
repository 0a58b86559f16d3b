/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#pragma once

#include <mutex>

#include "ILogSink.h"

namespace TransitEngine::Core::Logging {

/**
 * @brief Writes entries to stdout (Warning and above to stderr)
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useColor = true, bool showLocation = false);

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::mutex _mutex;
    bool _useColor;
    bool _showLocation;
};

} // namespace TransitEngine::Core::Logging
