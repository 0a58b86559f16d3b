/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file ProgressChannel.h
 * @brief Synchronous progress reporting and cooperative cancellation
 *
 * The callback runs on the thread performing the transfer. Its return value is the
 * only cancellation mechanism: Cancel and StopAndQuiet abort the transfer, Quiet and
 * StopAndQuiet suppress every later invocation for the rest of that transfer call.
 *
 * @code
 * auto cb = [](const ProgressReport& r) {
 *     return r.bytesTransferred * 2 >= r.totalBytes ? ProgressResult::Cancel : ProgressResult::Continue;
 * };
 * auto result = entry.copyTo("/tmp/out.bin", {}, cb);
 * // result.status == TransferStatus::Cancelled
 * @endcode
 */
#pragma once
#include <cstdint>
#include <functional>

namespace TransitEngine::Core::IO {

enum class ProgressResult {
    Continue,       // keep going and keep reporting
    Cancel,         // abort; the transfer ends Cancelled
    Quiet,          // keep going, stop reporting
    StopAndQuiet    // abort without further reports; the transfer ends Stopped
};

struct ProgressReport {
    uint64_t bytesTransferred = 0;  // cumulative for the current stream
    uint64_t totalBytes = 0;
    uint32_t streamIndex = 0;       // always 0; entries have a single data stream here
};

using ProgressCallback = std::function<ProgressResult(const ProgressReport&)>;

/**
 * @brief Per-transfer wrapper around a ProgressCallback
 *
 * Tracks quiet suppression and the abort decision for one transfer call.
 * A channel without a callback always continues.
 */
class ProgressChannel {
public:
    explicit ProgressChannel(ProgressCallback callback = {}, uint64_t minReportIntervalBytes = 0);

    /**
     * @brief Reports the start of a stream. Always invokes the callback unless quiet.
     * @return true to continue, false if the callback asked to abort
     */
    bool begin(uint64_t totalBytes, uint32_t streamIndex = 0);

    /**
     * @brief Reports progress after a chunk
     *
     * Reports closer together than the minimum interval are skipped, except the one
     * that reaches totalBytes.
     * @return true to continue, false if the callback asked to abort
     */
    bool advance(uint64_t bytesTransferred, uint64_t totalBytes, uint32_t streamIndex = 0);

    bool aborted() const noexcept { return _aborted; }
    // The abort decision (Cancel or StopAndQuiet); Continue when not aborted
    ProgressResult abortReason() const noexcept { return _aborted ? _abortReason : ProgressResult::Continue; }
    bool quiet() const noexcept { return _quiet; }
    bool hasCallback() const noexcept { return static_cast<bool>(_callback); }
    uint32_t invocationCount() const noexcept { return _invocations; }

private:
    bool dispatch(const ProgressReport& report);

    ProgressCallback _callback;
    uint64_t _minInterval;
    uint64_t _lastReported = 0;
    uint32_t _invocations = 0;
    bool _quiet = false;
    bool _aborted = false;
    ProgressResult _abortReason = ProgressResult::Continue;
};

} // namespace TransitEngine::Core::IO
