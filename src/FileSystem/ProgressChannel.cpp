/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "ProgressChannel.h"

namespace TransitEngine::Core::IO {

ProgressChannel::ProgressChannel(ProgressCallback callback, uint64_t minReportIntervalBytes)
    : _callback(std::move(callback))
    , _minInterval(minReportIntervalBytes) {
}

bool ProgressChannel::begin(uint64_t totalBytes, uint32_t streamIndex) {
    _lastReported = 0;
    return dispatch(ProgressReport{0, totalBytes, streamIndex});
}

bool ProgressChannel::advance(uint64_t bytesTransferred, uint64_t totalBytes, uint32_t streamIndex) {
    if (_aborted) return false;
    const bool reachedEnd = bytesTransferred >= totalBytes;
    if (!reachedEnd && bytesTransferred - _lastReported < _minInterval) return true;
    _lastReported = bytesTransferred;
    return dispatch(ProgressReport{bytesTransferred, totalBytes, streamIndex});
}

bool ProgressChannel::dispatch(const ProgressReport& report) {
    if (_aborted) return false;
    if (!_callback || _quiet) return true;

    ++_invocations;
    switch (_callback(report)) {
        case ProgressResult::Continue:
            return true;
        case ProgressResult::Quiet:
            _quiet = true;
            return true;
        case ProgressResult::Cancel:
            _aborted = true;
            _abortReason = ProgressResult::Cancel;
            return false;
        case ProgressResult::StopAndQuiet:
            _quiet = true;
            _aborted = true;
            _abortReason = ProgressResult::StopAndQuiet;
            return false;
    }
    return true;
}

} // namespace TransitEngine::Core::IO
