/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

#include "TransactionContext.h"
#include "PathResolver.h"
#include "../Logging/Logger.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iterator>
#include <vector>

#include <unistd.h>    // close(), unlink()
#include <sys/stat.h>  // chmod()

namespace TransitEngine::Core::IO {

namespace {
    // Reserves a unique hidden sibling name next to path
    FileResult<std::string> reserveStashPath(const std::string& native) {
        std::filesystem::path p(native);
        std::string tmpl = (p.parent_path() / ("." + p.filename().string() + ".transit-stash.XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        int fd = ::mkstemp(buf.data());
        if (fd < 0) {
            return FileResult<std::string>::failure(errorFromErrno(errno, "Cannot reserve stash name", native));
        }
        ::close(fd);
        return FileResult<std::string>::success(std::string(buf.data()));
    }

    int removeEntry(const std::string& native) {
        if (::unlink(native.c_str()) == 0 || errno == ENOENT) return 0;
        return errno;
    }
}

TransactionContext::~TransactionContext() {
    if (_state == State::Active && (!_journal.empty() || !_rollbackHooks.empty())) {
        auto err = rollback();
        if (!err.ok()) {
            TRANSIT_LOG_ERROR_CAT("Transaction", "Rollback on destruction failed: " + err.message + " (" + err.path + ")");
        }
    }
}

void TransactionContext::recordCreated(std::string path) {
    _journal.push_back(Step{Step::Kind::RemoveCreated, std::move(path), {}, 0});
}

void TransactionContext::recordRename(std::string from, std::string to) {
    _journal.push_back(Step{Step::Kind::RenameBack, std::move(to), std::move(from), 0});
}

void TransactionContext::recordPermissions(std::string path, uint32_t mode) {
    _journal.push_back(Step{Step::Kind::RestorePermissions, std::move(path), {}, mode});
}

void TransactionContext::onRollback(std::function<void()> hook) {
    if (_state != State::Active || !hook) return;
    _rollbackHooks.push_back(std::move(hook));
}

FileResult<std::string> TransactionContext::stash(const std::string& path) {
    const std::string native = PathResolver::toNativePath(path);
    auto reserved = reserveStashPath(native);
    if (!reserved) return reserved;

    if (::rename(native.c_str(), reserved->c_str()) != 0) {
        int e = errno;
        if (::unlink(reserved->c_str()) != 0 && errno != ENOENT) {
            TRANSIT_LOG_WARNING_CAT("Transaction", "Cannot release stash reservation: " + *reserved);
        }
        return FileResult<std::string>::failure(errorFromErrno(e, "Cannot move entry aside", path));
    }
    _journal.push_back(Step{Step::Kind::RestoreStash, *reserved, native, 0});
    return reserved;
}

void TransactionContext::absorb(TransactionContext& other) {
    _journal.insert(_journal.end(),
                    std::make_move_iterator(other._journal.begin()),
                    std::make_move_iterator(other._journal.end()));
    other._journal.clear();
    _rollbackHooks.insert(_rollbackHooks.end(),
                          std::make_move_iterator(other._rollbackHooks.begin()),
                          std::make_move_iterator(other._rollbackHooks.end()));
    other._rollbackHooks.clear();
    other._state = State::Committed;
}

FileErrorInfo TransactionContext::commit() {
    FileErrorInfo first;
    if (_state != State::Active) return first;

    for (const auto& step : _journal) {
        if (step.kind != Step::Kind::RestoreStash) continue;
        if (int err = removeEntry(step.path); err != 0) {
            auto info = errorFromErrno(err, "Cannot delete stashed entry", step.path);
            TRANSIT_LOG_ERROR_CAT("Transaction", info.message + ": " + step.path);
            if (first.ok()) first = std::move(info);
        }
    }
    _journal.clear();
    _rollbackHooks.clear();
    _state = State::Committed;
    return first;
}

FileErrorInfo TransactionContext::rollback() {
    FileErrorInfo first;
    if (_state != State::Active) return first;

    if (!_journal.empty()) {
        TRANSIT_LOG_WARNING_CAT("Transaction", "Rolling back " + std::to_string(_journal.size()) + " step(s)");
    }

    auto note = [&first](int err, const char* what, const std::string& path) {
        auto info = errorFromErrno(err, what, path);
        TRANSIT_LOG_ERROR_CAT("Transaction", info.message + ": " + path);
        if (first.ok()) first = std::move(info);
    };

    for (auto it = _journal.rbegin(); it != _journal.rend(); ++it) {
        const std::string path = PathResolver::toNativePath(it->path);
        switch (it->kind) {
            case Step::Kind::RemoveCreated:
                if (int err = removeEntry(path); err != 0) note(err, "Cannot remove created entry", path);
                break;
            case Step::Kind::RestoreStash:
            case Step::Kind::RenameBack: {
                const std::string original = PathResolver::toNativePath(it->original);
                if (::rename(path.c_str(), original.c_str()) != 0) note(errno, "Cannot restore entry", original);
                break;
            }
            case Step::Kind::RestorePermissions:
                if (::chmod(path.c_str(), static_cast<mode_t>(it->mode)) != 0 && errno != ENOENT) {
                    note(errno, "Cannot restore permissions", path);
                }
                break;
        }
    }
    _journal.clear();

    for (auto it = _rollbackHooks.rbegin(); it != _rollbackHooks.rend(); ++it) (*it)();
    _rollbackHooks.clear();
    _state = State::RolledBack;
    return first;
}

} // namespace TransitEngine::Core::IO
