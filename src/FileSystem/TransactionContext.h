/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Transit Core project.
 */

/**
 * @file TransactionContext.h
 * @brief Journal of filesystem steps that can be committed or rolled back as a unit
 *
 * Every destructive step a transfer takes is reversible until commit: overwritten or
 * deleted entries are first renamed aside to a hidden sibling ("stashed"), created
 * entries are recorded so they can be removed, and renames are recorded so they can
 * be undone. rollback() replays the journal in reverse. commit() deletes the stashes.
 *
 * Components that keep in-memory state about the journaled entries register rollback
 * hooks; they run after the filesystem steps are undone, newest first. Commit drops them.
 *
 * A context destroyed while still active rolls back.
 *
 * @code
 * TransactionContext tx;
 * a.copyTo(dir + "/a.bin", {}, {}, &tx);
 * b.moveTo(dir + "/b.bin", {}, {}, &tx);
 * if (!allGood) tx.rollback(); else tx.commit();
 * @endcode
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "FileError.h"

namespace TransitEngine::Core::IO {

class TransactionContext {
public:
    enum class State { Active, Committed, RolledBack };

    TransactionContext() = default;
    ~TransactionContext();

    TransactionContext(const TransactionContext&) = delete;
    TransactionContext& operator=(const TransactionContext&) = delete;

    // Records an entry this transaction created. Rollback removes it.
    void recordCreated(std::string path);
    // Records a rename from -> to. Rollback renames it back.
    void recordRename(std::string from, std::string to);
    // Records permission bits to restore on path during rollback
    void recordPermissions(std::string path, uint32_t mode);
    // Runs hook during rollback, after the filesystem steps. Ignored once the context is finished.
    void onRollback(std::function<void()> hook);

    /**
     * @brief Renames an existing entry aside to a hidden sibling and journals it
     *
     * Rollback renames the stash back over path. Commit deletes the stash.
     * @return The stash path, or the rename error
     */
    FileResult<std::string> stash(const std::string& path);

    /**
     * @brief Appends another context's journal and rollback hooks to this one and empties it
     *
     * Used to fold a finished operation into an enclosing transaction.
     */
    void absorb(TransactionContext& other);

    /**
     * @brief Finalizes the journal and deletes stashed entries
     * @return The first stash deletion error, if any. The transaction is Committed either way.
     */
    FileErrorInfo commit();

    /**
     * @brief Undoes every journaled step in reverse order
     * @return The first undo error, if any. Remaining steps are still attempted.
     */
    FileErrorInfo rollback();

    State state() const noexcept { return _state; }
    bool isActive() const noexcept { return _state == State::Active; }
    size_t pendingSteps() const noexcept { return _journal.size(); }
    size_t pendingHooks() const noexcept { return _rollbackHooks.size(); }

private:
    struct Step {
        enum class Kind { RemoveCreated, RestoreStash, RenameBack, RestorePermissions };
        Kind kind;
        std::string path;       // created entry, stash, or rename destination
        std::string original;   // stash origin or rename source
        uint32_t mode = 0;
    };

    std::vector<Step> _journal;
    std::vector<std::function<void()>> _rollbackHooks;
    State _state = State::Active;
};

} // namespace TransitEngine::Core::IO
