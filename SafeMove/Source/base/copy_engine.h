// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef COPY_ENGINE_H_2093847502938475
#define COPY_ENGINE_H_2093847502938475

#include <functional>
#include <set>
#include <basis/thread.h>
#include "cancellation.h"
#include "journal.h"
#include "process_callback.h"


namespace sm
{
enum class ItemOutcome
{
    done,
    permanentlyFailed,
    deferred, //transient error: entry stays pending for the next run
    stopped,  //cancellation: entry stays pending in a resumable stage
};


/*  drives one journal entry through the migration state machine:

    INIT -> OPEN_TEMP -> STREAM_COPY -> FLUSHED -> DATA_SYNCED -> HASHED -> VERIFIED -> RENAMED ->
    DEST_DIR_SYNCED -> SOURCE_REMOVED -> SOURCE_DIR_SYNCED -> DONE

    - resumes at the recorded stage: every step is repeatable, the journal is committed after each step
    - per-item errors: temp (and destination before source removal) cleaned up, FAILED, retried up to "maxRetries"
    - transient errors (stall, disk full): retried in-run, then deferred without counting as a failure
    - errors after the source was removed never touch the destination

    thread-safe: workers may process different entries concurrently           */
class CopyEngine
{
public:
    struct Hooks
    {
        //called after each durable (or batched) stage commit
        std::function<void(const JournalEntry& entry, Stage stage)> onStageCommitted;
        //default: moveAndRenameItem()
        std::function<void(const std::string& pathFrom, const std::string& pathTo)> renameItem; //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
        //default: basis::syncDirectory()
        std::function<void(const std::string& dirPath)> syncDirectory; //throw FileError
    };

    //settings paths must be normalized!
    CopyEngine(const MoveSettings& settings, Journal& journal, const CancellationToken& cancel, ProcessCallback& callback, const Hooks& hooks = {});

    ItemOutcome process(EntryId id); //throw JournalError

    std::string getTempFilePath(const JournalEntry& entry) const;

private:
    CopyEngine           (const CopyEngine&) = delete;
    CopyEngine& operator=(const CopyEngine&) = delete;

    ItemOutcome runStages(EntryId id); //throw FileError, SysError, JournalError

    void commit(EntryId id, Stage stage, const EntryFields& fields = {}); //throw JournalError

    void prepareAttempt  (const JournalEntry& entry); //throw FileError
    void copyToTemp      (const JournalEntry& entry); //throw FileError; observes cancellation
    void syncTempFile    (const JournalEntry& entry); //throw FileError
    void verifyTempFile  (const JournalEntry& entry); //throw FileError
    void renameToTarget  (const JournalEntry& entry); //throw FileError
    void removeSource    (const JournalEntry& entry); //throw FileError

    void renameWithFallback(const JournalEntry& entry, const std::string& tempPath); //throw FileError
    bool targetHasContent(const JournalEntry& entry, const std::string& filePath); //throw FileError
    void checkFreeSpace(const JournalEntry& entry); //throw TransientIOError, FileError
    void syncWithTimeout(int fd, const std::string& filePath); //throw FileError, TransientIOError
    void syncTargetFolders(const JournalEntry& entry); //throw FileError
    void syncFolder(const std::string& dirPath); //throw FileError

    std::optional<ItemOutcome> handleFailure(EntryId id, const basis::FileError& error); //throw JournalError; none: retry now
    void cleanUp(const JournalEntry& entry);

    const MoveSettings& settings_;
    Journal& journal_;
    const CancellationToken& cancel_;
    ProcessCallback& cb_;
    const Hooks hooks_;

    basis::Protected<std::set<std::string>> durableFolders_; //entry in parent folder synced during this run
};
}

#endif //COPY_ENGINE_H_2093847502938475
