// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef MIGRATION_H_8457203948570293
#define MIGRATION_H_8457203948570293

#include "checkpoint.h"
#include "copy_engine.h"
#include "return_codes.h"


namespace sm
{
struct MigrationResult
{
    std::chrono::system_clock::time_point startTime;
    std::chrono::milliseconds totalTime{};

    //this run:
    uint64_t filesDone     = 0;
    uint64_t bytesDone     = 0;
    uint64_t filesFailed   = 0; //permanently
    uint64_t filesDeferred = 0;
    uint64_t filesStopped  = 0;
    uint64_t foldersPruned = 0;
    int scanErrors = 0;
    bool stopped = false;

    //dry-run: what would be migrated
    uint64_t filesPlanned = 0;
    uint64_t bytesPlanned = 0;

    //whole journal after the run:
    Checkpoint totals;
    size_t entriesPending = 0; //non-terminal: next run continues
    std::vector<JournalEntry> permanentlyFailed;
};


/*  top-level driver:
    1. validate + normalize settings
    2. acquire run lock (not for dry-run): a second invocation fails with LockHeldError before touching the journal
    3. scan -> begin journal entries -> copy engine (inline, or one worker slot per target device)
    4. checkpoint counters every "checkpointInterval"
    5. prune source folders emptied by this run, deepest first

    "cancel" is observed at transition boundaries only; it's also set internally after a fatal error
    fatal errors (lock held, journal, invalid settings) are thrown, everything else ends up in MigrationResult      */
MigrationResult runMigration(const MoveSettings& settings, CancellationToken& cancel, ProcessCallback& callback,
                             const CopyEngine::Hooks& hooks = {}); //throw FileError, LockHeldError, JournalError

//absolute paths without trailing separator, defaults resolved; FileError for invalid settings
MoveSettings getNormalizedSettings(const MoveSettings& settings); //throw FileError

SmExitCode getExitCode(const MigrationResult& result);
TaskResult getTaskResult(const MigrationResult& result);

std::string formatSummary(const MigrationResult& result, bool dryRun);
}

#endif //MIGRATION_H_8457203948570293
