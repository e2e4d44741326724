// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef RUN_LOCK_H_5609823745092837
#define RUN_LOCK_H_5609823745092837

#include "migration_error.h"


namespace sm
{
const char RUN_LOCK_FILE_NAME[] = "run.lock";

/*  RAII: exclusive ownership of a root pair and of a journal folder by one process
    - root pair:  flock() on "<targetRoot>/.safemove/run-<CRC32 of root pair>.lock", independent of the journal location
    - journal:    flock() on "<journal folder>/run.lock": one journal never serves two runs, whatever their roots
    - released by the kernel even if the owner is killed => a crashed run never leaves a stale lock
    - lock files contain the owner's process information, shown to a second invocation
    - second invocation: LockHeldError, nothing else is touched
    - NOT thread-safe, one instance per process and journal                                            */
class RunLock
{
public:
    RunLock(const std::string& journalFolderPath, const std::string& sourceRoot, const std::string& targetRoot); //throw FileError, LockHeldError
    ~RunLock();

    void release(); //throw FileError

    const std::string& getLockFilePath    () const { return journalLockPath_; }
    const std::string& getPairLockFilePath() const { return pairLockPath_; }

private:
    RunLock           (const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    const std::string pairLockPath_;
    const std::string journalLockPath_;
    int fdPair_    = -1;
    int fdJournal_ = -1;
};


namespace impl //declare for unit tests:
{
std::string getPairLockFilePath(const std::string& sourceRoot, const std::string& targetRoot);

//process information of the current lock owner
std::string getLockOwnerDescription(const std::string& lockFilePath); //throw FileError
}
}

#endif //RUN_LOCK_H_5609823745092837
