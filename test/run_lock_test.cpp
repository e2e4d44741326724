// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "base/run_lock.h"
#include "test_util.h"

using namespace basis;
using namespace sm;
using namespace sm::test;


TEST(RunLock, SecondInstanceIsRejected)
{
    TempFolder tmp;
    const std::string journalPath = tmp / "journal";
    const std::string srcRoot = tmp / "src";
    const std::string tgtRoot = tmp / "tgt";

    RunLock lock(journalPath, srcRoot, tgtRoot);
    EXPECT_EQ(lock.getLockFilePath(), journalPath + "/run.lock");
    EXPECT_TRUE(fileExists(lock.getLockFilePath()));
    EXPECT_TRUE(startsWith(lock.getPairLockFilePath(), tgtRoot + "/.safemove/run-"));
    EXPECT_TRUE(fileExists(lock.getPairLockFilePath()));

    const std::string ownerDescr = sm::impl::getLockOwnerDescription(lock.getLockFilePath());
    EXPECT_TRUE(contains(ownerDescr, "Process ID: " + numberTo<std::string>(::getpid())));

    try
    {
        RunLock lock2(journalPath, srcRoot, tgtRoot);
        ADD_FAILURE();
    }
    catch (const LockHeldError& e)
    {
        EXPECT_TRUE(contains(e.toString(), "is in use by another process"));
        EXPECT_TRUE(contains(e.toString(), ownerDescr));
    }

    //the lock file belongs to the owner: still intact
    EXPECT_EQ(sm::impl::getLockOwnerDescription(lock.getLockFilePath()), ownerDescr);
}


TEST(RunLock, ReleaseAndReacquire)
{
    TempFolder tmp;
    const std::string journalPath = tmp / "journal";
    const std::string srcRoot = tmp / "src";
    const std::string tgtRoot = tmp / "tgt";
    {
        RunLock lock(journalPath, srcRoot, tgtRoot);
        lock.release();
        EXPECT_FALSE(fileExists(lock.getLockFilePath()));
        EXPECT_FALSE(fileExists(lock.getPairLockFilePath()));
        lock.release(); //no-op
    }
    {
        RunLock lock(journalPath, srcRoot, tgtRoot);
    }
    EXPECT_FALSE(fileExists(journalPath + "/run.lock"));

    RunLock lock(journalPath, srcRoot, tgtRoot);
    EXPECT_TRUE(fileExists(lock.getLockFilePath()));
}


TEST(RunLock, CrashedOwnerLeavesNoStaleLock)
{
    TempFolder tmp;
    const std::string journalPath = tmp / "journal";
    const std::string srcRoot = tmp / "src";
    const std::string tgtRoot = tmp / "tgt";

    const int rc = runInChildProcess([&]
    {
        RunLock lock(journalPath, srcRoot, tgtRoot);
        ::_exit(EXIT_CODE_CRASHED);
    });
    ASSERT_EQ(rc, EXIT_CODE_CRASHED);
    EXPECT_TRUE(fileExists(journalPath + "/run.lock")); //file left behind, but no lock

    EXPECT_NO_THROW(RunLock(journalPath, srcRoot, tgtRoot));
}


TEST(RunLock, LockHeldByOtherProcess)
{
    TempFolder tmp;
    const std::string journalPath = tmp / "journal";
    const std::string srcRoot = tmp / "src";
    const std::string tgtRoot = tmp / "tgt";

    int fdPipe[2] = {};
    ASSERT_EQ(::pipe(fdPipe), 0);
    int fdDone[2] = {};
    ASSERT_EQ(::pipe(fdDone), 0);

    const pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0)
    {
        int rc = 0;
        try
        {
            RunLock lock(journalPath, srcRoot, tgtRoot);
            char c = 'x';
            if (::write(fdPipe[1], &c, 1) != 1) //lock acquired
                rc = 1;
            if (::read(fdDone[0], &c, 1) != 1) //wait for parent
                rc = 1;
        }
        catch (const FileError&) { rc = 101; }
        ::_exit(rc);
    }

    char c = 0;
    ASSERT_EQ(::read(fdPipe[0], &c, 1), 1);

    try
    {
        RunLock lock(journalPath, srcRoot, tgtRoot);
        ADD_FAILURE();
    }
    catch (const LockHeldError& e)
    {
        EXPECT_TRUE(contains(e.toString(), "Process ID: " + numberTo<std::string>(pid)));
    }

    ASSERT_EQ(::write(fdDone[1], &c, 1), 1);
    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFEXITED(status) && WEXITSTATUS(status) == 0);

    for (int fd : {fdPipe[0], fdPipe[1], fdDone[0], fdDone[1]})
        ::close(fd);

    EXPECT_NO_THROW(RunLock(journalPath, srcRoot, tgtRoot));
}


TEST(RunLock, SameRootPairWithOtherJournal)
{
    TempFolder tmp;
    const std::string srcRoot = tmp / "src";
    const std::string tgtRoot = tmp / "tgt";

    RunLock lock(tmp / "journalA", srcRoot, tgtRoot);

    try
    {
        RunLock lock2(tmp / "journalB", srcRoot, tgtRoot);
        ADD_FAILURE();
    }
    catch (const LockHeldError& e)
    {
        EXPECT_TRUE(contains(e.toString(), "folder pair"));
        EXPECT_TRUE(contains(e.toString(), "Process ID: " + numberTo<std::string>(::getpid())));
    }
    //rejected before its journal folder was touched
    EXPECT_FALSE(itemExists(tmp / "journalB"));

    //other pairs are independent
    EXPECT_NO_THROW(RunLock(tmp / "journalC", srcRoot, tmp / "tgt2"));
    EXPECT_NO_THROW(RunLock(tmp / "journalD", tmp / "src2", tgtRoot));
}


TEST(RunLock, SameJournalWithOtherRootPair)
{
    TempFolder tmp;
    const std::string journalPath = tmp / "journal";

    RunLock lock(journalPath, tmp / "src", tmp / "tgt");
    EXPECT_THROW(RunLock(journalPath, tmp / "src2", tmp / "tgt2"), LockHeldError);

    //the pair lock taken before the journal lock failed is released again
    EXPECT_FALSE(fileExists(sm::impl::getPairLockFilePath(tmp / "src2", tmp / "tgt2")));
}
