// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include <map>
#include "base/migration.h"
#include "base/run_lock.h"
#include "log_file.h"
#include "test_util.h"

using namespace basis;
using namespace sm;
using namespace sm::test;


namespace
{
class MigrationTest : public testing::Test
{
protected:
    MigrationTest() :
        srcRoot_(tmp_ / "src"),
        tgtRoot_(tmp_ / "tgt"),
        settings_(makeSettings(srcRoot_, tgtRoot_))
    {
        createDirectoryIfMissingRecursion(srcRoot_);
    }

    //relative path => content
    void createSourceTree(const std::map<std::string, std::string>& files)
    {
        for (const auto& [relPath, content] : files)
            writeFile(appendPath(srcRoot_, relPath), content);
    }

    MigrationResult run(const CopyEngine::Hooks& hooks = {})
    {
        CancellationToken cancel;
        TestCallback cb;
        return runMigration(settings_, cancel, cb, hooks); //throw FileError
    }

    //relative path => content, journal folder excluded
    std::map<std::string, std::string> getTree(const std::string& rootPath)
    {
        std::map<std::string, std::string> output;
        std::vector<std::string> folders{rootPath};
        while (!folders.empty())
        {
            const std::string folderPath = folders.back();
            folders.pop_back();

            traverseFolder(folderPath,
            [&](const FileInfo& fi) { output.emplace(getRelativePath(fi.fullPath, rootPath), readFile(fi.fullPath)); },
            [&](const FolderInfo& fi)
            {
                if (fi.itemName != DEFAULT_JOURNAL_FOLDER_NAME)
                    folders.push_back(fi.fullPath);
            },
            [&](const OtherItemInfo& oi) { ADD_FAILURE() << oi.fullPath; });
        }
        return output;
    }

    std::string journalFolder() const { return tgtRoot_ + "/.safemove"; }

    TempFolder tmp_;
    const std::string srcRoot_;
    const std::string tgtRoot_;
    MoveSettings settings_;
};


std::map<std::string, std::string> makeTree(int fileCount, size_t fileSize)
{
    std::map<std::string, std::string> files;
    for (int i = 1; i <= fileCount; ++i)
    {
        const std::string name = std::string(i < 10 ? "file0" : "file") + numberTo<std::string>(i) + ".bin";
        files.emplace(i % 3 == 0 ? "sub/" + name : name, makeContent(fileSize + i, i));
    }
    return files;
}
}


TEST_F(MigrationTest, FullRun)
{
    const std::map<std::string, std::string> files
    {
        {"a.txt",               "alpha"},
        {"b.bin",               makeContent(50'000, 1)},
        {"empty",               ""},
        {"sub/c.txt",           "gamma"},
        {"sub/deeper/d.bin",    makeContent(12'345, 2)},
        {"other/e.txt",         "epsilon"},
    };
    createSourceTree(files);
    createDirectoryIfMissingRecursion(srcRoot_ + "/unrelated_empty");

    const MigrationResult result = run();

    EXPECT_EQ(getTree(tgtRoot_), files);
    EXPECT_TRUE(getTree(srcRoot_).empty());

    EXPECT_EQ(result.filesDone, files.size());
    EXPECT_EQ(result.bytesDone, 5u + 50'000 + 0 + 5 + 12'345 + 7);
    EXPECT_EQ(result.filesFailed, 0u);
    EXPECT_EQ(result.entriesPending, 0u);
    EXPECT_FALSE(result.stopped);
    EXPECT_EQ(result.totals.filesDone, files.size());
    EXPECT_EQ(getTaskResult(result), TaskResult::success);
    EXPECT_EQ(getExitCode(result), SmExitCode::success);

    //emptied folders are removed, deepest first; others are left alone
    EXPECT_EQ(result.foldersPruned, 3u); //sub/deeper, sub, other
    EXPECT_FALSE(itemExists(srcRoot_ + "/sub"));
    EXPECT_FALSE(itemExists(srcRoot_ + "/other"));
    EXPECT_TRUE (itemExists(srcRoot_ + "/unrelated_empty"));
    EXPECT_TRUE (itemExists(srcRoot_));

    //run artifacts
    EXPECT_FALSE(itemExists(journalFolder() + "/run.lock"));
    const std::optional<Checkpoint> cp = loadCheckpoint(journalFolder());
    ASSERT_TRUE(cp);
    EXPECT_EQ(cp->filesDone, files.size());
    EXPECT_EQ(cp->bytesDone, result.bytesDone);

    EXPECT_TRUE(contains(formatSummary(result, false), "Files moved: 6"));
}


TEST_F(MigrationTest, CompletedFilesAreNeverCopiedAgain)
{
    createSourceTree(makeTree(5, 1000));
    EXPECT_EQ(run().filesDone, 5u);

    //new file with the name of a migrated one + a genuinely new file
    writeFile(srcRoot_ + "/file01.bin", "impostor");
    writeFile(srcRoot_ + "/new.txt", "new");

    std::set<std::string> copied;
    const MigrationResult result = run({.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::openTemp)
            copied.insert(getItemName(entry.sourcePath));
    }});

    EXPECT_EQ(copied, std::set<std::string>{"new.txt"});
    EXPECT_EQ(result.filesDone, 1u);
    EXPECT_EQ(result.totals.filesDone, 6u);
    EXPECT_EQ(readFile(srcRoot_ + "/file01.bin"), "impostor"); //left in place
    EXPECT_EQ(readFile(tgtRoot_ + "/file01.bin"), makeTree(5, 1000).at("file01.bin"));
}


TEST_F(MigrationTest, DryRunChangesNothing)
{
    createSourceTree(makeTree(4, 100));
    settings_.dryRun = true;

    const MigrationResult result = run();

    EXPECT_EQ(result.filesPlanned, 4u);
    EXPECT_EQ(result.filesDone, 0u);
    EXPECT_EQ(getTree(srcRoot_), makeTree(4, 100));
    EXPECT_FALSE(itemExists(tgtRoot_));
    EXPECT_TRUE(contains(formatSummary(result, true), "Files to move: 4"));
}


TEST_F(MigrationTest, CrashAtEveryStageConverges)
{
    for (const Stage crashStage :
         {
             Stage::openTemp, Stage::streamCopy, Stage::flushed, Stage::dataSynced, Stage::hashed, Stage::verified, Stage::renamed,
             Stage::destDirSynced, Stage::sourceRemoved, Stage::sourceDirSynced, Stage::done,
         })
        for (const bool crossDevice : {false, true})
        {
            SCOPED_TRACE(getStageName(crashStage) + (crossDevice ? " (cross-device)" : ""));

            TempFolder tmp;
            settings_ = makeSettings(tmp / "src", tmp / "tgt");
            const std::map<std::string, std::string> files
            {
                {"a.bin",     makeContent(9000, 1)},
                {"b.bin",     makeContent(20'000, 2)},
                {"sub/c.bin", makeContent(3000, 3)},
            };
            for (const auto& [relPath, content] : files)
                writeFile(tmp / ("src/" + relPath), content);

            CopyEngine::Hooks hooks;
            if (crossDevice)
                hooks.renameItem = [](const std::string& pathFrom, const std::string& pathTo)
            {
                throw ErrorMoveUnsupported(replaceCpy("Cannot move %x.", "%x", fmtPath(pathFrom)), "EXDEV");
            };

            CopyEngine::Hooks hooksCrash = hooks;
            hooksCrash.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
            {
                if (stage == crashStage && getItemName(entry.sourcePath) == "b.bin" &&
                    (stage != Stage::streamCopy || entry.bytesCopied >= 8192))
                    ::_exit(EXIT_CODE_CRASHED);
            };

            ASSERT_EQ(runInChildProcess([&] { run(hooksCrash); }), EXIT_CODE_CRASHED);

            const MigrationResult result = run(hooks);

            EXPECT_EQ(getExitCode(result), SmExitCode::success);
            EXPECT_EQ(result.totals.filesDone, files.size());
            EXPECT_EQ(getTree(tmp / "tgt"), files); //no temp files, no duplicates
            EXPECT_TRUE(getTree(tmp / "src").empty());
        }
}


TEST_F(MigrationTest, RestartAfterKillDuringCopy)
{
    const std::map<std::string, std::string> files = makeTree(10, 10 * 4096);
    createSourceTree(files);

    const std::string victim = "file05.bin";

    ASSERT_EQ(runInChildProcess([&]
    {
        run({.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
        {
            if (stage == Stage::streamCopy && getItemName(entry.sourcePath) == victim && entry.bytesCopied >= 5 * 4096)
                ::_exit(EXIT_CODE_CRASHED); //SIGKILL: no cleanup, batched journal records lost
        }});
    }), EXIT_CODE_CRASHED);

    //scan order: root files first, then "sub"; files before the victim are complete and durable
    const std::map<std::string, std::string> tgtTree = getTree(tgtRoot_);
    for (const char* name : {"file01.bin", "file02.bin", "file04.bin"})
        EXPECT_TRUE(tgtTree.contains(name) && tgtTree.at(name) == files.at(name)) << name;
    EXPECT_FALSE(tgtTree.contains(victim));
    EXPECT_TRUE(fileExists(srcRoot_ + "/" + victim));

    std::set<std::string> copied;
    const MigrationResult result = run({.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::openTemp)
            copied.insert(getItemName(entry.sourcePath));
    }});

    EXPECT_EQ(getExitCode(result), SmExitCode::success);
    EXPECT_EQ(result.totals.filesDone, 10u);
    EXPECT_EQ(getTree(tgtRoot_), files);
    EXPECT_TRUE(getTree(srcRoot_).empty());

    for (const char* done : {"file01.bin", "file02.bin", "file04.bin"})
        EXPECT_FALSE(copied.contains(done)) << done;
    EXPECT_TRUE(copied.contains("file07.bin"));
    EXPECT_TRUE(copied.contains("file03.bin"));
}


TEST_F(MigrationTest, PermanentFailureAndSupersede)
{
    settings_.maxRetries = 0;
    createSourceTree({{"good.txt", "good"}, {"bad.txt", "bad"}});

    const MigrationResult result = run({.renameItem = [](const std::string& pathFrom, const std::string& pathTo)
    {
        if (getItemName(pathTo) == "bad.txt")
            throw FileError(replaceCpy("Cannot move file %x.", "%x", fmtPath(pathFrom)), "Input/output error");
        moveAndRenameItem(pathFrom, pathTo);
    }});

    EXPECT_EQ(result.filesDone, 1u);
    EXPECT_EQ(result.filesFailed, 1u);
    ASSERT_EQ(result.permanentlyFailed.size(), 1u);
    EXPECT_EQ(getItemName(result.permanentlyFailed[0].sourcePath), "bad.txt");
    EXPECT_EQ(getTaskResult(result), TaskResult::error);
    EXPECT_EQ(getExitCode(result), SmExitCode::incomplete);

    EXPECT_EQ(readFile(srcRoot_ + "/bad.txt"), "bad");
    EXPECT_FALSE(itemExists(tgtRoot_ + "/bad.txt"));
    EXPECT_FALSE(itemExists(tgtRoot_ + "/bad.txt.sm_tmp"));

    const std::string summary = formatSummary(result, false);
    EXPECT_TRUE(contains(summary, "Permanently failed"));
    EXPECT_TRUE(contains(summary, "bad.txt"));
    EXPECT_TRUE(contains(summary, "Input/output error"));

    //unchanged since: stays failed
    const MigrationResult result2 = run();
    EXPECT_EQ(result2.filesDone, 0u);
    EXPECT_EQ(result2.permanentlyFailed.size(), 1u);
    EXPECT_EQ(getExitCode(result2), SmExitCode::incomplete);

    //changed since: fresh attempt
    writeFile(srcRoot_ + "/bad.txt", "fixed");
    const MigrationResult result3 = run();
    EXPECT_EQ(result3.filesDone, 1u);
    EXPECT_TRUE(result3.permanentlyFailed.empty());
    EXPECT_EQ(getExitCode(result3), SmExitCode::success);
    EXPECT_EQ(readFile(tgtRoot_ + "/bad.txt"), "fixed");
}


TEST_F(MigrationTest, StopAndContinue)
{
    createSourceTree(makeTree(6, 5 * 4096));

    CancellationToken cancel;
    TestCallback cb;
    const MigrationResult result = runMigration(settings_, cancel, cb, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::streamCopy && getItemName(entry.sourcePath) == "file02.bin" && entry.bytesCopied > 0)
            cancel.requestStop();
    }});

    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.filesDone, 1u);
    EXPECT_EQ(result.filesStopped, 1u);
    EXPECT_GE(result.entriesPending, 1u);
    EXPECT_EQ(getTaskResult(result), TaskResult::cancelled);
    EXPECT_EQ(getExitCode(result), SmExitCode::incomplete);
    EXPECT_FALSE(itemExists(journalFolder() + "/run.lock"));

    const MigrationResult result2 = run();
    EXPECT_EQ(getExitCode(result2), SmExitCode::success);
    EXPECT_EQ(result2.totals.filesDone, 6u);
    EXPECT_EQ(getTree(tgtRoot_), makeTree(6, 5 * 4096));
}


TEST_F(MigrationTest, CheckpointIsSavedWithinBatch)
{
    createSourceTree(makeTree(3, 100));
    ASSERT_GE(settings_.scanBatchSize, 3u); //single batch

    //files moved so far according to the checkpoint, seen when the next file starts
    auto getCheckpointHistory = [&]
    {
        std::vector<uint64_t> history;
        run({.onStageCommitted = [&](const JournalEntry&, Stage stage)
        {
            if (stage == Stage::openTemp)
            {
                const std::optional<Checkpoint> cp = loadCheckpoint(journalFolder());
                history.push_back(cp ? cp->filesDone : 0);
            }
        }});
        return history;
    };

    settings_.checkpointInterval = std::chrono::seconds(0);
    EXPECT_EQ(getCheckpointHistory(), (std::vector<uint64_t>{0, 1, 2}));

    //interval not reached: only the final checkpoint of the previous run
    createSourceTree({{"more1", "x"}, {"more2", "y"}});
    settings_.checkpointInterval = std::chrono::seconds(3600);
    EXPECT_EQ(getCheckpointHistory(), (std::vector<uint64_t>{3, 3}));
}


TEST_F(MigrationTest, ResumeOnlyIgnoresNewFiles)
{
    createSourceTree(makeTree(3, 100));
    run();

    writeFile(srcRoot_ + "/late.txt", "late");
    settings_.resumeOnly = true;

    const MigrationResult result = run();
    EXPECT_EQ(result.filesDone, 0u);
    EXPECT_EQ(getExitCode(result), SmExitCode::success);
    EXPECT_TRUE(fileExists(srcRoot_ + "/late.txt"));
}


TEST_F(MigrationTest, ConcurrentRunIsRejected)
{
    createSourceTree(makeTree(2, 100));

    RunLock otherRun(journalFolder(), srcRoot_, tgtRoot_);

    EXPECT_THROW(run(), LockHeldError);

    //no side effects
    EXPECT_FALSE(itemExists(journalFolder() + "/journal.log"));
    EXPECT_FALSE(itemExists(journalFolder() + "/journal.db"));
    EXPECT_EQ(getTree(srcRoot_), makeTree(2, 100));
    EXPECT_TRUE(fileExists(otherRun.getLockFilePath()));
}


TEST_F(MigrationTest, MultipleWorkers)
{
    const std::map<std::string, std::string> files = makeTree(20, 3000);
    createSourceTree(files);
    settings_.workerCount = 4;

    const MigrationResult result = run();
    EXPECT_EQ(result.filesDone, 20u);
    EXPECT_EQ(getTree(tgtRoot_), files);
    EXPECT_TRUE(getTree(srcRoot_).empty());
}


TEST_F(MigrationTest, ExtensionFilterAndPruning)
{
    createSourceTree({{"a/photo.jpg", "1"}, {"a/notes.txt", "2"}, {"b/c/pic.JPG", "3"}});
    settings_.extensionFilter = {".jpg"};

    const MigrationResult result = run();
    EXPECT_EQ(result.filesDone, 2u);
    EXPECT_EQ(getTree(tgtRoot_), (std::map<std::string, std::string>{{"a/photo.jpg", "1"}, {"b/c/pic.JPG", "3"}}));
    EXPECT_EQ(getTree(srcRoot_), (std::map<std::string, std::string>{{"a/notes.txt", "2"}}));
    EXPECT_FALSE(itemExists(srcRoot_ + "/b"));
}


TEST_F(MigrationTest, NormalizedSettings)
{
    settings_.sourceRoot = srcRoot_ + "/./";
    settings_.extensionFilter = {".JPG", "png", " "};

    const MoveSettings s = getNormalizedSettings(settings_);
    EXPECT_EQ(s.sourceRoot, srcRoot_);
    EXPECT_EQ(s.journalFolderPath, tgtRoot_ + "/.safemove");
    EXPECT_EQ(s.logFilePath, tgtRoot_ + "/.safemove/safemove.log");
    EXPECT_EQ(s.extensionFilter, (std::set<std::string>{"jpg", "png"}));
}


TEST_F(MigrationTest, InvalidSettings)
{
    auto expectInvalid = [&](const std::function<void(MoveSettings& s)>& change)
    {
        MoveSettings s = settings_;
        change(s);
        EXPECT_THROW(getNormalizedSettings(s), FileError);
    };
    expectInvalid([&](MoveSettings& s) { s.sourceRoot = tmp_ / "missing"; });
    expectInvalid([&](MoveSettings& s) { s.sourceRoot.clear(); });
    expectInvalid([&](MoveSettings& s) { s.targetRoot = tmp_.path(); }); //source inside target
    expectInvalid([&](MoveSettings& s) { s.digestAlgorithm = "crc32"; });
    expectInvalid([&](MoveSettings& s) { s.workerCount = 0; });
    expectInvalid([&](MoveSettings& s) { s.chunkSize = 0; });
    expectInvalid([&](MoveSettings& s) { s.maxRetries = -1; });

    //fatal before anything is touched
    settings_.digestAlgorithm = "crc32";
    EXPECT_THROW(run(), FileError);
    EXPECT_FALSE(itemExists(tgtRoot_));
}


TEST(Checkpoint, SaveAndLoad)
{
    TempFolder tmp;
    EXPECT_FALSE(loadCheckpoint(tmp.path()));

    saveCheckpoint(tmp.path(), {.filesDone = 3, .bytesDone = 12345, .filesFailed = 1, .savedAt = 1'700'000'000});

    const std::optional<Checkpoint> cp = loadCheckpoint(tmp.path());
    ASSERT_TRUE(cp);
    EXPECT_EQ(cp->filesDone, 3u);
    EXPECT_EQ(cp->bytesDone, 12345u);
    EXPECT_EQ(cp->filesFailed, 1u);
    EXPECT_EQ(cp->savedAt, 1'700'000'000);

    setFileContent(tmp / "checkpoint.dat", "garbage");
    EXPECT_THROW(loadCheckpoint(tmp.path()), FileError);
}


TEST_F(MigrationTest, LogFileIsAppended)
{
    createSourceTree({{"a.txt", "a"}});
    const MigrationResult result = run();

    ErrorLog log;
    logMsg(log, "Moved file \"a.txt\".", MSG_TYPE_INFO, 1'700'000'000);
    logMsg(log, "Disk is slow.", MSG_TYPE_WARNING, 1'700'000'001);

    const std::string logFilePath = tmp_ / "logs/safemove.log";
    appendLogFile(logFilePath, result, log, false);
    appendLogFile(logFilePath, result, log, false);

    const std::string logText = readFile(logFilePath);
    EXPECT_EQ(logText, generateLogText(result, log, false) + generateLogText(result, log, false));

    const std::string runText = generateLogText(result, log, false);
    EXPECT_TRUE(startsWith(runText, "SafeMove "));
    EXPECT_TRUE(contains(runText, "Completed successfully"));
    EXPECT_TRUE(contains(runText, "Warnings: 1"));
    EXPECT_TRUE(contains(runText, "Disk is slow."));
}
