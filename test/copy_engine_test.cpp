// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "base/copy_engine.h"
#include <algorithm>
#include "test_util.h"
#include <sys/stat.h>

using namespace basis;
using namespace sm;
using namespace sm::test;


namespace
{
class CopyEngineTest : public testing::Test
{
protected:
    CopyEngineTest() :
        srcRoot_(tmp_ / "src"),
        tgtRoot_(tmp_ / "tgt"),
        settings_(makeSettings(srcRoot_, tgtRoot_))
    {
        settings_.journalFolderPath = tmp_ / "journal";
        createDirectoryIfMissingRecursion(srcRoot_);
    }

    Journal& getJournal()
    {
        if (!journal_)
            journal_ = std::make_unique<Journal>(settings_.journalFolderPath, Journal::Options{.maxRetries = settings_.maxRetries}, nullptr);
        return *journal_;
    }

    //source file + its journal entry
    EntryId addFile(const std::string& relPath, const std::string& content, const std::string& expectedDigest = {})
    {
        const std::string sourcePath = appendPath(srcRoot_, relPath);
        writeFile(sourcePath, content);

        return getJournal().begin(
        {
            .sourcePath     = sourcePath,
            .targetPath     = appendPath(tgtRoot_, relPath),
            .fileSize       = content.size(),
            .modTime        = 1'600'000'000,
            .expectedDigest = expectedDigest,
        });
    }

    ItemOutcome process(EntryId id, const CopyEngine::Hooks& hooks = {})
    {
        CopyEngine engine(settings_, getJournal(), cancel_, cb_, hooks);
        return engine.process(id); //throw JournalError
    }

    TempFolder tmp_;
    const std::string srcRoot_;
    const std::string tgtRoot_;
    MoveSettings settings_;
    CancellationToken cancel_;
    TestCallback cb_;
    std::unique_ptr<Journal> journal_;
};
}


TEST_F(CopyEngineTest, MoveSingleFile)
{
    const std::string content = makeContent(100'000, 10);
    const EntryId id = addFile("sub/file.bin", content);

    std::vector<Stage> stages;
    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry&, Stage stage)
    {
        if (stages.empty() || stages.back() != stage)
            stages.push_back(stage);
    }}), ItemOutcome::done);

    EXPECT_EQ(stages, (std::vector<Stage>
    {
        Stage::openTemp, Stage::streamCopy, Stage::flushed, Stage::dataSynced, Stage::hashed, Stage::verified,
        Stage::renamed, Stage::destDirSynced, Stage::sourceRemoved, Stage::sourceDirSynced, Stage::done,
    }));

    EXPECT_FALSE(fileExists(srcRoot_ + "/sub/file.bin"));
    EXPECT_EQ(readFile(tgtRoot_ + "/sub/file.bin"), content);
    EXPECT_FALSE(fileExists(tgtRoot_ + "/sub/file.bin.sm_tmp"));
    EXPECT_EQ(getFileDetails(tgtRoot_ + "/sub/file.bin").modTime.tv_sec, 1'600'000'000);

    const JournalEntry entry = getJournal().getEntry(id);
    EXPECT_EQ(entry.stage, Stage::done);
    EXPECT_EQ(entry.bytesCopied, content.size());
    EXPECT_EQ(entry.contentDigest, sha256(content));
    EXPECT_FALSE(entry.nonAtomicSwap);
    EXPECT_EQ(entry.retryCount, 0);

    //terminal: nothing left to do
    EXPECT_EQ(process(id), ItemOutcome::done);
}


TEST_F(CopyEngineTest, TransferMethods)
{
    const std::string content = makeContent(5 * 4096 + 123, 19);

    for (const TransferMethod method : {TransferMethod::stream, TransferMethod::zeroCopy, TransferMethod::automatic})
    {
        settings_.transferMethod = method;
        const std::string fileName = "file" + numberTo<std::string>(static_cast<int>(method));
        const EntryId id = addFile(fileName, content);

        EXPECT_EQ(process(id), ItemOutcome::done);
        EXPECT_EQ(readFile(tgtRoot_ + '/' + fileName), content);
        EXPECT_EQ(getJournal().getEntry(id).contentDigest, sha256(content));
    }
}


TEST_F(CopyEngineTest, EmptyFile)
{
    const EntryId id = addFile("empty", "");
    EXPECT_EQ(process(id), ItemOutcome::done);
    EXPECT_EQ(readFile(tgtRoot_ + "/empty"), "");
    EXPECT_EQ(getJournal().getEntry(id).contentDigest, sha256(""));
}


TEST_F(CopyEngineTest, ExpectedDigestMismatchFailsPermanently)
{
    settings_.maxRetries = 2;
    const EntryId id = addFile("file", "content", sha256("something else"));

    EXPECT_EQ(process(id), ItemOutcome::permanentlyFailed);

    const JournalEntry entry = getJournal().getEntry(id);
    EXPECT_EQ(entry.stage, Stage::permanentlyFailed);
    EXPECT_EQ(entry.retryCount, 2);
    EXPECT_TRUE(contains(entry.lastError, "Digest mismatch"));

    //source untouched, no debris
    EXPECT_EQ(readFile(srcRoot_ + "/file"), "content");
    EXPECT_FALSE(fileExists(tgtRoot_ + "/file"));
    EXPECT_FALSE(fileExists(tgtRoot_ + "/file.sm_tmp"));
    EXPECT_EQ(cb_.count(ProcessCallback::MsgType::warning), 2u); //"Retrying..."
    EXPECT_TRUE(cb_.contains("Giving up after 3 attempts"));
}


TEST_F(CopyEngineTest, SystemErrorIsRetriedAsItemFailure)
{
    settings_.maxRetries = 1;
    const EntryId id = addFile("file", "content");

    int errorsThrown = 0;
    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry&, Stage stage)
    {
        if (stage == Stage::flushed && errorsThrown++ == 0)
            throw SysError("Simulated system error.");
    }}), ItemOutcome::done);

    const JournalEntry entry = getJournal().getEntry(id);
    EXPECT_EQ(entry.retryCount, 1);
    EXPECT_TRUE(contains(entry.lastError, "Simulated system error."));
    EXPECT_FALSE(fileExists(tgtRoot_ + "/file.sm_tmp"));
    EXPECT_EQ(readFile(tgtRoot_ + "/file"), "content");
}


TEST_F(CopyEngineTest, SourceChangedAfterScan)
{
    settings_.maxRetries = 0;
    const EntryId id = addFile("file", "content");
    writeFile(srcRoot_ + "/file", "modified content");

    EXPECT_EQ(process(id), ItemOutcome::permanentlyFailed);
    EXPECT_TRUE(contains(getJournal().getEntry(id).lastError, "changed after it was scanned"));
    EXPECT_EQ(readFile(srcRoot_ + "/file"), "modified content");
}


TEST_F(CopyEngineTest, CrossDeviceFallback)
{
    const std::string content = makeContent(20'000, 11);
    const EntryId id = addFile("file", content);

    int renameCalls = 0;
    EXPECT_EQ(process(id, {.renameItem = [&](const std::string& pathFrom, const std::string& pathTo)
    {
        ++renameCalls;
        throw ErrorMoveUnsupported(replaceCpy("Cannot move %x.", "%x", fmtPath(pathFrom)), "EXDEV");
    }}), ItemOutcome::done);

    EXPECT_EQ(renameCalls, 1);
    EXPECT_EQ(readFile(tgtRoot_ + "/file"), content);
    EXPECT_FALSE(fileExists(tgtRoot_ + "/file.sm_tmp"));
    EXPECT_FALSE(fileExists(srcRoot_ + "/file"));
    EXPECT_TRUE(getJournal().getEntry(id).nonAtomicSwap);
    EXPECT_TRUE(cb_.contains("atomically"));
}


TEST_F(CopyEngineTest, CollisionWithDifferentContent)
{
    writeFile(tgtRoot_ + "/photo.jpg", "unrelated");
    writeFile(tgtRoot_ + "/photo_1.jpg", "also unrelated");
    const EntryId id = addFile("photo.jpg", "picture");

    EXPECT_EQ(process(id), ItemOutcome::done);

    EXPECT_EQ(getJournal().getEntry(id).targetPath, tgtRoot_ + "/photo_2.jpg");
    EXPECT_EQ(readFile(tgtRoot_ + "/photo_2.jpg"), "picture");
    EXPECT_EQ(readFile(tgtRoot_ + "/photo.jpg"), "unrelated");
    EXPECT_EQ(readFile(tgtRoot_ + "/photo_1.jpg"), "also unrelated");
    EXPECT_TRUE(cb_.contains("already exists. Using"));
}


TEST_F(CopyEngineTest, CollisionWithIdenticalContentIsAdopted)
{
    writeFile(tgtRoot_ + "/doc.txt", "same");
    const EntryId id = addFile("doc.txt", "same");

    EXPECT_EQ(process(id), ItemOutcome::done);

    EXPECT_EQ(getJournal().getEntry(id).targetPath, tgtRoot_ + "/doc.txt");
    EXPECT_EQ(readFile(tgtRoot_ + "/doc.txt"), "same");
    EXPECT_FALSE(fileExists(srcRoot_ + "/doc.txt"));
    EXPECT_FALSE(fileExists(tgtRoot_ + "/doc_1.txt"));
    EXPECT_TRUE(cb_.contains("identical content"));
}


TEST_F(CopyEngineTest, AdoptedTargetSurvivesFailure)
{
    settings_.maxRetries = 0;
    writeFile(tgtRoot_ + "/doc.txt", "same");
    const EntryId id = addFile("doc.txt", "same");

    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::renamed && entry.targetAdopted)
            throw FileError("Simulated error after adoption.");
    }}), ItemOutcome::permanentlyFailed);

    //never written by the engine: neither copy may be lost
    EXPECT_TRUE(getJournal().getEntry(id).targetAdopted);
    EXPECT_EQ(readFile(tgtRoot_ + "/doc.txt"), "same");
    EXPECT_EQ(readFile(srcRoot_ + "/doc.txt"), "same");
}


TEST_F(CopyEngineTest, ReadOnlySource)
{
    const std::string content = makeContent(3 * 4096 + 7, 15);
    const EntryId id = addFile("readonly.bin", content);
    setItemPermissions(srcRoot_ + "/readonly.bin", 0444);

    EXPECT_EQ(process(id), ItemOutcome::done);

    EXPECT_EQ(readFile(tgtRoot_ + "/readonly.bin"), content);
    EXPECT_EQ(getFileDetails(tgtRoot_ + "/readonly.bin").mode & 07777, 0444u);
    EXPECT_FALSE(fileExists(srcRoot_ + "/readonly.bin"));
    EXPECT_EQ(getJournal().getEntry(id).retryCount, 0);
}


TEST_F(CopyEngineTest, ReadOnlyTempFileIsResumed)
{
    const std::string content = makeContent(2 * 4096, 16);
    const EntryId id = addFile("readonly.bin", content);
    setItemPermissions(srcRoot_ + "/readonly.bin", 0444);

    //interrupted after the temp file received the source's permissions
    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry&, Stage stage)
    {
        if (stage == Stage::flushed)
            cancel_.requestStop();
    }}), ItemOutcome::stopped);
    EXPECT_EQ(getFileDetails(tgtRoot_ + "/readonly.bin.sm_tmp").mode & 07777, 0444u);

    CancellationToken cancelNew;
    CopyEngine engine(settings_, getJournal(), cancelNew, cb_);
    EXPECT_EQ(engine.process(id), ItemOutcome::done);
    EXPECT_EQ(readFile(tgtRoot_ + "/readonly.bin"), content);
    EXPECT_EQ(getJournal().getEntry(id).retryCount, 0);
}


TEST_F(CopyEngineTest, ReadOnlyPartialCopyIsResumed)
{
    const std::string content = makeContent(4 * 4096, 17);
    const EntryId id = addFile("readonly.bin", content);
    setItemPermissions(srcRoot_ + "/readonly.bin", 0444);

    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::streamCopy && entry.bytesCopied > 0)
            cancel_.requestStop();
    }}), ItemOutcome::stopped);
    setItemPermissions(tgtRoot_ + "/readonly.bin.sm_tmp", 0444);

    CancellationToken cancelNew;
    CopyEngine engine(settings_, getJournal(), cancelNew, cb_);
    EXPECT_EQ(engine.process(id), ItemOutcome::done);

    EXPECT_TRUE(cb_.contains("Resuming copy"));
    EXPECT_EQ(readFile(tgtRoot_ + "/readonly.bin"), content);
    EXPECT_EQ(getFileDetails(tgtRoot_ + "/readonly.bin").mode & 07777, 0444u);
}


TEST_F(CopyEngineTest, NewTargetFoldersAreMadeDurable)
{
    addFile("a/b/file1", "data1");
    addFile("a/b/file2", "data2");

    std::vector<std::string> syncedFolders;
    CopyEngine engine(settings_, getJournal(), cancel_, cb_, {.syncDirectory = [&](const std::string& dirPath)
    {
        syncedFolders.push_back(dirPath);
        syncDirectory(dirPath);
    }});

    //first file: every folder entry up to the file system root
    std::vector<std::string> expected{tgtRoot_ + "/a/b"};
    for (std::optional<std::string> parentPath = getParentFolderPath(tgtRoot_ + "/a/b"); parentPath; parentPath = getParentFolderPath(*parentPath))
        expected.push_back(*parentPath);
    expected.push_back(srcRoot_ + "/a/b");

    EXPECT_EQ(engine.process(getJournal().findEntry(srcRoot_ + "/a/b/file1")->id), ItemOutcome::done);
    EXPECT_EQ(syncedFolders, expected);
    EXPECT_EQ(expected.back(), srcRoot_ + "/a/b");
    EXPECT_TRUE(std::find(expected.begin(), expected.end(), tgtRoot_) != expected.end());
    EXPECT_TRUE(std::find(expected.begin(), expected.end(), tmp_.path()) != expected.end());

    //second file: parent folders are durable already
    syncedFolders.clear();
    EXPECT_EQ(engine.process(getJournal().findEntry(srcRoot_ + "/a/b/file2")->id), ItemOutcome::done);
    EXPECT_EQ(syncedFolders, (std::vector<std::string>{tgtRoot_ + "/a/b", srcRoot_ + "/a/b"}));
}


TEST_F(CopyEngineTest, SparseFileStaysSparse)
{
    const uint64_t fileSize = 8 * 1024 * 1024;
    const std::string sourcePath = srcRoot_ + "/disk.img";

    //three data blocks, the rest are holes
    std::string content(fileSize, '\0');
    {
        FileOutputPlain fileOut(sourcePath, FileOutputMode::createNew);
        unsigned int seed = 0;
        for (const uint64_t offset : {uint64_t(0), fileSize / 2, fileSize - 4096})
        {
            const std::string block = makeContent(4096, ++seed);
            fileOut.writeAt(block.data(), block.size(), offset);
            content.replace(offset, block.size(), block);
        }
        fileOut.truncate(fileSize);
        fileOut.setModTime({.tv_sec = 1'600'000'000, .tv_nsec = 0});
        fileOut.close();
    }

    const EntryId id = getJournal().begin(
    {
        .sourcePath     = sourcePath,
        .targetPath     = tgtRoot_ + "/disk.img",
        .fileSize       = fileSize,
        .modTime        = 1'600'000'000,
        .expectedDigest = sha256(content),
    });
    EXPECT_EQ(process(id), ItemOutcome::done);

    EXPECT_EQ(getJournal().getEntry(id).contentDigest, sha256(content));
    EXPECT_EQ(readFile(tgtRoot_ + "/disk.img"), content);

    struct stat targetInfo = {};
    ASSERT_EQ(::stat((tgtRoot_ + "/disk.img").c_str(), &targetInfo), 0);
    EXPECT_EQ(static_cast<uint64_t>(targetInfo.st_size), fileSize);
    EXPECT_LT(static_cast<uint64_t>(targetInfo.st_blocks) * 512, fileSize / 4); //holes were not materialized
}


TEST_F(CopyEngineTest, StagingFolder)
{
    settings_.stagingFolderPath = tmp_ / "staging";
    const EntryId id = addFile("a/b/file", "data");

    bool tempSeen = false;
    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::flushed)
            tempSeen = fileExists(tmp_ / ("staging/" + numberTo<std::string>(entry.id) + "_file.sm_tmp"));
    }}), ItemOutcome::done);

    EXPECT_TRUE(tempSeen);
    EXPECT_EQ(readFile(tgtRoot_ + "/a/b/file"), "data");
}


TEST_F(CopyEngineTest, StopAndResume)
{
    const std::string content = makeContent(10 * 4096 + 100, 12);
    const EntryId id = addFile("file", content);

    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::streamCopy && entry.bytesCopied >= 5 * 4096)
            cancel_.requestStop();
    }}), ItemOutcome::stopped);

    JournalEntry entry = getJournal().getEntry(id);
    EXPECT_EQ(entry.stage, Stage::streamCopy);
    EXPECT_EQ(entry.bytesCopied, 5u * 4096);
    EXPECT_EQ(entry.contentDigest, sha256(content.substr(0, 5 * 4096)));
    EXPECT_TRUE(fileExists(tgtRoot_ + "/file.sm_tmp"));

    CancellationToken cancelNew;
    CopyEngine engine(settings_, getJournal(), cancelNew, cb_);
    EXPECT_EQ(engine.process(id), ItemOutcome::done);

    EXPECT_TRUE(cb_.contains("Resuming copy"));
    EXPECT_EQ(readFile(tgtRoot_ + "/file"), content);
    EXPECT_EQ(getJournal().getEntry(id).contentDigest, sha256(content));
}


TEST_F(CopyEngineTest, ResumeWithCorruptedPartialCopy)
{
    const std::string content = makeContent(8 * 4096, 13);
    const EntryId id = addFile("file", content);

    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::streamCopy && entry.bytesCopied >= 3 * 4096)
            cancel_.requestStop();
    }}), ItemOutcome::stopped);

    //damage the partial copy
    {
        FileOutputPlain fileOut(tgtRoot_ + "/file.sm_tmp", FileOutputMode::resume);
        fileOut.writeAt("XXXX", 4, 100);
        fileOut.close();
    }

    CancellationToken cancelNew;
    CopyEngine engine(settings_, getJournal(), cancelNew, cb_);
    EXPECT_EQ(engine.process(id), ItemOutcome::done);

    EXPECT_TRUE(cb_.contains("Restarting copy"));
    EXPECT_EQ(readFile(tgtRoot_ + "/file"), content);
    EXPECT_EQ(getJournal().getEntry(id).retryCount, 0); //not a failed attempt
}


TEST_F(CopyEngineTest, ResumeWithMissingTempFile)
{
    const std::string content = makeContent(4 * 4096, 14);
    const EntryId id = addFile("file", content);

    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::streamCopy && entry.bytesCopied > 0)
            cancel_.requestStop();
    }}), ItemOutcome::stopped);

    removeFilePlain(tgtRoot_ + "/file.sm_tmp");

    CancellationToken cancelNew;
    CopyEngine engine(settings_, getJournal(), cancelNew, cb_);
    EXPECT_EQ(engine.process(id), ItemOutcome::done);
    EXPECT_TRUE(cb_.contains("Temporary file is missing"));
    EXPECT_EQ(readFile(tgtRoot_ + "/file"), content);
}


TEST_F(CopyEngineTest, InsufficientSpaceIsDeferred)
{
    settings_.minFreeSpace = 1ULL << 62;
    const EntryId id = addFile("file", "data");

    EXPECT_EQ(process(id), ItemOutcome::deferred);

    const JournalEntry entry = getJournal().getEntry(id);
    EXPECT_EQ(entry.stage, Stage::openTemp);
    EXPECT_EQ(entry.retryCount, 0);
    EXPECT_TRUE(contains(entry.lastError, "Not enough free disk space"));
    EXPECT_EQ(cb_.count(ProcessCallback::MsgType::warning), 1u); //one in-run retry
    EXPECT_EQ(cb_.count(ProcessCallback::MsgType::error), 1u);

    EXPECT_EQ(readFile(srcRoot_ + "/file"), "data");

    //space available again
    settings_.minFreeSpace = 0;
    EXPECT_EQ(process(id), ItemOutcome::done);
}


TEST_F(CopyEngineTest, StalledChunkIsDeferred)
{
    //no chunk of this size completes within zero seconds
    settings_.stallTimeout = std::chrono::seconds(0);
    settings_.transientRetries = 0;
    settings_.chunkSize = 4 * 1024 * 1024;

    const std::string content = makeContent(settings_.chunkSize, 18);
    const EntryId id = addFile("file", content);

    EXPECT_EQ(process(id), ItemOutcome::deferred);

    const JournalEntry entry = getJournal().getEntry(id);
    EXPECT_EQ(entry.stage, Stage::streamCopy);
    EXPECT_EQ(entry.bytesCopied, 0u);
    EXPECT_EQ(entry.retryCount, 0);
    EXPECT_TRUE(contains(entry.lastError, "I/O stalled"));
    EXPECT_EQ(readFile(srcRoot_ + "/file"), content);

    settings_.stallTimeout = std::chrono::seconds(60);
    EXPECT_EQ(process(id), ItemOutcome::done);
    EXPECT_EQ(readFile(tgtRoot_ + "/file"), content);
}


TEST_F(CopyEngineTest, TargetMissingBeforeSourceRemoval)
{
    settings_.maxRetries = 0;
    const EntryId id = addFile("file", "data");

    //destination vanishes after it was made durable: the source must survive
    EXPECT_EQ(process(id, {.onStageCommitted = [&](const JournalEntry& entry, Stage stage)
    {
        if (stage == Stage::destDirSynced)
            removeFilePlain(entry.targetPath);
    }}), ItemOutcome::permanentlyFailed);

    EXPECT_EQ(readFile(srcRoot_ + "/file"), "data");
    EXPECT_TRUE(contains(getJournal().getEntry(id).lastError, "is missing"));
}
