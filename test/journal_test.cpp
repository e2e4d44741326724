// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include <thread>
#include "base/journal.h"
#include "test_util.h"

using namespace basis;
using namespace sm;
using namespace sm::test;


namespace
{
WorkItem makeItem(const std::string& name, uint64_t fileSize = 1000)
{
    return
    {
        .sourcePath   = "/src/" + name,
        .targetPath   = "/dst/" + name,
        .fileSize     = fileSize,
        .modTime      = 1'600'000'000,
        .discoveredAt = 1'700'000'000,
    };
}


void advanceTo(Journal& journal, EntryId id, Stage stageLast)
{
    for (int s = static_cast<int>(journal.getEntry(id).stage) + 1; s <= static_cast<int>(stageLast); ++s)
        journal.commitStage(id, static_cast<Stage>(s));
}


class JournalTest : public testing::Test
{
protected:
    std::unique_ptr<Journal> openJournal(Journal::Options options = {})
    {
        return std::make_unique<Journal>(tmp_.path(), options, [this](const std::string& msg) { warnings_.push_back(msg); });
    }

    std::string logFilePath() const { return tmp_ / "journal.log"; }
    std::string dbFilePath () const { return tmp_ / "journal.db"; }

    TempFolder tmp_;
    std::vector<std::string> warnings_;
};
}


TEST_F(JournalTest, BeginIsIdempotent)
{
    auto journal = openJournal();

    const EntryId id1 = journal->begin(makeItem("a"));
    const EntryId id2 = journal->begin(makeItem("b"));
    EXPECT_NE(id1, id2);

    journal->commitStage(id1, Stage::openTemp);
    EXPECT_EQ(journal->begin(makeItem("a")), id1);
    EXPECT_EQ(journal->getEntry(id1).stage, Stage::openTemp); //unchanged
    EXPECT_EQ(journal->size(), 2u);

    EXPECT_TRUE(journal->isKnown("/src/a"));
    EXPECT_FALSE(journal->isKnown("/src/c"));
    EXPECT_EQ(journal->findEntry("/src/b")->id, id2);
    EXPECT_EQ(journal->getEntry(id1).digestAlgorithm, "sha256");
}


TEST_F(JournalTest, StatePersistsAcrossReopen)
{
    EntryId id = 0;
    {
        auto journal = openJournal();
        id = journal->begin(makeItem("a"));
        advanceTo(*journal, id, Stage::streamCopy);
        journal->commitStage(id, Stage::streamCopy, {.bytesCopied = 500, .contentDigest = "abcd"});
        journal->commitStage(id, Stage::flushed, {.bytesCopied = 1000, .contentDigest = "ef01", .targetAdopted = true});
    }
    auto journal = openJournal();
    const JournalEntry entry = journal->getEntry(id);
    EXPECT_EQ(entry.stage, Stage::flushed);
    EXPECT_EQ(entry.bytesCopied, 1000u);
    EXPECT_EQ(entry.contentDigest, "ef01");
    EXPECT_TRUE(entry.targetAdopted);
    EXPECT_FALSE(entry.nonAtomicSwap);
    EXPECT_EQ(entry.targetPath, "/dst/a");
    EXPECT_EQ(entry.discoveredAt, 1'700'000'000);
    EXPECT_TRUE(warnings_.empty());

    //ids are never reused
    EXPECT_GT(journal->begin(makeItem("b")), id);
}


TEST_F(JournalTest, CrashLosesOnlyBatchedCommits)
{
    const int rc = runInChildProcess([&]
    {
        auto journal = openJournal({.batchMaxCommits = 1000, .batchMaxDelay = std::chrono::hours(1)});

        const EntryId idA = journal->begin(makeItem("a"));
        advanceTo(*journal, idA, Stage::dataSynced); //FLUSHED, DATA_SYNCED: written + synced, with all batched records before them

        const EntryId idB = journal->begin(makeItem("b"));
        journal->commitStage(idB, Stage::openTemp); //batched only
        ::_exit(EXIT_CODE_CRASHED);
    });
    ASSERT_EQ(rc, EXIT_CODE_CRASHED);

    auto journal = openJournal();
    ASSERT_TRUE(journal->findEntry("/src/a"));
    EXPECT_EQ(journal->findEntry("/src/a")->stage, Stage::dataSynced);
    EXPECT_FALSE(journal->isKnown("/src/b")); //rediscovered by the next scan
}


TEST_F(JournalTest, DestDirSyncedIsAlwaysDurable)
{
    const int rc = runInChildProcess([&]
    {
        auto journal = openJournal({.durability = DurabilityLevel::none, .batchMaxCommits = 1000, .batchMaxDelay = std::chrono::hours(1)});

        const EntryId id = journal->begin(makeItem("a"));
        advanceTo(*journal, id, Stage::destDirSynced);
        ::_exit(EXIT_CODE_CRASHED);
    });
    ASSERT_EQ(rc, EXIT_CODE_CRASHED);

    auto journal = openJournal();
    ASSERT_TRUE(journal->findEntry("/src/a"));
    EXPECT_EQ(journal->findEntry("/src/a")->stage, Stage::destDirSynced);
}


TEST_F(JournalTest, DurabilityNoneBuffersUntilFlush)
{
    const int rc = runInChildProcess([&]
    {
        auto journal = openJournal({.durability = DurabilityLevel::none, .batchMaxCommits = 1000, .batchMaxDelay = std::chrono::hours(1)});

        const EntryId id = journal->begin(makeItem("a"));
        advanceTo(*journal, id, Stage::hashed);
        journal->flush();

        const EntryId id2 = journal->begin(makeItem("b"));
        advanceTo(*journal, id2, Stage::hashed); //still in process memory
        ::_exit(EXIT_CODE_CRASHED);
    });
    ASSERT_EQ(rc, EXIT_CODE_CRASHED);

    auto journal = openJournal();
    EXPECT_EQ(journal->findEntry("/src/a")->stage, Stage::hashed);
    EXPECT_FALSE(journal->isKnown("/src/b"));
}


TEST_F(JournalTest, IllegalTransitionsAreRejected)
{
    auto journal = openJournal({.maxRetries = 2});
    const EntryId id = journal->begin(makeItem("a"));

    advanceTo(*journal, id, Stage::hashed);
    EXPECT_THROW(journal->commitStage(id, Stage::streamCopy), std::logic_error); //backwards
    EXPECT_THROW(journal->commitStage(id, Stage::permanentlyFailed), std::logic_error); //only after FAILED
    EXPECT_THROW(journal->commitStage(id, Stage::failed, {.retryCount = 3}), std::logic_error); //> maxRetries

    journal->commitStage(id, Stage::hashed, {.lastError = "deferred"}); //same stage: allowed
    EXPECT_EQ(journal->getEntry(id).lastError, "deferred");

    journal->commitStage(id, Stage::failed, {.retryCount = 1, .lastError = "digest mismatch"});
    EXPECT_THROW(journal->commitStage(id, Stage::failed), std::logic_error);
    EXPECT_THROW(journal->commitStage(id, Stage::hashed), std::logic_error); //FAILED -> OPEN_TEMP only
    journal->commitStage(id, Stage::openTemp);

    advanceTo(*journal, id, Stage::done);
    EXPECT_THROW(journal->commitStage(id, Stage::failed), std::logic_error); //terminal entries are immutable
    EXPECT_THROW(journal->commitStage(id, Stage::done), std::logic_error);

    //failed transitions leave no trace
    EXPECT_EQ(journal->getEntry(id).stage, Stage::done);
    EXPECT_EQ(journal->getEntry(id).retryCount, 1);
}


TEST_F(JournalTest, TornTailIsTruncated)
{
    {
        auto journal = openJournal();
        const EntryId id = journal->begin(makeItem("a"));
        advanceTo(*journal, id, Stage::flushed);
    }
    const uint64_t validSize = getFileSize(logFilePath());
    ASSERT_GT(validSize, 0u);

    {
        //half a record: size field claims more than there is
        FileOutputPlain logFile(logFilePath(), FileOutputMode::resume);
        const std::string garbage = std::string("\xff\x00\x00\x00", 4) + "partial record";
        logFile.writeAt(garbage.data(), garbage.size(), validSize);
        logFile.close();
    }

    auto journal = openJournal();
    EXPECT_EQ(journal->findEntry("/src/a")->stage, Stage::flushed);
    ASSERT_EQ(warnings_.size(), 1u);
    EXPECT_TRUE(contains(warnings_[0], "incomplete record"));
    EXPECT_EQ(getFileSize(logFilePath()), validSize);

    //appending continues after the valid part
    journal->commitStage(journal->findEntry("/src/a")->id, Stage::dataSynced);
    journal.reset();
    warnings_.clear();

    journal = openJournal();
    EXPECT_EQ(journal->findEntry("/src/a")->stage, Stage::dataSynced);
    EXPECT_TRUE(warnings_.empty());
}


TEST_F(JournalTest, ChecksumMismatchEndsReplay)
{
    {
        auto journal = openJournal();
        const EntryId id = journal->begin(makeItem("a"));
        advanceTo(*journal, id, Stage::flushed);
        advanceTo(*journal, id, Stage::dataSynced);
    }
    //flip the last byte: checksum of the last record
    std::string content = readFile(logFilePath());
    content.back() ^= 0x55;
    setFileContent(logFilePath(), content);

    auto journal = openJournal();
    EXPECT_EQ(journal->findEntry("/src/a")->stage, Stage::flushed);
    EXPECT_EQ(warnings_.size(), 1u);
}


TEST_F(JournalTest, CloseCompactsIntoSnapshot)
{
    EntryId idA = 0;
    EntryId idB = 0;
    {
        auto journal = openJournal();
        idA = journal->begin(makeItem("a"));
        idB = journal->begin(makeItem("b"));
        advanceTo(*journal, idA, Stage::done);
        journal->commitStage(idB, Stage::openTemp);
        journal->close();
    }
    EXPECT_TRUE(fileExists(dbFilePath()));
    EXPECT_EQ(getFileSize(logFilePath()), 0u);

    auto journal = openJournal();
    EXPECT_EQ(journal->getEntry(idA).stage, Stage::done);
    EXPECT_EQ(journal->getEntry(idB).stage, Stage::openTemp);

    //snapshot + log
    journal->commitStage(idB, Stage::streamCopy, {.bytesCopied = 10});
    journal.reset();

    journal = openJournal();
    EXPECT_EQ(journal->getEntry(idB).stage, Stage::streamCopy);
    EXPECT_EQ(journal->getEntry(idB).bytesCopied, 10u);
    EXPECT_GT(journal->begin(makeItem("c")), idB);
}


TEST_F(JournalTest, AutomaticCompaction)
{
    {
        auto journal = openJournal({.compactLogSize = 2000});
        for (int i = 0; i < 20; ++i)
        {
            const EntryId id = journal->begin(makeItem("file" + numberTo<std::string>(i)));
            advanceTo(*journal, id, Stage::hashed);
        }
        EXPECT_LT(getFileSize(logFilePath()), 2000u + 1000u);
    }
    EXPECT_TRUE(fileExists(dbFilePath()));

    auto journal = openJournal();
    EXPECT_EQ(journal->size(), 20u);
    for (const JournalEntry& entry : journal->getEntries([](const JournalEntry&) { return true; }))
        EXPECT_EQ(entry.stage, Stage::hashed);
}


TEST_F(JournalTest, CorruptedSnapshotIsFatal)
{
    {
        auto journal = openJournal();
        journal->begin(makeItem("a"));
        journal->close();
    }
    std::string content = readFile(dbFilePath());
    content[content.size() / 2] ^= 0x55;
    setFileContent(dbFilePath(), content);

    EXPECT_THROW(openJournal(), JournalError);
}


TEST_F(JournalTest, SupersedeReplacesPermanentlyFailed)
{
    EntryId idOld = 0;
    EntryId idNew = 0;
    {
        auto journal = openJournal({.maxRetries = 0});
        idOld = journal->begin(makeItem("a"));
        journal->commitStage(idOld, Stage::openTemp);
        journal->commitStage(idOld, Stage::failed, {.lastError = "gone"});
        journal->commitStage(idOld, Stage::permanentlyFailed);

        EXPECT_THROW(journal->supersede("/src/b", makeItem("b")), std::logic_error);

        idNew = journal->supersede("/src/a", makeItem("a", 2000));
        EXPECT_NE(idNew, idOld);
    }
    auto journal = openJournal();
    const std::optional<JournalEntry> entry = journal->findEntry("/src/a");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->id, idNew);
    EXPECT_EQ(entry->stage, Stage::init);
    EXPECT_EQ(entry->fileSize, 2000u);
    EXPECT_EQ(journal->size(), 1u);
}


TEST_F(JournalTest, PendingCursorSkipsTerminalEntries)
{
    auto journal = openJournal({.maxRetries = 0});

    std::vector<EntryId> ids;
    for (const char* name : {"a", "b", "c", "d"})
        ids.push_back(journal->begin(makeItem(name)));

    advanceTo(*journal, ids[1], Stage::done);
    journal->commitStage(ids[2], Stage::failed);
    journal->commitStage(ids[2], Stage::permanentlyFailed);
    journal->commitStage(ids[3], Stage::renamed);

    Journal::PendingCursor cursor = journal->pending();
    std::vector<EntryId> pendingIds;
    while (std::optional<JournalEntry> entry = cursor.next())
        pendingIds.push_back(entry->id);

    EXPECT_EQ(pendingIds, (std::vector<EntryId>{ids[0], ids[3]}));
    EXPECT_TRUE (journal->isTerminal("/src/b"));
    EXPECT_FALSE(journal->isTerminal("/src/d"));
}


TEST_F(JournalTest, ReadOnlyRejectsMutation)
{
    EntryId id = 0;
    {
        auto journal = openJournal();
        id = journal->begin(makeItem("a"));
    }
    auto journal = openJournal({.readOnly = true});
    EXPECT_EQ(journal->getEntry(id).stage, Stage::init);
    EXPECT_THROW(journal->begin(makeItem("b")), std::logic_error);
    EXPECT_THROW(journal->commitStage(id, Stage::openTemp), std::logic_error);
}


TEST_F(JournalTest, ConcurrentCommits)
{
    const int threadCount = 4;
    const int itemsPerThread = 25;
    {
        auto journal = openJournal({.durability = DurabilityLevel::flushed});

        std::vector<std::thread> threads;
        for (int t = 0; t < threadCount; ++t)
            threads.emplace_back([&, t]
        {
            for (int i = 0; i < itemsPerThread; ++i)
            {
                const EntryId id = journal->begin(makeItem(numberTo<std::string>(t) + '_' + numberTo<std::string>(i)));
                advanceTo(*journal, id, Stage::done);
            }
        });
        for (std::thread& t : threads)
            t.join();
    }
    auto journal = openJournal();
    EXPECT_EQ(journal->size(), static_cast<size_t>(threadCount * itemsPerThread));
    EXPECT_EQ(journal->getEntries([](const JournalEntry& e) { return e.stage == Stage::done; }).size(), journal->size());
}
