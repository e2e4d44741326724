// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef JOURNAL_H_7328450982374509823
#define JOURNAL_H_7328450982374509823

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <basis/file_io.h>
#include "structures.h"
#include "migration_error.h"


namespace sm
{
/*  durable record of per-file migration state: the only writer of stage transitions

    journal folder layout:
        journal.log  append-only records [uint32 size][payload][uint32 crc32]; a torn tail is truncated on open
        journal.db   compressed snapshot of all entries, replaces the log during compaction

    - all calls are serialized internally: safe to use from several workers
    - stages only move forward; repeating the current stage records progress (STREAM_COPY) or a deferred error
    - INIT, OPEN_TEMP, STREAM_COPY and RENAMED updates are batched (every "batchMaxCommits" or "batchMaxDelay")
    - all other commits flush the batch and complete at the configured durability before returning
    - DEST_DIR_SYNCED authorizes source removal: always fsynced, independent of the durability level  */
class Journal
{
public:
    struct Options
    {
        DurabilityLevel durability = DurabilityLevel::fsynced;
        std::string digestAlgorithm = "sha256"; //recorded for new entries
        int maxRetries = 3;

        size_t batchMaxCommits = 64;
        std::chrono::milliseconds batchMaxDelay{2000};

        uint64_t compactLogSize = 64 * 1024 * 1024; //rewrite snapshot once the log exceeds this

        int commitRetries = 4; //write attempts after the first failure, exponential backoff
        std::chrono::milliseconds commitRetryDelay{100};

        bool readOnly = false; //dry-run: load only, any mutation is a contract violation
    };

    using WarningCallback = std::function<void(const std::string& msg)>;

    Journal(const std::string& folderPath, const Options& options, const WarningCallback& onWarning /*optional*/); //throw JournalError
    ~Journal();

    //idempotent: an existing entry for the source path is returned unchanged, whatever its stage
    EntryId begin(const WorkItem& item); //throw JournalError

    //PERMANENTLY_FAILED entry whose source reappeared as a different file: replace by a fresh entry
    EntryId supersede(const std::string& sourcePath, const WorkItem& item); //throw JournalError

    //throws std::logic_error for transitions the state machine does not allow
    void commitStage(EntryId id, Stage stage, const EntryFields& fields = {}); //throw JournalError

    JournalEntry getEntry(EntryId id) const;
    std::optional<JournalEntry> findEntry(const std::string& sourcePath) const;

    bool isKnown   (const std::string& sourcePath) const;
    bool isTerminal(const std::string& sourcePath) const;

    //lazy sequence of all entries except DONE and PERMANENTLY_FAILED, ordered by entry id
    class PendingCursor
    {
    public:
        std::optional<JournalEntry> next();

    private:
        friend class Journal;
        explicit PendingCursor(const Journal& journal) : journal_(journal) {}

        const Journal& journal_;
        std::optional<EntryId> lastId_;
    };
    PendingCursor pending() const { return PendingCursor(*this); }

    //snapshot of all entries, e.g. for the run summary
    std::vector<JournalEntry> getEntries(const std::function<bool(const JournalEntry& entry)>& pred) const;
    size_t size() const;

    //write batched updates at the configured durability
    void flush(); //throw JournalError

    //replace log by a fresh snapshot
    void compact(); //throw JournalError

    //flush + compact; reports errors, unlike ~Journal()
    void close(); //throw JournalError

    const std::string& getFolderPath() const { return folderPath_; }

private:
    Journal           (const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    enum class RecordKind : int8_t
    {
        upsert = 1,
        erase  = 2,
    };

    void loadSnapshot(); //throw JournalError
    void replayLog();    //throw JournalError
    void applyRecord(RecordKind kind, JournalEntry&& entry);

    void appendRecord(RecordKind kind, const JournalEntry& entry); //caller holds lock
    void writeBatch(bool syncData); //throw JournalError; caller holds lock
    void compactImpl();             //throw JournalError; caller holds lock
    void checkWritable() const;

    const JournalEntry& refEntry(EntryId id) const; //caller holds lock

    const std::string folderPath_;
    const std::string logFilePath_;
    const std::string dbFilePath_;
    const Options options_;
    const WarningCallback onWarning_;

    mutable std::mutex lockJournal_;

    std::map<EntryId, JournalEntry> entries_;
    std::unordered_map<std::string, EntryId> entryIdByPath_;
    EntryId nextId_ = 1;

    uint64_t seqNo_ = 0; //last record sequence number written (or buffered)

    std::unique_ptr<basis::FileOutputPlain> logFile_; //nullptr if read-only
    uint64_t logSize_ = 0; //end of the last record known to be complete

    std::string batchBuf_; //encoded records not yet written
    size_t batchCount_ = 0;
    std::chrono::steady_clock::time_point batchStartTime_;
    bool closed_ = false;
};
}

#endif //JOURNAL_H_7328450982374509823
