// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "journal.h"
#include <algorithm>
#include <bit> //std::endian
#include <ctime>
#include <thread>
#include <utility>
#include <basis/crc.h>
#include <basis/extra_log.h>
#include <basis/zlib_wrap.h>

using namespace basis;
using namespace sm;


namespace
{
//-------------------------------------------------------------------------------------------------------------------------------
const char JOURNAL_DB_DESCR[] = "SafeMove Journal";
const int JOURNAL_DB_VERSION = 1; //2026-10-19
const int JOURNAL_RECORD_VERSION = 1;

const char JOURNAL_LOG_NAME[] = "journal.log";
const char JOURNAL_DB_NAME [] = "journal.db";
//-------------------------------------------------------------------------------------------------------------------------------

/*------------------------------------------------------------------------------
  | ensure 32/64 bit portability: use fixed size data types only e.g. uint32_t |
  ------------------------------------------------------------------------------*/
static_assert(std::endian::native == std::endian::little);

template <class BufferedOutputStream>
void writeEntry(BufferedOutputStream& stream, const JournalEntry& entry)
{
    writeNumber<uint64_t>(stream, entry.id);
    writeContainer       (stream, entry.sourcePath);
    writeContainer       (stream, entry.targetPath);
    writeNumber<uint64_t>(stream, entry.fileSize);
    writeNumber<int64_t> (stream, entry.modTime);
    writeNumber<int8_t>  (stream, static_cast<int8_t>(entry.stage));
    writeNumber<uint64_t>(stream, entry.bytesCopied);
    writeContainer       (stream, entry.contentDigest);
    writeContainer       (stream, entry.digestAlgorithm);
    writeNumber<int32_t> (stream, entry.retryCount);
    writeContainer       (stream, entry.lastError);
    writeNumber<int64_t> (stream, entry.updatedAt);
    writeNumber<int64_t> (stream, entry.discoveredAt);
    writeNumber<int8_t>  (stream, entry.nonAtomicSwap);
    writeNumber<int8_t>  (stream, entry.targetAdopted);
    writeContainer       (stream, entry.expectedDigest);
}


template <class BufferedInputStream>
JournalEntry readEntry(BufferedInputStream& stream) //throw SysError
{
    JournalEntry entry;
    entry.id              = readNumber<uint64_t>(stream); //throw SysErrorUnexpectedEos
    entry.sourcePath      = readContainer<std::string>(stream);
    entry.targetPath      = readContainer<std::string>(stream);
    entry.fileSize        = readNumber<uint64_t>(stream);
    entry.modTime         = readNumber<int64_t>(stream);

    const int8_t stage = readNumber<int8_t>(stream);
    if (stage < static_cast<int8_t>(Stage::init) || stage > static_cast<int8_t>(Stage::permanentlyFailed))
        throw SysError("File content is corrupted. (invalid stage " + numberTo<std::string>(static_cast<int>(stage)) + ')');
    entry.stage           = static_cast<Stage>(stage);

    entry.bytesCopied     = readNumber<uint64_t>(stream);
    entry.contentDigest   = readContainer<std::string>(stream);
    entry.digestAlgorithm = readContainer<std::string>(stream);
    entry.retryCount      = readNumber<int32_t>(stream);
    entry.lastError       = readContainer<std::string>(stream);
    entry.updatedAt       = readNumber<int64_t>(stream);
    entry.discoveredAt    = readNumber<int64_t>(stream);
    entry.nonAtomicSwap   = readNumber<int8_t>(stream) != 0;
    entry.targetAdopted   = readNumber<int8_t>(stream) != 0;
    entry.expectedDigest  = readContainer<std::string>(stream);
    return entry;
}


bool isBatchable(Stage stage)
{
    switch (stage)
    {
        case Stage::init:
        case Stage::openTemp:
        case Stage::streamCopy:
        case Stage::renamed: //torn rename is detected on resume: destination re-hashed against the full digest recorded at HASHED
            return true;

        case Stage::flushed:
        case Stage::dataSynced:
        case Stage::hashed:
        case Stage::verified:
        case Stage::destDirSynced:
        case Stage::sourceRemoved:
        case Stage::sourceDirSynced:
        case Stage::done:
        case Stage::failed:
        case Stage::permanentlyFailed:
            break;
    }
    return false;
}


void validateTransition(const JournalEntry& entry, Stage stageNew, const EntryFields& fields, int maxRetries) //throw std::logic_error
{
    auto throwViolation = [&](const std::string& details)
    {
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation! " +
                               getStageName(entry.stage) + " -> " + getStageName(stageNew) + " for " + fmtPath(entry.sourcePath) +
                               (details.empty() ? "" : ": " + details));
    };

    if (isTerminal(entry.stage))
        throwViolation("entry is immutable");

    if (fields.retryCount && (*fields.retryCount < 0 || *fields.retryCount > maxRetries))
        throwViolation("retry count " + numberTo<std::string>(*fields.retryCount) + " out of range");

    switch (stageNew)
    {
        case Stage::failed:
            if (entry.stage == Stage::failed)
                throwViolation("");
            return;

        case Stage::permanentlyFailed:
            if (entry.stage != Stage::failed)
                throwViolation("");
            return;

        default:
            break;
    }

    if (entry.stage == Stage::failed)
    {
        if (stageNew != Stage::openTemp) //the only way back: retry
            throwViolation("");
        return;
    }

    //same stage: progress update or error note of a deferred item
    if (stageNew < entry.stage)
        throwViolation("");
}


void applyFields(JournalEntry& entry, const EntryFields& fields)
{
    if (fields.bytesCopied)   entry.bytesCopied   = *fields.bytesCopied;
    if (fields.contentDigest) entry.contentDigest = *fields.contentDigest;
    if (fields.retryCount)    entry.retryCount    = *fields.retryCount;
    if (fields.lastError)     entry.lastError     = *fields.lastError;
    if (fields.nonAtomicSwap) entry.nonAtomicSwap = *fields.nonAtomicSwap;
    if (fields.targetAdopted) entry.targetAdopted = *fields.targetAdopted;
    if (fields.targetPath)    entry.targetPath    = *fields.targetPath;
}
}


Journal::Journal(const std::string& folderPath, const Options& options, const WarningCallback& onWarning) : //throw JournalError
    folderPath_(folderPath),
    logFilePath_(appendPath(folderPath, JOURNAL_LOG_NAME)),
    dbFilePath_ (appendPath(folderPath, JOURNAL_DB_NAME)),
    options_(options),
    onWarning_(onWarning)
{
    if (options_.maxRetries < 0 || options_.batchMaxCommits == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");
    try
    {
        if (!options_.readOnly)
            createDirectoryIfMissingRecursion(folderPath_); //throw FileError
    }
    catch (const FileError& e) { throw JournalError(replaceCpy("Cannot open journal %x.", "%x", fmtPath(folderPath_)), e.toString()); }

    loadSnapshot(); //throw JournalError
    replayLog();    //throw JournalError

    if (!options_.readOnly && logSize_ >= options_.compactLogSize)
        compactImpl(); //throw JournalError
}


Journal::~Journal()
{
    if (!closed_ && logFile_)
        try
        {
            std::lock_guard dummy(lockJournal_);
            writeBatch(options_.durability == DurabilityLevel::fsynced); //throw JournalError
        }
        catch (const JournalError& e) { logExtraError(e.toString()); }
}


void Journal::loadSnapshot() //throw JournalError
{
    std::string byteStream;
    try
    {
        if (!itemExists(dbFilePath_)) //throw FileError
            return;
        byteStream = getFileContent(dbFilePath_); //throw FileError
    }
    catch (const FileError& e) { throw JournalError(replaceCpy("Cannot read journal %x.", "%x", fmtPath(dbFilePath_)), e.toString()); }

    try
    {
        MemoryStreamIn streamIn(byteStream);

        char formatDescr[sizeof(JOURNAL_DB_DESCR)] = {};
        readArray(streamIn, formatDescr, sizeof(formatDescr)); //throw SysErrorUnexpectedEos

        if (!std::equal(std::begin(formatDescr), std::end(formatDescr), std::begin(JOURNAL_DB_DESCR)))
            throw SysError("File content is corrupted. (invalid header)");

        const int version = readNumber<int32_t>(streamIn); //throw SysErrorUnexpectedEos
        if (version != JOURNAL_DB_VERSION)
            throw SysError("Unsupported data format. Version: " + numberTo<std::string>(version));

        //catch data corruption ASAP + don't rely on std::bad_alloc for consistency checking
        if (byteStream.size() < sizeof(uint32_t))
            throw SysErrorUnexpectedEos();
        const std::string_view byteStreamTrm(byteStream.data(), byteStream.size() - sizeof(uint32_t));

        MemoryStreamOut crcStreamOut;
        writeNumber<uint32_t>(crcStreamOut, getCrc32(byteStreamTrm));

        if (!endsWith(byteStream, crcStreamOut.ref()))
            throw SysError("File content is corrupted. (invalid checksum)");

        const std::string payload = decompress(readContainer<std::string>(streamIn)); //throw SysError
        MemoryStreamIn payloadIn(payload);

        seqNo_  = readNumber<uint64_t>(payloadIn); //throw SysErrorUnexpectedEos
        nextId_ = readNumber<uint64_t>(payloadIn); //

        for (size_t i = readNumber<uint32_t>(payloadIn); i-- > 0;)
            applyRecord(RecordKind::upsert, readEntry(payloadIn)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw JournalError(replaceCpy("Cannot read journal %x.", "%x", fmtPath(dbFilePath_)), e.toString());
    }
}


void Journal::replayLog() //throw JournalError
{
    std::string byteStream;
    try
    {
        if (itemExists(logFilePath_)) //throw FileError
            byteStream = getFileContent(logFilePath_); //throw FileError
    }
    catch (const FileError& e) { throw JournalError(replaceCpy("Cannot read journal %x.", "%x", fmtPath(logFilePath_)), e.toString()); }

    const uint64_t seqNoSnapshot = seqNo_;
    size_t validEnd = 0;
    std::string tornReason;

    MemoryStreamIn streamIn(byteStream);
    while (!streamIn.eof())
        try
        {
            const uint32_t payloadSize = readNumber<uint32_t>(streamIn); //throw SysErrorUnexpectedEos
            if (payloadSize > byteStream.size() - streamIn.pos())
                throw SysErrorUnexpectedEos();

            const std::string_view payload(byteStream.data() + streamIn.pos(), payloadSize);
            std::string skipBuf(payloadSize, '\0');
            readArray(streamIn, skipBuf.data(), payloadSize); //throw SysErrorUnexpectedEos

            if (readNumber<uint32_t>(streamIn) != getCrc32(payload)) //throw SysErrorUnexpectedEos
                throw SysError("File content is corrupted. (invalid checksum)");

            MemoryStreamIn payloadIn(payload);
            const uint64_t seqNo = readNumber<uint64_t>(payloadIn);
            const int recordVersion = readNumber<int8_t>(payloadIn);
            if (recordVersion != JOURNAL_RECORD_VERSION)
                throw SysError("Unsupported data format. Version: " + numberTo<std::string>(recordVersion));

            const auto kind = static_cast<RecordKind>(readNumber<int8_t>(payloadIn));
            if (kind != RecordKind::upsert && kind != RecordKind::erase)
                throw SysError("File content is corrupted. (invalid record type)");

            JournalEntry entry = readEntry(payloadIn); //throw SysError

            if (seqNo > seqNoSnapshot) //older records are already contained in the snapshot
            {
                nextId_ = std::max(nextId_, entry.id + 1);
                applyRecord(kind, std::move(entry));
            }
            seqNo_ = std::max(seqNo_, seqNo);
            validEnd = streamIn.pos();
        }
        catch (const SysError& e)
        {
            tornReason = e.toString();
            break;
        }

    logSize_ = validEnd;

    if (validEnd < byteStream.size())
    {
        //crash during append: the lost records were never acknowledged to the caller
        if (onWarning_)
            onWarning_(replaceCpy(replaceCpy("Journal %x ends with an incomplete record at offset %y. The rest of the file is discarded.",
                                             "%x", fmtPath(logFilePath_)),
                                  "%y", numberTo<std::string>(validEnd)) + "\n\n" + tornReason);
    }

    if (options_.readOnly)
        return;
    try
    {
        const bool logExisting = itemExists(logFilePath_); //throw FileError

        logFile_ = std::make_unique<FileOutputPlain>(logFilePath_, FileOutputMode::resume); //throw FileError
        if (validEnd < byteStream.size())
        {
            logFile_->truncate(validEnd); //throw FileError
            logFile_->syncData();         //throw FileError
        }
        if (!logExisting)
            syncDirectory(folderPath_); //throw FileError
    }
    catch (const FileError& e) { throw JournalError(replaceCpy("Cannot open journal %x.", "%x", fmtPath(logFilePath_)), e.toString()); }
}


void Journal::applyRecord(RecordKind kind, JournalEntry&& entry)
{
    switch (kind)
    {
        case RecordKind::upsert:
        {
            if (auto itPath = entryIdByPath_.find(entry.sourcePath);
                itPath != entryIdByPath_.end() && itPath->second != entry.id)
                entries_.erase(itPath->second); //superseded without erase record (snapshot order)

            entryIdByPath_[entry.sourcePath] = entry.id;
            const EntryId id = entry.id;
            entries_.insert_or_assign(id, std::move(entry));
        }
        break;

        case RecordKind::erase:
            if (auto it = entries_.find(entry.id); it != entries_.end())
            {
                if (auto itPath = entryIdByPath_.find(it->second.sourcePath);
                    itPath != entryIdByPath_.end() && itPath->second == entry.id)
                    entryIdByPath_.erase(itPath);
                entries_.erase(it);
            }
            break;
    }
}


void Journal::checkWritable() const
{
    if (options_.readOnly || closed_ || !logFile_)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation! Journal is read-only.");
}


const JournalEntry& Journal::refEntry(EntryId id) const
{
    auto it = entries_.find(id);
    if (it == entries_.end())
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation! Unknown journal entry " + numberTo<std::string>(id) + '.');
    return it->second;
}


void Journal::appendRecord(RecordKind kind, const JournalEntry& entry)
{
    MemoryStreamOut payload;
    writeNumber<uint64_t>(payload, ++seqNo_);
    writeNumber<int8_t>  (payload, JOURNAL_RECORD_VERSION);
    writeNumber<int8_t>  (payload, static_cast<int8_t>(kind));
    writeEntry(payload, entry);

    MemoryStreamOut record;
    writeNumber<uint32_t>(record, static_cast<uint32_t>(payload.ref().size()));
    writeArray           (record, payload.ref().data(), payload.ref().size());
    writeNumber<uint32_t>(record, getCrc32(payload.ref()));

    if (batchCount_ == 0)
        batchStartTime_ = std::chrono::steady_clock::now();
    batchBuf_ += record.ref();
    ++batchCount_;
}


void Journal::writeBatch(bool syncData) //throw JournalError
{
    if (batchBuf_.empty())
        return;

    for (int attempt = 0;; ++attempt)
        try
        {
            logFile_->writeAt(batchBuf_.data(), batchBuf_.size(), logSize_); //throw FileError, ErrorDiskFull
            if (syncData)
                logFile_->syncData(); //throw FileError
            break;
        }
        catch (const FileError& e)
        {
            //don't leave a half-written record behind: it would hide all later records from replay
            try { logFile_->truncate(logSize_); /*throw FileError*/ }
            catch (const FileError& e2) { logExtraError(e2.toString()); }

            if (attempt >= options_.commitRetries)
                throw JournalError(replaceCpy("Cannot update journal %x.", "%x", fmtPath(logFilePath_)), e.toString());

            std::this_thread::sleep_for(options_.commitRetryDelay * (1 << attempt));
        }

    logSize_ += batchBuf_.size();
    batchBuf_.clear();
    batchCount_ = 0;

    if (logSize_ >= options_.compactLogSize)
        compactImpl(); //throw JournalError
}


EntryId Journal::begin(const WorkItem& item) //throw JournalError
{
    std::lock_guard dummy(lockJournal_);

    if (auto it = entryIdByPath_.find(item.sourcePath); it != entryIdByPath_.end())
        return it->second;

    checkWritable();

    JournalEntry entry
    {
        .id              = nextId_++,
        .sourcePath      = item.sourcePath,
        .targetPath      = item.targetPath,
        .fileSize        = item.fileSize,
        .modTime         = item.modTime,
        .stage           = Stage::init,
        .digestAlgorithm = options_.digestAlgorithm,
        .updatedAt       = std::time(nullptr),
        .discoveredAt    = item.discoveredAt,
        .expectedDigest  = item.expectedDigest,
    };
    appendRecord(RecordKind::upsert, entry);

    const EntryId id = entry.id;
    applyRecord(RecordKind::upsert, std::move(entry));

    if (batchCount_ >= options_.batchMaxCommits ||
        std::chrono::steady_clock::now() - batchStartTime_ >= options_.batchMaxDelay)
        writeBatch(options_.durability == DurabilityLevel::fsynced); //throw JournalError
    return id;
}


EntryId Journal::supersede(const std::string& sourcePath, const WorkItem& item) //throw JournalError
{
    std::lock_guard dummy(lockJournal_);
    checkWritable();

    auto it = entryIdByPath_.find(sourcePath);
    if (it == entryIdByPath_.end() || refEntry(it->second).stage != Stage::permanentlyFailed || item.sourcePath != sourcePath)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation! Only a permanently failed entry can be superseded.");

    appendRecord(RecordKind::erase, refEntry(it->second));
    applyRecord (RecordKind::erase, JournalEntry(refEntry(it->second)));

    JournalEntry entry
    {
        .id              = nextId_++,
        .sourcePath      = item.sourcePath,
        .targetPath      = item.targetPath,
        .fileSize        = item.fileSize,
        .modTime         = item.modTime,
        .stage           = Stage::init,
        .digestAlgorithm = options_.digestAlgorithm,
        .updatedAt       = std::time(nullptr),
        .discoveredAt    = item.discoveredAt,
        .expectedDigest  = item.expectedDigest,
    };
    appendRecord(RecordKind::upsert, entry);

    const EntryId id = entry.id;
    applyRecord(RecordKind::upsert, std::move(entry));

    //both records are written together: a lost tail only forgets the file, which is then rediscovered
    writeBatch(options_.durability == DurabilityLevel::fsynced); //throw JournalError
    return id;
}


void Journal::commitStage(EntryId id, Stage stage, const EntryFields& fields) //throw JournalError
{
    std::lock_guard dummy(lockJournal_);
    checkWritable();

    JournalEntry entry = refEntry(id);
    validateTransition(entry, stage, fields, options_.maxRetries); //throw std::logic_error

    entry.stage = stage;
    applyFields(entry, fields);
    entry.updatedAt = std::time(nullptr);

    appendRecord(RecordKind::upsert, entry);
    applyRecord(RecordKind::upsert, std::move(entry));

    if (stage == Stage::destDirSynced) //authorizes source removal: never trust the page cache here
        return writeBatch(true /*syncData*/); //throw JournalError

    if (isBatchable(stage))
    {
        if (batchCount_ >= options_.batchMaxCommits ||
            std::chrono::steady_clock::now() - batchStartTime_ >= options_.batchMaxDelay)
            writeBatch(options_.durability == DurabilityLevel::fsynced); //throw JournalError
        return;
    }

    switch (options_.durability)
    {
        case DurabilityLevel::none: //buffered until the batch is full
            if (batchCount_ >= options_.batchMaxCommits)
                writeBatch(false); //throw JournalError
            break;
        case DurabilityLevel::flushed:
            writeBatch(false); //throw JournalError
            break;
        case DurabilityLevel::fsynced:
            writeBatch(true); //throw JournalError
            break;
    }
}


JournalEntry Journal::getEntry(EntryId id) const
{
    std::lock_guard dummy(lockJournal_);
    return refEntry(id);
}


std::optional<JournalEntry> Journal::findEntry(const std::string& sourcePath) const
{
    std::lock_guard dummy(lockJournal_);
    if (auto it = entryIdByPath_.find(sourcePath); it != entryIdByPath_.end())
        return refEntry(it->second);
    return std::nullopt;
}


bool Journal::isKnown(const std::string& sourcePath) const
{
    std::lock_guard dummy(lockJournal_);
    return entryIdByPath_.contains(sourcePath);
}


bool Journal::isTerminal(const std::string& sourcePath) const
{
    std::lock_guard dummy(lockJournal_);
    if (auto it = entryIdByPath_.find(sourcePath); it != entryIdByPath_.end())
        return sm::isTerminal(refEntry(it->second).stage);
    return false;
}


std::optional<JournalEntry> Journal::PendingCursor::next()
{
    std::lock_guard dummy(journal_.lockJournal_);

    for (auto it = lastId_ ? journal_.entries_.upper_bound(*lastId_) : journal_.entries_.begin();
         it != journal_.entries_.end(); ++it)
    {
        lastId_ = it->first;
        if (!sm::isTerminal(it->second.stage))
            return it->second;
    }
    return std::nullopt;
}


std::vector<JournalEntry> Journal::getEntries(const std::function<bool(const JournalEntry& entry)>& pred) const
{
    std::lock_guard dummy(lockJournal_);

    std::vector<JournalEntry> output;
    for (const auto& [id, entry] : entries_)
        if (pred(entry))
            output.push_back(entry);
    return output;
}


size_t Journal::size() const
{
    std::lock_guard dummy(lockJournal_);
    return entries_.size();
}


void Journal::flush() //throw JournalError
{
    std::lock_guard dummy(lockJournal_);
    if (logFile_ && !closed_)
        writeBatch(options_.durability == DurabilityLevel::fsynced); //throw JournalError
}


void Journal::compact() //throw JournalError
{
    std::lock_guard dummy(lockJournal_);
    checkWritable();
    compactImpl(); //throw JournalError
}


void Journal::compactImpl() //throw JournalError
{
    //1. all records must be in the log before the snapshot claims their sequence number
    if (!batchBuf_.empty())
    {
        //write directly: writeBatch() would recurse into compaction
        const std::string batch = std::exchange(batchBuf_, std::string());
        batchCount_ = 0;
        try
        {
            logFile_->writeAt(batch.data(), batch.size(), logSize_); //throw FileError, ErrorDiskFull
        }
        catch (const FileError& e) { throw JournalError(replaceCpy("Cannot update journal %x.", "%x", fmtPath(logFilePath_)), e.toString()); }
        logSize_ += batch.size();
    }

    //2. snapshot
    MemoryStreamOut payloadOut;
    writeNumber<uint64_t>(payloadOut, seqNo_);
    writeNumber<uint64_t>(payloadOut, nextId_);
    writeNumber<uint32_t>(payloadOut, static_cast<uint32_t>(entries_.size()));
    for (const auto& [id, entry] : entries_)
        writeEntry(payloadOut, entry);

    MemoryStreamOut streamOut;
    writeArray(streamOut, JOURNAL_DB_DESCR, sizeof(JOURNAL_DB_DESCR));
    writeNumber<int32_t>(streamOut, JOURNAL_DB_VERSION);
    try
    {
        writeContainer(streamOut, compress(payloadOut.ref(), 3 /*level*/)); //throw SysError
    }
    catch (const SysError& e) { throw JournalError(replaceCpy("Cannot write journal %x.", "%x", fmtPath(dbFilePath_)), e.toString()); }

    writeNumber<uint32_t>(streamOut, getCrc32(streamOut.ref()));

    try
    {
        setFileContent(dbFilePath_, streamOut.ref()); //throw FileError: temp file + fsync + rename + fsync folder

        //3. log records are now redundant: a crash before truncation replays nothing (sequence numbers <= snapshot)
        logFile_->truncate(0); //throw FileError
        logFile_->syncData();  //throw FileError
        logSize_ = 0;
    }
    catch (const FileError& e) { throw JournalError(replaceCpy("Cannot write journal %x.", "%x", fmtPath(dbFilePath_)), e.toString()); }
}


void Journal::close() //throw JournalError
{
    std::lock_guard dummy(lockJournal_);
    if (closed_ || !logFile_)
        return;

    compactImpl(); //throw JournalError

    try
    {
        logFile_->close(); //throw FileError
    }
    catch (const FileError& e) { throw JournalError(replaceCpy("Cannot write journal %x.", "%x", fmtPath(logFilePath_)), e.toString()); }
    logFile_.reset();
    closed_ = true;
}
