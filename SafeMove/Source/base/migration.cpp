// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "migration.h"
#include <algorithm>
#include <map>
#include <set>
#include <basis/thread.h>
#include <basis/time.h>
#include "run_lock.h"
#include "scanner.h"
#include "verifier.h"

using namespace basis;
using namespace sm;


namespace
{
struct RunStats
{
    uint64_t filesDone     = 0;
    uint64_t bytesDone     = 0;
    uint64_t filesFailed   = 0;
    uint64_t filesDeferred = 0;
    uint64_t filesStopped  = 0;
    std::set<std::string> sourceFolders; //parents of moved files: candidates for pruning
    std::exception_ptr fatalError;       //first one wins
};


Checkpoint getJournalTotals(const Journal& journal)
{
    Checkpoint cp;
    for (const JournalEntry& entry : journal.getEntries([](const JournalEntry& e) { return isTerminal(e.stage); }))
        if (entry.stage == Stage::done)
        {
            ++cp.filesDone;
            cp.bytesDone += entry.fileSize;
        }
        else
            ++cp.filesFailed;
    return cp;
}


//deepest first; stop at the first non-empty folder of each chain
uint64_t pruneEmptyFolders(const std::set<std::string>& folderPaths, const std::string& sourceRoot, ProcessCallback& cb)
{
    std::set<std::string> candidates;
    for (const std::string& folderPath : folderPaths)
        for (std::string path = folderPath; path != sourceRoot && isPathWithin(path, sourceRoot);)
        {
            candidates.insert(path);
            if (std::optional<std::string> parentPath = getParentFolderPath(path))
                path = *parentPath;
            else
                break;
        }

    std::vector<std::string> sortedPaths(candidates.begin(), candidates.end());
    std::sort(sortedPaths.begin(), sortedPaths.end(), [](const std::string& lhs, const std::string& rhs)
    {
        const auto depthL = std::count(lhs.begin(), lhs.end(), FILE_NAME_SEPARATOR);
        const auto depthR = std::count(rhs.begin(), rhs.end(), FILE_NAME_SEPARATOR);
        if (depthL != depthR)
            return depthL > depthR;
        return lhs < rhs;
    });

    uint64_t foldersRemoved = 0;
    for (const std::string& folderPath : sortedPaths)
        try
        {
            if (removeDirectoryIfEmpty(folderPath)) //throw FileError
            {
                cb.logMessage(replaceCpy("Removed empty folder %x.", "%x", fmtPath(folderPath)), ProcessCallback::MsgType::info);
                ++foldersRemoved;
            }
        }
        catch (const FileError& e) { cb.logMessage(e.toString(), ProcessCallback::MsgType::warning); }

    return foldersRemoved;
}
}


MoveSettings sm::getNormalizedSettings(const MoveSettings& settings) //throw FileError
{
    MoveSettings out = settings;

    auto normalize = [](std::string& path)
    {
        if (!path.empty())
            try
            {
                path = getNormalizedPath(path); //throw SysError
            }
            catch (const SysError& e) { throw FileError(replaceCpy("Cannot resolve path %x.", "%x", fmtPath(path)), e.toString()); }
    };

    if (out.sourceRoot.empty())
        throw FileError("Source folder not specified.");
    if (out.targetRoot.empty())
        throw FileError("Target folder not specified.");

    normalize(out.sourceRoot);
    normalize(out.targetRoot);
    normalize(out.journalFolderPath);
    normalize(out.stagingFolderPath);
    normalize(out.logFilePath);

    out.journalFolderPath = getJournalFolderPath(out);
    out.logFilePath       = getLogFilePath(out);

    if (getItemTypeIfExists(out.sourceRoot) != ItemType::folder) //throw FileError
        throw FileError(replaceCpy("Source folder %x does not exist.", "%x", fmtPath(out.sourceRoot)));

    if (isPathWithin(out.sourceRoot, out.targetRoot))
        throw FileError(replaceCpy(replaceCpy("Source folder %x must not be located inside target folder %y.",
                                              "%x", fmtPath(out.sourceRoot)), "%y", fmtPath(out.targetRoot)));

    if (!isSupportedDigest(out.digestAlgorithm))
    {
        std::string supported;
        for (const std::string& algo : getDigestAlgorithms())
            supported += (supported.empty() ? "" : ", ") + algo;
        throw FileError(replaceCpy("Unsupported digest algorithm %x.", "%x", fmtPath(out.digestAlgorithm)), "Supported: " + supported);
    }

    if (out.workerCount == 0)
        throw FileError("Number of workers must be at least 1.");
    if (out.chunkSize == 0)
        throw FileError("Chunk size must not be zero.");
    if (out.maxRetries < 0)
        throw FileError("Maximum number of retries must not be negative.");
    if (out.scanBatchSize == 0 || out.batchMaxCommits == 0)
        throw FileError("Batch size must not be zero.");

    std::set<std::string> extensions;
    for (const std::string& ext : out.extensionFilter)
        if (std::string extTrm = asciiToLowerCpy(trimCpy(afterLast(ext, ".", IfNotFoundReturn::all)));
            !extTrm.empty())
            extensions.insert(std::move(extTrm));
    out.extensionFilter = std::move(extensions);

    return out;
}


MigrationResult sm::runMigration(const MoveSettings& settingsRaw, CancellationToken& cancel, ProcessCallback& cb, const CopyEngine::Hooks& hooks) //throw FileError, LockHeldError, JournalError
{
    MigrationResult result;
    result.startTime = std::chrono::system_clock::now();
    const auto startTime = std::chrono::steady_clock::now();

    const MoveSettings settings = getNormalizedSettings(settingsRaw); //throw FileError

    //acquire before the journal is even read: LockHeldError => no side effects
    std::optional<RunLock> runLock;
    if (!settings.dryRun)
        runLock.emplace(settings.journalFolderPath, settings.sourceRoot, settings.targetRoot); //throw FileError, LockHeldError

    Journal journal(settings.journalFolderPath,
    {
        .durability      = settings.durability,
        .digestAlgorithm = settings.digestAlgorithm,
        .maxRetries      = settings.maxRetries,
        .batchMaxCommits = settings.batchMaxCommits,
        .batchMaxDelay   = settings.batchMaxDelay,
        .readOnly        = settings.dryRun,
    },
    [&](const std::string& msg) { cb.logMessage(msg, ProcessCallback::MsgType::warning); }); //throw JournalError

    try
    {
        if (const std::optional<Checkpoint> cp = loadCheckpoint(settings.journalFolderPath)) //throw FileError
            cb.logMessage(replaceCpy(replaceCpy(replaceCpy(replaceCpy("Previous runs (%w): %x files moved, %y bytes, %z files failed.",
                                                                      "%w", formatTime(formatDateTimeTag, cp->savedAt)),
                                                           "%x", numberTo<std::string>(cp->filesDone)),
                                                "%y", numberTo<std::string>(cp->bytesDone)),
                                     "%z", numberTo<std::string>(cp->filesFailed)), ProcessCallback::MsgType::info);
    }
    catch (const FileError& e) { cb.logMessage(e.toString(), ProcessCallback::MsgType::warning); } //derived data only: journal is authoritative

    Checkpoint totals = getJournalTotals(journal);

    CopyEngine engine(settings, journal, cancel, cb, hooks);
    Scanner scanner(settings, journal, cancel, cb);

    Protected<RunStats> runStats;

    //worker threads: saves are serialized by the lock on the last save time
    Protected<std::chrono::steady_clock::time_point> lastCheckpointTime(std::chrono::steady_clock::now());

    auto saveCheckpointNow = [&]
    {
        const Checkpoint cp = runStats.access([&](const RunStats& rs)
        {
            return Checkpoint
            {
                .filesDone   = totals.filesDone   + rs.filesDone,
                .bytesDone   = totals.bytesDone   + rs.bytesDone,
                .filesFailed = totals.filesFailed + rs.filesFailed,
                .savedAt     = std::time(nullptr),
            };
        });
        lastCheckpointTime.access([&](std::chrono::steady_clock::time_point& lastTime)
        {
            try
            {
                saveCheckpoint(settings.journalFolderPath, cp); //throw FileError
            }
            catch (const FileError& e) { cb.logMessage(e.toString(), ProcessCallback::MsgType::warning); }
            lastTime = std::chrono::steady_clock::now();
        });
    };

    auto saveCheckpointIfDue = [&]
    {
        const bool due = lastCheckpointTime.access([&](const std::chrono::steady_clock::time_point& lastTime)
        { return std::chrono::steady_clock::now() - lastTime >= settings.checkpointInterval; });
        if (due)
            saveCheckpointNow();
    };

    auto processItem = [&](EntryId id, const std::string& sourcePath, uint64_t fileSize)
    {
        try
        {
            const ItemOutcome outcome = engine.process(id); //throw JournalError

            runStats.access([&](RunStats& rs)
            {
                switch (outcome)
                {
                    case ItemOutcome::done:
                        ++rs.filesDone;
                        rs.bytesDone += fileSize;
                        if (std::optional<std::string> parentPath = getParentFolderPath(sourcePath))
                            rs.sourceFolders.insert(*parentPath);
                        break;
                    case ItemOutcome::permanentlyFailed:
                        ++rs.filesFailed;
                        break;
                    case ItemOutcome::deferred:
                        ++rs.filesDeferred;
                        break;
                    case ItemOutcome::stopped:
                        ++rs.filesStopped;
                        break;
                }
            });

            saveCheckpointIfDue();
        }
        catch (const JournalError&)
        {
            runStats.access([](RunStats& rs) { if (!rs.fatalError) rs.fatalError = std::current_exception(); });
            cancel.requestStop(); //no point in continuing without bookkeeping
        }
        catch (const FileError& e) //not attributable to a stage: the entry stays pending for the next run
        {
            cb.logMessage(e.toString(), ProcessCallback::MsgType::error);
            runStats.access([](RunStats& rs) { ++rs.filesDeferred; });
        }
        catch (const SysError& e)
        {
            cb.logMessage(replaceCpy("Cannot move file %x.", "%x", fmtPath(sourcePath)) + "\n\n" + e.toString(), ProcessCallback::MsgType::error);
            runStats.access([](RunStats& rs) { ++rs.filesDeferred; });
        }
    };

    //one slot per target device: parallel I/O across devices, sequential I/O on each
    std::vector<ThreadGroup<std::function<void()>>> workerSlots;
    std::map<VolumeId, size_t> slotByVolume;
    if (settings.workerCount > 1)
        for (size_t i = 0; i < settings.workerCount; ++i)
            workerSlots.emplace_back(1, "Migration worker");

    auto getWorkerSlot = [&](const std::string& targetPath) -> ThreadGroup<std::function<void()>>&
    {
        VolumeId volumeId = 0;
        try
        {
            volumeId = getVolumeId(targetPath); //throw FileError
        }
        catch (const FileError& e) { cb.logMessage(e.toString(), ProcessCallback::MsgType::warning); } //first slot will do

        auto [it, inserted] = slotByVolume.try_emplace(volumeId, slotByVolume.size() % workerSlots.size());
        return workerSlots[it->second];
    };

    //-------------------------------------------------------------------------------
    cb.initNewPhase(-1, -1, ProcessPhase::migrate);

    for (;;)
    {
        std::vector<ScanItem> batch = scanner.nextBatch(); //throw FileError
        if (batch.empty())
            break;

        for (const ScanItem& si : batch)
        {
            if (cancel.stopRequested())
                break;

            if (settings.dryRun)
            {
                cb.logMessage(replaceCpy(replaceCpy("Would move %x to %y.", "%x", fmtPath(si.item.sourcePath)), "%y", fmtPath(si.item.targetPath)),
                              ProcessCallback::MsgType::info);
                ++result.filesPlanned;
                result.bytesPlanned += si.item.fileSize;
                cb.updateDataTotal(1, si.item.fileSize);
                continue;
            }

            const EntryId id = si.action == ScanAction::supersede ?
                               journal.supersede(si.item.sourcePath, si.item) : //throw JournalError
                               journal.begin(si.item);                         //
            if (si.action == ScanAction::supersede)
                cb.logMessage(replaceCpy("File %x was changed after it failed permanently. Retrying.", "%x", fmtPath(si.item.sourcePath)),
                              ProcessCallback::MsgType::info);

            cb.updateDataTotal(1, si.item.fileSize);

            if (workerSlots.empty())
                processItem(id, si.item.sourcePath, si.item.fileSize); //throw JournalError
            else
                getWorkerSlot(si.item.targetPath).run([&processItem, id, sourcePath = si.item.sourcePath, fileSize = si.item.fileSize]
            {
                processItem(id, sourcePath, fileSize);
            });
        }

        for (ThreadGroup<std::function<void()>>& slot : workerSlots)
            slot.wait();

        if (std::exception_ptr fatalError = runStats.access([](const RunStats& rs) { return rs.fatalError; }))
            std::rethrow_exception(fatalError); //throw JournalError

        if (cancel.stopRequested())
            break;
    }
    //-------------------------------------------------------------------------------

    result.stopped    = cancel.stopRequested();
    result.scanErrors = scanner.getErrorCount();

    runStats.access([&](const RunStats& rs)
    {
        result.filesDone     = rs.filesDone;
        result.bytesDone     = rs.bytesDone;
        result.filesFailed   = rs.filesFailed;
        result.filesDeferred = rs.filesDeferred;
        result.filesStopped  = rs.filesStopped;
    });

    result.permanentlyFailed = journal.getEntries([](const JournalEntry& e) { return e.stage == Stage::permanentlyFailed; });
    result.entriesPending    = journal.getEntries([](const JournalEntry& e) { return !isTerminal(e.stage); }).size();

    if (!settings.dryRun)
    {
        journal.close(); //throw JournalError
        saveCheckpointNow();

        if (settings.pruneEmptySourceFolders && !result.stopped)
        {
            cb.initNewPhase(-1, -1, ProcessPhase::prune);
            const std::set<std::string> sourceFolders = runStats.access([](const RunStats& rs) { return rs.sourceFolders; });
            result.foldersPruned = pruneEmptyFolders(sourceFolders, settings.sourceRoot, cb);
        }
        runLock->release(); //throw FileError
    }

    result.totals = getJournalTotals(journal);
    result.totals.savedAt = std::time(nullptr);
    result.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    return result;
}


TaskResult sm::getTaskResult(const MigrationResult& result)
{
    if (result.stopped)
        return TaskResult::cancelled;
    if (!result.permanentlyFailed.empty() || result.entriesPending > 0 || result.scanErrors > 0)
        return TaskResult::error;
    return TaskResult::success;
}


SmExitCode sm::getExitCode(const MigrationResult& result)
{
    switch (getTaskResult(result))
    {
        case TaskResult::success:
            return SmExitCode::success;
        case TaskResult::error:
        case TaskResult::cancelled:
            break;
    }
    return SmExitCode::incomplete;
}


std::string sm::formatSummary(const MigrationResult& result, bool dryRun)
{
    std::string output = getTaskResultLabel(getTaskResult(result)) + '\n';

    auto addLine = [&](const std::string& label, const std::string& value) { output += "    " + label + ": " + value + '\n'; };

    if (dryRun)
    {
        addLine("Files to move", numberTo<std::string>(result.filesPlanned));
        addLine("Bytes to move", numberTo<std::string>(result.bytesPlanned));
    }
    else
    {
        addLine("Files moved", numberTo<std::string>(result.filesDone));
        addLine("Bytes moved", numberTo<std::string>(result.bytesDone));
        if (result.filesFailed > 0)   addLine("Files failed", numberTo<std::string>(result.filesFailed));
        if (result.filesDeferred > 0) addLine("Files deferred", numberTo<std::string>(result.filesDeferred));
        if (result.filesStopped > 0)  addLine("Files stopped", numberTo<std::string>(result.filesStopped));
        if (result.foldersPruned > 0) addLine("Empty folders removed", numberTo<std::string>(result.foldersPruned));
    }
    if (result.scanErrors > 0)
        addLine("Folders not readable", numberTo<std::string>(result.scanErrors));

    addLine("Total moved (all runs)", numberTo<std::string>(result.totals.filesDone) + " files, " +
            numberTo<std::string>(result.totals.bytesDone) + " bytes");
    if (result.entriesPending > 0)
        addLine("Pending for next run", numberTo<std::string>(result.entriesPending));
    addLine("Total time", formatDuration(std::chrono::duration_cast<std::chrono::seconds>(result.totalTime)));

    if (!result.permanentlyFailed.empty())
    {
        output += "\nPermanently failed:\n";
        for (const JournalEntry& entry : result.permanentlyFailed)
        {
            output += "    " + fmtPath(entry.sourcePath) + '\n';
            for (const std::string& line : splitCpy(entry.lastError, '\n', SplitOnEmpty::skip))
                output += "        " + line + '\n';
        }
    }
    return output;
}
