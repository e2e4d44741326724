// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "copy_engine.h"
#include <basis/extra_log.h>
#include <basis/file_io.h>
#include <basis/thread.h>
#include "verifier.h"
#include <unistd.h> //dup, fsync

using namespace basis;
using namespace sm;


namespace
{
//internal: cooperative stop observed right after a commit
class StopRequest {};


std::string getParentPath(const std::string& itemPath)
{
    if (std::optional<std::string> parentPath = getParentFolderPath(itemPath))
        return *parentPath;
    throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation! " + fmtPath(itemPath));
}


//"dir/name.ext" -> "dir/name_1.ext", "dir/name_2.ext", ...
std::string createUniqueTargetPath(const std::string& targetPath) //throw FileError
{
    const std::string parentPath = getParentPath(targetPath);
    const std::string itemName   = getItemName(targetPath);
    const std::string extension  = getFileExtension(itemName);
    const std::string stem = extension.empty() ? itemName : beforeLast(itemName, ".", IfNotFoundReturn::all);

    for (int i = 1;; ++i)
    {
        const std::string candidate = appendPath(parentPath, stem + '_' + numberTo<std::string>(i) + (extension.empty() ? "" : '.' + extension));

        if (!itemExists(candidate) && !itemExists(candidate + TEMP_FILE_ENDING)) //throw FileError
            return candidate;
    }
}


std::string formatBytes(uint64_t bytes) { return numberTo<std::string>(bytes) + " bytes"; }
}


CopyEngine::CopyEngine(const MoveSettings& settings, Journal& journal, const CancellationToken& cancel, ProcessCallback& callback, const Hooks& hooks) :
    settings_(settings),
    journal_(journal),
    cancel_(cancel),
    cb_(callback),
    hooks_(hooks)
{
    if (settings_.chunkSize == 0 || settings_.maxRetries < 0 || settings_.transientRetries < 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");
}


std::string CopyEngine::getTempFilePath(const JournalEntry& entry) const
{
    if (settings_.stagingFolderPath.empty())
        return entry.targetPath + TEMP_FILE_ENDING;

    //staging folder is flat: entry id keeps names unique, and stable when the target name changes after a collision
    return appendPath(settings_.stagingFolderPath, numberTo<std::string>(entry.id) + '_' + getItemName(entry.targetPath) + TEMP_FILE_ENDING);
}


ItemOutcome CopyEngine::process(EntryId id) //throw JournalError
{
    for (int transientAttempt = 0;; ++transientAttempt)
    {
        std::optional<FileError> transientError;
        std::optional<FileError> itemError;
        try
        {
            return runStages(id); //throw FileError, SysError, JournalError, StopRequest
        }
        catch (const StopRequest&) { return ItemOutcome::stopped; }
        catch (const TransientIOError& e) { transientError = e; }
        catch (const ErrorDiskFull&    e) { transientError = e; }
        catch (const JournalError&) { throw; } //fatal for the run
        catch (const FileError& e) { itemError = e; }
        catch (const SysError&  e) { itemError = FileError(replaceCpy("Cannot move file %x.", "%x", fmtPath(journal_.getEntry(id).sourcePath)), e.toString()); }

        if (itemError)
        {
            const JournalEntry entry = journal_.getEntry(id);

            if (isForwardStage(entry.stage) && entry.stage >= Stage::sourceRemoved) //the copy is all that's left: never undo
                transientError = itemError;
            else
            {
                if (std::optional<ItemOutcome> outcome = handleFailure(id, *itemError)) //throw JournalError
                    return *outcome;

                transientAttempt = -1; //fresh attempt
                continue;
            }
        }

        const std::string errorMsg = transientError->toString();
        if (transientAttempt < settings_.transientRetries)
        {
            cb_.logMessage(errorMsg + "\n\n" + replaceCpy("Retrying in %x ms...", "%x",
                                                          numberTo<std::string>((settings_.transientRetryDelay * (1 << transientAttempt)).count())),
                           ProcessCallback::MsgType::warning);

            const auto delayUntil = std::chrono::steady_clock::now() + settings_.transientRetryDelay * (1 << transientAttempt);
            for (auto now = std::chrono::steady_clock::now(); now < delayUntil; now = std::chrono::steady_clock::now())
            {
                if (cancel_.stopRequested())
                    return ItemOutcome::stopped;
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(delayUntil - now, UI_UPDATE_INTERVAL));
            }
            continue;
        }

        //leave for the next run: retry count unchanged
        cb_.logMessage(errorMsg + "\n\n" + "The file will be retried during the next run.", ProcessCallback::MsgType::error);

        if (const JournalEntry entry = journal_.getEntry(id);
            !isTerminal(entry.stage) && entry.stage != Stage::failed)
            journal_.commitStage(id, entry.stage, {.lastError = errorMsg}); //throw JournalError
        return ItemOutcome::deferred;
    }
}


ItemOutcome CopyEngine::runStages(EntryId id) //throw FileError, SysError, JournalError, StopRequest
{
    for (;;)
    {
        if (cancel_.stopRequested())
            throw StopRequest();

        const JournalEntry entry = journal_.getEntry(id);
        const std::string tempPath = getTempFilePath(entry);

        switch (entry.stage)
        {
            case Stage::init:
            case Stage::failed: //retry from scratch
                cb_.updateStatus(replaceCpy("Moving file %x", "%x", fmtPath(entry.sourcePath)));
                commit(id, Stage::openTemp, {.bytesCopied = 0, .contentDigest = std::string(), .targetAdopted = false}); //throw JournalError
                break;

            case Stage::openTemp:
                prepareAttempt(entry); //throw FileError
                break;

            case Stage::streamCopy:
                copyToTemp(entry); //throw FileError, StopRequest
                break;

            case Stage::flushed:
                syncTempFile(entry); //throw FileError
                commit(id, Stage::dataSynced); //throw JournalError
                break;

            case Stage::dataSynced:
                //streaming digest recorded with FLUSHED is final now: temp content is durable
                if (!itemExists(tempPath)) //throw FileError
                    throw CorruptionError(replaceCpy("Cannot find temporary file %x.", "%x", fmtPath(tempPath)));
                if (entry.contentDigest.empty())
                    throw CorruptionError(replaceCpy("Verification of %x failed.", "%x", fmtPath(tempPath)), "Content digest is missing.");
                commit(id, Stage::hashed); //throw JournalError
                break;

            case Stage::hashed:
                if (!itemExists(tempPath) && targetHasContent(entry, entry.targetPath)) //throw FileError
                {
                    commit(id, Stage::renamed); //rename completed, but its batched commit was lost
                    break;
                }
                verifyTempFile(entry); //throw FileError
                commit(id, Stage::verified); //throw JournalError
                break;

            case Stage::verified:
                renameToTarget(entry); //throw FileError
                break;

            case Stage::renamed:
                syncTargetFolders(entry); //throw FileError
                commit(id, Stage::destDirSynced); //throw JournalError
                break;

            case Stage::destDirSynced:
                removeSource(entry); //throw FileError
                commit(id, Stage::sourceRemoved); //throw JournalError
                break;

            case Stage::sourceRemoved:
                syncFolder(getParentPath(entry.sourcePath)); //throw FileError
                commit(id, Stage::sourceDirSynced); //throw JournalError
                break;

            case Stage::sourceDirSynced:
                commit(id, Stage::done); //throw JournalError
                cb_.logMessage(replaceCpy(replaceCpy("Moved file %x to %y.", "%x", fmtPath(entry.sourcePath)), "%y", fmtPath(entry.targetPath)),
                               ProcessCallback::MsgType::info);
                cb_.updateDataProcessed(1, 0);
                return ItemOutcome::done;

            case Stage::done:
                return ItemOutcome::done;

            case Stage::permanentlyFailed:
                return ItemOutcome::permanentlyFailed;
        }
    }
}


void CopyEngine::commit(EntryId id, Stage stage, const EntryFields& fields) //throw JournalError
{
    journal_.commitStage(id, stage, fields); //throw JournalError

    if (hooks_.onStageCommitted)
        hooks_.onStageCommitted(journal_.getEntry(id), stage);
}


void CopyEngine::prepareAttempt(const JournalEntry& entry) //throw FileError
{
    std::optional<std::string> targetPathNew;

    if (itemExists(entry.targetPath)) //throw FileError
    {
        //same file migrated by another tool (or a previous run without journal): adopt instead of duplicating
        if (entry.retryCount == 0 && getFileSize(entry.targetPath) == entry.fileSize) //throw FileError
        {
            const std::string sourceDigest = hashFile(entry.sourcePath, entry.digestAlgorithm, settings_.chunkSize, nullptr); //throw FileError
            const std::string targetDigest = hashFile(entry.targetPath, entry.digestAlgorithm, settings_.chunkSize, nullptr); //throw FileError

            if (sourceDigest == targetDigest)
            {
                cb_.logMessage(replaceCpy("Target file %x already exists with identical content.", "%x", fmtPath(entry.targetPath)),
                               ProcessCallback::MsgType::info);

                //never written by us: cleanUp() must not delete it
                commit(entry.id, Stage::hashed, {.bytesCopied = entry.fileSize, .contentDigest = sourceDigest, .targetAdopted = true}); //throw JournalError
                verifyCopy(entry.targetPath, entry.fileSize, sourceDigest, entry.fileSize, entry.expectedDigest); //throw CorruptionError
                commit(entry.id, Stage::verified); //throw JournalError
                commit(entry.id, Stage::renamed);  //
                return;
            }
        }

        targetPathNew = createUniqueTargetPath(entry.targetPath); //throw FileError
        cb_.logMessage(replaceCpy(replaceCpy("Target file %x already exists. Using %y instead.", "%x", fmtPath(entry.targetPath)), "%y", fmtPath(*targetPathNew)),
                       ProcessCallback::MsgType::warning);
    }

    const std::string targetPath = targetPathNew ? *targetPathNew : entry.targetPath;
    createDirectoryIfMissingRecursion(getParentPath(targetPath)); //throw FileError
    if (!settings_.stagingFolderPath.empty())
        createDirectoryIfMissingRecursion(settings_.stagingFolderPath); //throw FileError

    checkFreeSpace(entry); //throw TransientIOError, FileError

    commit(entry.id, Stage::streamCopy, {.bytesCopied = 0, .contentDigest = std::string(), .targetPath = targetPathNew}); //throw JournalError
}


void CopyEngine::copyToTemp(const JournalEntry& entry) //throw FileError, StopRequest
{
    const std::string tempPath = getTempFilePath(entry);
    const std::string errorMsg = replaceCpy(replaceCpy("Cannot copy file %x to %y.", "%x", fmtPath(entry.sourcePath)), "%y", fmtPath(tempPath));

    //shared with the I/O thread: a chunk call hanging on a dead mount may outlive this function
    auto fileIn = std::make_shared<FileInputPlain>(entry.sourcePath); //throw FileError
    const struct stat srcInfo = fileIn->getStatBuffered(); //throw FileError

    if (static_cast<uint64_t>(srcInfo.st_size) != entry.fileSize || srcInfo.st_mtime != entry.modTime)
        throw CorruptionError(errorMsg, replaceCpy("Source file %x was changed after it was scanned.", "%x", fmtPath(entry.sourcePath)));

    checkFreeSpace(entry); //throw TransientIOError, FileError

    const bool tempExisting = itemExists(tempPath); //throw FileError
    if (tempExisting) //interrupted after the source's permissions were applied: read-only source => read-only temp
        if (const FileDetails tempDetails = getFileDetails(tempPath); //throw FileError
            !(tempDetails.mode & S_IWUSR))
            setItemPermissions(tempPath, (tempDetails.mode & 07777) | S_IWUSR); //throw FileError

    auto fileOut = std::make_shared<FileOutputPlain>(tempPath, FileOutputMode::resume); //throw FileError, ErrorDiskFull

    try
    {
        //resume: trust the partial copy only after its digest was re-derived
        std::optional<HashContext> ctx;
        uint64_t pos = 0;

        if (entry.bytesCopied > 0)
        {
            std::string restartReason;
            if (!tempExisting)
                restartReason = "Temporary file is missing.";
            else if (fileOut->getCurrentSize() < entry.bytesCopied) //throw FileError
                restartReason = "Temporary file is shorter than recorded.";
            else
            {
                fileOut->truncate(entry.bytesCopied); //throw FileError

                HashContext prefixCtx = rehashPrefix(tempPath, entry.bytesCopied, entry.digestAlgorithm, settings_.chunkSize, nullptr); //throw FileError
                if (prefixCtx.finalizeHex() == entry.contentDigest) //throw SysError
                {
                    ctx = std::move(prefixCtx);
                    pos = entry.bytesCopied;
                    cb_.logMessage(replaceCpy(replaceCpy("Resuming copy of %x at %y.", "%x", fmtPath(entry.sourcePath)), "%y", formatBytes(pos)),
                                   ProcessCallback::MsgType::info);
                }
                else
                    restartReason = "Temporary file content does not match the recorded digest.";
            }

            if (!restartReason.empty())
            {
                cb_.logMessage(replaceCpy("Restarting copy of %x from the beginning.", "%x", fmtPath(entry.sourcePath)) + "\n\n" + restartReason,
                               ProcessCallback::MsgType::warning);
                cb_.updateDataTotal(0, entry.bytesCopied); //copied again
            }
        }

        if (!ctx)
        {
            ctx.emplace(entry.digestAlgorithm); //throw SysError
            fileOut->truncate(0); //throw FileError
        }

        bool tryZeroCopy = [&]
        {
            switch (settings_.transferMethod)
            {
                case TransferMethod::automatic:
                    return srcInfo.st_dev == fileOut->getStatBuffered().st_dev; //throw FileError
                case TransferMethod::stream:
                    return false;
                case TransferMethod::zeroCopy:
                    return true;
            }
            return false;
        }();

        auto buffer = std::make_shared<std::vector<char>>(settings_.chunkSize);

        while (pos < entry.fileSize)
        {
            //sparse file: don't materialize holes
            const uint64_t dataBegin = std::min(fileIn->findNextData(pos).value_or(entry.fileSize), entry.fileSize); //throw FileError
            if (dataBegin > pos)
            {
                ctx->updateZeros(dataBegin - pos); //throw SysError
                fileOut->truncate(dataBegin); //throw FileError
                pos = dataBegin;
                continue;
            }

            const uint64_t dataEnd = std::min(fileIn->findNextHole(pos), entry.fileSize); //throw FileError
            while (pos < dataEnd)
            {
                const size_t chunkSize = static_cast<size_t>(std::min<uint64_t>(dataEnd - pos, buffer->size()));

                //a timed-out chunk may still be written later: verification of the temp file catches the stray bytes
                auto ftChunk = runAsync([fileIn, fileOut, buffer, pos, chunkSize, tryZeroCopy]
                {
                    setCurrentThreadName("SafeMove: chunk I/O");

                    //the digest needs the bytes even if the kernel does the copying
                    const size_t bytesRead = fileIn->readAt(buffer->data(), chunkSize, pos); //throw FileError
                    if (bytesRead != chunkSize)
                        return std::make_pair(bytesRead, tryZeroCopy);

                    size_t bytesCopied = 0;
                    bool zeroCopySupported = tryZeroCopy;
                    while (zeroCopySupported && bytesCopied < chunkSize)
                        if (std::optional<size_t> bytesDelta = tryCopyFileRange(*fileIn, pos + bytesCopied, *fileOut, pos + bytesCopied, chunkSize - bytesCopied)) //throw FileError, ErrorDiskFull
                            bytesCopied += *bytesDelta;
                        else
                            zeroCopySupported = false; //not supported for this file pair

                    if (bytesCopied < chunkSize)
                        fileOut->writeAt(buffer->data() + bytesCopied, chunkSize - bytesCopied, pos + bytesCopied); //throw FileError, ErrorDiskFull

                    return std::make_pair(bytesRead, zeroCopySupported);
                });

                if (ftChunk.wait_for(settings_.stallTimeout) != std::future_status::ready)
                    throw TransientIOError(errorMsg, replaceCpy("I/O stalled for more than %x seconds.", "%x",
                                                                numberTo<std::string>(settings_.stallTimeout.count())));

                const auto [bytesRead, zeroCopySupported] = ftChunk.get(); //throw FileError, ErrorDiskFull
                if (bytesRead != chunkSize) //source got shorter
                    throw CorruptionError(errorMsg, replaceCpy("Source file %x was changed during the copy.", "%x", fmtPath(entry.sourcePath)));
                tryZeroCopy = zeroCopySupported;

                ctx->update(buffer->data(), chunkSize); //throw SysError
                pos += chunkSize;

                commit(entry.id, Stage::streamCopy, {.bytesCopied = pos, .contentDigest = ctx->finalizeHex() /*throw SysError*/}); //throw JournalError
                cb_.updateDataProcessed(0, chunkSize);

                if (cancel_.stopRequested())
                    throw StopRequest();
            }
        }
        fileOut->truncate(entry.fileSize); //throw FileError; trailing hole

        //source modified while copying? => the digest doesn't describe it
        struct stat srcInfoNow = {};
        if (::fstat(fileIn->getHandle(), &srcInfoNow) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(entry.sourcePath)), "fstat");

        if (srcInfoNow.st_size != srcInfo.st_size ||
            srcInfoNow.st_mtim.tv_sec  != srcInfo.st_mtim.tv_sec ||
            srcInfoNow.st_mtim.tv_nsec != srcInfo.st_mtim.tv_nsec)
            throw CorruptionError(errorMsg, replaceCpy("Source file %x was changed during the copy.", "%x", fmtPath(entry.sourcePath)));

        //basic metadata: applied before the durability barrier
        fileOut->setPermissions(srcInfo.st_mode & 07777); //throw FileError
        fileOut->setModTime(srcInfo.st_mtim);             //throw FileError
        if (runningAsRoot())
            fileOut->setOwner(srcInfo.st_uid, srcInfo.st_gid); //throw FileError

        fileOut->close(); //throw FileError

        commit(entry.id, Stage::flushed, {.bytesCopied = entry.fileSize, .contentDigest = ctx->finalizeHex() /*throw SysError*/}); //throw JournalError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void CopyEngine::syncTempFile(const JournalEntry& entry) //throw FileError
{
    const std::string tempPath = getTempFilePath(entry);

    if (!itemExists(tempPath)) //throw FileError; don't create an empty one
        throw CorruptionError(replaceCpy("Cannot find temporary file %x.", "%x", fmtPath(tempPath)));

    //read-only handle: the temp file may carry a read-only source's permissions already
    FileInputPlain fileIn(tempPath); //throw FileError
    syncWithTimeout(fileIn.getHandle(), tempPath); //throw FileError, TransientIOError
    fileIn.close(); //throw FileError
}


void CopyEngine::syncWithTimeout(int fd, const std::string& filePath) //throw FileError, TransientIOError
{
    const std::string errorMsg = replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath));

    //own descriptor: a stalled fsync() may outlive this call
    const int fdTmp = ::dup(fd);
    if (fdTmp == -1)
        THROW_LAST_FILE_ERROR(errorMsg, "dup");

    auto ftSync = runAsync([fdTmp]
    {
        setCurrentThreadName("SafeMove: fsync");

        const ErrorCode ec = ::fsync(fdTmp) == 0 ? 0 : getLastError();
        ::close(fdTmp);
        return ec;
    });

    if (ftSync.wait_for(settings_.stallTimeout) != std::future_status::ready)
        throw TransientIOError(errorMsg, replaceCpy("Data synchronization stalled for more than %x seconds.", "%x",
                                                    numberTo<std::string>(settings_.stallTimeout.count())));

    if (const ErrorCode ec = ftSync.get();
        ec != 0)
    {
        if (ec == ENOSPC || ec == EDQUOT)
            throw ErrorDiskFull(errorMsg, formatSystemError("fsync", ec));
        throw FileError(errorMsg, formatSystemError("fsync", ec));
    }
}


void CopyEngine::syncFolder(const std::string& dirPath) //throw FileError
{
    if (hooks_.syncDirectory)
        hooks_.syncDirectory(dirPath); //throw FileError
    else
        syncDirectory(dirPath); //throw FileError
}


//target folders may have been created by this run or an interrupted one: make each folder's entry durable up to the file system root
void CopyEngine::syncTargetFolders(const JournalEntry& entry) //throw FileError
{
    std::string folderPath = getParentPath(entry.targetPath);
    syncFolder(folderPath); //throw FileError; the file's own entry

    while (const std::optional<std::string> parentPath = getParentFolderPath(folderPath))
    {
        if (durableFolders_.access([&](const std::set<std::string>& folders) { return folders.contains(folderPath); }))
            break;

        syncFolder(*parentPath); //throw FileError
        durableFolders_.access([&](std::set<std::string>& folders) { folders.insert(folderPath); });
        folderPath = *parentPath;
    }
}


void CopyEngine::verifyTempFile(const JournalEntry& entry) //throw FileError
{
    const std::string tempPath = getTempFilePath(entry);

    if (!itemExists(tempPath)) //throw FileError
        throw CorruptionError(replaceCpy("Cannot find temporary file %x.", "%x", fmtPath(tempPath)));

    verifyCopy(tempPath, getFileSize(tempPath) /*throw FileError*/, entry.contentDigest, entry.fileSize, entry.expectedDigest); //throw CorruptionError
}


bool CopyEngine::targetHasContent(const JournalEntry& entry, const std::string& filePath) //throw FileError
{
    if (entry.contentDigest.empty() || !itemExists(filePath)) //throw FileError
        return false;

    return getFileSize(filePath) == entry.fileSize && //throw FileError
           equalAsciiNoCase(hashFile(filePath, entry.digestAlgorithm, settings_.chunkSize, nullptr), entry.contentDigest); //throw FileError
}


void CopyEngine::renameToTarget(const JournalEntry& entry) //throw FileError
{
    const std::string tempPath = getTempFilePath(entry);

    if (!itemExists(tempPath)) //throw FileError
    {
        if (targetHasContent(entry, entry.targetPath)) //throw FileError
            return commit(entry.id, Stage::renamed); //rename completed, but its batched commit was lost

        throw CorruptionError(replaceCpy("Cannot find temporary file %x.", "%x", fmtPath(tempPath)));
    }

    if (itemExists(entry.targetPath)) //throw FileError
    {
        //copy fallback completed before the crash, but was never committed
        if (targetHasContent(entry, entry.targetPath)) //throw FileError
        {
            FileInputPlain fileIn(entry.targetPath); //throw FileError
            syncWithTimeout(fileIn.getHandle(), entry.targetPath); //throw FileError, TransientIOError
            fileIn.close(); //throw FileError

            removeFilePlain(tempPath); //throw FileError
            return commit(entry.id, Stage::renamed, {.nonAtomicSwap = true}); //throw JournalError
        }

        throw ErrorTargetExisting(replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", fmtPath(tempPath)), "%y", fmtPath(entry.targetPath)),
                                  "The target file already exists with different content.");
    }

    renameWithFallback(entry, tempPath); //throw FileError
}


void CopyEngine::renameWithFallback(const JournalEntry& entry, const std::string& tempPath) //throw FileError
{
    try
    {
        if (hooks_.renameItem)
            hooks_.renameItem(tempPath, entry.targetPath); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
        else
            moveAndRenameItem(tempPath, entry.targetPath); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

        commit(entry.id, Stage::renamed); //throw JournalError
        return;
    }
    catch (const ErrorMoveUnsupported& e)
    {
        cb_.logMessage(replaceCpy(replaceCpy("Cannot move %x to %y atomically. Copying instead: the target is not replaced atomically.",
                                             "%x", fmtPath(tempPath)), "%y", fmtPath(entry.targetPath)) + "\n\n" + e.toString(),
                       ProcessCallback::MsgType::warning);
    }

    //fallback: copy + sync + remove temp
    {
        FileInputPlain fileIn(tempPath); //throw FileError
        const struct stat tmpInfo = fileIn.getStatBuffered(); //throw FileError

        FileOutputPlain fileOut(entry.targetPath, FileOutputMode::createNew); //throw FileError, ErrorTargetExisting; deleted unless close() succeeds
        cb_.updateDataTotal(0, entry.fileSize);

        std::vector<char> buffer(settings_.chunkSize);
        for (uint64_t pos = 0; pos < entry.fileSize;)
        {
            const size_t bytesRead = fileIn.readAt(buffer.data(), static_cast<size_t>(std::min<uint64_t>(entry.fileSize - pos, buffer.size())), pos); //throw FileError
            if (bytesRead == 0)
                throw CorruptionError(replaceCpy("Cannot read file %x.", "%x", fmtPath(tempPath)), "Unexpected end of file.");

            fileOut.writeAt(buffer.data(), bytesRead, pos); //throw FileError, ErrorDiskFull
            pos += bytesRead;
            cb_.updateDataProcessed(0, bytesRead);
        }

        fileOut.setPermissions(tmpInfo.st_mode & 07777); //throw FileError
        fileOut.setModTime(tmpInfo.st_mtim);             //throw FileError
        if (runningAsRoot())
            fileOut.setOwner(tmpInfo.st_uid, tmpInfo.st_gid); //throw FileError

        syncWithTimeout(fileOut.getHandle(), entry.targetPath); //throw FileError, TransientIOError
        fileOut.close(); //throw FileError
    }

    //re-read once: the copy was made outside the streaming digest
    if (!targetHasContent(entry, entry.targetPath)) //throw FileError
    {
        try { removeFilePlain(entry.targetPath); /*throw FileError*/ }
        catch (const FileError& e) { logExtraError(e.toString()); }

        throw CorruptionError(replaceCpy("Verification of %x failed.", "%x", fmtPath(entry.targetPath)), "Content differs from the temporary file.");
    }

    removeFilePlain(tempPath); //throw FileError
    commit(entry.id, Stage::renamed, {.nonAtomicSwap = true}); //throw JournalError
}


void CopyEngine::removeSource(const JournalEntry& entry) //throw FileError
{
    const std::string errorMsg = replaceCpy("Cannot delete file %x.", "%x", fmtPath(entry.sourcePath));

    //last line of defense: never remove the only copy
    if (!itemExists(entry.targetPath)) //throw FileError
        throw CorruptionError(errorMsg, replaceCpy("Target file %x is missing.", "%x", fmtPath(entry.targetPath)));

    if (const uint64_t targetSize = getFileSize(entry.targetPath); //throw FileError
        targetSize != entry.fileSize)
        throw CorruptionError(errorMsg, replaceCpy(replaceCpy("Target file %x has %y.", "%x", fmtPath(entry.targetPath)), "%y", formatBytes(targetSize)));

    if (!itemExists(entry.sourcePath)) //throw FileError; removed before the crash
        return;

    const FileDetails srcDetails = getFileDetails(entry.sourcePath); //throw FileError
    if (srcDetails.fileSize != entry.fileSize || srcDetails.modTime.tv_sec != entry.modTime)
        throw CorruptionError(errorMsg, replaceCpy("Source file %x was changed during migration.", "%x", fmtPath(entry.sourcePath)));

    removeFilePlain(entry.sourcePath); //throw FileError
}


void CopyEngine::checkFreeSpace(const JournalEntry& entry) //throw TransientIOError, FileError
{
    const std::string folderPath = getParentPath(getTempFilePath(entry));

    const int64_t freeSpace = getFreeDiskSpace(folderPath); //throw FileError
    if (freeSpace < 0) //not available
        return;

    const uint64_t required = entry.fileSize - std::min(entry.bytesCopied, entry.fileSize) + settings_.minFreeSpace;
    if (static_cast<uint64_t>(freeSpace) < required)
        throw TransientIOError(replaceCpy("Not enough free disk space available in %x.", "%x", fmtPath(folderPath)),
                               replaceCpy(replaceCpy("Required: %x, available: %y", "%x", formatBytes(required)), "%y", formatBytes(freeSpace)));
}


std::optional<ItemOutcome> CopyEngine::handleFailure(EntryId id, const FileError& error) //throw JournalError
{
    const JournalEntry entry = journal_.getEntry(id);
    if (isTerminal(entry.stage))
        return entry.stage == Stage::done ? ItemOutcome::done : ItemOutcome::permanentlyFailed;

    //before FAILED is recorded: a crash during cleanup resumes at the failing stage and runs into the same error
    cleanUp(entry);

    const std::string errorMsg = error.toString();

    if (entry.retryCount >= settings_.maxRetries)
    {
        commit(id, Stage::failed, {.lastError = errorMsg}); //throw JournalError
        commit(id, Stage::permanentlyFailed);               //
        cb_.logMessage(errorMsg + "\n\n" + replaceCpy("Giving up after %x attempts.", "%x", numberTo<std::string>(entry.retryCount + 1)),
                       ProcessCallback::MsgType::error);
        cb_.updateDataProcessed(1, 0);
        return ItemOutcome::permanentlyFailed;
    }

    commit(id, Stage::failed, {.retryCount = entry.retryCount + 1, .lastError = errorMsg}); //throw JournalError
    cb_.logMessage(errorMsg + "\n\n" + replaceCpy(replaceCpy("Retrying (attempt %x of %y)...", "%x", numberTo<std::string>(entry.retryCount + 2)),
                                                  "%y", numberTo<std::string>(settings_.maxRetries + 1)),
                   ProcessCallback::MsgType::warning);
    return std::nullopt;
}


void CopyEngine::cleanUp(const JournalEntry& entry)
{
    try
    {
        removeFileIfExists(getTempFilePath(entry)); //throw FileError
    }
    catch (const FileError& e) { cb_.logMessage(e.toString(), ProcessCallback::MsgType::warning); }

    //destination created by this entry, source still in place
    if (entry.stage >= Stage::renamed && entry.stage < Stage::sourceRemoved && !entry.targetAdopted)
        try
        {
            removeFileIfExists(entry.targetPath); //throw FileError
        }
        catch (const FileError& e) { cb_.logMessage(e.toString(), ProcessCallback::MsgType::warning); }
}
