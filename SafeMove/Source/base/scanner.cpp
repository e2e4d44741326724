// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "scanner.h"
#include <algorithm>
#include <ctime>
#include <basis/file_traverser.h>

using namespace basis;
using namespace sm;


Scanner::Scanner(const MoveSettings& settings, const Journal& journal, const CancellationToken& cancel, ProcessCallback& callback) :
    settings_(settings),
    journal_(journal),
    cancel_(cancel),
    cb_(callback)
{
    if (settings_.scanBatchSize == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    pendingCursor_.emplace(journal_.pending());
}


std::vector<ScanItem> Scanner::nextBatch() //throw FileError
{
    //phase 1: journal entries left over from previous runs
    while (pendingCursor_ && buffer_.size() < settings_.scanBatchSize)
        if (std::optional<JournalEntry> entry = pendingCursor_->next())
            buffer_.push_back(
        {
            .item =
            {
                .sourcePath     = entry->sourcePath,
                .targetPath     = entry->targetPath,
                .fileSize       = entry->fileSize,
                .modTime        = entry->modTime,
                .discoveredAt   = entry->discoveredAt,
                .expectedDigest = entry->expectedDigest,
            },
            .action = ScanAction::resume,
        });
        else
            pendingCursor_.reset();

    //phase 2: discover new files
    if (!settings_.resumeOnly)
    {
        if (!walkStarted_)
        {
            walkStarted_ = true;
            folderStack_.push_back(settings_.sourceRoot);
        }

        while (buffer_.size() < settings_.scanBatchSize && !folderStack_.empty() && !cancel_.stopRequested())
            traverseNextFolder(); //throw FileError
    }

    std::vector<ScanItem> batch;
    if (buffer_.size() <= settings_.scanBatchSize)
        batch.swap(buffer_);
    else //a single large folder may exceed the batch size
    {
        batch.assign(std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.begin() + settings_.scanBatchSize));
        buffer_.erase(buffer_.begin(), buffer_.begin() + settings_.scanBatchSize);
    }
    return batch;
}


void Scanner::traverseNextFolder() //throw FileError
{
    const std::string folderPath = std::move(folderStack_.back());
    folderStack_.pop_back();

    cb_.updateStatus(replaceCpy("Scanning: %x", "%x", fmtPath(folderPath)));

    std::vector<FileInfo> files;
    std::vector<std::string> subFolders;
    try
    {
        traverseFolder(folderPath,
        [&](const FileInfo& fi) { files.push_back(fi); },
        [&](const FolderInfo& fi)
        {
            if (!isExcludedFolder(fi.fullPath))
                subFolders.push_back(fi.fullPath);
        },
        [&](const OtherItemInfo& oi)
        {
            if (oi.isSymlink)
                cb_.logMessage(replaceCpy("Skipping symbolic link %x.", "%x", fmtPath(oi.fullPath)), ProcessCallback::MsgType::info);
            else
                cb_.logMessage(replaceCpy("Skipping special file %x.", "%x", fmtPath(oi.fullPath)), ProcessCallback::MsgType::info);
        }); //throw FileError
    }
    catch (const FileError& e)
    {
        if (folderPath == settings_.sourceRoot) //nothing to migrate without the root
            throw;

        ++errorCount_;
        cb_.logMessage(e.toString(), ProcessCallback::MsgType::error);
        return;
    }

    //deterministic order: easier to follow in the log, reproducible tests
    std::sort(files.begin(), files.end(), [](const FileInfo& lhs, const FileInfo& rhs) { return lhs.itemName < rhs.itemName; });
    std::sort(subFolders.begin(), subFolders.end(), std::greater());

    for (const FileInfo& fi : files)
        addFile(fi.fullPath, fi.fileSize, fi.modTime);

    //stack: push in reverse => visit in ascending order
    folderStack_.insert(folderStack_.end(), std::make_move_iterator(subFolders.begin()), std::make_move_iterator(subFolders.end()));
}


void Scanner::addFile(const std::string& filePath, uint64_t fileSize, time_t modTime)
{
    if (endsWith(filePath, TEMP_FILE_ENDING))
        return;

    if (!settings_.extensionFilter.empty() &&
        !settings_.extensionFilter.contains(asciiToLowerCpy(getFileExtension(filePath))))
        return;

    WorkItem item
    {
        .sourcePath   = filePath,
        .targetPath   = getTargetPath(filePath),
        .fileSize     = fileSize,
        .modTime      = modTime,
        .discoveredAt = std::time(nullptr),
    };

    if (std::optional<JournalEntry> entry = journal_.findEntry(filePath))
        switch (entry->stage)
        {
            case Stage::permanentlyFailed:
                if (entry->fileSize != fileSize || entry->modTime != modTime)
                    buffer_.push_back({std::move(item), ScanAction::supersede});
                return;

            case Stage::done: //a new file with the name of one already moved: don't touch the migrated copy
                cb_.logMessage(replaceCpy("Skipping %x: a file of this name was already migrated.", "%x", fmtPath(filePath)),
                               ProcessCallback::MsgType::warning);
                return;

            default: //pending: phase 1 picked it up already
                return;
        }

    buffer_.push_back({std::move(item), ScanAction::start});
}


bool Scanner::isExcludedFolder(const std::string& folderPath) const
{
    if (folderPath == journal_.getFolderPath())
        return true;

    if (!settings_.stagingFolderPath.empty() && folderPath == settings_.stagingFolderPath)
        return true;

    //target nested inside source: don't migrate the migrated files again
    return folderPath == settings_.targetRoot;
}


std::string Scanner::getTargetPath(const std::string& sourcePath) const
{
    std::string targetPath = settings_.targetRoot;
    if (settings_.keepSourceFolderName)
        targetPath = appendPath(targetPath, getItemName(settings_.sourceRoot));

    return appendPath(targetPath, getRelativePath(sourcePath, settings_.sourceRoot));
}
