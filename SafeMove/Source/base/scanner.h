// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef SCANNER_H_1394857029384752
#define SCANNER_H_1394857029384752

#include <vector>
#include "cancellation.h"
#include "journal.h"
#include "process_callback.h"


namespace sm
{
enum class ScanAction
{
    resume,    //entry exists and is not terminal
    start,     //new file
    supersede, //replaces a PERMANENTLY_FAILED entry: the file was changed since
};

struct ScanItem
{
    WorkItem item;
    ScanAction action = ScanAction::start;
};


/*  enumerates work in bounded batches:
    1. pending journal entries (crash recovery, deferred items)
    2. depth-first walk of the source tree (skipped in resume-only mode)
        - memory: one folder listing + stack of unvisited folders
        - skips: journal and staging folder, target root nested inside the source,
                 temp files, symlinks (not followed), other non-regular items
        - known paths are skipped, except changed PERMANENTLY_FAILED ones

    settings paths must be normalized!                                          */
class Scanner
{
public:
    Scanner(const MoveSettings& settings, const Journal& journal, const CancellationToken& cancel, ProcessCallback& callback);

    //empty: scan complete (or stop requested)
    std::vector<ScanItem> nextBatch(); //throw FileError

    int getErrorCount() const { return errorCount_; } //folders that could not be read

private:
    Scanner           (const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    void traverseNextFolder(); //throw FileError
    void addFile(const std::string& filePath, uint64_t fileSize, time_t modTime);
    bool isExcludedFolder(const std::string& folderPath) const;
    std::string getTargetPath(const std::string& sourcePath) const;

    const MoveSettings& settings_;
    const Journal& journal_;
    const CancellationToken& cancel_;
    ProcessCallback& cb_;

    std::optional<Journal::PendingCursor> pendingCursor_; //phase 1
    std::vector<std::string> folderStack_;                //phase 2
    bool walkStarted_ = false;

    std::vector<ScanItem> buffer_;
    int errorCount_ = 0;
};
}

#endif //SCANNER_H_1394857029384752
