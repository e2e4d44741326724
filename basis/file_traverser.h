// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef FILER_TRAVERSER_H_127463214871234
#define FILER_TRAVERSER_H_127463214871234

#include <functional>
#include "file_error.h"


namespace basis
{
struct FileInfo //regular files only
{
    std::string itemName;
    std::string fullPath;
    uint64_t fileSize = 0; //[bytes]
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
};

struct FolderInfo
{
    std::string itemName;
    std::string fullPath;
};

struct OtherItemInfo //symlinks, devices, FIFOs, sockets: never followed, never opened
{
    std::string itemName;
    std::string fullPath;
    bool isSymlink = false;
};

//- non-recursive
//- callbacks are optional
void traverseFolder(const std::string& dirPath,
                    const std::function<void(const FileInfo&      fi)>& onFile,
                    const std::function<void(const FolderInfo&    fi)>& onFolder,
                    const std::function<void(const OtherItemInfo& oi)>& onOther); //throw FileError
}

#endif //FILER_TRAVERSER_H_127463214871234
