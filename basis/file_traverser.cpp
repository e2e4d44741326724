// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "file_traverser.h"
#include "file_path.h"
#include <sys/stat.h>
#include <dirent.h>

using namespace basis;


void basis::traverseFolder(const std::string& dirPath,
                           const std::function<void(const FileInfo&      fi)>& onFile,
                           const std::function<void(const FolderInfo&    fi)>& onFolder,
                           const std::function<void(const OtherItemInfo& oi)>& onOther) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot open directory %x.", "%x", fmtPath(dirPath)), "opendir");
    BASIS_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder);
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy("Cannot read directory %x.", "%x", fmtPath(dirPath)), "readdir");
            //don't retry but restart dir traversal on error!
        }

        //don't return "." and ".."
        const char* itemNameRaw = dirEntry->d_name;

        if (itemNameRaw[0] == '.' &&
            (itemNameRaw[1] == 0 || (itemNameRaw[1] == '.' && itemNameRaw[2] == 0)))
            continue;

        const std::string itemName = itemNameRaw;
        if (itemName.empty())
            throw FileError(replaceCpy("Cannot read directory %x.", "%x", fmtPath(dirPath)), formatSystemError("readdir", "", "Folder contains an item without name."));

        const std::string itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::lstat(itemPath.c_str(), &statData) != 0) //lstat() does not resolve symlinks
        {
            if (errno == ENOENT) //deleted after readdir(): nothing to migrate
                continue;
            THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), "lstat");
        }

        if (S_ISDIR(statData.st_mode))
        {
            if (onFolder)
                onFolder({itemName, itemPath});
        }
        else if (S_ISREG(statData.st_mode))
        {
            if (onFile)
                onFile({itemName, itemPath, static_cast<uint64_t>(statData.st_size), statData.st_mtime});
        }
        else //an "open" on a pipe would block => report only
        {
            if (onOther)
                onOther({itemName, itemPath, S_ISLNK(statData.st_mode)});
        }
    }
}
