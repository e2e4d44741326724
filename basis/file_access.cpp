// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include <vector>
#include "scope_guard.h"

#include <sys/vfs.h>  //statfs
#include <sys/stat.h> //chmod
#include <fcntl.h>   //open, AT_FDCWD, RENAME_NOREPLACE
#include <stdio.h>   //renameat2
#include <unistd.h>

using namespace basis;


namespace
{
struct SysErrorCode : public basis::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const std::string& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    if (S_ISREG(itemInfo.st_mode))
        return ItemType::file;
    return ItemType::other; //S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


//walk up until an existing folder is found: free disk space and device id are queried for paths not yet created
std::string getFirstExistingPath(const std::string& itemPath) //throw SysError
{
    std::string path = itemPath;
    for (;;)
        try
        {
            getItemTypeImpl(path); //throw SysErrorCode
            return path;
        }
        catch (const SysErrorCode& e)
        {
            if (e.errorCode != ENOENT && e.errorCode != ENOTDIR)
                throw;

            const std::optional<std::string> parentPath = getParentFolderPath(path);
            if (!parentPath)
                throw;
            path = *parentPath;
        }
}
}


ItemType basis::getItemType(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> basis::getItemTypeIfExists(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR)
            return std::nullopt;
        throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString());
    }
}


FileDetails basis::getFileDetails(const std::string& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::lstat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("lstat");

        return
        {
            .fileSize = static_cast<uint64_t>(fileInfo.st_size),
            .modTime  = fileInfo.st_mtim,
            .mode     = fileInfo.st_mode,
            .ownerId  = fileInfo.st_uid,
            .groupId  = fileInfo.st_gid,
            .volumeId = fileInfo.st_dev,
            .fileIdx  = fileInfo.st_ino,
        };
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath)), e.toString()); }
}


uint64_t basis::getFileSize(const std::string& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return fileInfo.st_size;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath)), e.toString()); }
}


int64_t basis::getFreeDiskSpace(const std::string& folderPath) //throw FileError
{
    try
    {
        const std::string existingPath = getFirstExistingPath(folderPath); //throw SysError

        struct statfs info = {};
        if (::statfs(existingPath.c_str(), &info) != 0) //follows symlinks!
            THROW_LAST_SYS_ERROR("statfs");
        //"Fields that are undefined for a particular file system are set to 0."
        if (static_cast<int64_t>(info.f_bsize) <= 0 ||
            static_cast<int64_t>(info.f_bavail) <= 0)
            return -1;

        return static_cast<int64_t>(info.f_bsize) * static_cast<int64_t>(info.f_bavail);
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot determine free disk space for %x.", "%x", fmtPath(folderPath)), e.toString()); }
}


VolumeId basis::getVolumeId(const std::string& itemPath) //throw FileError
{
    try
    {
        const std::string existingPath = getFirstExistingPath(itemPath); //throw SysError

        struct stat itemInfo = {};
        if (::stat(existingPath.c_str(), &itemInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return itemInfo.st_dev;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString()); }
}


void basis::removeFilePlain(const std::string& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(filePath)), e.toString()); }
}


bool basis::removeFileIfExists(const std::string& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
    {
        if (errno == ENOENT)
            return false;
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot delete file %x.", "%x", fmtPath(filePath)), "unlink");
    }
    return true;
}


void basis::removeDirectoryPlain(const std::string& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot delete directory %x.", "%x", fmtPath(dirPath)), e.toString()); }
}


bool basis::removeDirectoryIfEmpty(const std::string& dirPath) //throw FileError
{
    if (::rmdir(dirPath.c_str()) != 0)
    {
        const ErrorCode ec = errno;
        if (ec == ENOTEMPTY || ec == EEXIST /*POSIX allows both*/ || ec == ENOENT)
            return false;
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot delete directory %x.", "%x", fmtPath(dirPath)), "rmdir");
    }
    return true;
}


namespace
{
std::string generateMoveErrorMsg(const std::string& pathFrom, const std::string& pathTo)
{
    if (getParentFolderPath(pathFrom) == getParentFolderPath(pathTo)) //pure "rename"
        return replaceCpy(replaceCpy("Cannot rename %x to %y.",
                                     "%x", fmtPath(pathFrom)),
                          "%y", fmtPath(getItemName(pathTo)));
    else //"move" or "move + rename"
        return trimCpy(replaceCpy(replaceCpy("Cannot move %x to %y.",
                                             "%x", '\n' + fmtPath(pathFrom)),
                                  "%y", '\n' + fmtPath(pathTo)));
}
}


void basis::moveAndRenameItem(const std::string& pathFrom, const std::string& pathTo) //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return generateMoveErrorMsg(pathFrom, pathTo); };

    //plain rename() never fails with EEXIST, but silently replaces the target
    if (::renameat2(AT_FDCWD, pathFrom.c_str(), AT_FDCWD, pathTo.c_str(), RENAME_NOREPLACE) == 0)
        return;

    const ErrorCode ec = errno;
    if (ec == EEXIST)
        throw ErrorTargetExisting(getErrorMsg(), replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(pathTo))));

    if (ec == EXDEV)
        throw ErrorMoveUnsupported(getErrorMsg(), formatSystemError("renameat2", ec));

    if (ec != EINVAL && ec != ENOSYS) //file system without RENAME_NOREPLACE support (e.g. older NFS)
        throw FileError(getErrorMsg(), formatSystemError("renameat2", ec));

    //fallback: check + rename; there is a race window if another process creates the target in between
    struct stat targetInfo = {};
    if (::lstat(pathTo.c_str(), &targetInfo) == 0)
        throw ErrorTargetExisting(getErrorMsg(), replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(pathTo))));
    if (errno != ENOENT)
        throw FileError(getErrorMsg(), formatSystemError("lstat(target)", errno));

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        if (errno == EXDEV)
            throw ErrorMoveUnsupported(getErrorMsg(), formatSystemError("rename", errno));

        throw FileError(getErrorMsg(), formatSystemError("rename", errno));
    }
}


void basis::createDirectory(const std::string& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        const std::string dirName = getItemName(dirPath);
        if (std::all_of(dirName.begin(), dirName.end(), [](char c) { return c == '.'; }))
            throw SysError(replaceCpy("Invalid folder name %x.", "%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e.toString()); }
}


void basis::createDirectoryIfMissingRecursion(const std::string& dirPath) //throw FileError
{
    try
    {
        //path most likely already exists => check first; find first existing parent folder (backwards iteration):
        std::string dirPathEx = dirPath;
        std::vector<std::string> dirNames; //reverse order
        for (;;)
        {
            const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx); //throw FileError
            if (type)
            {
                if (*type != ItemType::folder && *type != ItemType::symlink /*follow*/)
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(dirPathEx))));
                break;
            }

            const std::optional<std::string> parentPath = getParentFolderPath(dirPathEx);
            if (!parentPath) //device root
                throw SysError(replaceCpy("Cannot find %x.", "%x", fmtPath(dirPathEx)));
            dirNames.push_back(getItemName(dirPathEx));
            dirPathEx = *parentPath;
        }

        std::string dirPathNew = dirPathEx;
        for (auto it = dirNames.rbegin(); it != dirNames.rend(); ++it)
        {
            dirPathNew = appendPath(dirPathNew, *it);
            try
            {
                createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
            }
            catch (ErrorTargetExisting&) //possible if workers create the same parent folder in parallel
            {
                if (getItemType(dirPathNew) != ItemType::folder) //throw FileError
                    throw;
            }
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e.toString()); }
}


void basis::setItemPermissions(const std::string& itemPath, mode_t mode) //throw FileError
{
    if (::chmod(itemPath.c_str(), mode) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write permissions of %x.", "%x", fmtPath(itemPath)), "chmod");
}


void basis::syncDirectory(const std::string& dirPath) //throw FileError
{
    try
    {
        const int fdDir = ::open(dirPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fdDir == -1)
            THROW_LAST_SYS_ERROR("open");
        BASIS_ON_SCOPE_EXIT(::close(fdDir));

        if (::fsync(fdDir) != 0)
            if (errno != EINVAL) //"fd is bound to a special file which does not support synchronization"
                THROW_LAST_SYS_ERROR("fsync");
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(dirPath)), e.toString()); }
}
