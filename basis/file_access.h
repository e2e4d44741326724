// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include "file_path.h"
#include "file_error.h"
#include <sys/stat.h>
#include <unistd.h> //geteuid


namespace basis
{
using FileIndex  = ino_t;
using VolumeId   = dev_t;

enum class ItemType
{
    file,
    folder,
    symlink,
    other, //device, FIFO, socket
};
//symlink handling: do NOT follow
ItemType getItemType(const std::string& itemPath); //throw FileError
//distinguish error/not existing: ENOENT and ENOTDIR mean "not existing"
std::optional<ItemType> getItemTypeIfExists(const std::string& itemPath); //throw FileError

inline bool itemExists(const std::string& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError


struct FileDetails
{
    uint64_t fileSize = 0;
    timespec modTime  = {};
    mode_t   mode     = 0;
    uid_t    ownerId  = 0;
    gid_t    groupId  = 0;
    VolumeId volumeId = 0;
    FileIndex fileIdx = 0;
};
//symlink handling: do NOT follow
FileDetails getFileDetails(const std::string& filePath); //throw FileError

//symlink handling: follow
uint64_t getFileSize(const std::string& filePath); //throw FileError

//- symlink handling: follow
//- returns < 0 if not available
//- folderPath does not need to exist (yet): the first existing parent is queried
int64_t getFreeDiskSpace(const std::string& folderPath); //throw FileError

//device of the item or of its first existing parent folder
VolumeId getVolumeId(const std::string& itemPath); //throw FileError

void removeFilePlain     (const std::string& filePath); //throw FileError; ERROR if not existing
bool removeFileIfExists  (const std::string& filePath); //throw FileError; return false if not existing
void removeDirectoryPlain(const std::string& dirPath ); //throw FileError; ERROR if not existing
bool removeDirectoryIfEmpty(const std::string& dirPath); //throw FileError; return false if not empty or not existing

//never overwrites: renameat2(RENAME_NOREPLACE)
void moveAndRenameItem(const std::string& pathFrom, const std::string& pathTo); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

void createDirectory(const std::string& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing
void createDirectoryIfMissingRecursion(const std::string& dirPath); //throw FileError

//follows symlinks
void setItemPermissions(const std::string& itemPath, mode_t mode); //throw FileError

//make renames, creations and deletions of the folder's children durable
void syncDirectory(const std::string& dirPath); //throw FileError

//only root may change the owner: caller must check
inline bool runningAsRoot() { return ::geteuid() == 0; }
}

#endif //FILE_ACCESS_H_8017341345614857
