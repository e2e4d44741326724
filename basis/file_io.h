// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_access.h"
#include "serialize.h"
#include "crc.h"
#include "guid.h"


namespace basis
{
/*  OS-buffered file I/O:
    - positional reads/writes (pread/pwrite): resumable at any offset
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const std::string& getFilePath() const { return filePath_; }

    size_t getBlockSize(); //throw FileError

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

    uint64_t getCurrentSize(); //throw FileError; unbuffered fstat()

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
    size_t blockSizeBuf_ = 0;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const std::string& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
    size_t tryReadAt(void* buffer, size_t bytesToRead, uint64_t offset); //throw FileError

    //return "bytesToRead" bytes unless end of file!
    size_t readAt(void* buffer, size_t bytesToRead, uint64_t offset); //throw FileError

    //sparse file support (SEEK_DATA/SEEK_HOLE):
    //- start of the next data region at or after "offset"; none if only a hole follows up to EOF
    //- file systems without support report the whole file as data
    std::optional<uint64_t> findNextData(uint64_t offset); //throw FileError
    //- end of the data region containing "offset" (at most EOF)
    uint64_t findNextHole(uint64_t offset); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath);
};


enum class FileOutputMode
{
    createNew, //fail with ErrorTargetExisting if existing; deleted again unless close() succeeds
    resume,    //create if missing, keep existing content: the file outlives the process
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const std::string& filePath, FileOutputMode mode); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError, ErrorDiskFull
    size_t tryWriteAt(const void* buffer, size_t bytesToWrite, uint64_t offset); //throw FileError, ErrorDiskFull

    void writeAt(const void* buffer, size_t bytesToWrite, uint64_t offset); //throw FileError, ErrorDiskFull

    //shrink or extend (holes!)
    void truncate(uint64_t newSize); //throw FileError, ErrorDiskFull

    void syncData(); //throw FileError; fdatasync()
    void syncAll (); //throw FileError; fsync(): data + metadata

    void setModTime(const timespec& modTime); //throw FileError
    void setPermissions(mode_t mode); //throw FileError
    void setOwner(uid_t ownerId, gid_t groupId); //throw FileError; requires root

    //createNew: close() when done, or else file is considered incomplete and will be deleted!

private:
    const FileOutputMode mode_;
};

//-----------------------------------------------------------------------------------------------

//kernel-side transfer (copy_file_range): no user space buffer, reflink/server-side copy where supported
//returns none if not supported for this file pair (cross-device, unsupported file system): caller falls back to read + write
std::optional<size_t> tryCopyFileRange(FileInputPlain& fileIn, uint64_t offsetIn,
                                       FileOutputPlain& fileOut, uint64_t offsetOut, size_t bytesToCopy); //throw FileError, ErrorDiskFull

//-----------------------------------------------------------------------------------------------

//stream I/O convenience functions:

inline
std::string getPathWithTempName(const std::string& filePath) //generate (hopefully) unique file name
{
    const std::string shortGuid = printNumber("%04x", static_cast<unsigned int>(getCrc16(generateGUID())));
    return filePath + '.' + shortGuid + ".tmp";
}

[[nodiscard]] std::string getFileContent(const std::string& filePath); //throw FileError

//overwrites if existing + transactional + durable: temp file, fsync, rename, fsync parent folder
void setFileContent(const std::string& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345
