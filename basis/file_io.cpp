// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "file_io.h"
#include "extra_log.h"
#include <sys/stat.h>
#include <fcntl.h>  //open
#include <unistd.h> //close, read, write, copy_file_range

using namespace basis;


namespace
{
//ENOSPC/EDQUOT are worth retrying once the operator freed space
[[noreturn]] void throwWriteError(const std::string& filePath, const char* functionName, ErrorCode ec)
{
    const std::string msg = replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath));
    if (ec == ENOSPC || ec == EDQUOT)
        throw ErrorDiskFull(msg, formatSystemError(functionName, ec));
    throw FileError(msg, formatSystemError(functionName, ec));
}
}


size_t FileBase::getBlockSize() //throw FileError
{
    if (blockSizeBuf_ == 0)
    {
        /*  - statfs::f_bsize  - "optimal transfer block size"
            - stat::st_blksize - "blocksize for file system I/O. Writing in smaller chunks may cause an inefficient read-modify-rewrite."  */
        const auto st_blksize = getStatBuffered().st_blksize; //throw FileError
        if (st_blksize > 0)             //st_blksize is signed!
            blockSizeBuf_ = st_blksize; //

        blockSizeBuf_ = std::max(blockSizeBuf_, defaultBlockSize);
    }
    return blockSizeBuf_;
}


const struct stat& FileBase::getStatBuffered() //throw FileError
{
    if (!statBuf_)
        try
        {
            if (hFile_ == invalidFileHandle)
                throw SysError("Contract error: getStatBuffered() called after close().");

            struct stat fileInfo = {};
            if (::fstat(hFile_, &fileInfo) != 0)
                THROW_LAST_SYS_ERROR("fstat");
            statBuf_ = std::move(fileInfo);
        }
        catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath_)), e.toString()); }

    return *statBuf_;
}


uint64_t FileBase::getCurrentSize() //throw FileError
{
    struct stat fileInfo = {};
    if (::fstat(hFile_, &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath_)), "fstat");
    return fileInfo.st_size;
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError("Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, struct stat>
openHandleForRead(const std::string& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError("Unsupported item type. [" + printNumber("0%06o", fileInfo.st_mode & S_IFMT) + ']');

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return {fdFile /*pass ownership*/, fileInfo};
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot open file %x.", "%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const std::string& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {} //throw FileError


FileInputPlain::FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath) :
    FileBase(fileDetails.first, filePath)
{
    setStatBuffered(fileDetails.second);

    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file %x.", "%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}


size_t FileInputPlain::tryReadAt(void* buffer, size_t bytesToRead, uint64_t offset) //throw FileError
{
    if (bytesToRead == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::pread(getHandle(), buffer, bytesToRead, static_cast<off_t>(offset));
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("pread");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead);
        return bytesRead;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}


size_t FileInputPlain::readAt(void* buffer, size_t bytesToRead, uint64_t offset) //throw FileError
{
    size_t bytesRead = 0;
    while (bytesRead < bytesToRead)
    {
        const size_t bytesReadNow = tryReadAt(static_cast<char*>(buffer) + bytesRead, bytesToRead - bytesRead, offset + bytesRead); //throw FileError
        if (bytesReadNow == 0) //EOF
            break;
        bytesRead += bytesReadNow;
    }
    return bytesRead;
}


std::optional<uint64_t> FileInputPlain::findNextData(uint64_t offset) //throw FileError
{
    const off_t pos = ::lseek(getHandle(), static_cast<off_t>(offset), SEEK_DATA);
    if (pos < 0)
    {
        if (errno == ENXIO) //"offset is beyond the end of the file" or only a hole follows
            return std::nullopt;
        if (errno == EINVAL) //file system without SEEK_DATA support
            return offset;
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), "lseek(SEEK_DATA)");
    }
    return pos;
}


uint64_t FileInputPlain::findNextHole(uint64_t offset) //throw FileError
{
    const off_t pos = ::lseek(getHandle(), static_cast<off_t>(offset), SEEK_HOLE);
    if (pos < 0)
    {
        if (errno == ENXIO || errno == EINVAL) //beyond EOF, or no SEEK_HOLE support => data up to EOF
            return getStatBuffered().st_size; //throw FileError
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), "lseek(SEEK_HOLE)");
    }
    return pos; //there is always an implicit hole at EOF
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const std::string& filePath, FileOutputMode mode) //throw FileError, ErrorTargetExisting
{
    try
    {
        const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

        //O_EXCL contains a race condition on NFS file systems: https://linux.die.net/man/2/open
        const int fdFile = ::open(filePath.c_str(),
                                  O_CREAT | (mode == FileOutputMode::createNew ? O_EXCL : 0) | O_WRONLY | O_CLOEXEC,
                                  lockFileMode);
        if (fdFile == -1)
        {
            const int ec = errno; //copy before making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath)), formatSystemError("open", ec));

            THROW_LAST_SYS_ERROR("open");
        }
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath)), e.toString()); }
}
}


FileOutputPlain::FileOutputPlain(const std::string& filePath, FileOutputMode mode) :
    FileBase(openHandleForWrite(filePath, mode), filePath), //throw FileError, ErrorTargetExisting
    mode_(mode) {}


FileOutputPlain::~FileOutputPlain()
{
    if (mode_ == FileOutputMode::createNew &&
        getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(getFilePath())) + "\n\n" + e.toString());
        }
}


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError, ErrorDiskFull
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    do
    {
        bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
    }
    while (bytesWritten < 0 && errno == EINTR);
    //if ::write() is interrupted (EINTR) right in the middle, it will return successfully with "bytesWritten < bytesToWrite"!

    if (bytesWritten <= 0)
        throwWriteError(getFilePath(), "write", bytesWritten == 0 ? ENOSPC /*treat as error: buggy drivers*/ : errno);

    if (static_cast<size_t>(bytesWritten) > bytesToWrite) //better safe than sorry
        throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), formatSystemError("write", "", "Buffer overflow."));
    return bytesWritten;
}


size_t FileOutputPlain::tryWriteAt(const void* buffer, size_t bytesToWrite, uint64_t offset) //throw FileError, ErrorDiskFull
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    do
    {
        bytesWritten = ::pwrite(getHandle(), buffer, bytesToWrite, static_cast<off_t>(offset));
    }
    while (bytesWritten < 0 && errno == EINTR);

    if (bytesWritten <= 0)
        throwWriteError(getFilePath(), "pwrite", bytesWritten == 0 ? ENOSPC : errno);

    if (static_cast<size_t>(bytesWritten) > bytesToWrite)
        throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), formatSystemError("pwrite", "", "Buffer overflow."));
    return bytesWritten;
}


void FileOutputPlain::writeAt(const void* buffer, size_t bytesToWrite, uint64_t offset) //throw FileError, ErrorDiskFull
{
    size_t bytesWritten = 0;
    while (bytesWritten < bytesToWrite)
        bytesWritten += tryWriteAt(static_cast<const char*>(buffer) + bytesWritten, bytesToWrite - bytesWritten, offset + bytesWritten); //throw FileError, ErrorDiskFull
}


void FileOutputPlain::truncate(uint64_t newSize) //throw FileError, ErrorDiskFull
{
    if (::ftruncate(getHandle(), static_cast<off_t>(newSize)) != 0)
        throwWriteError(getFilePath(), "ftruncate", errno);
}


void FileOutputPlain::syncData() //throw FileError
{
    if (::fdatasync(getHandle()) != 0)
        throwWriteError(getFilePath(), "fdatasync", errno); //ENOSPC/EDQUOT possible for delayed allocation
}


void FileOutputPlain::syncAll() //throw FileError
{
    if (::fsync(getHandle()) != 0)
        throwWriteError(getFilePath(), "fsync", errno);
}


void FileOutputPlain::setModTime(const timespec& modTime) //throw FileError
{
    const timespec newTimes[2] =
    {
        {.tv_sec = ::time(nullptr), .tv_nsec = 0}, //access time
        modTime,
    };
    if (::futimens(getHandle(), newTimes) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write modification time of %x.", "%x", fmtPath(getFilePath())), "futimens");
}


void FileOutputPlain::setPermissions(mode_t mode) //throw FileError
{
    if (::fchmod(getHandle(), mode & 07777) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write permissions of %x.", "%x", fmtPath(getFilePath())), "fchmod");
}


void FileOutputPlain::setOwner(uid_t ownerId, gid_t groupId) //throw FileError
{
    if (::fchown(getHandle(), ownerId, groupId) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write permissions of %x.", "%x", fmtPath(getFilePath())), "fchown");
}

//----------------------------------------------------------------------------------------------------

std::optional<size_t> basis::tryCopyFileRange(FileInputPlain& fileIn, uint64_t offsetIn,
                                              FileOutputPlain& fileOut, uint64_t offsetOut, size_t bytesToCopy) //throw FileError, ErrorDiskFull
{
    if (bytesToCopy == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    off_t posIn  = static_cast<off_t>(offsetIn);
    off_t posOut = static_cast<off_t>(offsetOut);

    ssize_t bytesCopied = 0;
    do
    {
        bytesCopied = ::copy_file_range(fileIn.getHandle(), &posIn, fileOut.getHandle(), &posOut, bytesToCopy, 0 /*flags*/);
    }
    while (bytesCopied < 0 && errno == EINTR);

    if (bytesCopied < 0)
    {
        const ErrorCode ec = errno;
        if (ec == EXDEV || ec == EINVAL || ec == ENOSYS || ec == EOPNOTSUPP)
            return std::nullopt;

        if (ec == EIO || ec == EBADF) //unclear which side failed: blame the source
            THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file %x.", "%x", fmtPath(fileIn.getFilePath())), "copy_file_range");

        throwWriteError(fileOut.getFilePath(), "copy_file_range", ec);
    }
    if (bytesCopied == 0) //source shrank below the expected size
        throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(fileIn.getFilePath())), formatSystemError("copy_file_range", "", "Unexpected end of file."));

    return bytesCopied;
}

//----------------------------------------------------------------------------------------------------

std::string basis::getFileContent(const std::string& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    const size_t blockSize = fileIn.getBlockSize(); //throw FileError

    std::string content;
    for (;;)
    {
        content.resize(content.size() + blockSize);
        const size_t bytesRead = fileIn.tryRead(content.data() + content.size() - blockSize, blockSize); //throw FileError; may return short, only 0 means EOF
        content.resize(content.size() - blockSize + bytesRead); //caveat: unsigned arithmetics

        if (bytesRead == 0)
        {
            content.shrink_to_fit(); //snapshots are kept in memory until decompressed
            return content;
        }
    }
}


void basis::setFileContent(const std::string& filePath, std::string_view byteStream) //throw FileError
{
    const std::string tmpFilePath = getPathWithTempName(filePath);
    {
        FileOutputPlain tmpFile(tmpFilePath, FileOutputMode::createNew); //throw FileError, (ErrorTargetExisting)

        const size_t blockSize = tmpFile.getBlockSize(); //throw FileError

        for (size_t bytesWritten = 0; bytesWritten < byteStream.size();)
            bytesWritten += tmpFile.tryWrite(byteStream.data() + bytesWritten, std::min(byteStream.size() - bytesWritten, blockSize)); //throw FileError; may return short!

        tmpFile.syncAll(); //throw FileError
        tmpFile.close();   //throw FileError
    }
    //take over ownership:
    BASIS_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally, replacing the old version
    if (::rename(tmpFilePath.c_str(), filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(replaceCpy("Cannot rename %x to %y.", "%x", fmtPath(tmpFilePath)), "%y", fmtPath(getItemName(filePath))), "rename");

    if (const std::optional<std::string> parentPath = getParentFolderPath(filePath))
        syncDirectory(*parentPath); //throw FileError
}
