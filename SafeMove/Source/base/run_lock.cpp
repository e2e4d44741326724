// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "run_lock.h"
#include <algorithm>
#include <utility>
#include <basis/crc.h>
#include <basis/extra_log.h>
#include <basis/file_io.h>
#include <basis/guid.h>
#include <basis/scope_guard.h>
#include <sys/file.h> //flock()
#include <fcntl.h>    //open()
#include <unistd.h>   //close()
#include <pwd.h>      //getpwuid_r()
#include "structures.h"

using namespace basis;
using namespace sm;


namespace
{
const char LOCK_FILE_DESCR[] = "SafeMove Lock";
const int LOCK_FILE_VERSION = 1; //2026-10-19


struct LockInformation
{
    std::string lockId; //16 byte GUID

    std::string computerName; //format: HostName.DomainName
    std::string userId;

    uint64_t sessionId = 0; //session of the process, NOT the user
    uint64_t processId = 0;

    uint32_t rootPairKey = 0; //CRC32 of source and target root
};


std::string getLoginUser() //throw FileError
{
    const uid_t userIdNo = ::getuid(); //never fails

    std::vector<char> buf(std::max<long>(10000, ::sysconf(_SC_GETPW_R_SIZE_MAX)));
    struct passwd buf2 = {};
    struct passwd* pwEntry = nullptr;
    if (const int rv = ::getpwuid_r(userIdNo, &buf2, buf.data(), buf.size(), &pwEntry);
        rv != 0 || !pwEntry)
    {
        //e.g. container without passwd entry
        if (std::optional<std::string> user = getEnvironmentVar("USER"))
            return *user;
        return numberTo<std::string>(userIdNo);
    }
    return pwEntry->pw_name;
}


LockInformation getLockInfoFromCurrentProcess(uint32_t rootPairKey) //throw FileError
{
    LockInformation lockInfo =
    {
        .lockId = generateGUID(),
        .userId = getLoginUser(), //throw FileError
        .rootPairKey = rootPairKey,
    };

    std::vector<char> buf(10000);
    if (::gethostname(buf.data(), buf.size()) != 0)
        THROW_LAST_FILE_ERROR("Cannot get process information.", "gethostname");
    lockInfo.computerName = std::string("Linux ") + buf.data() + '.';

    if (::getdomainname(buf.data(), buf.size()) != 0)
        THROW_LAST_FILE_ERROR("Cannot get process information.", "getdomainname");
    lockInfo.computerName += buf.data(); //can be "(none)"!

    lockInfo.processId = ::getpid(); //never fails

    const pid_t procSid = ::getsid(0);
    if (procSid < 0)
        THROW_LAST_FILE_ERROR("Cannot get process information.", "getsid");
    lockInfo.sessionId = procSid;

    return lockInfo;
}


std::string serialize(const LockInformation& lockInfo)
{
    MemoryStreamOut streamOut;
    writeArray(streamOut, LOCK_FILE_DESCR, sizeof(LOCK_FILE_DESCR));
    writeNumber<int32_t>(streamOut, LOCK_FILE_VERSION);

    writeContainer(streamOut, lockInfo.lockId);
    writeContainer(streamOut, lockInfo.computerName);
    writeContainer(streamOut, lockInfo.userId);
    writeNumber<uint64_t>(streamOut, lockInfo.sessionId);
    writeNumber<uint64_t>(streamOut, lockInfo.processId);
    writeNumber<uint32_t>(streamOut, lockInfo.rootPairKey);

    writeNumber<uint32_t>(streamOut, getCrc32(streamOut.ref()));
    writeArray(streamOut, "x", 1); //sentinel: mark logical end with a non-space character
    return streamOut.ref();
}


LockInformation unserialize(const std::string& byteStream) //throw SysError
{
    MemoryStreamIn streamIn(byteStream);

    char formatDescr[sizeof(LOCK_FILE_DESCR)] = {};
    readArray(streamIn, &formatDescr, sizeof(formatDescr)); //throw SysErrorUnexpectedEos

    if (!std::equal(std::begin(formatDescr), std::end(formatDescr), std::begin(LOCK_FILE_DESCR)))
        throw SysError("File content is corrupted. (invalid header)");

    const int version = readNumber<int32_t>(streamIn); //throw SysErrorUnexpectedEos
    if (version != LOCK_FILE_VERSION)
        throw SysError("Unsupported data format. Version: " + numberTo<std::string>(version));

    //catch data corruption ASAP + don't rely on std::bad_alloc for consistency checking
    const size_t posEnd = byteStream.rfind('x'); //skip blanks (+ unrelated corrupted data e.g. nulls!)
    if (posEnd == std::string::npos || posEnd < sizeof(uint32_t))
        throw SysErrorUnexpectedEos();

    const std::string_view byteStreamTrm(byteStream.data(), posEnd);

    MemoryStreamOut crcStreamOut;
    writeNumber<uint32_t>(crcStreamOut, getCrc32(byteStreamTrm.substr(0, byteStreamTrm.size() - sizeof(uint32_t))));

    if (!endsWith(byteStreamTrm, crcStreamOut.ref()))
        throw SysError("File content is corrupted. (invalid checksum)");

    LockInformation lockInfo = {};
    lockInfo.lockId       = readContainer<std::string>(streamIn); //
    lockInfo.computerName = readContainer<std::string>(streamIn); //SysErrorUnexpectedEos
    lockInfo.userId       = readContainer<std::string>(streamIn); //
    lockInfo.sessionId    = readNumber<uint64_t>(streamIn);
    lockInfo.processId    = readNumber<uint64_t>(streamIn);
    lockInfo.rootPairKey  = readNumber<uint32_t>(streamIn);
    return lockInfo;
}


std::string formatLockOwner(const LockInformation& lockInfo)
{
    return "Computer: " + lockInfo.computerName + '\n' +
           "User: "     + lockInfo.userId + '\n' +
           "Process ID: " + numberTo<std::string>(lockInfo.processId);
}


uint32_t getRootPairKey(const std::string& sourceRoot, const std::string& targetRoot)
{
    Crc32Accumulator acc;
    acc.update(sourceRoot);
    acc.update(std::string_view("\0", 1));
    acc.update(targetRoot);
    return acc.get();
}


//returns locked file descriptor; "lockedMsg" describes the resource for LockHeldError
int acquireLockFile(const std::string& lockFilePath, uint32_t rootPairKey, const std::string& lockedMsg) //throw FileError, LockHeldError
{
    const std::string errorMsg = replaceCpy("Cannot set directory lock for %x.", "%x", fmtPath(lockFilePath));

    if (const std::optional<std::string> parentPath = getParentFolderPath(lockFilePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    int fdLocked = -1;
    for (;;)
    {
        const int fd = ::open(lockFilePath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd == -1)
            THROW_LAST_FILE_ERROR(errorMsg, "open");
        BASIS_ON_SCOPE_FAIL(::close(fd));

        if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            const ErrorCode ec = getLastError(); //copy before directly/indirectly making other system calls!
            if (ec != EWOULDBLOCK)
                throw FileError(errorMsg, formatSystemError("flock", ec));

            std::string ownerDescr;
            try
            {
                ownerDescr = sm::impl::getLockOwnerDescription(lockFilePath); //throw FileError
            }
            catch (const FileError& e) { ownerDescr = e.toString(); } //owner may be writing its information just now

            throw LockHeldError(lockedMsg, ownerDescr);
        }

        //previous owner may have unlinked the file between our open() and flock() => lock on a dead inode
        struct stat fdInfo = {};
        if (::fstat(fd, &fdInfo) != 0)
            THROW_LAST_FILE_ERROR(errorMsg, "fstat");

        struct stat pathInfo = {};
        if (::stat(lockFilePath.c_str(), &pathInfo) != 0 ||
            pathInfo.st_ino != fdInfo.st_ino || pathInfo.st_dev != fdInfo.st_dev)
        {
            ::close(fd);
            continue;
        }

        fdLocked = fd;
        break;
    }
    BASIS_ON_SCOPE_FAIL(::unlink(lockFilePath.c_str()); ::close(fdLocked));

    const std::string byteStream = serialize(getLockInfoFromCurrentProcess(rootPairKey)); //throw FileError

    if (::ftruncate(fdLocked, 0) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write file %x.", "%x", fmtPath(lockFilePath)), "ftruncate");

    for (size_t bytesWritten = 0; bytesWritten < byteStream.size();)
    {
        const ssize_t rv = ::pwrite(fdLocked, byteStream.data() + bytesWritten, byteStream.size() - bytesWritten, bytesWritten);
        if (rv < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_FILE_ERROR(replaceCpy("Cannot write file %x.", "%x", fmtPath(lockFilePath)), "pwrite");
        }
        bytesWritten += rv;
    }
    return fdLocked;
}


void releaseLockFile(int& fdLocked, const std::string& lockFilePath) //throw FileError
{
    if (fdLocked == -1)
        return;

    const int fd = std::exchange(fdLocked, -1);
    BASIS_ON_SCOPE_EXIT(::close(fd)); //releases flock()

    //unlink while still holding the lock: a waiting process detects the stale inode
    if (::unlink(lockFilePath.c_str()) != 0 && errno != ENOENT)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot delete file %x.", "%x", fmtPath(lockFilePath)), "unlink");
}
}


std::string sm::impl::getPairLockFilePath(const std::string& sourceRoot, const std::string& targetRoot)
{
    return appendPath(appendPath(targetRoot, DEFAULT_JOURNAL_FOLDER_NAME),
                      "run-" + printNumber<uint32_t>("%08x", getRootPairKey(sourceRoot, targetRoot)) + ".lock");
}


std::string sm::impl::getLockOwnerDescription(const std::string& lockFilePath) //throw FileError
{
    const std::string byteStream = getFileContent(lockFilePath); //throw FileError
    try
    {
        return formatLockOwner(unserialize(byteStream)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(lockFilePath)), e.toString());
    }
}


RunLock::RunLock(const std::string& journalFolderPath, const std::string& sourceRoot, const std::string& targetRoot) : //throw FileError, LockHeldError
    pairLockPath_(impl::getPairLockFilePath(sourceRoot, targetRoot)),
    journalLockPath_(appendPath(journalFolderPath, RUN_LOCK_FILE_NAME))
{
    const uint32_t rootPairKey = getRootPairKey(sourceRoot, targetRoot);

    //root pair first: two runs on the same roots would share temp files, regardless of their journals
    fdPair_ = acquireLockFile(pairLockPath_, rootPairKey, replaceCpy(replaceCpy("The folder pair %x -> %y is in use by another process.",
                                                                                "%x", fmtPath(sourceRoot)), "%y", fmtPath(targetRoot))); //throw FileError, LockHeldError
    BASIS_ON_SCOPE_FAIL(try { releaseLockFile(fdPair_, pairLockPath_); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    fdJournal_ = acquireLockFile(journalLockPath_, rootPairKey, replaceCpy("The journal %x is in use by another process.",
                                                                           "%x", fmtPath(journalFolderPath))); //throw FileError, LockHeldError
}


RunLock::~RunLock()
{
    try
    {
        release(); //throw FileError
    }
    catch (const FileError& e) { logExtraError(e.toString()); }
}


void RunLock::release() //throw FileError
{
    BASIS_ON_SCOPE_EXIT(try { releaseLockFile(fdPair_, pairLockPath_); } //throw FileError
    catch (const FileError& e) { logExtraError(e.toString()); });

    releaseLockFile(fdJournal_, journalLockPath_); //throw FileError
}
