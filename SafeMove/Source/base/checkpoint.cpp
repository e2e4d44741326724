// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "checkpoint.h"
#include <algorithm>
#include <basis/crc.h>
#include <basis/file_io.h>

using namespace basis;
using namespace sm;


namespace
{
const char CHECKPOINT_DESCR[] = "SafeMove Checkpoint";
const int CHECKPOINT_VERSION = 1; //2026-10-19
}


std::optional<Checkpoint> sm::loadCheckpoint(const std::string& journalFolderPath) //throw FileError
{
    const std::string filePath = appendPath(journalFolderPath, CHECKPOINT_FILE_NAME);

    if (!itemExists(filePath)) //throw FileError
        return std::nullopt;

    const std::string byteStream = getFileContent(filePath); //throw FileError
    try
    {
        MemoryStreamIn streamIn(byteStream);

        char formatDescr[sizeof(CHECKPOINT_DESCR)] = {};
        readArray(streamIn, formatDescr, sizeof(formatDescr)); //throw SysErrorUnexpectedEos

        if (!std::equal(std::begin(formatDescr), std::end(formatDescr), std::begin(CHECKPOINT_DESCR)))
            throw SysError("File content is corrupted. (invalid header)");

        const int version = readNumber<int32_t>(streamIn); //throw SysErrorUnexpectedEos
        if (version != CHECKPOINT_VERSION)
            throw SysError("Unsupported data format. Version: " + numberTo<std::string>(version));

        if (byteStream.size() < sizeof(uint32_t))
            throw SysErrorUnexpectedEos();

        MemoryStreamOut crcStreamOut;
        writeNumber<uint32_t>(crcStreamOut, getCrc32(std::string_view(byteStream.data(), byteStream.size() - sizeof(uint32_t))));

        if (!endsWith(byteStream, crcStreamOut.ref()))
            throw SysError("File content is corrupted. (invalid checksum)");

        Checkpoint cp;
        cp.filesDone   = readNumber<uint64_t>(streamIn); //
        cp.bytesDone   = readNumber<uint64_t>(streamIn); //throw SysErrorUnexpectedEos
        cp.filesFailed = readNumber<uint64_t>(streamIn); //
        cp.savedAt     = readNumber<int64_t >(streamIn); //
        return cp;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(filePath)), e.toString()); }
}


void sm::saveCheckpoint(const std::string& journalFolderPath, const Checkpoint& cp) //throw FileError
{
    MemoryStreamOut streamOut;
    writeArray(streamOut, CHECKPOINT_DESCR, sizeof(CHECKPOINT_DESCR));
    writeNumber<int32_t>(streamOut, CHECKPOINT_VERSION);

    writeNumber<uint64_t>(streamOut, cp.filesDone);
    writeNumber<uint64_t>(streamOut, cp.bytesDone);
    writeNumber<uint64_t>(streamOut, cp.filesFailed);
    writeNumber<int64_t >(streamOut, cp.savedAt);

    writeNumber<uint32_t>(streamOut, getCrc32(streamOut.ref()));

    setFileContent(appendPath(journalFolderPath, CHECKPOINT_FILE_NAME), streamOut.ref()); //throw FileError
}
