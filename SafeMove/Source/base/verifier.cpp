// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "verifier.h"
#include <algorithm>
#include <basis/file_io.h>

using namespace basis;
using namespace sm;


namespace
{
//hash [0, byteCount): holes are fed as zeros without reading them
void hashFileRange(FileInputPlain& fileIn, HashContext& ctx, uint64_t byteCount, size_t chunkSize, const IoCallback& notifyIo) //throw FileError
{
    if (chunkSize == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    std::vector<char> buffer(chunkSize);

    try
    {
        for (uint64_t pos = 0; pos < byteCount;)
        {
            const uint64_t dataBegin = std::min(fileIn.findNextData(pos).value_or(byteCount), byteCount); //throw FileError
            if (dataBegin > pos)
            {
                ctx.updateZeros(dataBegin - pos); //throw SysError
                pos = dataBegin;
                continue;
            }

            const uint64_t dataEnd = std::min(fileIn.findNextHole(pos), byteCount); //throw FileError
            while (pos < dataEnd)
            {
                const size_t bytesToRead = static_cast<size_t>(std::min<uint64_t>(dataEnd - pos, buffer.size()));
                const size_t bytesRead = fileIn.readAt(buffer.data(), bytesToRead, pos); //throw FileError
                if (bytesRead != bytesToRead) //file shrunk concurrently
                    throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(fileIn.getFilePath())),
                                    "Unexpected end of file at offset " + numberTo<std::string>(pos + bytesRead) + '.');

                ctx.update(buffer.data(), bytesRead); //throw SysError
                pos += bytesRead;

                if (notifyIo) notifyIo(bytesRead); //throw X
            }
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot calculate checksum of %x.", "%x", fmtPath(fileIn.getFilePath())), e.toString()); }
}
}


const std::vector<std::string>& sm::getDigestAlgorithms()
{
    static const std::vector<std::string> algorithms
    {
        "sha256",
        "sha512",
        "sha3-256",
        "blake2b512",
        "sha1",
        "md5",
    };
    return algorithms;
}


bool sm::isSupportedDigest(std::string_view algorithm)
{
    const auto& algos = getDigestAlgorithms();
    return std::find(algos.begin(), algos.end(), algorithm) != algos.end() &&
           isDigestAvailable(std::string(algorithm)); //OpenSSL build may lack some (FIPS)
}


void sm::verifyCopy(const std::string& filePath, uint64_t actualSize, const std::string& actualDigest,
                    uint64_t expectedSize, const std::string& expectedDigest) //throw CorruptionError
{
    const std::string errorMsg = replaceCpy("Verification of %x failed.", "%x", fmtPath(filePath));

    if (actualSize != expectedSize)
        throw CorruptionError(errorMsg, replaceCpy(replaceCpy("Size mismatch: %x bytes expected, %y bytes copied.",
                                                              "%x", numberTo<std::string>(expectedSize)),
                                                   "%y", numberTo<std::string>(actualSize)));
    if (actualDigest.empty())
        throw CorruptionError(errorMsg, "Content digest is missing.");

    if (!expectedDigest.empty() && !equalAsciiNoCase(actualDigest, expectedDigest))
        throw CorruptionError(errorMsg, replaceCpy(replaceCpy("Digest mismatch: %x expected, %y calculated.",
                                                              "%x", expectedDigest),
                                                   "%y", actualDigest));
}


HashContext sm::rehashPrefix(const std::string& filePath, uint64_t byteCount, const std::string& algorithm,
                             size_t chunkSize, const IoCallback& notifyIo) //throw FileError, CorruptionError
{
    HashContext ctx = [&]
    {
        try { return HashContext(algorithm); /*throw SysError*/ }
        catch (const SysError& e) { throw FileError(replaceCpy("Cannot calculate checksum of %x.", "%x", fmtPath(filePath)), e.toString()); }
    }();

    FileInputPlain fileIn(filePath); //throw FileError

    const uint64_t fileSize = fileIn.getCurrentSize(); //throw FileError
    if (fileSize < byteCount)
        throw CorruptionError(replaceCpy("Verification of %x failed.", "%x", fmtPath(filePath)),
                              replaceCpy(replaceCpy("File has %x bytes, at least %y bytes expected.",
                                                    "%x", numberTo<std::string>(fileSize)),
                                         "%y", numberTo<std::string>(byteCount)));

    hashFileRange(fileIn, ctx, byteCount, chunkSize, notifyIo); //throw FileError
    return ctx;
}


std::string sm::hashFile(const std::string& filePath, const std::string& algorithm,
                         size_t chunkSize, const IoCallback& notifyIo) //throw FileError
{
    try
    {
        HashContext ctx(algorithm); //throw SysError

        FileInputPlain fileIn(filePath); //throw FileError
        hashFileRange(fileIn, ctx, fileIn.getCurrentSize() /*throw FileError*/, chunkSize, notifyIo); //throw FileError

        return ctx.finalizeHex(); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot calculate checksum of %x.", "%x", fmtPath(filePath)), e.toString()); }
}
