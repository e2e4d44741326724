// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "zlib_wrap.h"
#include <cstring>
#include <zlib.h>

using namespace basis;


namespace
{
std::string getZlibErrorLiteral(int sc)
{
    switch (sc)
    {
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_NEED_DICT);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_STREAM_END);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_OK);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_ERRNO);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_STREAM_ERROR);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_DATA_ERROR);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_MEM_ERROR);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_BUF_ERROR);
            BASIS_CHECK_CASE_FOR_CONSTANT(Z_VERSION_ERROR);

        default:
            return "zlib error " + numberTo<std::string>(sc);
    }
}

using SizeHeader = uint64_t; //portable number type!
}


#undef compress //mitigate zlib macro

std::string basis::compress(std::string_view stream, int level) //throw SysError
{
    std::string output;
    if (stream.empty()) //don't hand zlib a nullptr
        return output;

    const SizeHeader uncompressedSize = stream.size();
    const uLong bufferEstimate = ::compressBound(static_cast<uLong>(stream.size())); //larger than input size!

    output.resize(sizeof(uncompressedSize) + bufferEstimate);
    std::memcpy(output.data(), &uncompressedSize, sizeof(uncompressedSize));

    uLongf bytesWritten = bufferEstimate;
    const int rv = ::compress2(reinterpret_cast<Bytef*>(output.data() + sizeof(uncompressedSize)), &bytesWritten,
                               reinterpret_cast<const Bytef*>(stream.data()), static_cast<uLong>(stream.size()),
                               level);
    // Z_MEM_ERROR: not enough memory
    // Z_BUF_ERROR: not enough room in the output buffer
    if (rv != Z_OK || bytesWritten > bufferEstimate)
        throw SysError(formatSystemError("zlib compress2", getZlibErrorLiteral(rv), ""));

    output.resize(sizeof(uncompressedSize) + bytesWritten);
    output.shrink_to_fit(); //snapshots are kept in memory only briefly, but can be large
    return output;
}


std::string basis::decompress(std::string_view stream) //throw SysError
{
    std::string output;
    if (stream.empty())
        return output;

    SizeHeader uncompressedSize = 0;
    if (stream.size() < sizeof(uncompressedSize))
        throw SysError("zlib error: stream size < 8");

    std::memcpy(&uncompressedSize, stream.data(), sizeof(uncompressedSize));

    //output MUST NOT be empty, else zlib gets a nullptr => Z_STREAM_ERROR
    if (uncompressedSize == 0) //compress() maps empty -> empty, skipping zlib
        throw SysError("zlib error: uncompressed size == 0");

    try
    {
        output.resize(static_cast<size_t>(uncompressedSize)); //throw std::bad_alloc
    }
    //most likely due to data corruption:
    catch (const std::length_error& e) { throw SysError(std::string("zlib error: Out of memory. ") + e.what()); }
    catch (const    std::bad_alloc& e) { throw SysError(std::string("zlib error: Out of memory. ") + e.what()); }

    uLongf bytesWritten = static_cast<uLongf>(uncompressedSize);
    const int rv = ::uncompress(reinterpret_cast<Bytef*>(output.data()), &bytesWritten,
                                reinterpret_cast<const Bytef*>(stream.data() + sizeof(uncompressedSize)),
                                static_cast<uLong>(stream.size() - sizeof(uncompressedSize)));
    // Z_DATA_ERROR: input data was corrupted or incomplete
    if (rv != Z_OK)
        throw SysError(formatSystemError("zlib uncompress", getZlibErrorLiteral(rv), ""));

    if (bytesWritten != uncompressedSize)
        throw SysError(formatSystemError("zlib uncompress", "", "bytes written != uncompressed size."));

    return output;
}
