// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef ZLIB_WRAP_H_428597064566
#define ZLIB_WRAP_H_428597064566

#include "sys_error.h"


namespace basis
{
/*  in-memory deflate for journal snapshots

    stream layout: [uint64 uncompressed size][zlib stream]
    => empty input maps to empty output, zlib is skipped

    compression level must be between 0 and 9:
    0: no compression
    9: best compression                                      */
std::string compress(std::string_view stream, int level); //throw SysError

std::string decompress(std::string_view stream); //throw SysError
}

#endif //ZLIB_WRAP_H_428597064566
