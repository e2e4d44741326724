// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef VERIFIER_H_0823745092387450923
#define VERIFIER_H_0823745092387450923

#include <vector>
#include <basis/open_ssl.h>
#include <basis/serialize.h>
#include "migration_error.h"


namespace sm
{
//digest algorithms accepted for "--digest": resolved once at configuration time
const std::vector<std::string>& getDigestAlgorithms(); //"sha256" first = default
bool isSupportedDigest(std::string_view algorithm);

//exact size + digest match is the only success criterion
void verifyCopy(const std::string& filePath, uint64_t actualSize, const std::string& actualDigest,
                uint64_t expectedSize, const std::string& expectedDigest /*empty: size check only*/); //throw CorruptionError

/*  read the first "byteCount" bytes once and continue the digest from there:
    - used on resume to validate the partial digest recorded in the journal
    - short file => CorruptionError                                               */
basis::HashContext rehashPrefix(const std::string& filePath, uint64_t byteCount, const std::string& algorithm,
                                size_t chunkSize, const basis::IoCallback& notifyIo /*optional*/); //throw FileError, CorruptionError

//digest of the complete file (sparse regions are hashed as zeros without reading them)
std::string hashFile(const std::string& filePath, const std::string& algorithm,
                     size_t chunkSize, const basis::IoCallback& notifyIo /*optional*/); //throw FileError
}

#endif //VERIFIER_H_0823745092387450923
