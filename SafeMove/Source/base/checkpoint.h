// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef CHECKPOINT_H_1029384750192837
#define CHECKPOINT_H_1029384750192837

#include <optional>
#include <basis/file_error.h>


namespace sm
{
const char CHECKPOINT_FILE_NAME[] = "checkpoint.dat";

//aggregate progress counters: derived from the journal, never authoritative
struct Checkpoint
{
    uint64_t filesDone   = 0;
    uint64_t bytesDone   = 0;
    uint64_t filesFailed = 0; //permanently
    time_t   savedAt     = 0;
};

//none if missing; corrupted file => FileError
std::optional<Checkpoint> loadCheckpoint(const std::string& journalFolderPath); //throw FileError
void saveCheckpoint(const std::string& journalFolderPath, const Checkpoint& cp); //throw FileError
}

#endif //CHECKPOINT_H_1029384750192837
