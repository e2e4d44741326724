// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef MIGRATION_ERROR_H_3948572094857203
#define MIGRATION_ERROR_H_3948572094857203

#include <basis/file_error.h>


namespace sm
{
//per item, retried with backoff: stalls, momentary I/O failures, disk full
DEFINE_NEW_FILE_ERROR(TransientIOError)
//size or digest mismatch: cleanup, bounded retries, then permanent failure
DEFINE_NEW_FILE_ERROR(CorruptionError)
//bookkeeping unavailable: fatal for the run
DEFINE_NEW_FILE_ERROR(JournalError)
//another run owns the journal: fatal, no side effects
DEFINE_NEW_FILE_ERROR(LockHeldError)

//atomic rename unsupported => copy + sync + remove fallback
using CrossDeviceError = basis::ErrorMoveUnsupported;
}

#endif //MIGRATION_ERROR_H_3948572094857203
