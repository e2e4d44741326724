// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef LOG_FILE_H_931726432167489732164
#define LOG_FILE_H_931726432167489732164

#include <basis/error_log.h>
#include <basis/file_error.h>
#include "base/migration.h"


namespace sm
{
//header box with the run summary, followed by all log messages
std::string generateLogText(const MigrationResult& result, const basis::ErrorLog& log, bool dryRun);

//append to the (shared) log file of all runs; creates missing parent folders
void appendLogFile(const std::string& logFilePath, const MigrationResult& result, const basis::ErrorLog& log, bool dryRun); //throw FileError
}

#endif //LOG_FILE_H_931726432167489732164
