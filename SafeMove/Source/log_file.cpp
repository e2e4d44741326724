// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "log_file.h"
#include <basis/file_access.h>
#include <basis/file_io.h>

using namespace basis;
using namespace sm;


namespace
{
const int SEPARATION_LINE_LEN = 40;


std::string generateLogHeaderTxt(const MigrationResult& result, const ErrorLog& log, bool dryRun)
{
    const std::string tabSpace(4, ' ');

    std::string headerLine = std::string(dryRun ? "SafeMove (dry run) " : "SafeMove ") +
                             formatTime(formatDateTimeTag, std::chrono::system_clock::to_time_t(result.startTime));

    //assemble summary box
    std::vector<std::string> summary;
    summary.emplace_back();
    for (const std::string& line : splitCpy(formatSummary(result, dryRun), '\n', SplitOnEmpty::allow))
        summary.push_back(line.empty() ? line : tabSpace + line);

    const ErrorLogStats logCount = getStats(log);
    if (logCount.error   > 0) summary.push_back(tabSpace + "Errors: "   + numberTo<std::string>(logCount.error));
    if (logCount.warning > 0) summary.push_back(tabSpace + "Warnings: " + numberTo<std::string>(logCount.warning));

    size_t sepLineLen = 0; //calculate max width
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::string output = headerLine + '\n';
    output += std::string(sepLineLen + 1, '_') + '\n';

    for (const std::string& str : summary)
        output += '|' + str + '\n';

    output += '|' + std::string(sepLineLen, '_') + "\n\n";
    return output;
}
}


std::string sm::generateLogText(const MigrationResult& result, const ErrorLog& log, bool dryRun)
{
    return generateLogHeaderTxt(result, log, dryRun) +
           formatLog(log) +
           std::string(SEPARATION_LINE_LEN, '_') + "\n\n";
}


void sm::appendLogFile(const std::string& logFilePath, const MigrationResult& result, const ErrorLog& log, bool dryRun) //throw FileError
{
    const std::string logText = generateLogText(result, log, dryRun);

    if (const std::optional<std::string> parentPath = getParentFolderPath(logFilePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    FileOutputPlain logFile(logFilePath, FileOutputMode::resume); //throw FileError
    logFile.writeAt(logText.c_str(), logText.size(), logFile.getCurrentSize()); //throw FileError, ErrorDiskFull
    logFile.close(); //throw FileError
}
