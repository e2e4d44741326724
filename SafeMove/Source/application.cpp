// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include <csignal>
#include <iostream>
#include <basis/extra_log.h>
#include <basis/open_ssl.h>
#include "base/migration.h"
#include "command_line.h"
#include "log_file.h"
#include "status_handler.h"

using namespace basis;
using namespace sm;


namespace
{
CancellationToken globalCancel; //set asynchronously by signal handler


void onStopSignal(int sig)
{
    globalCancel.requestStop();
    //second Ctrl+C: terminate right away; the journal is crash-safe
    ::signal(sig, SIG_DFL);
}


void notifyAppError(const std::string& msg)
{
    std::cerr << "Error: " + msg + '\n';
}
}


int main(int argc, char* argv[])
{
    //errors that could not be reported otherwise, e.g. journal cleanup during stack unwinding
    initExtraLog([](const ErrorLog& log)
    {
        std::cerr << formatLog(log); //don't call functions depending on global state (which might be destroyed already!)
    });

    openSslInit();

    for (const int sig : {SIGINT, SIGTERM}) //"graceful" exit requested, unlike SIGKILL
        if (::signal(sig, onStopSignal) == SIG_ERR)
            logExtraError("Error during process initialization.\n\n" + formatSystemError(sig == SIGINT ? "signal(SIGINT)" : "signal(SIGTERM)", getLastError()));

    CommandLine cmdLine;
    try
    {
        cmdLine = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc)); //throw FileError
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        std::cerr << "Run \"SafeMove --help\" for usage.\n";
        return static_cast<int>(SmExitCode::fatal);
    }

    if (cmdLine.showHelp)
    {
        std::cout << getSyntaxHelp();
        return static_cast<int>(SmExitCode::success);
    }

    ConsoleStatusHandler statusHandler(cmdLine.verbose);
    if (!cmdLine.configWarning.empty())
        statusHandler.logMessage(cmdLine.configWarning, ProcessCallback::MsgType::warning);

    SmExitCode exitCode = SmExitCode::success;
    std::optional<MigrationResult> result;
    try
    {
        result = runMigration(cmdLine.settings, globalCancel, statusHandler); //throw FileError, LockHeldError, JournalError
        raiseExitCode(exitCode, getExitCode(*result));
    }
    catch (const FileError& e) //lock held, journal unavailable, invalid settings: nothing left to report but the error
    {
        statusHandler.logMessage(e.toString(), ProcessCallback::MsgType::error);
        raiseExitCode(exitCode, SmExitCode::fatal);
    }

    const ErrorLog log = statusHandler.fetchLog();

    if (result)
    {
        std::cout << formatSummary(*result, cmdLine.settings.dryRun);

        if (!cmdLine.settings.dryRun)
            try
            {
                const MoveSettings settings = getNormalizedSettings(cmdLine.settings); //throw FileError
                appendLogFile(settings.logFilePath, *result, log, false /*dryRun*/); //throw FileError
            }
            catch (const FileError& e)
            {
                notifyAppError(e.toString());
                raiseExitCode(exitCode, SmExitCode::incomplete);
            }
    }

    if (ErrorLog extraLog = fetchExtraLog(); //errors raised during log file creation
        !extraLog.empty())
        std::cerr << formatLog(extraLog);

    return static_cast<int>(exitCode);
}
