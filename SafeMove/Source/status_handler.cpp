// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "status_handler.h"
#include <cstdio>
#include <utility>
#include <unistd.h> //isatty
#include <basis/extra_log.h>

using namespace basis;
using namespace sm;


namespace
{
std::chrono::steady_clock::time_point lastExec; //accessed under ConsoleStatusHandler::lockStatus_ only

const size_t STATUS_TEXT_MAX = 100;


std::string getPhaseLabel(ProcessPhase phase)
{
    switch (phase)
    {
        case ProcessPhase::none:
            return std::string();
        case ProcessPhase::scan:
            return "Scanning";
        case ProcessPhase::migrate:
            return "Moving";
        case ProcessPhase::prune:
            return "Cleaning up";
    }
    assert(false);
    return std::string();
}


std::string formatProgress(const ProgressStats& current, const ProgressStats& total)
{
    std::string output = numberTo<std::string>(current.items);
    if (total.items >= 0)
        output += '/' + numberTo<std::string>(total.items);
    output += " items, " + numberTo<std::string>(current.bytes / (1024 * 1024));
    if (total.bytes >= 0)
        output += '/' + numberTo<std::string>(total.bytes / (1024 * 1024));
    return output + " MiB";
}
}


bool sm::uiUpdateDue(bool force)
{
    const auto now = std::chrono::steady_clock::now();

    if (now >= lastExec + UI_UPDATE_INTERVAL || force)
    {
        lastExec = now;
        return true;
    }
    return false;
}


ConsoleStatusHandler::ConsoleStatusHandler(bool verbose) :
    verbose_(verbose),
    progressVisible_(::isatty(STDERR_FILENO) != 0) {}


void ConsoleStatusHandler::initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phase)
{
    assert((itemsTotal < 0) == (bytesTotal < 0));
    std::lock_guard dummy(lockStatus_);
    currentPhase_ = phase;
    statsCurrent_ = {};
    statsTotal_ = { itemsTotal, bytesTotal };
}


void ConsoleStatusHandler::updateDataProcessed(int itemsDelta, int64_t bytesDelta)
{
    std::lock_guard dummy(lockStatus_);
    statsCurrent_.items += itemsDelta;
    statsCurrent_.bytes += bytesDelta;
    if (uiUpdateDue())
        printProgress();
}


void ConsoleStatusHandler::updateDataTotal(int itemsDelta, int64_t bytesDelta)
{
    std::lock_guard dummy(lockStatus_);
    //totals start out unknown: items are discovered batch by batch
    if (statsTotal_.items < 0) statsTotal_ = {};

    statsTotal_.items += itemsDelta;
    statsTotal_.bytes += bytesDelta;
}


void ConsoleStatusHandler::updateStatus(std::string&& msg)
{
    std::lock_guard dummy(lockStatus_);
    statusText_ = std::move(msg);
    if (uiUpdateDue())
        printProgress();
}


void ConsoleStatusHandler::logMessage(const std::string& msg, MsgType type)
{
    const MessageType msgType = [&]
    {
        switch (type)
        {
            case MsgType::info:
                return MSG_TYPE_INFO;
            case MsgType::warning:
                return MSG_TYPE_WARNING;
            case MsgType::error:
                break;
        }
        return MSG_TYPE_ERROR;
    }();

    std::lock_guard dummy(lockStatus_);
    logMsg(errorLog_, msg, msgType);

    if (msgType != MSG_TYPE_INFO || verbose_)
    {
        clearProgressLine();
        const std::string msgFmt = formatMessage(errorLog_.back());
        std::fwrite(msgFmt.c_str(), 1, msgFmt.size(), stderr);
        std::fflush(stderr);
    }
}


ProgressStats ConsoleStatusHandler::getStatsCurrent() const
{
    std::lock_guard dummy(lockStatus_);
    return statsCurrent_;
}


ProgressStats ConsoleStatusHandler::getStatsTotal() const
{
    std::lock_guard dummy(lockStatus_);
    return statsTotal_;
}


ErrorLog ConsoleStatusHandler::fetchLog()
{
    std::lock_guard dummy(lockStatus_);
    clearProgressLine();

    //append "extra" log for errors that could not otherwise be reported:
    if (ErrorLog extraLog = fetchExtraLog();
        !extraLog.empty())
        mergeLog(errorLog_, std::move(extraLog));

    return std::exchange(errorLog_, ErrorLog());
}


void ConsoleStatusHandler::printProgress()
{
    if (!progressVisible_)
        return;

    std::string line = getPhaseLabel(currentPhase_);
    if (!line.empty())
        line += ": ";
    line += formatProgress(statsCurrent_, statsTotal_);

    if (!statusText_.empty())
    {
        line += "  " + statusText_;
        if (line.size() > STATUS_TEXT_MAX)
            line = line.substr(0, STATUS_TEXT_MAX - 3) + "...";
    }

    std::string output = '\r' + line;
    if (line.size() < progressLineLen_)
        output.append(progressLineLen_ - line.size(), ' ');
    progressLineLen_ = line.size();

    std::fwrite(output.c_str(), 1, output.size(), stderr);
    std::fflush(stderr);
}


void ConsoleStatusHandler::clearProgressLine()
{
    if (progressLineLen_ > 0)
    {
        const std::string output = '\r' + std::string(progressLineLen_, ' ') + '\r';
        std::fwrite(output.c_str(), 1, output.size(), stderr);
        progressLineLen_ = 0;
    }
}
