// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_48257827842345454545
#define PROCESS_CALLBACK_H_48257827842345454545

#include <string>
#include <cstdint>
#include <chrono>


namespace sm
{
constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100); //perform ui updates not more often than necessary

enum class ProcessPhase
{
    none, //initial status
    scan,
    migrate,
    prune,
};

/*  report status during migration
    - called from worker threads: implementations synchronize internally
    - must not throw: cancellation is requested via CancellationToken, never by throwing out of a callback  */
struct ProcessCallback
{
    virtual ~ProcessCallback() {}

    //estimated amount of data that will be processed in the next phase; -1: unknown
    virtual void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) = 0; //noexcept

    virtual void updateDataProcessed(int itemsDelta, int64_t bytesDelta) = 0; //noexcept
    /* the estimated and actual total workload may change during migration:
            1. items are discovered batch by batch
            2. restart of a partially copied file: bytes are copied again
            3. cross-device fallback: temp file copied a second time           */
    virtual void updateDataTotal    (int itemsDelta, int64_t bytesDelta) = 0; //noexcept

    //UI info only, should *not* be logged
    virtual void updateStatus(std::string&& msg) = 0; //noexcept

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    //log only; must *not* call updateStatus()!
    virtual void logMessage(const std::string& msg, MsgType type) = 0; //noexcept
};
}

#endif //PROCESS_CALLBACK_H_48257827842345454545
