// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_81704805908341534
#define STATUS_HANDLER_H_81704805908341534

#include <mutex>
#include <basis/error_log.h>
#include "base/process_callback.h"


namespace sm
{
bool uiUpdateDue(bool force = false); //test if a specific amount of time is over


struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;

    bool operator==(const ProgressStats&) const = default;
};


/*  console reporting for the command line tool:
    - log messages are collected and echoed to stderr immediately
    - status text and progress are refreshed on a single stderr line (terminal only)
    - called from worker threads: all access is serialized          */
class ConsoleStatusHandler : public ProcessCallback
{
public:
    explicit ConsoleStatusHandler(bool verbose);

    //implement ProcessCallback
    void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phase) override;
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override;
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override;
    void updateStatus(std::string&& msg) override;
    void logMessage(const std::string& msg, MsgType type) override;

    ProgressStats getStatsCurrent() const;
    ProgressStats getStatsTotal  () const;

    //merge errors from the extra log and hand over all messages collected so far
    basis::ErrorLog fetchLog();

private:
    void printProgress(); //caller holds lock
    void clearProgressLine(); //

    const bool verbose_;
    const bool progressVisible_; //stderr is a terminal

    mutable std::mutex lockStatus_;
    ProcessPhase currentPhase_ = ProcessPhase::none;
    ProgressStats statsCurrent_;
    ProgressStats statsTotal_ { -1, -1 };
    std::string statusText_;
    size_t progressLineLen_ = 0;
    basis::ErrorLog errorLog_;
};
}

#endif //STATUS_HANDLER_H_81704805908341534
