// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include <utility>
#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight (temp file cleanup after a failed copy)
    - destructors (closing a journal, releasing the run lock)
    - worker threads without a status handler at hand          */

namespace basis
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog) { reportOutstandingLog_ = reportOutstandingLog; }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void logError(const std::string& msg) { logMsg(log_, msg, MSG_TYPE_ERROR); }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


inline
Protected<ExtraLog>& refGlobalExtraLog()
{
    static Protected<ExtraLog> globalExtraLog; //"magic static": constructed on first use, destroyed after main()
    return globalExtraLog;
}
}


//"reportOutstandingLog" runs during global shutdown if errors were never fetched: nothrow!
inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
{
    impl::refGlobalExtraLog().access([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    return impl::refGlobalExtraLog().access([](impl::ExtraLog& el) { return el.fetchLog(); });
}


inline
void logExtraError(const std::string& msg) //nothrow!
{
    impl::refGlobalExtraLog().access([&](impl::ExtraLog& el) { el.logError(msg); });
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
