// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <cassert>
#include <string>


namespace sm
{
enum class SmExitCode //as returned on process exit
{
    success = 0, //all items DONE
    incomplete,  //permanently failed, deferred or stopped items left
    fatal,       //lock held, journal unavailable, invalid configuration
};


inline
void raiseExitCode(SmExitCode& rc, SmExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class TaskResult
{
    success,
    error,
    cancelled,
};


inline
std::string getTaskResultLabel(TaskResult result)
{
    switch (result)
    {
        //*INDENT-OFF*
        case TaskResult::success:   return "Completed successfully";
        case TaskResult::error:     return "Completed with errors";
        case TaskResult::cancelled: return "Stopped";
        //*INDENT-ON*
    }
    assert(false);
    return std::string();
}
}

#endif //RETURN_CODES_H_81307482137054156
