// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace basis;


void basis::setCurrentThreadName(const std::string& threadName)
{
    //kernel limit: 16 bytes including the terminating null => longer names are truncated silently
    ::prctl(PR_SET_NAME, threadName.c_str(), 0, 0, 0);
}


namespace
{
//don't make this a function-scope static (avoid code-gen for "magic static")
const std::thread::id globalMainThreadId = std::this_thread::get_id();
}


bool basis::runningOnMainThread()
{
    if (globalMainThreadId == std::thread::id()) //if called during static initialization!
        return true;

    return std::this_thread::get_id() == globalMainThreadId;
}
