// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <chrono>
#include <cstdio> //snprintf
#include <ctime>
#include <string>


namespace basis
{
//format strings for std::strftime()
inline const char* const formatDateTag     = "%Y-%m-%d"; //e.g. 2022-03-27
inline const char* const formatTimeTag     = "%H:%M:%S"; //e.g. 14:01:59
inline const char* const formatDateTimeTag = "%Y-%m-%d %H:%M:%S";

std::string formatTime(const char* format, time_t utcTime = std::time(nullptr)); //local time; returns empty string on error

std::string formatDuration(std::chrono::seconds duration); //e.g. "1:02:07"




//############################ implementation ##############################
inline
std::string formatTime(const char* format, time_t utcTime)
{
    struct tm localTime = {};
    if (!::localtime_r(&utcTime, &localTime)) //thread-safe, unlike std::localtime()
        return std::string();

    char buffer[128] = {};
    const size_t charsWritten = std::strftime(buffer, sizeof(buffer), format, &localTime);
    //"If the resulting string doesn't fit, zero is returned and the content of the buffer is indeterminate."
    return std::string(buffer, charsWritten);
}


inline
std::string formatDuration(std::chrono::seconds duration)
{
    const auto totalSec = duration.count() < 0 ? 0 : duration.count();
    const long long hours = totalSec / 3600;
    const long long mins  = totalSec / 60 % 60;
    const long long secs  = totalSec % 60;

    char buffer[64] = {};
    const int charsWritten = std::snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld", hours, mins, secs);
    return charsWritten > 0 ? std::string(buffer, charsWritten) : std::string();
}
}

#endif //TIME_H_8457092814324342453627
