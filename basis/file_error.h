// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef FILE_ERROR_H_839567308565656789
#define FILE_ERROR_H_839567308565656789

#include "sys_error.h" //we'll need this later anyway!


namespace basis
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::string& msg) : msg_(msg) {}
    FileError(const std::string& msg, const std::string& details) : msg_(msg + "\n\n" + details) {}
    virtual ~FileError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public basis::FileError { X(const std::string& msg) : FileError(msg) {} X(const std::string& msg, const std::string& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorMoveUnsupported) //rename() across devices
DEFINE_NEW_FILE_ERROR(ErrorDiskFull)        //ENOSPC, EDQUOT: worth retrying once space was freed


//errno must be evaluated *before* making any other (indirect) system calls, e.g. memory allocation for the message:
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const basis::ErrorCode ecInternal = basis::getLastError(); throw basis::FileError(msg, basis::formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::string for error messages --------------------

inline std::string fmtPath(const std::string& displayPath) { return '"' + displayPath + '"'; }
inline std::string fmtPath(const char* displayPath) { return fmtPath(std::string(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_839567308565656789
