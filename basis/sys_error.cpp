// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#include "sys_error.h"
#include <cstring> //strerror_r

using namespace basis;


namespace
{
std::string formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes a file mover actually runs into; everything else is printed numerically
    {
            BASIS_CHECK_CASE_FOR_CONSTANT(EPERM);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOENT);
            BASIS_CHECK_CASE_FOR_CONSTANT(ESRCH);
            BASIS_CHECK_CASE_FOR_CONSTANT(EINTR);
            BASIS_CHECK_CASE_FOR_CONSTANT(EIO);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENXIO);
            BASIS_CHECK_CASE_FOR_CONSTANT(EBADF);
            BASIS_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            BASIS_CHECK_CASE_FOR_CONSTANT(EACCES);
            BASIS_CHECK_CASE_FOR_CONSTANT(EFAULT);
            BASIS_CHECK_CASE_FOR_CONSTANT(EBUSY);
            BASIS_CHECK_CASE_FOR_CONSTANT(EEXIST);
            BASIS_CHECK_CASE_FOR_CONSTANT(EXDEV);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENODEV);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            BASIS_CHECK_CASE_FOR_CONSTANT(EISDIR);
            BASIS_CHECK_CASE_FOR_CONSTANT(EINVAL);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENFILE);
            BASIS_CHECK_CASE_FOR_CONSTANT(EMFILE);
            BASIS_CHECK_CASE_FOR_CONSTANT(ETXTBSY);
            BASIS_CHECK_CASE_FOR_CONSTANT(EFBIG);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            BASIS_CHECK_CASE_FOR_CONSTANT(ESPIPE);
            BASIS_CHECK_CASE_FOR_CONSTANT(EROFS);
            BASIS_CHECK_CASE_FOR_CONSTANT(EMLINK);
            BASIS_CHECK_CASE_FOR_CONSTANT(ERANGE);
            BASIS_CHECK_CASE_FOR_CONSTANT(EDEADLK);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOLCK);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            BASIS_CHECK_CASE_FOR_CONSTANT(ELOOP);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENODATA);
            BASIS_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            BASIS_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            BASIS_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            BASIS_CHECK_CASE_FOR_CONSTANT(ESTALE);
            BASIS_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            BASIS_CHECK_CASE_FOR_CONSTANT(ECANCELED);
            BASIS_CHECK_CASE_FOR_CONSTANT(EREMOTEIO);
            BASIS_CHECK_CASE_FOR_CONSTANT(ENOMEDIUM);

        default:
            return "Error code " + numberTo<std::string>(ec);
    }
}
}


std::string basis::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    BASIS_ON_SCOPE_EXIT(errno = ecCurrent);

    char buffer[256] = {};
    //GNU variant: may or may not use the buffer, but always returns a valid string
    const char* errorMsg = ::strerror_r(ec, buffer, sizeof(buffer));

    return trimCpy(errorMsg ? errorMsg : "");
}


std::string basis::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::string basis::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output = trimCpy(errorCode);

    const std::string errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += ": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += " [" + functionName + ']';

    return trimCpy(output);
}
