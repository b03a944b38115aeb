// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef EXTRA_LOG_H_4470192836615047281
#define EXTRA_LOG_H_4470192836615047281

#include <mutex>
#include "error_log.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors in destructors
    - worker threads without a caller to report to                   */

namespace ferry
{
void logExtraError(const std::wstring& msg); //nothrow!

ErrorLog fetchExtraLog();







//######################## implementation ##########################
namespace impl
{
inline std::mutex globalExtraLogLock;
inline ErrorLog   globalExtraLog;
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    std::lock_guard dummy(impl::globalExtraLogLock);
    logMsg(impl::globalExtraLog, msg, LogLevel::error);
}


inline
ErrorLog fetchExtraLog()
{
    std::lock_guard dummy(impl::globalExtraLogLock);
    return std::exchange(impl::globalExtraLog, ErrorLog());
}
}

#endif //EXTRA_LOG_H_4470192836615047281
