// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef RETURN_CODES_H_2741096358112847306
#define RETURN_CODES_H_2741096358112847306

#include <cassert>
#include <ferry/i18n.h>


namespace rff
{
enum RffReturnCode //as returned after process exit
{
    RFF_RC_SUCCESS = 0,
    RFF_RC_WARNING,
    RFF_RC_ERROR,
    RFF_RC_ABORTED,
    RFF_RC_EXCEPTION,
};


inline
void raiseReturnCode(RffReturnCode& rc, RffReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class RunResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
RffReturnCode mapToReturnCode(RunResult runStatus)
{
    switch (runStatus)
    {
        case RunResult::finishedSuccess:
            return RFF_RC_SUCCESS;
        case RunResult::finishedWarning:
            return RFF_RC_WARNING;
        case RunResult::finishedError:
            return RFF_RC_ERROR;
        case RunResult::aborted:
            return RFF_RC_ABORTED;
    }
    assert(false);
    return RFF_RC_ABORTED;
}


inline
std::wstring getFinalStatusLabel(RunResult finalStatus)
{
    switch (finalStatus)
    {
        case RunResult::finishedSuccess:
            return  _("Completed successfully");
        case RunResult::finishedWarning:
            return _("Completed with warnings");
        case RunResult::finishedError:
            return _("Completed with errors");
        case RunResult::aborted:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_2741096358112847306
