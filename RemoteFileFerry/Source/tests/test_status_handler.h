// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TEST_STATUS_HANDLER_H_5729104836615203948
#define TEST_STATUS_HANDLER_H_5729104836615203948

#include <functional>
#include <ferry/time.h>
#include "../base/status_handler.h"


namespace rff
{
class TestStatusHandler : public StatusHandler
{
public:
    std::function<void(TestStatusHandler& handler)> onUiUpdate; //e.g. call userRequestAbort()

    void forceUiUpdateNoThrow() override
    {
        if (onUiUpdate)
            onUiUpdate(*this);
    }
};


inline
time_t makeUtcTime(int year, int month, int day, int hour, int minute, int second)
{
    return ferry::utcToTimeT({year, month, day, hour, minute, second}).first;
}
}

#endif //TEST_STATUS_HANDLER_H_5729104836615203948
