// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_5906138274411206453
#define PROCESS_CALLBACK_H_5906138274411206453

#include <string>
#include <cstdint>
#include <chrono>


namespace rff
{
//report status during a transfer run; the core knows nothing about how it is rendered
struct ProcessCallback
{
    virtual ~ProcessCallback() {}

    //note: this one must NOT throw: called while unwinding a failed attempt
    virtual void updateDataProcessed(int itemsDelta, int64_t bytesDelta) = 0; //noexcept!

    //opportunity to abort must be implemented in a frequently-executed method like requestUiUpdate()
    virtual void requestUiUpdate(bool force = false) = 0; //throw X

    //UI info only, should *not* be logged
    virtual void updateStatus(const std::wstring& msg) = 0; //throw X

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    //log only; must *not* call updateStatus()!
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //throw X
};


constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100); //perform ui updates not more often than necessary
}

#endif //PROCESS_CALLBACK_H_5906138274411206453
