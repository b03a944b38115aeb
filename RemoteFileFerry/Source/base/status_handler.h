// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_6630982147520938461
#define STATUS_HANDLER_H_6630982147520938461

#include <atomic>
#include <functional>
#include <thread>
#include <ferry/error_log.h>
#include "process_callback.h"


namespace rff
{
//Exception class used to abort the transfer run
class AbortProcess {};


struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;

    bool operator==(const ProgressStats&) const = default;
};


//partial callback implementation with common functionality: error log, statistics, abort request
class StatusHandler : public ProcessCallback
{
public:
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override //noexcept
    {
        statsCurrent_.items += itemsDelta;
        statsCurrent_.bytes += bytesDelta;
    }

    void requestUiUpdate(bool force) final //throw AbortProcess
    {
        const auto now = std::chrono::steady_clock::now();
        if (force || now >= lastUiUpdate_ + UI_UPDATE_INTERVAL)
        {
            lastUiUpdate_ = now;
            forceUiUpdateNoThrow();

            //triggered by userRequestAbort() => sufficient to evaluate occasionally
            if (abortRequested_)
                throw AbortProcess();
        }
    }

    virtual void forceUiUpdateNoThrow() = 0; //noexcept

    void updateStatus(const std::wstring& msg) final //throw AbortProcess
    {
        statusText_ = msg; //update *before* running operations that can throw
        requestUiUpdate(false /*force*/); //throw AbortProcess
    }

    void logMessage(const std::wstring& msg, MsgType type) final //noexcept: usable while handling AbortProcess
    {
        ferry::logMsg(errorLog_, msg, [&]
        {
            switch (type)
            {
                case MsgType::info:
                    return ferry::LogLevel::info;
                case MsgType::warning:
                    return ferry::LogLevel::warning;
                case MsgType::error:
                    break;
            }
            return ferry::LogLevel::error;
        }());
        onNewLogEntry(errorLog_.back());
    }

    //may be called from any thread, e.g. a signal handler trampoline
    void userRequestAbort() { abortRequested_ = true; }
    bool abortIsRequested() const { return abortRequested_; }

    ProgressStats getStatsCurrent() const { return statsCurrent_; }
    const std::wstring& currentStatusText() const { return statusText_; }
    const ferry::ErrorLog& getErrorLog() const { return errorLog_; }

protected:
    virtual void onNewLogEntry(const ferry::LogEntry& /*entry*/) {} //e.g. echo to console

private:
    ProgressStats statsCurrent_;
    std::wstring statusText_;
    ferry::ErrorLog errorLog_;
    std::chrono::steady_clock::time_point lastUiUpdate_;

    std::atomic<bool> abortRequested_{false};
};

//------------------------------------------------------------------------------------------

//wait between retries: keep the status line alive and give the user a chance to cancel
inline
void delayAndCountDown(const std::wstring& operationName, std::chrono::seconds delay, const std::function<void(const std::wstring& msg)>& notifyStatus /*throw X*/)
{
    assert(!ferry::endsWith(operationName, L"."));

    const auto delayUntil = std::chrono::steady_clock::now() + delay;
    for (auto now = std::chrono::steady_clock::now(); now < delayUntil; now = std::chrono::steady_clock::now())
    {
        const auto timeMs = std::chrono::duration_cast<std::chrono::milliseconds>(delayUntil - now).count();
        if (notifyStatus)
            notifyStatus(operationName + L"... " + ferry::replaceCpy(_("%x sec"), L"%x", ferry::numberTo<std::wstring>((timeMs + 999) / 1000))); //throw X

        std::this_thread::sleep_for(UI_UPDATE_INTERVAL / 2);
    }
}
}

#endif //STATUS_HANDLER_H_6630982147520938461
