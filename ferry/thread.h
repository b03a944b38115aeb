// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef THREAD_H_9051837462018736205
#define THREAD_H_9051837462018736205

#include <mutex>
#include <thread>
#include <pthread.h>
#include "sys_error.h"


namespace ferry
{
class ThreadStopRequest {};

/*  std::thread joined on destruction

    the owner must make the worker return before destruction, e.g. by setting the
    AsyncStreamBuffer it blocks on into an error state of ThreadStopRequest           */
class WorkerThread
{
public:
    WorkerThread() {}
    WorkerThread           (WorkerThread&&    ) noexcept = default;
    WorkerThread& operator=(WorkerThread&& tmp) noexcept
    {
        if (stdThread_.joinable())
            stdThread_.join();
        stdThread_ = std::move(tmp.stdThread_);
        return *this;
    }

    template <class Function>
    explicit WorkerThread(Function&& f) :
        stdThread_([f = std::forward<Function>(f)]() mutable
    {
        try
        {
            f(); //throw ThreadStopRequest
        }
        catch (ThreadStopRequest&) {}
    }) {}

    ~WorkerThread()
    {
        if (stdThread_.joinable())
            stdThread_.join();
    }

private:
    std::thread stdThread_;
};


//serialize access to a shared value
template <class T>
class Protected
{
public:
    Protected() {}

    template <class Function>
    auto access(Function fun) //-> decltype(fun(std::declval<T&>()))
    {
        std::lock_guard dummy(lockValue_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lockValue_;
    T value_{};
};


inline
void setCurrentThreadName(const std::string& threadName)
{
    //Linux limits thread names to 16 bytes including null-termination
    if (const int rv = ::pthread_setname_np(::pthread_self(), threadName.substr(0, 15).c_str());
        rv != 0)
        logExtraError(formatSystemError("pthread_setname_np", rv));
}
}

#endif //THREAD_H_9051837462018736205
