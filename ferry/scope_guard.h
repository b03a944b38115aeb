// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5830174613278450193
#define SCOPE_GUARD_H_5830174613278450193

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


//run cleanup code when leaving a scope, optionally only on success or only on failure
namespace ferry
{
/*  Usage:
        FERRY_ON_SCOPE_EXIT(::curl_easy_cleanup(handle));
        FERRY_ON_SCOPE_FAIL(session.removeFile(tmpPath));

    Caveat: cleanup code must not throw => log instead!                  */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ~ScopeGuard() noexcept(runMode != ScopeGuardRunMode::onSuccess)
    {
        if (!dismissed_)
        {
            if constexpr (runMode == ScopeGuardRunMode::onExit)
                fun_();
            else
            {
                const bool failed = std::uncaught_exceptions() > exceptionCount_;
                if ((runMode == ScopeGuardRunMode::onFail) == failed)
                    fun_();
            }
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define FERRY_CONCAT_SUB(X, Y) X ## Y
#define FERRY_CONCAT(X, Y) FERRY_CONCAT_SUB(X, Y)

//map enum constants to their (non-translated) names for error messages
#define FERRY_CHECK_CASE_FOR_CONSTANT(X) case X: return FERRY_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define FERRY_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define FERRY_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onExit   >([&]{ X; });
#define FERRY_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onFail   >([&]{ X; });
#define FERRY_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto FERRY_CONCAT(scopeGuard, __LINE__) = ferry::makeGuard<ferry::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_5830174613278450193
