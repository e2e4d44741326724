// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_8971632487321434
#define SCOPE_GUARD_H_8971632487321434

#include <cassert>
#include <exception> //std::uncaught_exceptions
#include <type_traits>
#include <utility>


namespace basis
{
/*  Scope Guard

        auto guardFd = basis::makeGuard<ScopeGuardRunMode::onExit>([&] { ::close(fd); });
            ...
        guardFd.dismiss();

    Scope Exit:
        BASIS_ON_SCOPE_EXIT   (CleanUp());
        BASIS_ON_SCOPE_FAIL   (UndoTemporaryWork());              */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool /*failed*/, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onExit>)
{
    fun(); //throw X; caveat: must not throw while an exception is in flight => std::terminate
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onFail>) noexcept
{
    if (failed)
        fun(); //undo code must report its own errors via logExtraError(): throwing here means std::terminate
}


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exceptionCount_;
            runScopeGuardDestructor(fun_, failed, std::integral_constant<ScopeGuardRunMode, runMode>());
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define BASIS_CONCAT_SUB(X, Y) X ## Y
#define BASIS_CONCAT(X, Y) BASIS_CONCAT_SUB(X, Y)

#define BASIS_CHECK_CASE_FOR_CONSTANT(X) case X: return #X


#define BASIS_ON_SCOPE_EXIT(X) [[maybe_unused]] auto BASIS_CONCAT(scopeGuard, __LINE__) = basis::makeGuard<basis::ScopeGuardRunMode::onExit>([&]{ X; });
#define BASIS_ON_SCOPE_FAIL(X) [[maybe_unused]] auto BASIS_CONCAT(scopeGuard, __LINE__) = basis::makeGuard<basis::ScopeGuardRunMode::onFail>([&]{ X; });

#endif //SCOPE_GUARD_H_8971632487321434
