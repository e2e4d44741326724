// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef THREAD_H_7896323423432235246427
#define THREAD_H_7896323423432235246427

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "string_tools.h"


namespace basis
{
void setCurrentThreadName(const std::string& threadName);

bool runningOnMainThread();

//------------------------------------------------------------------------------------------

/*  std::async replacement: guaranteed to run asynchronously, and the returned std::future does NOT block in its destructor
    => lets the caller give up on a stalled system call (e.g. fsync() on a hung NFS mount) while the detached thread finishes later

    Example:
            auto ft = basis::runAsync([fd] { return ::fsync(fd); });
            if (ft.wait_for(std::chrono::seconds(30)) != std::future_status::ready)
                //stalled                                                                        */
template <class Function>
auto runAsync(Function&& fun);

//------------------------------------------------------------------------------------------

//value associated with mutex and guaranteed protected access:
template <class T>
class Protected
{
public:
    Protected() {}
    explicit Protected(const T& value) : value_(value) {}

    template <class Function>
    auto access(Function fun)
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

//------------------------------------------------------------------------------------------

/*  FIFO worker pool: at most "threadCountMax" threads, started lazily when work arrives
    - tasks must not throw: report errors via the caller's own channel
    - ~ThreadGroup() finishes the current task of each thread, discards the rest and joins  */
template <class Function>
class ThreadGroup
{
public:
    ThreadGroup(size_t threadCountMax, const std::string& groupName) : threadCountMax_(threadCountMax), groupName_(groupName)
    { if (threadCountMax == 0) throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!"); }

    ThreadGroup           (ThreadGroup&& tmp) noexcept = default; //required for std::vector<ThreadGroup>
    ThreadGroup& operator=(ThreadGroup&& tmp) = delete;

    ~ThreadGroup()
    {
        if (workLoad_) //null after move
        {
            {
                std::lock_guard dummy(workLoad_->lock);
                workLoad_->shutdown = true;
            }
            workLoad_->conditionNewTask.notify_all();
        }
        for (std::thread& w : worker_)
            w.join();
    }

    //context of controlling thread, non-blocking:
    void run(Function&& task)
    {
        {
            std::lock_guard dummy(workLoad_->lock);

            workLoad_->tasks.push_back(std::move(task));
            const size_t tasksPending = ++(workLoad_->tasksPending);

            if (worker_.size() < std::min(tasksPending, threadCountMax_))
                addWorkerThread();
        }
        workLoad_->conditionNewTask.notify_all();
    }

    //context of controlling thread, blocking:
    void wait()
    {
        std::unique_lock dummy(workLoad_->lock);
        workLoad_->conditionAllDone.wait(dummy, [&workLoad = *workLoad_] { return workLoad.tasksPending == 0; });
    }

private:
    ThreadGroup           (const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    struct WorkLoad
    {
        std::mutex lock;
        std::deque<Function> tasks; //FIFO
        size_t tasksPending = 0;
        bool shutdown = false;
        std::condition_variable conditionNewTask;
        std::condition_variable conditionAllDone;
    };

    void addWorkerThread()
    {
        std::string threadName = groupName_ + '[' + numberTo<std::string>(worker_.size() + 1) + ']';

        worker_.emplace_back([workLoad = workLoad_ /*share ownership!*/, threadName = std::move(threadName)] //don't capture "this"! ThreadGroup is movable
        {
            setCurrentThreadName(threadName);

            std::unique_lock dummy(workLoad->lock);
            for (;;)
            {
                workLoad->conditionNewTask.wait(dummy, [&wl = *workLoad] { return wl.shutdown || !wl.tasks.empty(); });
                if (workLoad->shutdown)
                    return;

                Function task = std::move(workLoad->tasks.front());
                /**/                      workLoad->tasks.pop_front();

                dummy.unlock();
                task();
                dummy.lock();

                if (--(workLoad->tasksPending) == 0)
                    workLoad->conditionAllDone.notify_all();
            }
        });
    }

    std::vector<std::thread> worker_;
    std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>();
    size_t threadCountMax_;
    std::string groupName_;
};








//###################### implementation ######################

template <class Function> inline
auto runAsync(Function&& fun)
{
    using ResultType = decltype(fun());

    //std::packaged_task requires a copy-constructible function object: share ownership otherwise
    auto sharedFun = std::make_shared<std::decay_t<Function>>(std::forward<Function>(fun));

    std::packaged_task<ResultType()> pt([sharedFun] { return (*sharedFun)(); });
    auto fut = pt.get_future();
    std::thread(std::move(pt)).detach(); //~thread() calls std::terminate() if joinable()!
    return fut;
}
}

#endif //THREAD_H_7896323423432235246427
