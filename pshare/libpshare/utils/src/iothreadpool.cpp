#include "iothreadpool.hpp"

namespace pshare::utils
{
IOThreadPool::IOThreadPool()
    : idle_thread_count_ {0}
    , busy_thread_count_ {0}
    , running_ {true}
{}

IOThreadPool::~IOThreadPool()
{
    {
        std::lock_guard lock {mutex_};
        running_ = false;
        for (auto &[job, completion_token] : pending_jobs_)
        {
            completion_token.cancel();
            completion_token.complete();
        }
        pending_jobs_.clear();
    }
    cv_job_available_.notify_all();

    for (auto &th : threads_)
    {
        th.join();
    }
}

CompletionToken IOThreadPool::add_job(Job &&job)
{
    CompletionToken completion_token;

    {
        std::lock_guard lock {mutex_};
        if (!running_)
        {
            completion_token.cancel();
            completion_token.complete();
            return completion_token;
        }

        pending_jobs_.emplace_back(std::move(job), completion_token);
        if (idle_thread_count_ < pending_jobs_.size())
        {
            threads_.emplace_back(&IOThreadPool::thread_routine, this);
        }
    }
    cv_job_available_.notify_one();

    return completion_token;
}

size_t IOThreadPool::thread_count() const
{
    std::lock_guard lock {mutex_};
    return threads_.size();
}

size_t IOThreadPool::busy_thread_count() const
{
    std::lock_guard lock {mutex_};
    return busy_thread_count_;
}

void IOThreadPool::wait_until_all_jobs_done()
{
    std::unique_lock lock {mutex_};
    cv_all_done_.wait(lock, [this] { return pending_jobs_.empty() && busy_thread_count_ == 0; });
}

void IOThreadPool::thread_routine()
{
    std::unique_lock lock {mutex_};

    for (;;)
    {
        ++idle_thread_count_;
        cv_job_available_.wait(lock, [this] { return !pending_jobs_.empty() || !running_; });
        --idle_thread_count_;

        if (!running_)
        {
            break;
        }

        auto [job, completion_token] = std::move(pending_jobs_.front());
        pending_jobs_.pop_front();
        ++busy_thread_count_;

        lock.unlock();
        if (!completion_token.is_cancelled())
        {
            job(completion_token);
        }
        completion_token.complete();
        lock.lock();

        --busy_thread_count_;
        if (pending_jobs_.empty() && busy_thread_count_ == 0)
        {
            cv_all_done_.notify_all();
        }
    }
}
}  // namespace pshare::utils
