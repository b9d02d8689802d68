#ifndef PSHARE_UTILS_IOTHREADPOOL_HPP_
#define PSHARE_UTILS_IOTHREADPOOL_HPP_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "executer.hpp"

namespace pshare::utils
{
// Executer for blocking work. A new worker thread is spawned whenever a job is added and no
// worker is idle, so jobs never wait behind each other.
class IOThreadPool : public Executer
{
public:
    IOThreadPool();
    IOThreadPool(const IOThreadPool &) = delete;
    IOThreadPool &operator=(const IOThreadPool &) = delete;
    ~IOThreadPool() override;

    CompletionToken add_job(Job &&job) override;

    [[nodiscard]] size_t thread_count() const;
    [[nodiscard]] size_t busy_thread_count() const;
    void                 wait_until_all_jobs_done();

private:
    void thread_routine();

    std::vector<std::thread>                    threads_;
    std::deque<std::pair<Job, CompletionToken>> pending_jobs_;
    size_t                                      idle_thread_count_;
    size_t                                      busy_thread_count_;
    bool                                        running_;
    mutable std::mutex                          mutex_;
    std::condition_variable                     cv_job_available_;
    std::condition_variable                     cv_all_done_;
};
}  // namespace pshare::utils

#endif  // PSHARE_UTILS_IOTHREADPOOL_HPP_
