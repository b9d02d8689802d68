#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "iothreadpool.hpp"

using namespace ::pshare::utils;
using namespace ::testing;

namespace
{
class IOThreadPoolTest : public Test
{
protected:
    static void RunTest(int total_jobs)
    {
        std::mutex              mut;
        std::condition_variable cv;

        int                       done_jobs = 0;
        std::chrono::milliseconds job_duration {100};
        std::chrono::milliseconds timeout {job_duration * 5};

        IOThreadPool thread_pool;

        for (int i = 0; i != total_jobs; ++i)
        {
            thread_pool.add_job([&](const CompletionToken &) {
                std::this_thread::sleep_for(job_duration);
                {
                    std::lock_guard lock {mut};
                    ++done_jobs;
                }
                cv.notify_one();
            });
        }

        // Blocking jobs run side by side, so the whole batch takes about one job duration
        std::unique_lock lock {mut};
        bool done = cv.wait_for(lock, timeout, [&] { return total_jobs == done_jobs; });
        EXPECT_TRUE(done);
    }
};
}  // namespace

TEST_F(IOThreadPoolTest, FewJobs)
{
    RunTest(3);
}

TEST_F(IOThreadPoolTest, ManyJobs)
{
    RunTest(50);
}

TEST_F(IOThreadPoolTest, WaitUntilAllJobsDone)
{
    const int        total_jobs = 10;
    std::atomic<int> done_jobs {0};
    IOThreadPool     thread_pool;

    for (int i = 0; i != total_jobs; ++i)
    {
        thread_pool.add_job([&](const CompletionToken &) {
            std::this_thread::sleep_for(std::chrono::milliseconds {10});
            ++done_jobs;
        });
    }

    thread_pool.wait_until_all_jobs_done();
    EXPECT_EQ(done_jobs, total_jobs);
    EXPECT_EQ(thread_pool.busy_thread_count(), 0);
}

TEST_F(IOThreadPoolTest, IdleThreadsAreReused)
{
    IOThreadPool thread_pool;

    for (int i = 0; i != 5; ++i)
    {
        thread_pool.add_job([](const CompletionToken &) {});
        thread_pool.wait_until_all_jobs_done();
    }

    EXPECT_EQ(thread_pool.thread_count(), 1);
}

TEST_F(IOThreadPoolTest, CompletionTokenSignalsJobEnd)
{
    bool         executed = false;
    IOThreadPool thread_pool;

    auto token = thread_pool.add_job([&](const CompletionToken &) { executed = true; });

    EXPECT_TRUE(token.wait_for_completion(std::chrono::milliseconds {1000}));
    EXPECT_TRUE(executed);
    EXPECT_FALSE(token.is_cancelled());
}
