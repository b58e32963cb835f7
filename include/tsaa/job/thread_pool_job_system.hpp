#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: thread_pool_job_system.hpp
    MODULE: job
    PURPOSE: Fixed-size worker pool backing the row-parallel kernels and the
             per-view fan-out of the anti-aliasing pipeline.
*/


#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "tsaa/job/job_system.hpp"

namespace tsaa
{
    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count)
        {
            const size_t n = worker_count == 0 ? 1 : worker_count;
            workers_.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                workers_.emplace_back([this]() { worker_loop(); });
            }
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                stopping_ = true;
            }
            work_cv_.notify_all();
            for (auto& w : workers_)
            {
                if (w.joinable()) w.join();
            }
        }

        void enqueue(std::function<void()> job) override
        {
            if (!job) return;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                queue_.push_back(std::move(job));
                ++unfinished_;
            }
            work_cv_.notify_one();
        }

        void wait_idle() override
        {
            std::unique_lock<std::mutex> lock(mtx_);
            idle_cv_.wait(lock, [this]() { return unfinished_ == 0; });
        }

        size_t worker_count() const override
        {
            return workers_.size();
        }

    private:
        void worker_loop()
        {
            for (;;)
            {
                std::function<void()> job{};
                {
                    std::unique_lock<std::mutex> lock(mtx_);
                    work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                    if (queue_.empty()) return;
                    job = std::move(queue_.front());
                    queue_.pop_front();
                }

                job();

                std::lock_guard<std::mutex> lock(mtx_);
                if (--unfinished_ == 0) idle_cv_.notify_all();
            }
        }

        std::vector<std::thread> workers_{};
        std::deque<std::function<void()>> queue_{};
        std::mutex mtx_{};
        std::condition_variable work_cv_{};
        std::condition_variable idle_cv_{};
        size_t unfinished_ = 0;
        bool stopping_ = false;
    };
}
