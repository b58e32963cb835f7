#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: job_system.hpp
    MODULE: job
    PURPOSE: Job submission interface and a wait group used to join fan-out work.
*/


#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace tsaa
{
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void enqueue(std::function<void()> job) = 0;
        virtual void wait_idle() = 0;
        virtual size_t worker_count() const = 0;
    };

    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            pending_.fetch_add(n, std::memory_order_relaxed);
        }

        void done()
        {
            if (pending_.fetch_sub(1, std::memory_order_acq_rel) != 1) return;
            std::lock_guard<std::mutex> lock(mtx_);
            cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return pending_.load(std::memory_order_acquire) == 0; });
        }

        int pending() const
        {
            return pending_.load(std::memory_order_acquire);
        }

    private:
        std::atomic<int> pending_{0};
        std::mutex mtx_{};
        std::condition_variable cv_{};
    };
}
