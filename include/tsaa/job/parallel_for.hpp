#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: parallel_for.hpp
    MODULE: job
    PURPOSE: Row-range and per-item fan-out helpers over IJobSystem.
*/


#include <algorithm>
#include <cstddef>

#include "tsaa/job/job_system.hpp"

namespace tsaa
{
    // Splits [0, rows) into contiguous row bands. Runs inline when there is no job
    // system or the image is smaller than one band.
    template<typename Fn>
    inline void parallel_for_rows(IJobSystem* js, int rows, int min_rows_per_job, Fn&& fn)
    {
        if (rows <= 0) return;
        const int grain = std::max(1, min_rows_per_job);
        if (!js || rows <= grain)
        {
            fn(0, rows);
            return;
        }

        const int workers = (int)std::max<size_t>(1, js->worker_count());
        const int bands = std::max(1, std::min(workers * 2, (rows + grain - 1) / grain));
        const int band_rows = (rows + bands - 1) / bands;

        WaitGroup wg{};
        for (int y0 = 0; y0 < rows; y0 += band_rows)
        {
            const int y1 = std::min(rows, y0 + band_rows);
            wg.add(1);
            js->enqueue([y0, y1, &fn, &wg]() {
                fn(y0, y1);
                wg.done();
            });
        }
        wg.wait();
    }

    // One job per item. Used for independent views.
    template<typename Fn>
    inline void parallel_for_each_index(IJobSystem* js, size_t count, Fn&& fn)
    {
        if (count == 0) return;
        if (!js || count == 1)
        {
            for (size_t i = 0; i < count; ++i) fn(i);
            return;
        }

        WaitGroup wg{};
        for (size_t i = 0; i < count; ++i)
        {
            wg.add(1);
            js->enqueue([i, &fn, &wg]() {
                fn(i);
                wg.done();
            });
        }
        wg.wait();
    }
}
