#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: context.hpp
    MODULE: core
    PURPOSE: Per-run context shared by every view: job system, frame counter, debug
             counters and the diagnostic event list filled when a pass degrades.
*/


#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "tsaa/core/log.hpp"
#include "tsaa/job/job_system.hpp"

namespace tsaa
{
    // Frame-level counters. Views add into it under Context's lock.
    struct AntiAliasingDebugStats
    {
        uint64_t smaa_edge_pixels = 0;
        uint64_t smaa_blended_pixels = 0;
        uint64_t taa_history_pixels = 0;
        uint64_t taa_disoccluded_pixels = 0;
        uint64_t taa_depth_rejected_pixels = 0;
        uint64_t passes_executed = 0;
        uint64_t passes_failed = 0;
        uint64_t history_reallocations = 0;

        void reset()
        {
            *this = AntiAliasingDebugStats{};
        }

        void accumulate(const AntiAliasingDebugStats& o)
        {
            smaa_edge_pixels += o.smaa_edge_pixels;
            smaa_blended_pixels += o.smaa_blended_pixels;
            taa_history_pixels += o.taa_history_pixels;
            taa_disoccluded_pixels += o.taa_disoccluded_pixels;
            taa_depth_rejected_pixels += o.taa_depth_rejected_pixels;
            passes_executed += o.passes_executed;
            passes_failed += o.passes_failed;
            history_reallocations += o.history_reallocations;
        }
    };

    struct AntiAliasingDiagnostic
    {
        uint64_t frame_index = 0;
        uint32_t view_id = 0;
        std::string pass_id{};
        std::string message{};
    };

    struct Context
    {
        IJobSystem* job_system = nullptr;
        uint64_t frame_index = 0;
        AntiAliasingDebugStats debug{};
        std::vector<AntiAliasingDiagnostic> diagnostics{};

        void begin_frame(uint64_t index)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            frame_index = index;
            debug.reset();
            diagnostics.clear();
        }

        // Logged as a warning and kept for external observability tooling until the
        // next begin_frame.
        void report_diagnostic(uint32_t view_id, std::string pass_id, std::string message)
        {
            log_warn("AA view " + std::to_string(view_id) + " pass '" + pass_id + "': " + message);
            std::lock_guard<std::mutex> lock(mtx_);
            diagnostics.push_back(AntiAliasingDiagnostic{frame_index, view_id, std::move(pass_id), std::move(message)});
        }

        void add_stats(const AntiAliasingDebugStats& stats)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            debug.accumulate(stats);
        }

    private:
        std::mutex mtx_{};
    };
}
