#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: frame_timeline.hpp
    MODULE: rhi
    PURPOSE: Frames-in-flight fence emulation. Hands out monotonically increasing
             frame serials and tracks which of them the device has completed, so
             resources can be released only after their last user retired.
*/


#include <algorithm>
#include <cstdint>
#include <vector>

namespace tsaa
{
    struct FrameTimelineConfig
    {
        uint32_t frames_in_flight = 2;
    };

    struct FrameTimelineStats
    {
        uint64_t frames_begun = 0;
        uint64_t frames_submitted = 0;
        // begin_frame() had to wait for a slot's previous frame.
        uint64_t slot_waits = 0;
    };

    class FrameTimeline
    {
    public:
        explicit FrameTimeline(FrameTimelineConfig cfg = {})
        {
            configure(cfg);
        }

        void configure(FrameTimelineConfig cfg)
        {
            cfg_ = cfg;
            if (cfg_.frames_in_flight == 0) cfg_.frames_in_flight = 1;
            wait_idle();
            slots_.assign((size_t)cfg_.frames_in_flight, FrameSlot{});
        }

        // Waits for the frame that last used this slot, then opens a new serial.
        uint64_t begin_frame()
        {
            if (frame_open_) end_frame();
            const uint64_t serial = ++last_begun_;
            FrameSlot& slot = slots_[(size_t)(serial % slots_.size())];
            if (slot.in_flight && slot.serial > completed_)
            {
                ++stats_.slot_waits;
                complete_through(slot.serial);
            }
            slot.serial = serial;
            slot.in_flight = false;
            frame_open_ = true;
            ++stats_.frames_begun;
            return serial;
        }

        void end_frame()
        {
            if (!frame_open_) return;
            FrameSlot& slot = slots_[(size_t)(last_begun_ % slots_.size())];
            slot.in_flight = true;
            last_submitted_ = last_begun_;
            frame_open_ = false;
            ++stats_.frames_submitted;
        }

        // Device signalled completion of everything up to `serial`.
        void complete_through(uint64_t serial)
        {
            completed_ = std::max(completed_, std::min(serial, last_submitted_));
        }

        void wait_idle()
        {
            completed_ = std::max(completed_, last_submitted_);
        }

        uint64_t current_serial() const { return last_begun_; }
        uint64_t completed_serial() const { return completed_; }
        bool frame_open() const { return frame_open_; }
        uint32_t frames_in_flight() const { return cfg_.frames_in_flight; }
        const FrameTimelineStats& stats() const { return stats_; }

    private:
        struct FrameSlot
        {
            uint64_t serial = 0;
            bool in_flight = false;
        };

        FrameTimelineConfig cfg_{};
        std::vector<FrameSlot> slots_{};
        uint64_t last_begun_ = 0;
        uint64_t last_submitted_ = 0;
        uint64_t completed_ = 0;
        bool frame_open_ = false;
        FrameTimelineStats stats_{};
    };
}
