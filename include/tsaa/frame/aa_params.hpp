#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: aa_params.hpp
    MODULE: frame
    PURPOSE: Per-view anti-aliasing parameter blocks. Immutable within a frame, the
             host may hand a different block to each frame.
*/


#include <cstdint>

namespace tsaa
{
    enum class SmaaPreset : uint8_t
    {
        Low = 0,
        Medium = 1,
        High = 2,
        Ultra = 3
    };

    enum class SmaaEdgeMode : uint8_t
    {
        Luma = 0,
        Color = 1
    };

    enum class TaaClampMode : uint8_t
    {
        // Clip toward the mean of a YCoCg box at mean +- gamma * stddev.
        VarianceClip = 0,
        // Plain RGB min/max box of the 3x3 neighborhood.
        MinMax = 1
    };

    enum class TaaHistoryFilter : uint8_t
    {
        CatmullRom = 0,
        Bilinear = 1
    };

    // Which color TAA consumes when SMAA is also enabled.
    enum class TaaInputSource : uint8_t
    {
        PostSmaa = 0,
        PreSmaa = 1
    };

    struct SmaaParams
    {
        bool enable = false;
        SmaaPreset preset = SmaaPreset::High;
        SmaaEdgeMode edge_mode = SmaaEdgeMode::Luma;
        // Negative values keep the preset's constant.
        float threshold_override = -1.0f;
        int max_search_steps_override = -1;
        int corner_rounding_override = -1;
        float local_contrast_adaptation_factor = 2.0f;
    };

    struct TaaParams
    {
        bool enable = false;
        // Weight of history for moving or freshly reset pixels.
        float history_blend = 0.9f;
        // Lower bound of the current-frame weight once confidence accumulates.
        float min_current_weight = 0.015f;
        TaaClampMode clamp_mode = TaaClampMode::VarianceClip;
        // 0 keeps the reprojected history, 1 applies the full clamp.
        float clamp_strength = 1.0f;
        float variance_gamma = 1.0f;
        float depth_reject_threshold = 0.01f;
        bool accumulate_confidence = true;
        float static_motion_threshold_px = 0.01f;
        bool tonemapped_blend = true;
        TaaHistoryFilter history_filter = TaaHistoryFilter::CatmullRom;
        bool dilate_velocity = true;
        bool reset_on_camera_cut = true;
        TaaInputSource input_source = TaaInputSource::PostSmaa;
    };

    struct JitterParams
    {
        bool enable = true;
        uint32_t sequence_length = 8;
        float scale = 1.0f;
        // Texture LOD bias hint for the rasterizer while TAA is active.
        float mip_bias = -1.0f;
    };

    struct AntiAliasingParams
    {
        SmaaParams smaa{};
        TaaParams taa{};
        JitterParams jitter{};
    };
}
