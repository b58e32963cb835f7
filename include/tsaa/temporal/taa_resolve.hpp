#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: taa_resolve.hpp
    MODULE: temporal
    PURPOSE: TAA resolve kernel. Reprojects history with per-pixel velocity, rejects
             disoccluded or depth-mismatched history, clamps it into the current 3x3
             neighborhood and blends with confidence-driven weights.
*/


#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <string>

#include <glm/glm.hpp>

#include "tsaa/core/result.hpp"
#include "tsaa/frame/aa_params.hpp"
#include "tsaa/gfx/color_math.hpp"
#include "tsaa/gfx/sampling.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/job/parallel_for.hpp"

namespace tsaa
{
    inline constexpr float kTaaConfidenceStep = 10.0f;

    struct TaaResolveInputs
    {
        const ColorTexture* current = nullptr;
        const DepthTexture* depth = nullptr;
        const VelocityTexture* velocity = nullptr;
        const ColorTexture* history_color = nullptr;
        const DepthTexture* history_depth = nullptr;
        // False forces current color only (reset, camera cut, first frame, resize).
        bool history_valid = false;
    };

    struct TaaResolveOutputs
    {
        ColorTexture* color = nullptr;
        ColorTexture* history_color = nullptr;
        DepthTexture* history_depth = nullptr;
    };

    enum class TaaPixelOutcome : uint8_t
    {
        Accumulated = 0,
        Reset = 1,
        Disoccluded = 2,
        DepthRejected = 3
    };

    struct TaaPixelResult
    {
        glm::vec4 color{0.0f};
        float confidence = 1.0f;
        // Depth the pixel was tested with; stored to the history depth slot.
        float depth = 1.0f;
        TaaPixelOutcome outcome = TaaPixelOutcome::Reset;
    };

    struct TaaResolveStats
    {
        uint64_t accumulated_pixels = 0;
        uint64_t reset_pixels = 0;
        uint64_t disoccluded_pixels = 0;
        uint64_t depth_rejected_pixels = 0;
    };

    // Playdead-style clip of `q` toward the center of [box_min, box_max].
    inline glm::vec3 clip_toward_box_center(const glm::vec3& q, const glm::vec3& box_min, const glm::vec3& box_max)
    {
        const glm::vec3 center = 0.5f * (box_max + box_min);
        const glm::vec3 half = 0.5f * (box_max - box_min) + glm::vec3(1e-5f);
        const glm::vec3 v = q - center;
        const glm::vec3 unit = glm::abs(v / half);
        const float m = std::max(unit.x, std::max(unit.y, unit.z));
        return m > 1.0f ? center + v / m : q;
    }

    struct TaaNeighborhood
    {
        glm::vec3 rgb_min{0.0f};
        glm::vec3 rgb_max{0.0f};
        glm::vec3 ycocg_mean{0.0f};
        glm::vec3 ycocg_stddev{0.0f};
        glm::ivec2 closest{0};
        float closest_depth = 1.0f;
    };

    // 3x3 statistics in the blend space (tonemapped or linear), plus the closest-depth
    // texel used for velocity dilation.
    inline TaaNeighborhood taa_gather_neighborhood(
        const ColorTexture& current,
        const DepthTexture& depth,
        int x,
        int y,
        bool tonemapped)
    {
        TaaNeighborhood n{};
        n.closest = glm::ivec2(x, y);
        n.closest_depth = depth.at(x, y);
        n.rgb_min = glm::vec3(1e30f);
        n.rgb_max = glm::vec3(-1e30f);

        glm::vec3 m1(0.0f);
        glm::vec3 m2(0.0f);
        for (int dy = -1; dy <= 1; ++dy)
        {
            for (int dx = -1; dx <= 1; ++dx)
            {
                glm::vec3 c = glm::vec3(current.at_clamped(x + dx, y + dy));
                if (tonemapped) c = tonemap_reversible(c);
                n.rgb_min = glm::min(n.rgb_min, c);
                n.rgb_max = glm::max(n.rgb_max, c);
                const glm::vec3 ycocg = rgb_to_ycocg(c);
                m1 += ycocg;
                m2 += ycocg * ycocg;

                const int sx = std::clamp(x + dx, 0, depth.w - 1);
                const int sy = std::clamp(y + dy, 0, depth.h - 1);
                const float d = depth.at(sx, sy);
                if (d < n.closest_depth)
                {
                    n.closest_depth = d;
                    n.closest = glm::ivec2(sx, sy);
                }
            }
        }
        n.ycocg_mean = m1 / 9.0f;
        n.ycocg_stddev = glm::sqrt(glm::max(m2 / 9.0f - n.ycocg_mean * n.ycocg_mean, glm::vec3(0.0f)));
        return n;
    }

    // Smallest |history_depth - depth| over the 3x3 history texels around (hx, hy).
    inline float taa_history_depth_error(const DepthTexture& history_depth, int hx, int hy, float depth)
    {
        float best = 1e30f;
        for (int dy = -1; dy <= 1; ++dy)
        {
            for (int dx = -1; dx <= 1; ++dx)
            {
                best = std::min(best, std::abs(history_depth.at_clamped(hx + dx, hy + dy) - depth));
            }
        }
        return best;
    }

    inline glm::vec3 taa_clamp_history(const glm::vec3& history, const TaaNeighborhood& n, const TaaParams& p)
    {
        glm::vec3 clamped{};
        if (p.clamp_mode == TaaClampMode::MinMax)
        {
            clamped = glm::clamp(history, n.rgb_min, n.rgb_max);
        }
        else
        {
            const glm::vec3 g = n.ycocg_stddev * std::max(0.0f, p.variance_gamma);
            const glm::vec3 q = clip_toward_box_center(rgb_to_ycocg(history), n.ycocg_mean - g, n.ycocg_mean + g);
            clamped = ycocg_to_rgb(q);
        }
        return glm::mix(history, clamped, std::clamp(p.clamp_strength, 0.0f, 1.0f));
    }

    // Pure per-pixel resolve. Every texture in `in` must share one extent.
    inline TaaPixelResult taa_resolve_pixel(const TaaResolveInputs& in, const TaaParams& p, int x, int y)
    {
        const glm::vec4 center = in.current->at(x, y);
        const TaaNeighborhood n = taa_gather_neighborhood(*in.current, *in.depth, x, y, p.tonemapped_blend);
        const float cur_depth = p.dilate_velocity ? n.closest_depth : in.depth->at(x, y);
        if (!in.history_valid)
        {
            return TaaPixelResult{center, 1.0f, cur_depth, TaaPixelOutcome::Reset};
        }

        const glm::ivec2 vel_px = p.dilate_velocity ? n.closest : glm::ivec2(x, y);
        const glm::vec2 velocity = in.velocity->at(vel_px.x, vel_px.y);

        const glm::vec2 extent((float)in.current->w, (float)in.current->h);
        const glm::vec2 uv = (glm::vec2((float)x, (float)y) + glm::vec2(0.5f)) / extent;
        const glm::vec2 history_pos = (uv - velocity) * extent;
        if (!(history_pos.x >= 0.0f && history_pos.y >= 0.0f && history_pos.x < extent.x && history_pos.y < extent.y))
        {
            return TaaPixelResult{center, 1.0f, cur_depth, TaaPixelOutcome::Disoccluded};
        }

        const int hx = std::min((int)history_pos.x, in.current->w - 1);
        const int hy = std::min((int)history_pos.y, in.current->h - 1);
        if (taa_history_depth_error(*in.history_depth, hx, hy, cur_depth) > std::max(0.0f, p.depth_reject_threshold))
        {
            return TaaPixelResult{center, 1.0f, cur_depth, TaaPixelOutcome::DepthRejected};
        }

        glm::vec3 history = (p.history_filter == TaaHistoryFilter::CatmullRom)
            ? glm::vec3(sample_catmull_rom(*in.history_color, history_pos))
            : glm::vec3(sample_bilinear(*in.history_color, history_pos));
        history = glm::max(history, glm::vec3(0.0f));
        const float prev_confidence = std::max(1.0f, in.history_color->at(hx, hy).a);

        glm::vec3 current_rgb = glm::vec3(center);
        if (p.tonemapped_blend)
        {
            current_rgb = tonemap_reversible(current_rgb);
            history = tonemap_reversible(history);
        }
        history = taa_clamp_history(history, n, p);

        const float motion_px = glm::length(velocity * extent);
        float confidence = 1.0f;
        if (p.accumulate_confidence && motion_px < p.static_motion_threshold_px)
        {
            confidence = prev_confidence + kTaaConfidenceStep;
        }

        const float max_current = std::clamp(1.0f - p.history_blend, 0.0f, 1.0f);
        float current_weight = max_current;
        if (p.accumulate_confidence)
        {
            const float min_current = std::min(std::max(0.0f, p.min_current_weight), max_current);
            current_weight = std::clamp(1.0f / confidence, min_current, max_current);
        }

        glm::vec3 blended = glm::mix(history, current_rgb, current_weight);
        if (p.tonemapped_blend) blended = tonemap_reversible_inverse(blended);
        return TaaPixelResult{glm::vec4(blended, center.a), confidence, cur_depth, TaaPixelOutcome::Accumulated};
    }

    inline Status validate_taa_resolve_io(const TaaResolveInputs& in, const TaaResolveOutputs& out)
    {
        if (!in.current || !in.depth || !in.velocity) return status_error("TAA resolve missing color, depth or velocity input");
        if (!out.color || !out.history_color || !out.history_depth) return status_error("TAA resolve missing output target");
        if (!in.history_color || !in.history_depth) return status_error("TAA resolve missing history read slot");
        if (out.color == in.current) return status_error("TAA resolve output aliases its input");
        if (out.history_color == in.history_color) return status_error("TAA resolve history read and write alias");

        const TextureExtent e = in.current->extent();
        if (!e.valid()) return status_error("TAA resolve input has zero extent");
        if (in.depth->extent() != e || in.velocity->extent() != e)
        {
            return status_error("TAA resolve depth/velocity extent does not match color");
        }
        if (out.color->extent() != e || out.history_color->extent() != e || out.history_depth->extent() != e)
        {
            return status_error("TAA resolve output extent does not match color");
        }
        if (in.history_valid && (in.history_color->extent() != e || in.history_depth->extent() != e))
        {
            return status_error("TAA resolve history extent does not match color");
        }
        return status_ok();
    }

    inline Result<TaaResolveStats> run_taa_resolve(
        IJobSystem* js,
        const TaaResolveInputs& in,
        const TaaResolveOutputs& out,
        const TaaParams& params)
    {
        const Status io = validate_taa_resolve_io(in, out);
        if (!io.ok) return io.forward_error<TaaResolveStats>();

        std::atomic<uint64_t> accumulated{0};
        std::atomic<uint64_t> reset{0};
        std::atomic<uint64_t> disoccluded{0};
        std::atomic<uint64_t> rejected{0};

        const int w = in.current->w;
        const int h = in.current->h;
        parallel_for_rows(js, h, 16, [&](int y0, int y1) {
            uint64_t counts[4] = {0, 0, 0, 0};
            for (int y = y0; y < y1; ++y)
            {
                for (int x = 0; x < w; ++x)
                {
                    const TaaPixelResult r = taa_resolve_pixel(in, params, x, y);
                    out.color->at(x, y) = r.color;
                    out.history_color->at(x, y) = glm::vec4(glm::vec3(r.color), r.confidence);
                    out.history_depth->at(x, y) = r.depth;
                    ++counts[(int)r.outcome];
                }
            }
            accumulated.fetch_add(counts[0], std::memory_order_relaxed);
            reset.fetch_add(counts[1], std::memory_order_relaxed);
            disoccluded.fetch_add(counts[2], std::memory_order_relaxed);
            rejected.fetch_add(counts[3], std::memory_order_relaxed);
        });

        TaaResolveStats stats{};
        stats.accumulated_pixels = accumulated.load();
        stats.reset_pixels = reset.load();
        stats.disoccluded_pixels = disoccluded.load();
        stats.depth_rejected_pixels = rejected.load();
        return Result<TaaResolveStats>::success(stats);
    }
}
