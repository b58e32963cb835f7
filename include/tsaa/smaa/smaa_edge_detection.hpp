#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: smaa_edge_detection.hpp
    MODULE: smaa
    PURPOSE: SMAA first pass. Marks left/top edges from luma or color contrast with
             local contrast adaptation.
*/


#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "tsaa/core/result.hpp"
#include "tsaa/frame/aa_params.hpp"
#include "tsaa/frame/aa_presets.hpp"
#include "tsaa/gfx/color_math.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/job/parallel_for.hpp"

namespace tsaa
{
    namespace detail
    {
        template<typename DeltaFn>
        inline glm::vec2 smaa_detect_edges(
            const ColorTexture& color,
            int x,
            int y,
            float threshold,
            float local_contrast_factor,
            DeltaFn&& delta)
        {
            const glm::vec4& c = color.at(x, y);
            const glm::vec4& left = color.at_clamped(x - 1, y);
            const glm::vec4& top = color.at_clamped(x, y - 1);

            const float d_left = delta(c, left);
            const float d_top = delta(c, top);
            glm::vec2 edges(d_left >= threshold ? 1.0f : 0.0f, d_top >= threshold ? 1.0f : 0.0f);
            if (edges.x == 0.0f && edges.y == 0.0f) return edges;

            const float d_right = delta(c, color.at_clamped(x + 1, y));
            const float d_bottom = delta(c, color.at_clamped(x, y + 1));
            const float d_left_left = delta(left, color.at_clamped(x - 2, y));
            const float d_top_top = delta(top, color.at_clamped(x, y - 2));
            const float max_delta = std::max({d_left, d_top, d_right, d_bottom, d_left_left, d_top_top});

            // A stronger neighboring edge hides a weaker one.
            if (max_delta > local_contrast_factor * d_left) edges.x = 0.0f;
            if (max_delta > local_contrast_factor * d_top) edges.y = 0.0f;
            return edges;
        }
    }

    inline glm::vec2 smaa_detect_edges_luma(
        const ColorTexture& color,
        int x,
        int y,
        float threshold,
        float local_contrast_factor)
    {
        return detail::smaa_detect_edges(color, x, y, threshold, local_contrast_factor,
            [](const glm::vec4& a, const glm::vec4& b) {
                return std::abs(luma_rec709(glm::vec3(a)) - luma_rec709(glm::vec3(b)));
            });
    }

    inline glm::vec2 smaa_detect_edges_color(
        const ColorTexture& color,
        int x,
        int y,
        float threshold,
        float local_contrast_factor)
    {
        return detail::smaa_detect_edges(color, x, y, threshold, local_contrast_factor,
            [](const glm::vec4& a, const glm::vec4& b) {
                return max_component(glm::abs(glm::vec3(a) - glm::vec3(b)));
            });
    }

    // `edges` must already match the color extent. Returns the number of edge pixels.
    inline Result<uint64_t> run_smaa_edge_detection(
        IJobSystem* js,
        const ColorTexture& color,
        EdgeTexture& edges,
        SmaaEdgeMode mode,
        const SmaaQualitySettings& quality)
    {
        if (!color.extent().valid()) return Result<uint64_t>::failure("SMAA edge detection input has zero extent");
        if (edges.extent() != color.extent()) return Result<uint64_t>::failure("SMAA edge target extent does not match color");

        std::atomic<uint64_t> edge_pixels{0};
        parallel_for_rows(js, color.h, 16, [&](int y0, int y1) {
            uint64_t local = 0;
            for (int y = y0; y < y1; ++y)
            {
                for (int x = 0; x < color.w; ++x)
                {
                    const glm::vec2 e = (mode == SmaaEdgeMode::Color)
                        ? smaa_detect_edges_color(color, x, y, quality.threshold, quality.local_contrast_adaptation_factor)
                        : smaa_detect_edges_luma(color, x, y, quality.threshold, quality.local_contrast_adaptation_factor);
                    edges.at(x, y) = e;
                    if (e.x != 0.0f || e.y != 0.0f) ++local;
                }
            }
            edge_pixels.fetch_add(local, std::memory_order_relaxed);
        });
        return Result<uint64_t>::success(edge_pixels.load());
    }
}
