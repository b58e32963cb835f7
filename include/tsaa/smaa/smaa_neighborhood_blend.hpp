#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: smaa_neighborhood_blend.hpp
    MODULE: smaa
    PURPOSE: SMAA third pass. Blends each pixel toward its direct neighbors along the
             dominant edge axis using the weights of the second pass.
*/


#include <algorithm>
#include <atomic>
#include <cstdint>

#include <glm/glm.hpp>

#include "tsaa/core/result.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/job/parallel_for.hpp"

namespace tsaa
{
    inline constexpr float kSmaaBlendEpsilon = 1e-5f;

    inline glm::vec4 smaa_neighborhood_blend(const ColorTexture& color, const BlendWeightTexture& weights, int x, int y)
    {
        // right: right neighbor's left-line share, bottom: bottom neighbor's top-line
        // share, left/top: this pixel's own shares.
        const float right = weights.load_or(x + 1, y, glm::vec4(0.0f)).w;
        const float bottom = weights.load_or(x, y + 1, glm::vec4(0.0f)).y;
        const glm::vec4& own = weights.at(x, y);
        const float left = own.z;
        const float top = own.x;

        const glm::vec4& c = color.at(x, y);
        if (right + bottom + left + top < kSmaaBlendEpsilon) return c;

        const bool horizontal = std::max(right, left) > std::max(bottom, top);
        glm::vec4 a{};
        glm::vec4 b{};
        float wa = 0.0f;
        float wb = 0.0f;
        if (horizontal)
        {
            a = glm::mix(c, color.at_clamped(x + 1, y), right);
            b = glm::mix(c, color.at_clamped(x - 1, y), left);
            wa = right;
            wb = left;
        }
        else
        {
            a = glm::mix(c, color.at_clamped(x, y + 1), bottom);
            b = glm::mix(c, color.at_clamped(x, y - 1), top);
            wa = bottom;
            wb = top;
        }
        const float sum = wa + wb;
        return (a * wa + b * wb) / sum;
    }

    inline Result<uint64_t> run_smaa_neighborhood_blending(
        IJobSystem* js,
        const ColorTexture& color,
        const BlendWeightTexture& weights,
        ColorTexture& out)
    {
        if (!color.extent().valid()) return Result<uint64_t>::failure("SMAA blend input has zero extent");
        if (weights.extent() != color.extent()) return Result<uint64_t>::failure("SMAA blend weights extent does not match color");
        if (out.extent() != color.extent()) return Result<uint64_t>::failure("SMAA blend output extent does not match color");
        if (&out == &color) return Result<uint64_t>::failure("SMAA blend output aliases its input");

        std::atomic<uint64_t> blended{0};
        parallel_for_rows(js, color.h, 16, [&](int y0, int y1) {
            uint64_t local = 0;
            for (int y = y0; y < y1; ++y)
            {
                for (int x = 0; x < color.w; ++x)
                {
                    const glm::vec4 v = smaa_neighborhood_blend(color, weights, x, y);
                    out.at(x, y) = v;
                    if (v != color.at(x, y)) ++local;
                }
            }
            blended.fetch_add(local, std::memory_order_relaxed);
        });
        return Result<uint64_t>::success(blended.load());
    }
}
