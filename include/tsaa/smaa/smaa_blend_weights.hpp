#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: smaa_blend_weights.hpp
    MODULE: smaa
    PURPOSE: SMAA second pass. Walks each edge line to its ends, classifies the
             crossing edges there and turns the pattern into coverage weights through
             the Area LUT.

    Both line orientations are handled in one line space: `u` runs along the line,
    `v` across it. A line at v lies on the boundary between rows v-1 and v (columns
    for vertical lines), row v being the pixel that owns the edge.
*/


#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "tsaa/core/result.hpp"
#include "tsaa/frame/aa_presets.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/job/parallel_for.hpp"
#include "tsaa/smaa/smaa_lookup_tables.hpp"

namespace tsaa
{
    enum class SmaaLineAxis : uint8_t
    {
        Horizontal = 0,
        Vertical = 1
    };

    // Edge texture viewed in line space. Reads outside the image return 0.
    struct SmaaEdgeLine
    {
        const EdgeTexture* edges = nullptr;
        SmaaLineAxis axis = SmaaLineAxis::Horizontal;

        uint32_t along(int u, int v) const
        {
            if (axis == SmaaLineAxis::Horizontal) return edges->load_or(u, v, glm::vec2(0.0f)).y != 0.0f ? 1u : 0u;
            return edges->load_or(v, u, glm::vec2(0.0f)).x != 0.0f ? 1u : 0u;
        }

        uint32_t crossing(int u, int v) const
        {
            if (axis == SmaaLineAxis::Horizontal) return edges->load_or(u, v, glm::vec2(0.0f)).x != 0.0f ? 1u : 0u;
            return edges->load_or(v, u, glm::vec2(0.0f)).y != 0.0f ? 1u : 0u;
        }
    };

    struct SmaaLineEnds
    {
        int distance_negative = 0;
        int distance_positive = 0;
        // Codes: 0 none, 1 crossing on the previous row only, 3 on the owning row
        // only, 4 both.
        int crossing_negative = 0;
        int crossing_positive = 0;
    };

    namespace detail
    {
        inline uint32_t smaa_pack_block(uint32_t far_prev, uint32_t near_prev, uint32_t far_cur, uint32_t near_cur)
        {
            return far_prev | (near_prev << 1u) | (far_cur << 2u) | (near_cur << 3u);
        }

        inline bool smaa_block_continues(uint32_t along, uint32_t crossing)
        {
            return (along & 0xCu) == 0xCu && crossing == 0u;
        }
    }

    // Distance from u to the last pixel of the line toward -u.
    inline int smaa_search_negative(
        const SmaaEdgeLine& line,
        const SmaaLookupTables& luts,
        int u,
        int v,
        int max_steps)
    {
        int c = u;
        uint32_t along = 0;
        uint32_t crossing = 0;
        for (int step = 0;; ++step)
        {
            along = detail::smaa_pack_block(line.along(c - 1, v - 1), line.along(c, v - 1), line.along(c - 1, v), line.along(c, v));
            crossing = detail::smaa_pack_block(line.crossing(c - 1, v - 1), line.crossing(c, v - 1), line.crossing(c - 1, v), line.crossing(c, v));
            if (step + 1 >= max_steps || !detail::smaa_block_continues(along, crossing)) break;
            c -= 2;
        }
        const int end = c + 1 - luts.search_delta(SmaaSearchDirection::Negative, crossing, along);
        return std::max(0, u - end);
    }

    // Distance from u to the last pixel of the line toward +u.
    inline int smaa_search_positive(
        const SmaaEdgeLine& line,
        const SmaaLookupTables& luts,
        int u,
        int v,
        int max_steps)
    {
        int c = u + 1;
        uint32_t along = 0;
        uint32_t crossing = 0;
        for (int step = 0;; ++step)
        {
            along = detail::smaa_pack_block(line.along(c + 1, v - 1), line.along(c, v - 1), line.along(c + 1, v), line.along(c, v));
            crossing = detail::smaa_pack_block(line.crossing(c + 1, v - 1), line.crossing(c, v - 1), line.crossing(c + 1, v), line.crossing(c, v));
            if (step + 1 >= max_steps || !detail::smaa_block_continues(along, crossing)) break;
            c += 2;
        }
        const int end = c - 1 + luts.search_delta(SmaaSearchDirection::Positive, crossing, along);
        return std::max(0, end - u);
    }

    // Crossing code of the boundary on the -u side of pixel u.
    inline int smaa_crossing_code(const SmaaEdgeLine& line, int u, int v)
    {
        return (int)line.crossing(u, v) * 3 + (int)line.crossing(u, v - 1);
    }

    inline SmaaLineEnds smaa_find_line_ends(
        const SmaaEdgeLine& line,
        const SmaaLookupTables& luts,
        int u,
        int v,
        int max_steps)
    {
        SmaaLineEnds ends{};
        ends.distance_negative = smaa_search_negative(line, luts, u, v, max_steps);
        ends.distance_positive = smaa_search_positive(line, luts, u, v, max_steps);
        ends.crossing_negative = smaa_crossing_code(line, u - ends.distance_negative, v);
        ends.crossing_positive = smaa_crossing_code(line, u + ends.distance_positive + 1, v);
        return ends;
    }

    // Bilinear fetch inside the (e1, e2) cell at sqrt-compressed distances.
    inline glm::vec2 smaa_area(const SmaaLookupTables& luts, const SmaaLineEnds& ends)
    {
        const float max_coord = (float)(kSmaaAreaLutCellSize - 1);
        const float sx = std::min(std::sqrt((float)ends.distance_negative), max_coord);
        const float sy = std::min(std::sqrt((float)ends.distance_positive), max_coord);
        const int x0 = (int)sx;
        const int y0 = (int)sy;
        const int x1 = std::min(x0 + 1, kSmaaAreaLutCellSize - 1);
        const int y1 = std::min(y0 + 1, kSmaaAreaLutCellSize - 1);
        const float fx = sx - (float)x0;
        const float fy = sy - (float)y0;

        const int bx = std::clamp(ends.crossing_negative, 0, kSmaaAreaLutCells - 1) * kSmaaAreaLutCellSize;
        const int by = std::clamp(ends.crossing_positive, 0, kSmaaAreaLutCells - 1) * kSmaaAreaLutCellSize;
        const glm::vec2 a = luts.area_texel(bx + x0, by + y0);
        const glm::vec2 b = luts.area_texel(bx + x1, by + y0);
        const glm::vec2 c = luts.area_texel(bx + x0, by + y1);
        const glm::vec2 d = luts.area_texel(bx + x1, by + y1);
        return glm::mix(glm::mix(a, b, fx), glm::mix(c, d, fx), fy);
    }

    // Attenuates weights where the line ends in a corner rather than a step, so
    // sharp geometric corners are kept. `rounding` is in percent.
    inline glm::vec2 smaa_corner_factor(const SmaaEdgeLine& line, const SmaaLineEnds& ends, int u, int v, int rounding)
    {
        const int dn = ends.distance_negative;
        const int dp = ends.distance_positive;
        glm::vec2 left_right(dn <= dp ? 1.0f : 0.0f, dp <= dn ? 1.0f : 0.0f);
        left_right *= (1.0f - (float)rounding / 100.0f) / (left_right.x + left_right.y);

        const int ul = u - dn;
        const int ur = u + dp + 1;
        glm::vec2 factor(1.0f);
        factor.x -= left_right.x * (float)line.crossing(ul, v + 1) + left_right.y * (float)line.crossing(ur, v + 1);
        factor.y -= left_right.x * (float)line.crossing(ul, v - 2) + left_right.y * (float)line.crossing(ur, v - 2);
        return glm::clamp(factor, glm::vec2(0.0f), glm::vec2(1.0f));
    }

    inline glm::vec2 smaa_line_weights(
        const SmaaEdgeLine& line,
        const SmaaLookupTables& luts,
        int u,
        int v,
        const SmaaQualitySettings& quality)
    {
        const SmaaLineEnds ends = smaa_find_line_ends(line, luts, u, v, quality.max_search_steps);
        glm::vec2 w = smaa_area(luts, ends);
        if (quality.corner_detection && (w.x != 0.0f || w.y != 0.0f))
        {
            w *= smaa_corner_factor(line, ends, u, v, quality.corner_rounding);
        }
        return w;
    }

    // .x/.y from the top edge (horizontal line), .z/.w from the left edge.
    inline glm::vec4 smaa_blending_weights(
        const EdgeTexture& edges,
        const SmaaLookupTables& luts,
        int x,
        int y,
        const SmaaQualitySettings& quality)
    {
        glm::vec4 weights(0.0f);
        const glm::vec2 e = edges.at(x, y);
        if (e.y != 0.0f)
        {
            const SmaaEdgeLine line{&edges, SmaaLineAxis::Horizontal};
            const glm::vec2 w = smaa_line_weights(line, luts, x, y, quality);
            weights.x = w.x;
            weights.y = w.y;
        }
        if (e.x != 0.0f)
        {
            const SmaaEdgeLine line{&edges, SmaaLineAxis::Vertical};
            const glm::vec2 w = smaa_line_weights(line, luts, y, x, quality);
            weights.z = w.x;
            weights.w = w.y;
        }
        return weights;
    }

    // Returns the number of pixels with any non-zero weight.
    inline Result<uint64_t> run_smaa_blending_weights(
        IJobSystem* js,
        const EdgeTexture& edges,
        const SmaaLookupTables& luts,
        BlendWeightTexture& weights,
        const SmaaQualitySettings& quality)
    {
        if (!edges.extent().valid()) return Result<uint64_t>::failure("SMAA weight pass input has zero extent");
        if (weights.extent() != edges.extent()) return Result<uint64_t>::failure("SMAA weight target extent does not match edges");
        if (luts.area.size() != kSmaaAreaLutByteSize || luts.search.size() != kSmaaSearchLutByteSize)
        {
            return Result<uint64_t>::failure("SMAA lookup tables are not loaded");
        }

        std::atomic<uint64_t> weighted{0};
        parallel_for_rows(js, edges.h, 16, [&](int y0, int y1) {
            uint64_t local = 0;
            for (int y = y0; y < y1; ++y)
            {
                for (int x = 0; x < edges.w; ++x)
                {
                    const glm::vec4 w = smaa_blending_weights(edges, luts, x, y, quality);
                    weights.at(x, y) = w;
                    if (w != glm::vec4(0.0f)) ++local;
                }
            }
            weighted.fetch_add(local, std::memory_order_relaxed);
        });
        return Result<uint64_t>::success(weighted.load());
    }
}
