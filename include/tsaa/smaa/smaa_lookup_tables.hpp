#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: smaa_lookup_tables.hpp
    MODULE: smaa
    PURPOSE: Area and Search lookup tables for SMAA blending-weight calculation.
             Layouts are fixed constants. The generators below are the offline tools
             that produce the bytes an asset system hands to load_smaa_lookup_tables().

    Area LUT (RG8, 80x80): 5x5 cells of 16x16 texels. Cell (e1, e2) is the pair of
    crossing codes at both ends of a line, texel (i, j) inside a cell holds the coverage
    of a pixel at distance i*i from the left end and j*j from the right end.
    Channel 0 is coverage taken from the far side of the edge, channel 1 coverage given
    to it.

    Search LUT (R8, 32x16): texel (dir * 16 + crossing_bits, along_bits) holds the
    final 0..2 pixel correction of a 2-pixel-stepped search, stored as delta * 127.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "tsaa/core/result.hpp"

namespace tsaa
{
    inline constexpr int kSmaaAreaLutCellSize = 16;
    inline constexpr int kSmaaAreaLutCells = 5;
    inline constexpr int kSmaaAreaLutWidth = kSmaaAreaLutCellSize * kSmaaAreaLutCells;
    inline constexpr int kSmaaAreaLutHeight = kSmaaAreaLutCellSize * kSmaaAreaLutCells;
    inline constexpr size_t kSmaaAreaLutByteSize = (size_t)kSmaaAreaLutWidth * (size_t)kSmaaAreaLutHeight * 2u;

    inline constexpr int kSmaaSearchLutWidth = 32;
    inline constexpr int kSmaaSearchLutHeight = 16;
    inline constexpr size_t kSmaaSearchLutByteSize = (size_t)kSmaaSearchLutWidth * (size_t)kSmaaSearchLutHeight;

    inline constexpr float kSmaaSmoothMaxDistance = 32.0f;

    enum class SmaaSearchDirection : uint8_t
    {
        Negative = 0,
        Positive = 1
    };

    struct SmaaLookupTables
    {
        std::vector<uint8_t> area{};
        std::vector<uint8_t> search{};

        glm::vec2 area_texel(int x, int y) const
        {
            const size_t i = ((size_t)y * (size_t)kSmaaAreaLutWidth + (size_t)x) * 2u;
            return glm::vec2((float)area[i], (float)area[i + 1u]) / 255.0f;
        }

        int search_delta(SmaaSearchDirection dir, uint32_t crossing_bits, uint32_t along_bits) const
        {
            const size_t x = (size_t)dir * 16u + (size_t)(crossing_bits & 15u);
            const size_t y = (size_t)(along_bits & 15u);
            return (int)std::lround((float)search[y * (size_t)kSmaaSearchLutWidth + x] / 127.0f);
        }
    };

    using SmaaLookupTablesRef = std::shared_ptr<const SmaaLookupTables>;

    namespace detail
    {
        // Coverage of pixel [x, x+1] under the line through p1 and p2, split by which
        // side of the edge it falls on.
        inline glm::vec2 smaa_area_under_segment(glm::vec2 p1, glm::vec2 p2, float x)
        {
            const glm::vec2 d = p2 - p1;
            const float x1 = x;
            const float x2 = x + 1.0f;
            const bool inside = (x1 >= p1.x && x1 < p2.x) || (x2 > p1.x && x2 <= p2.x);
            if (!inside) return glm::vec2(0.0f);

            const float y1 = p1.y + d.y * (x1 - p1.x) / d.x;
            const float y2 = p1.y + d.y * (x2 - p1.x) / d.x;
            const bool trapezoid = (std::signbit(y1) == std::signbit(y2))
                || std::abs(y1) < 1e-4f
                || std::abs(y2) < 1e-4f;
            if (trapezoid)
            {
                const float a = 0.5f * (y1 + y2);
                return a < 0.0f ? glm::vec2(std::abs(a), 0.0f) : glm::vec2(0.0f, std::abs(a));
            }

            // Two triangles meeting where the line crosses the edge.
            const float xc = -p1.y * d.x / d.y + p1.x;
            const float t = xc - std::floor(xc);
            const float a1 = std::abs(y1) * t * 0.5f;
            const float a2 = std::abs(y2) * (1.0f - t) * 0.5f;
            glm::vec2 out(0.0f);
            out[y1 < 0.0f ? 0 : 1] += a1;
            out[y2 < 0.0f ? 0 : 1] += a2;
            return out;
        }

        // Long lines converge toward the exact area, short ones are softened.
        inline glm::vec2 smaa_smooth_area(float d, glm::vec2 a1, glm::vec2 a2)
        {
            const glm::vec2 b1 = glm::sqrt(a1 * 2.0f) * 0.5f;
            const glm::vec2 b2 = glm::sqrt(a2 * 2.0f) * 0.5f;
            const float p = std::clamp(d / kSmaaSmoothMaxDistance, 0.0f, 1.0f);
            return glm::mix(b1, a1, p) + glm::mix(b2, a2, p);
        }

        // Crossing-code pair of each of the 16 orthogonal patterns.
        inline constexpr std::array<std::array<int, 2>, 16> kSmaaOrthoPatternEdges = {{
            {{0, 0}}, {{3, 0}}, {{0, 3}}, {{3, 3}},
            {{1, 0}}, {{4, 0}}, {{1, 3}}, {{4, 3}},
            {{0, 1}}, {{3, 1}}, {{0, 4}}, {{3, 4}},
            {{1, 1}}, {{4, 1}}, {{1, 4}}, {{4, 4}}
        }};

        inline glm::vec2 smaa_area_ortho(int pattern, float left, float right)
        {
            const float d = left + right + 1.0f;
            const float o1 = 0.5f;
            const float o2 = -0.5f;
            const glm::vec2 zero(0.0f);
            auto area = [left](glm::vec2 a, glm::vec2 b) { return smaa_area_under_segment(a, b, left); };

            switch (pattern)
            {
                case 1: return left <= right ? area({0.0f, o2}, {0.5f * d, 0.0f}) : zero;
                case 2: return left >= right ? area({0.5f * d, 0.0f}, {d, o2}) : zero;
                case 3: return smaa_smooth_area(d, area({0.0f, o2}, {0.5f * d, 0.0f}), area({0.5f * d, 0.0f}, {d, o2}));
                case 4: return left <= right ? area({0.0f, o1}, {0.5f * d, 0.0f}) : zero;
                case 6: return area({0.0f, o1}, {d, o2});
                case 7: return area({0.0f, o1}, {d, o2});
                case 8: return left >= right ? area({0.5f * d, 0.0f}, {d, o1}) : zero;
                case 9: return area({0.0f, o2}, {d, o1});
                case 11: return area({0.0f, o2}, {d, o1});
                case 12: return smaa_smooth_area(d, area({0.0f, o1}, {0.5f * d, 0.0f}), area({0.5f * d, 0.0f}, {d, o1}));
                case 13: return area({0.0f, o2}, {d, o1});
                case 14: return area({0.0f, o1}, {d, o2});
                default: break;
            }
            // 0, 5, 10 and 15 have no step to smooth.
            return zero;
        }

        inline bool bit(uint32_t v, int i) { return ((v >> i) & 1u) != 0u; }

        // Bit i of `along`/`crossing` is block texel i: 0 far/previous row, 1 near/
        // previous row, 2 far/current row, 3 near/current row.
        inline int smaa_search_end_delta(SmaaSearchDirection dir, uint32_t crossing, uint32_t along)
        {
            int delta = 0;
            if (dir == SmaaSearchDirection::Negative)
            {
                if (bit(along, 3)) delta = 1;
                if (delta == 1 && bit(along, 2) && !bit(crossing, 1) && !bit(crossing, 3)) delta = 2;
            }
            else
            {
                if (bit(along, 3) && !bit(crossing, 1) && !bit(crossing, 3)) delta = 1;
                if (delta == 1 && bit(along, 2) && !bit(crossing, 0) && !bit(crossing, 2)) delta = 2;
            }
            return delta;
        }

        inline uint8_t to_unorm8(float v)
        {
            return (uint8_t)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
        }
    }

    inline std::vector<uint8_t> generate_smaa_area_lut_bytes()
    {
        std::vector<uint8_t> out(kSmaaAreaLutByteSize, 0u);
        for (int pattern = 0; pattern < 16; ++pattern)
        {
            const int e1 = detail::kSmaaOrthoPatternEdges[(size_t)pattern][0];
            const int e2 = detail::kSmaaOrthoPatternEdges[(size_t)pattern][1];
            for (int j = 0; j < kSmaaAreaLutCellSize; ++j)
            {
                for (int i = 0; i < kSmaaAreaLutCellSize; ++i)
                {
                    const glm::vec2 a = detail::smaa_area_ortho(pattern, (float)(i * i), (float)(j * j));
                    const int x = e1 * kSmaaAreaLutCellSize + i;
                    const int y = e2 * kSmaaAreaLutCellSize + j;
                    const size_t idx = ((size_t)y * (size_t)kSmaaAreaLutWidth + (size_t)x) * 2u;
                    out[idx] = detail::to_unorm8(a.x);
                    out[idx + 1u] = detail::to_unorm8(a.y);
                }
            }
        }
        return out;
    }

    inline std::vector<uint8_t> generate_smaa_search_lut_bytes()
    {
        std::vector<uint8_t> out(kSmaaSearchLutByteSize, 0u);
        for (uint32_t dir = 0; dir < 2u; ++dir)
        {
            for (uint32_t crossing = 0; crossing < 16u; ++crossing)
            {
                for (uint32_t along = 0; along < 16u; ++along)
                {
                    const int delta = detail::smaa_search_end_delta((SmaaSearchDirection)dir, crossing, along);
                    out[(size_t)along * (size_t)kSmaaSearchLutWidth + dir * 16u + crossing] = (uint8_t)(delta * 127);
                }
            }
        }
        return out;
    }

    inline Result<SmaaLookupTablesRef> load_smaa_lookup_tables(
        std::span<const uint8_t> area_rg8,
        std::span<const uint8_t> search_r8)
    {
        if (area_rg8.size() != kSmaaAreaLutByteSize)
        {
            return Result<SmaaLookupTablesRef>::failure(
                "SMAA area LUT must be " + std::to_string(kSmaaAreaLutWidth) + "x" + std::to_string(kSmaaAreaLutHeight)
                + " RG8 (" + std::to_string(kSmaaAreaLutByteSize) + " bytes), got " + std::to_string(area_rg8.size()));
        }
        if (search_r8.size() != kSmaaSearchLutByteSize)
        {
            return Result<SmaaLookupTablesRef>::failure(
                "SMAA search LUT must be " + std::to_string(kSmaaSearchLutWidth) + "x" + std::to_string(kSmaaSearchLutHeight)
                + " R8 (" + std::to_string(kSmaaSearchLutByteSize) + " bytes), got " + std::to_string(search_r8.size()));
        }
        for (uint8_t v : search_r8)
        {
            if (v != 0u && v != 127u && v != 254u)
            {
                return Result<SmaaLookupTablesRef>::failure("SMAA search LUT holds a value outside {0, 127, 254}");
            }
        }

        auto tables = std::make_shared<SmaaLookupTables>();
        tables->area.assign(area_rg8.begin(), area_rg8.end());
        tables->search.assign(search_r8.begin(), search_r8.end());
        return Result<SmaaLookupTablesRef>::success(std::move(tables));
    }

    inline SmaaLookupTablesRef build_smaa_lookup_tables()
    {
        const std::vector<uint8_t> area = generate_smaa_area_lut_bytes();
        const std::vector<uint8_t> search = generate_smaa_search_lut_bytes();
        auto loaded = load_smaa_lookup_tables(area, search);
        return loaded.ok ? loaded.value : SmaaLookupTablesRef{};
    }
}
