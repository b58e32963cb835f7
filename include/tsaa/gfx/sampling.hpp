#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: sampling.hpp
    MODULE: gfx
    PURPOSE: Filtered texture reads in texel space (texel centers at i + 0.5) with
             clamp-to-edge addressing.
*/


#include <glm/glm.hpp>

#include "tsaa/gfx/texture.hpp"

namespace tsaa
{
    template<typename TTexel>
    inline TTexel sample_bilinear(const Texture2D<TTexel>& tex, glm::vec2 pos)
    {
        const glm::vec2 p = pos - glm::vec2(0.5f);
        const glm::vec2 base = glm::floor(p);
        const glm::vec2 f = p - base;
        const int x0 = (int)base.x;
        const int y0 = (int)base.y;

        const TTexel a = tex.at_clamped(x0, y0);
        const TTexel b = tex.at_clamped(x0 + 1, y0);
        const TTexel c = tex.at_clamped(x0, y0 + 1);
        const TTexel d = tex.at_clamped(x0 + 1, y0 + 1);
        const TTexel top = a * (1.0f - f.x) + b * f.x;
        const TTexel bottom = c * (1.0f - f.x) + d * f.x;
        return top * (1.0f - f.y) + bottom * f.y;
    }

    namespace detail
    {
        inline glm::vec4 catmull_rom_weights(float t)
        {
            const float t2 = t * t;
            const float t3 = t2 * t;
            return glm::vec4(
                0.5f * (-t3 + 2.0f * t2 - t),
                0.5f * (3.0f * t3 - 5.0f * t2 + 2.0f),
                0.5f * (-3.0f * t3 + 4.0f * t2 + t),
                0.5f * (t3 - t2)
            );
        }
    }

    // 4x4 Catmull-Rom. The negative lobes can overshoot, callers clamp as needed.
    inline glm::vec4 sample_catmull_rom(const ColorTexture& tex, glm::vec2 pos)
    {
        const glm::vec2 p = pos - glm::vec2(0.5f);
        const glm::vec2 base = glm::floor(p);
        const glm::vec2 f = p - base;
        const glm::vec4 wx = detail::catmull_rom_weights(f.x);
        const glm::vec4 wy = detail::catmull_rom_weights(f.y);
        const int x0 = (int)base.x - 1;
        const int y0 = (int)base.y - 1;

        glm::vec4 sum(0.0f);
        for (int j = 0; j < 4; ++j)
        {
            glm::vec4 row(0.0f);
            for (int i = 0; i < 4; ++i)
            {
                row += tex.at_clamped(x0 + i, y0 + j) * wx[i];
            }
            sum += row * wy[j];
        }
        return sum;
    }
}
