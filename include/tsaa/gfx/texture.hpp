#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: texture.hpp
    MODULE: gfx
    PURPOSE: CPU-side 2D texel storage standing in for the GPU textures that the
             anti-aliasing passes read and write.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace tsaa
{
    struct TextureExtent
    {
        int w = 0;
        int h = 0;

        bool valid() const { return w > 0 && h > 0; }
        size_t texel_count() const { return valid() ? (size_t)w * (size_t)h : 0u; }

        bool operator==(const TextureExtent& o) const { return w == o.w && h == o.h; }
        bool operator!=(const TextureExtent& o) const { return !(*this == o); }
    };

    template<typename TTexel>
    struct Texture2D
    {
        using texel_type = TTexel;

        int w = 0;
        int h = 0;
        std::vector<TTexel> texels{};

        Texture2D() = default;
        Texture2D(int W, int H, const TTexel& clear_value) { resize(W, H, clear_value); }

        void resize(int W, int H, const TTexel& clear_value)
        {
            w = std::max(0, W);
            h = std::max(0, H);
            texels.assign((size_t)w * (size_t)h, clear_value);
        }

        void clear(const TTexel& clear_value)
        {
            std::fill(texels.begin(), texels.end(), clear_value);
        }

        void release()
        {
            w = 0;
            h = 0;
            std::vector<TTexel>{}.swap(texels);
        }

        TextureExtent extent() const { return TextureExtent{w, h}; }
        bool empty() const { return texels.empty(); }
        size_t size_bytes() const { return texels.size() * sizeof(TTexel); }

        bool in_bounds(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }

        TTexel& at(int x, int y) { return texels[(size_t)y * (size_t)w + (size_t)x]; }
        const TTexel& at(int x, int y) const { return texels[(size_t)y * (size_t)w + (size_t)x]; }

        // Clamp-to-edge addressing.
        const TTexel& at_clamped(int x, int y) const
        {
            return at(std::clamp(x, 0, w - 1), std::clamp(y, 0, h - 1));
        }

        // Border addressing: reads outside the texture return `border`.
        TTexel load_or(int x, int y, const TTexel& border) const
        {
            return in_bounds(x, y) ? at(x, y) : border;
        }
    };

    // Linear RGBA. Alpha of history textures carries accumulated confidence.
    using ColorTexture = Texture2D<glm::vec4>;
    // [0, 1], smaller is closer, cleared to 1.
    using DepthTexture = Texture2D<float>;
    // uv_current - uv_previous.
    using VelocityTexture = Texture2D<glm::vec2>;
    // x: edge on the left border of the texel, y: edge on the top border.
    using EdgeTexture = Texture2D<glm::vec2>;
    // x/y: horizontal line weights, z/w: vertical line weights.
    using BlendWeightTexture = Texture2D<glm::vec4>;

    template<typename TTexel>
    inline size_t texture_bytes_for(TextureExtent extent)
    {
        return extent.texel_count() * sizeof(TTexel);
    }
}
