#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: frame_presenter.hpp
    MODULE: platform
    PURPOSE: Shows a resolved color target on screen and reports demo input.
*/


#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "tsaa/gfx/texture.hpp"
#include "tsaa/platform/platform_input.hpp"

namespace tsaa
{
    struct PresenterDesc
    {
        std::string title{};
        // Window size in screen pixels.
        int window_width = 1280;
        int window_height = 720;
        // Resolution the pipeline renders at; upscaled with nearest filtering.
        TextureExtent canvas{320, 180};
    };

    // Linear [0,1] color to gamma 2.2 RGBA8, alpha forced opaque.
    inline void encode_display_rgba8(const ColorTexture& color, std::vector<uint8_t>& out)
    {
        out.resize((size_t)color.w * (size_t)color.h * 4);
        for (int y = 0; y < color.h; ++y)
        {
            uint8_t* row = out.data() + (size_t)y * (size_t)color.w * 4;
            for (int x = 0; x < color.w; ++x)
            {
                const glm::vec3 c = glm::clamp(glm::vec3(color.at(x, y)), glm::vec3(0.0f), glm::vec3(1.0f));
                const glm::vec3 g = glm::pow(c, glm::vec3(1.0f / 2.2f));
                row[x * 4 + 0] = (uint8_t)std::lround(g.r * 255.0f);
                row[x * 4 + 1] = (uint8_t)std::lround(g.g * 255.0f);
                row[x * 4 + 2] = (uint8_t)std::lround(g.b * 255.0f);
                row[x * 4 + 3] = 255;
            }
        }
    }

    class IFramePresenter
    {
    public:
        virtual ~IFramePresenter() = default;

        virtual bool ready() const = 0;
        // Returns false once the user asked to quit.
        virtual bool poll(PlatformInputState& out) = 0;
        virtual void set_caption(const std::string& caption) = 0;
        // Color extent must match PresenterDesc::canvas; other sizes are dropped.
        virtual bool show(const ColorTexture& color) = 0;
    };
}
