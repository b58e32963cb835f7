#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: color_math.hpp
    MODULE: gfx
    PURPOSE: Color-space helpers shared by the SMAA and TAA kernels.
*/


#include <algorithm>

#include <glm/glm.hpp>

namespace tsaa
{
    inline float luma_rec709(const glm::vec3& c)
    {
        return glm::dot(c, glm::vec3(0.2126f, 0.7152f, 0.0722f));
    }

    inline float max_component(const glm::vec3& c)
    {
        return std::max(c.r, std::max(c.g, c.b));
    }

    inline glm::vec3 rgb_to_ycocg(const glm::vec3& c)
    {
        const float y = 0.25f * c.r + 0.5f * c.g + 0.25f * c.b;
        const float co = 0.5f * c.r - 0.5f * c.b;
        const float cg = -0.25f * c.r + 0.5f * c.g - 0.25f * c.b;
        return glm::vec3(y, co, cg);
    }

    inline glm::vec3 ycocg_to_rgb(const glm::vec3& c)
    {
        const float tmp = c.x - c.z;
        return glm::vec3(tmp + c.y, c.x + c.z, tmp - c.y);
    }

    // Karis reversible tonemap. Keeps bright outliers from dominating a blend.
    inline glm::vec3 tonemap_reversible(const glm::vec3& c)
    {
        return c / (1.0f + max_component(c));
    }

    inline glm::vec3 tonemap_reversible_inverse(const glm::vec3& c)
    {
        return c / std::max(1e-5f, 1.0f - max_component(c));
    }
}
