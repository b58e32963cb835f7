#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: view_frame_state.hpp
    MODULE: pipeline
    PURPOSE: Per-view state the anti-aliasing nodes read and write during one frame,
             and the shared services they call into.
*/


#include <cstdint>

#include <glm/glm.hpp>

#include "tsaa/core/context.hpp"
#include "tsaa/frame/aa_params.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/gfx/texture_budget.hpp"
#include "tsaa/smaa/smaa_pipeline.hpp"
#include "tsaa/temporal/history_buffer.hpp"
#include "tsaa/temporal/jitter_sequence.hpp"

namespace tsaa
{
    // Published by the jitter node for the rasterizer. Velocity must be computed
    // between unjittered positions, so the offset is exposed separately.
    struct JitterFrame
    {
        glm::vec2 offset_px{0.0f};
        glm::vec2 offset_ndc{0.0f};
        glm::mat4 projection{1.0f};
        glm::mat4 jittered_projection{1.0f};
        uint32_t sequence_index = 0;
        float mip_bias = 0.0f;
    };

    struct ViewFrameState
    {
        uint32_t view_id = 0;
        TextureExtent extent{};
        // Camera cut, scene load, resize or explicit reset.
        bool history_invalid = false;
        glm::mat4 projection{1.0f};

        JitterFrame jitter{};
        SmaaViewTargets smaa_targets{};
        ColorTexture smaa_output{};
        ColorTexture taa_output{};
        HistoryAcquisition history{};
        bool history_acquired = false;

        AntiAliasingDebugStats stats{};

        void begin_frame()
        {
            history = HistoryAcquisition{};
            history_acquired = false;
            stats.reset();
        }

        void release_targets(TextureBudget* budget)
        {
            smaa_targets.release(budget);
            release_texture(smaa_output, budget);
            release_texture(taa_output, budget);
        }
    };

    // Shared across views. All members are safe to call from concurrent views.
    struct AntiAliasingServices
    {
        JitterSequence* jitter = nullptr;
        HistoryBufferManager* history = nullptr;
        const SmaaPipeline* smaa = nullptr;
        TextureBudget* budget = nullptr;
    };
}
