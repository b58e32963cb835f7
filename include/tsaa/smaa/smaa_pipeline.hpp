#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: smaa_pipeline.hpp
    MODULE: smaa
    PURPOSE: SMAA stages (edges, weights, blend) over a shared reference to the lookup
             tables. The graph nodes run one stage each; run() chains all three.
             Per-view targets live in SmaaViewTargets.
*/


#include <cstdint>
#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "tsaa/core/log.hpp"
#include "tsaa/core/result.hpp"
#include "tsaa/frame/aa_params.hpp"
#include "tsaa/frame/aa_presets.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/gfx/texture_budget.hpp"
#include "tsaa/smaa/smaa_blend_weights.hpp"
#include "tsaa/smaa/smaa_edge_detection.hpp"
#include "tsaa/smaa/smaa_lookup_tables.hpp"
#include "tsaa/smaa/smaa_neighborhood_blend.hpp"

namespace tsaa
{
    // Transient per-view intermediates. Contents are rewritten every frame, storage is
    // kept while the extent stays the same.
    struct SmaaViewTargets
    {
        EdgeTexture edges{};
        BlendWeightTexture weights{};

        Status ensure(TextureExtent extent, TextureBudget* budget)
        {
            const Status e = ensure_texture(edges, extent, glm::vec2(0.0f), budget, "smaa.edges");
            if (!e.ok) return e;
            return ensure_texture(weights, extent, glm::vec4(0.0f), budget, "smaa.weights");
        }

        void release(TextureBudget* budget)
        {
            release_texture(edges, budget);
            release_texture(weights, budget);
        }
    };

    struct SmaaRunStats
    {
        uint64_t edge_pixels = 0;
        uint64_t weighted_pixels = 0;
        uint64_t blended_pixels = 0;
    };

    class SmaaPipeline
    {
    public:
        // Missing or malformed tables are a configuration error. The pipeline stays
        // unready and every stage fails.
        Status build(SmaaLookupTablesRef luts)
        {
            luts_.reset();
            if (!luts) return status_error("SMAA lookup tables missing");
            if (luts->area.size() != kSmaaAreaLutByteSize || luts->search.size() != kSmaaSearchLutByteSize)
            {
                return status_error("SMAA lookup tables have unexpected dimensions");
            }
            luts_ = std::move(luts);
            return status_ok();
        }

        bool ready() const { return (bool)luts_; }
        const SmaaLookupTablesRef& lookup_tables() const { return luts_; }

        Result<uint64_t> detect_edges(
            IJobSystem* js,
            const ColorTexture& input,
            SmaaViewTargets& targets,
            const SmaaParams& params,
            TextureBudget* budget) const
        {
            if (!ready()) return Result<uint64_t>::failure(kUnavailable);
            const Status t = targets.ensure(input.extent(), budget);
            if (!t.ok) return t.forward_error<uint64_t>();
            return run_smaa_edge_detection(js, input, targets.edges, params.edge_mode, resolve_smaa_quality(params));
        }

        Result<uint64_t> compute_weights(
            IJobSystem* js,
            const EdgeTexture& edges,
            SmaaViewTargets& targets,
            const SmaaParams& params,
            TextureBudget* budget) const
        {
            if (!ready()) return Result<uint64_t>::failure(kUnavailable);
            const Status t = targets.ensure(edges.extent(), budget);
            if (!t.ok) return t.forward_error<uint64_t>();
            return run_smaa_blending_weights(js, edges, *luts_, targets.weights, resolve_smaa_quality(params));
        }

        Result<uint64_t> blend(
            IJobSystem* js,
            const ColorTexture& input,
            const BlendWeightTexture& weights,
            ColorTexture& output,
            TextureBudget* budget) const
        {
            if (!ready()) return Result<uint64_t>::failure(kUnavailable);
            if (&output == &input) return Result<uint64_t>::failure("SMAA output aliases its input");
            const Status t = ensure_texture(output, input.extent(), glm::vec4(0.0f), budget, "smaa.color");
            if (!t.ok) return t.forward_error<uint64_t>();
            return run_smaa_neighborhood_blending(js, input, weights, output);
        }

        // All three stages for one image. On failure `output` holds no valid frame and
        // the caller presents `input` unchanged.
        Result<SmaaRunStats> run(
            IJobSystem* js,
            const ColorTexture& input,
            SmaaViewTargets& targets,
            ColorTexture& output,
            const SmaaParams& params,
            TextureBudget* budget) const
        {
            SmaaRunStats stats{};

            auto edges = detect_edges(js, input, targets, params, budget);
            if (!edges.ok) return edges.forward_error<SmaaRunStats>();
            stats.edge_pixels = edges.value;

            auto weights = compute_weights(js, targets.edges, targets, params, budget);
            if (!weights.ok) return weights.forward_error<SmaaRunStats>();
            stats.weighted_pixels = weights.value;

            auto blended = blend(js, input, targets.weights, output, budget);
            if (!blended.ok) return blended.forward_error<SmaaRunStats>();
            stats.blended_pixels = blended.value;
            return Result<SmaaRunStats>::success(stats);
        }

    private:
        static constexpr const char* kUnavailable = "SMAA disabled: lookup tables unavailable";

        SmaaLookupTablesRef luts_{};
    };
}
