#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: pass_adapters.hpp
    MODULE: pipeline
    PURPOSE: Render-graph nodes wrapping the jitter, SMAA, TAA and history kernels.
             Each node declares its IO and binds what it produced into the frame
             resource table.
*/


#include <functional>
#include <string>
#include <utility>

#include "tsaa/core/log.hpp"
#include "tsaa/pipeline/frame_resources.hpp"
#include "tsaa/pipeline/render_pass.hpp"
#include "tsaa/smaa/smaa_pipeline.hpp"
#include "tsaa/temporal/jitter_sequence.hpp"
#include "tsaa/temporal/taa_resolve.hpp"

namespace tsaa
{
    namespace detail
    {
        inline std::string missing_input_message(const std::string& name)
        {
            return "required input '" + name + "' is not bound";
        }
    }

    class JitterUpdatePass final : public IRenderPass
    {
    public:
        const char* id() const override { return pass_id_name(PassId::JitterUpdate); }
        PassId pass_id() const override { return PassId::JitterUpdate; }

        PassIODesc describe_io() const override
        {
            PassIODesc io{};
            io.write(aa_resource::kCameraJitter, FrameResourceKind::Jitter);
            return io;
        }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            ViewFrameState& view = pctx.view;
            JitterFrame& jf = view.jitter;
            jf = JitterFrame{};
            jf.projection = view.projection;
            jf.jittered_projection = view.projection;

            const bool active = pctx.params.taa.enable && pctx.params.jitter.enable && pctx.services.jitter;
            if (active)
            {
                JitterSequence& seq = *pctx.services.jitter;
                const JitterParams& jp = pctx.params.jitter;
                if (seq.configure_view(view.view_id, jp.sequence_length, jp.scale) == JitterConfigChange::Clamped)
                {
                    log_warn("jitter_update: view " + std::to_string(view.view_id) + " sequence length "
                        + std::to_string(jp.sequence_length) + " clamped to "
                        + std::to_string(clamp_jitter_length(jp.sequence_length)));
                }
                if (view.history_invalid) seq.reset(view.view_id);
                jf.offset_px = seq.next(view.view_id, view.extent);
                const JitterState state = seq.state(view.view_id);
                jf.offset_ndc = state.offset_ndc;
                jf.sequence_index = state.index;
                jf.jittered_projection = jitter_projection(view.projection, jf.offset_ndc);
                jf.mip_bias = pctx.params.jitter.mip_bias;
            }

            pctx.resources.bind(aa_resource::kCameraJitter, FrameResourceKind::Jitter, &view.jitter);
            return PassExecutionResult::executed();
        }
    };

    class SmaaEdgeDetectionPass final : public IRenderPass
    {
    public:
        explicit SmaaEdgeDetectionPass(std::string input = aa_resource::kSceneColor)
            : input_(std::move(input))
        {}

        const char* id() const override { return pass_id_name(PassId::SmaaEdgeDetection); }
        PassId pass_id() const override { return PassId::SmaaEdgeDetection; }

        PassIODesc describe_io() const override
        {
            PassIODesc io{};
            io.read(input_, FrameResourceKind::Color);
            io.write(aa_resource::kSmaaEdges, FrameResourceKind::Edges);
            return io;
        }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            if (!pctx.services.smaa || !pctx.services.smaa->ready())
            {
                return PassExecutionResult::skipped("lookup tables unavailable");
            }
            const ColorTexture* color = pctx.resources.color(input_);
            if (!color) return PassExecutionResult::failed(detail::missing_input_message(input_));

            ViewFrameState& view = pctx.view;
            auto edges = pctx.services.smaa->detect_edges(
                pctx.jobs, *color, view.smaa_targets, pctx.params.smaa, pctx.services.budget);
            if (!edges.ok) return PassExecutionResult::failed(edges.error);

            view.stats.smaa_edge_pixels += edges.value;
            pctx.resources.bind_edges(aa_resource::kSmaaEdges, &view.smaa_targets.edges);
            return PassExecutionResult::executed();
        }

    private:
        std::string input_{};
    };

    class SmaaBlendingWeightsPass final : public IRenderPass
    {
    public:
        const char* id() const override { return pass_id_name(PassId::SmaaBlendingWeights); }
        PassId pass_id() const override { return PassId::SmaaBlendingWeights; }

        PassIODesc describe_io() const override
        {
            PassIODesc io{};
            io.read(aa_resource::kSmaaEdges, FrameResourceKind::Edges);
            io.write(aa_resource::kSmaaWeights, FrameResourceKind::BlendWeights);
            return io;
        }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            if (!pctx.services.smaa || !pctx.services.smaa->ready())
            {
                return PassExecutionResult::skipped("lookup tables unavailable");
            }
            const EdgeTexture* edges = pctx.resources.edges(aa_resource::kSmaaEdges);
            if (!edges) return PassExecutionResult::failed(detail::missing_input_message(aa_resource::kSmaaEdges));

            ViewFrameState& view = pctx.view;
            auto weights = pctx.services.smaa->compute_weights(
                pctx.jobs, *edges, view.smaa_targets, pctx.params.smaa, pctx.services.budget);
            if (!weights.ok) return PassExecutionResult::failed(weights.error);

            pctx.resources.bind_weights(aa_resource::kSmaaWeights, &view.smaa_targets.weights);
            return PassExecutionResult::executed();
        }
    };

    class SmaaNeighborhoodBlendingPass final : public IRenderPass
    {
    public:
        explicit SmaaNeighborhoodBlendingPass(std::string input = aa_resource::kSceneColor)
            : input_(std::move(input))
        {}

        const char* id() const override { return pass_id_name(PassId::SmaaNeighborhoodBlending); }
        PassId pass_id() const override { return PassId::SmaaNeighborhoodBlending; }

        PassIODesc describe_io() const override
        {
            PassIODesc io{};
            io.read(input_, FrameResourceKind::Color);
            io.read(aa_resource::kSmaaWeights, FrameResourceKind::BlendWeights);
            io.write(aa_resource::kSmaaColor, FrameResourceKind::Color);
            io.identity_fallback(aa_resource::kSmaaColor, input_);
            return io;
        }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            if (!pctx.services.smaa || !pctx.services.smaa->ready())
            {
                return PassExecutionResult::skipped("lookup tables unavailable");
            }
            const ColorTexture* color = pctx.resources.color(input_);
            if (!color) return PassExecutionResult::failed(detail::missing_input_message(input_));
            const BlendWeightTexture* weights = pctx.resources.weights(aa_resource::kSmaaWeights);
            if (!weights) return PassExecutionResult::failed(detail::missing_input_message(aa_resource::kSmaaWeights));

            ViewFrameState& view = pctx.view;
            auto blended = pctx.services.smaa->blend(pctx.jobs, *color, *weights, view.smaa_output, pctx.services.budget);
            if (!blended.ok) return PassExecutionResult::failed(blended.error);

            view.stats.smaa_blended_pixels += blended.value;
            pctx.resources.bind_color(aa_resource::kSmaaColor, &view.smaa_output);
            return PassExecutionResult::executed();
        }

    private:
        std::string input_{};
    };

    class TaaResolvePass final : public IRenderPass
    {
    public:
        explicit TaaResolvePass(std::string input = aa_resource::kSmaaColor)
            : input_(std::move(input))
        {}

        const char* id() const override { return pass_id_name(PassId::TaaResolve); }
        PassId pass_id() const override { return PassId::TaaResolve; }

        PassIODesc describe_io() const override
        {
            PassIODesc io{};
            io.read(input_, FrameResourceKind::Color);
            io.read(aa_resource::kSceneDepth, FrameResourceKind::Depth);
            io.read(aa_resource::kSceneVelocity, FrameResourceKind::Velocity);
            io.read(aa_resource::kTaaHistory, FrameResourceKind::History);
            io.write(aa_resource::kTaaColor, FrameResourceKind::Color);
            io.write(aa_resource::kTaaHistoryNext, FrameResourceKind::History);
            io.identity_fallback(aa_resource::kTaaColor, input_);
            return io;
        }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            ViewFrameState& view = pctx.view;
            HistoryBufferManager* history = pctx.services.history;
            if (!history) return PassExecutionResult::failed("history buffer manager unavailable");

            // Whatever goes wrong here, next frame must not blend against this one.
            auto fail = [&](std::string why) {
                history->invalidate(view.view_id);
                return PassExecutionResult::failed(std::move(why));
            };

            const ColorTexture* color = pctx.resources.color(input_);
            if (!color) return fail(detail::missing_input_message(input_));
            const DepthTexture* depth = pctx.resources.depth(aa_resource::kSceneDepth);
            if (!depth) return fail(detail::missing_input_message(aa_resource::kSceneDepth));
            const VelocityTexture* velocity = pctx.resources.velocity(aa_resource::kSceneVelocity);
            if (!velocity) return fail(detail::missing_input_message(aa_resource::kSceneVelocity));

            const TextureExtent extent = color->extent();
            auto acq = history->acquire(view.view_id, extent, pctx.frame_serial);
            if (!acq.ok) return fail(acq.error);
            view.history = acq.value;
            view.history_acquired = true;
            if (view.history.reallocated) view.stats.history_reallocations++;
            pctx.resources.bind(aa_resource::kTaaHistory, FrameResourceKind::History, &view.history);

            const Status target = ensure_texture(view.taa_output, extent, glm::vec4(0.0f), pctx.services.budget, "taa.color");
            if (!target.ok) return fail(target.error);

            TaaResolveInputs in{};
            in.current = color;
            in.depth = depth;
            in.velocity = velocity;
            in.history_color = view.history.read_color;
            in.history_depth = view.history.read_depth;
            in.history_valid = view.history.history_valid && !view.history_invalid;

            TaaResolveOutputs out{};
            out.color = &view.taa_output;
            out.history_color = view.history.write_color;
            out.history_depth = view.history.write_depth;

            auto stats = run_taa_resolve(pctx.jobs, in, out, pctx.params.taa);
            if (!stats.ok) return fail(stats.error);

            view.stats.taa_history_pixels += stats.value.accumulated_pixels;
            view.stats.taa_disoccluded_pixels += stats.value.disoccluded_pixels;
            view.stats.taa_depth_rejected_pixels += stats.value.depth_rejected_pixels;

            pctx.resources.bind_color(aa_resource::kTaaColor, &view.taa_output);
            pctx.resources.bind(aa_resource::kTaaHistoryNext, FrameResourceKind::History, &view.history);
            return PassExecutionResult::executed();
        }

    private:
        std::string input_{};
    };

    class TaaHistoryCommitPass final : public IRenderPass
    {
    public:
        const char* id() const override { return pass_id_name(PassId::TaaHistoryCommit); }
        PassId pass_id() const override { return PassId::TaaHistoryCommit; }

        PassIODesc describe_io() const override
        {
            PassIODesc io{};
            io.read(aa_resource::kTaaHistoryNext, FrameResourceKind::History);
            io.read_write(aa_resource::kTaaHistory, FrameResourceKind::History);
            return io;
        }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            HistoryBufferManager* history = pctx.services.history;
            if (!history) return PassExecutionResult::failed("history buffer manager unavailable");

            const uint32_t view_id = pctx.view.view_id;
            if (!pctx.resources.history(aa_resource::kTaaHistoryNext))
            {
                history->invalidate(view_id);
                return PassExecutionResult::skipped("no resolved history this frame");
            }
            if (!history->commit(view_id))
            {
                return PassExecutionResult::failed("history commit for unknown view " + std::to_string(view_id));
            }
            return PassExecutionResult::executed();
        }
    };

    // Host-provided node, e.g. the geometry/velocity producer. It participates in
    // ordering through its declared IO and binds its own outputs.
    class CallbackRenderPass final : public IRenderPass
    {
    public:
        using ExecuteFn = std::function<PassExecutionResult(PassExecutionContext&)>;

        CallbackRenderPass(std::string id, PassIODesc io, ExecuteFn fn)
            : id_(std::move(id)), io_(std::move(io)), fn_(std::move(fn))
        {}

        const char* id() const override { return id_.c_str(); }
        PassIODesc describe_io() const override { return io_; }

        PassExecutionResult execute(PassExecutionContext& pctx) override
        {
            if (!fn_) return PassExecutionResult::skipped("no callback");
            return fn_(pctx);
        }

    private:
        std::string id_{};
        PassIODesc io_{};
        ExecuteFn fn_{};
    };
}
