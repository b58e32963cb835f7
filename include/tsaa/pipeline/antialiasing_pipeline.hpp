#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: antialiasing_pipeline.hpp
    MODULE: pipeline
    PURPOSE: Host-facing orchestration. Owns the shared services (jitter sequence,
             history buffers, SMAA lookup tables, texture budget, frame timeline), keeps
             one compiled frame graph per view and runs the anti-aliasing nodes for each
             view of a frame.
*/


#include <exception>
#include <new>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "tsaa/core/context.hpp"
#include "tsaa/core/log.hpp"
#include "tsaa/frame/aa_params.hpp"
#include "tsaa/gfx/texture_budget.hpp"
#include "tsaa/job/parallel_for.hpp"
#include "tsaa/pipeline/frame_graph.hpp"
#include "tsaa/pipeline/frame_resources.hpp"
#include "tsaa/pipeline/pass_registry.hpp"
#include "tsaa/pipeline/render_pass.hpp"
#include "tsaa/pipeline/view_frame_state.hpp"
#include "tsaa/rhi/frame_timeline.hpp"
#include "tsaa/smaa/smaa_pipeline.hpp"
#include "tsaa/temporal/history_buffer.hpp"
#include "tsaa/temporal/jitter_sequence.hpp"

namespace tsaa
{
    struct AntiAliasingPipelineDesc
    {
        SmaaLookupTablesRef smaa_luts{};
        // 0 = unlimited.
        size_t texture_budget_bytes = 0;
        FrameTimelineConfig timeline{};
        uint32_t jitter_sequence_length = 8;
        float jitter_scale = 1.0f;
    };

    struct PipelineBuildReport
    {
        // False when any configuration error was found. The pipeline still runs with
        // the affected technique disabled.
        bool valid = true;
        bool smaa_available = false;
        bool taa_available = false;
        std::vector<std::string> errors{};
        std::vector<std::string> warnings{};
    };

    struct ViewFrameRequest
    {
        uint32_t view_id = 0;
        // Taken from `color` when left empty.
        TextureExtent extent{};
        AntiAliasingParams params{};
        // Camera cut, scene load or explicit reset.
        bool history_invalid = false;
        glm::mat4 projection{1.0f};

        // Imported as scene.color / scene.depth / scene.velocity. May be null when an
        // external pass produces them.
        const ColorTexture* color = nullptr;
        const DepthTexture* depth = nullptr;
        const VelocityTexture* velocity = nullptr;
    };

    struct PassRecord
    {
        std::string pass_id{};
        PassStatus status = PassStatus::Skipped;
        std::string message{};
    };

    struct ViewFrameResult
    {
        uint32_t view_id = 0;
        bool ok = false;
        // Final color for the next stage. Stays valid until this view executes again
        // or its deferred release completes.
        const ColorTexture* output = nullptr;

        glm::mat4 jittered_projection{1.0f};
        glm::vec2 jitter_px{0.0f};
        glm::vec2 jitter_ndc{0.0f};
        uint32_t jitter_index = 0;
        float mip_bias = 0.0f;

        bool smaa_applied = false;
        bool taa_applied = false;
        bool history_reset = false;
        // At least one node failed and fell back to identity.
        bool degraded = false;

        std::vector<PassRecord> passes{};
        FrameGraphReport graph_report{};
        AntiAliasingDebugStats stats{};
    };

    inline const char* anti_aliasing_final_output(TaaInputSource source)
    {
        return source == TaaInputSource::PreSmaa ? aa_resource::kSmaaColor : aa_resource::kTaaColor;
    }

    class AntiAliasingPipeline
    {
    public:
        AntiAliasingPipeline() = default;
        AntiAliasingPipeline(const AntiAliasingPipeline&) = delete;
        AntiAliasingPipeline& operator=(const AntiAliasingPipeline&) = delete;

        ~AntiAliasingPipeline()
        {
            shutdown();
        }

        const PipelineBuildReport& build(const AntiAliasingPipelineDesc& desc)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            report_ = PipelineBuildReport{};

            budget_.set_limit(desc.texture_budget_bytes);
            timeline_.configure(desc.timeline);

            if (!jitter_.configure(desc.jitter_sequence_length, desc.jitter_scale))
            {
                const std::string msg = "jitter sequence length " + std::to_string(desc.jitter_sequence_length)
                    + " clamped to " + std::to_string(jitter_.length());
                report_.warnings.push_back(msg);
                log_warn("AntiAliasingPipeline: " + msg);
            }

            const Status smaa_ok = smaa_.build(desc.smaa_luts);
            report_.smaa_available = smaa_ok.ok;
            if (!smaa_ok.ok)
            {
                report_.errors.push_back(smaa_ok.error + "; SMAA disabled");
                log_error("AntiAliasingPipeline: " + smaa_ok.error + "; SMAA disabled");
            }

            report_.taa_available = true;
            report_.valid = report_.errors.empty();
            built_ = true;
            ++graph_generation_;

            log_info(
                std::string("AntiAliasingPipeline built: smaa=") + (report_.smaa_available ? "on" : "off")
                + " jitter_length=" + std::to_string(jitter_.length())
                + " frames_in_flight=" + std::to_string(timeline_.frames_in_flight()));
            return report_;
        }

        bool built() const { return built_; }
        const PipelineBuildReport& report() const { return report_; }

        // Added to every view's graph, ordered by its declared IO. Executed once per view
        // per frame, possibly from several threads at once.
        void add_external_pass(std::shared_ptr<IRenderPass> pass)
        {
            if (!pass) return;
            std::lock_guard<std::mutex> lock(mtx_);
            external_passes_.push_back(std::move(pass));
            ++graph_generation_;
        }

        void clear_external_passes()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            external_passes_.clear();
            ++graph_generation_;
        }

        bool create_view(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (views_.find(view_id) != views_.end()) return false;
            views_[view_id] = make_view_record_locked(view_id);
            return true;
        }

        // Buffers the view used this frame stay alive until the timeline reports the
        // current serial complete.
        bool destroy_view(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = views_.find(view_id);
            if (it == views_.end()) return false;

            const uint64_t serial = timeline_.current_serial();
            history_.release_view(view_id, serial);
            jitter_.remove_view(view_id);
            for (auto& pass : it->second->passes) pass->on_view_destroyed(view_id);
            for (auto& pass : external_passes_) pass->on_view_destroyed(view_id);

            RetiredView retired{};
            retired.record = std::move(it->second);
            retired.serial = serial;
            retired_views_.push_back(std::move(retired));
            views_.erase(it);
            return true;
        }

        bool has_view(uint32_t view_id) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return views_.find(view_id) != views_.end();
        }

        size_t view_count() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return views_.size();
        }

        size_t retired_view_count() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return retired_views_.size();
        }

        uint64_t begin_frame(Context& ctx)
        {
            uint64_t serial = 0;
            uint64_t completed = 0;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                serial = timeline_.begin_frame();
                completed = timeline_.completed_serial();
                collect_retired_views_locked(completed);
            }
            ctx.begin_frame(serial);
            history_.collect(completed);
            return serial;
        }

        void end_frame()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            timeline_.end_frame();
        }

        ViewFrameResult execute_view(Context& ctx, const ViewFrameRequest& request)
        {
            return execute_view_impl(ctx, request, ctx.job_system);
        }

        // Views run concurrently on ctx.job_system. Their kernels then run single-threaded
        // so no pool worker waits on the pool.
        std::vector<ViewFrameResult> execute_views(Context& ctx, std::span<const ViewFrameRequest> requests)
        {
            std::vector<ViewFrameResult> results(requests.size());

            std::unordered_set<uint32_t> seen{};
            std::vector<bool> duplicate(requests.size(), false);
            for (size_t i = 0; i < requests.size(); ++i)
            {
                if (!seen.insert(requests[i].view_id).second) duplicate[i] = true;
            }

            IJobSystem* kernel_jobs = requests.size() > 1 ? nullptr : ctx.job_system;
            parallel_for_each_index(ctx.job_system, requests.size(), [&](size_t i) {
                if (duplicate[i])
                {
                    results[i].view_id = requests[i].view_id;
                    results[i].output = requests[i].color;
                    results[i].degraded = true;
                    ctx.report_diagnostic(requests[i].view_id, "pipeline", "view submitted twice in one frame; ignored");
                    return;
                }
                results[i] = execute_view_impl(ctx, requests[i], kernel_jobs);
            });
            return results;
        }

        // Waits for outstanding frames and frees everything.
        void shutdown()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            timeline_.end_frame();
            timeline_.wait_idle();
            for (auto& kv : views_) kv.second->state.release_targets(&budget_);
            views_.clear();
            for (auto& retired : retired_views_) retired.record->state.release_targets(&budget_);
            retired_views_.clear();
            history_.release_all();
        }

        JitterSequence& jitter_sequence() { return jitter_; }
        HistoryBufferManager& history_manager() { return history_; }
        const SmaaPipeline& smaa_pipeline() const { return smaa_; }
        TextureBudget& texture_budget() { return budget_; }
        FrameTimeline& timeline() { return timeline_; }

    private:
        struct ViewRecord
        {
            ViewFrameState state{};
            FrameResourceTable resources{};
            std::vector<std::unique_ptr<IRenderPass>> passes{};
            std::vector<std::shared_ptr<IRenderPass>> externals{};
            FrameGraph graph{};
            uint64_t graph_generation = 0;
            TaaInputSource wired_source = TaaInputSource::PostSmaa;
            bool taa_active_last_frame = false;
        };

        struct RetiredView
        {
            std::unique_ptr<ViewRecord> record{};
            uint64_t serial = 0;
        };

        std::unique_ptr<ViewRecord> make_view_record_locked(uint32_t view_id)
        {
            auto rec = std::make_unique<ViewRecord>();
            rec->state.view_id = view_id;
            return rec;
        }

        ViewRecord* find_or_create_view(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = views_.find(view_id);
            if (it != views_.end()) return it->second.get();
            auto& slot = views_[view_id];
            slot = make_view_record_locked(view_id);
            return slot.get();
        }

        void collect_retired_views_locked(uint64_t completed_serial)
        {
            for (auto it = retired_views_.begin(); it != retired_views_.end();)
            {
                if (it->serial <= completed_serial)
                {
                    it->record->state.release_targets(&budget_);
                    it = retired_views_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        // Standard chain: jitter, SMAA x3, TAA resolve, history commit, then host passes.
        // Insertion order is a tie-break only, the graph orders by declared IO.
        void rebuild_graph(ViewRecord& rec, TaaInputSource source)
        {
            std::vector<std::shared_ptr<IRenderPass>> externals{};
            uint64_t generation = 0;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                externals = external_passes_;
                generation = graph_generation_;
            }

            PassWiring smaa_wiring{};
            PassWiring taa_wiring{};
            if (source == TaaInputSource::PreSmaa)
            {
                taa_wiring.color_input = aa_resource::kSceneColor;
                smaa_wiring.color_input = aa_resource::kTaaColor;
            }
            else
            {
                smaa_wiring.color_input = aa_resource::kSceneColor;
                taa_wiring.color_input = aa_resource::kSmaaColor;
            }

            rec.passes.clear();
            rec.passes.push_back(registry_.create(PassId::JitterUpdate));
            rec.passes.push_back(registry_.create(PassId::SmaaEdgeDetection, smaa_wiring));
            rec.passes.push_back(registry_.create(PassId::SmaaBlendingWeights, smaa_wiring));
            rec.passes.push_back(registry_.create(PassId::SmaaNeighborhoodBlending, smaa_wiring));
            rec.passes.push_back(registry_.create(PassId::TaaResolve, taa_wiring));
            rec.passes.push_back(registry_.create(PassId::TaaHistoryCommit));

            rec.graph.clear();
            for (auto& pass : rec.passes) rec.graph.add_pass(pass.get());
            for (auto& pass : externals) rec.graph.add_pass(pass.get());
            // Shared with other views, kept alive while this graph references them.
            rec.externals = std::move(externals);

            const std::vector<std::string> imported = {
                aa_resource::kSceneColor,
                aa_resource::kSceneDepth,
                aa_resource::kSceneVelocity,
                aa_resource::kTaaHistory,
            };
            if (!rec.graph.compile(imported))
            {
                for (const auto& e : rec.graph.report().errors) log_error("AntiAliasingPipeline view " + std::to_string(rec.state.view_id) + ": " + e);
            }
            rec.graph_generation = generation;
            rec.wired_source = source;
        }

        std::string first_unproduced_input(const FrameGraphNode& node, const ViewRecord& rec) const
        {
            for (const auto& r : node.io.resources)
            {
                if (r.access != PassResourceAccess::Read) continue;
                if (rec.resources.has(r.name)) continue;
                for (const auto& other : rec.graph.nodes())
                {
                    if (other.pass == node.pass) continue;
                    for (const auto& w : other.io.resources)
                    {
                        if (w.key == r.key && w.access == PassResourceAccess::Write) return r.name;
                    }
                }
            }
            return {};
        }

        static void apply_fallbacks(const PassIODesc& io, FrameResourceTable& resources)
        {
            for (const auto& fb : io.fallbacks)
            {
                if (!resources.has(fb.output)) resources.alias(fb.output, fb.input);
            }
        }

        static PassExecutionResult run_pass_guarded(IRenderPass& pass, PassExecutionContext& pctx)
        {
            try
            {
                return pass.execute(pctx);
            }
            catch (const std::bad_alloc&)
            {
                return PassExecutionResult::failed("out of memory");
            }
            catch (const std::exception& e)
            {
                return PassExecutionResult::failed(std::string("exception: ") + e.what());
            }
        }

        ViewFrameResult execute_view_impl(Context& ctx, const ViewFrameRequest& request, IJobSystem* jobs)
        {
            ViewFrameResult result{};
            result.view_id = request.view_id;
            result.output = request.color;

            const TextureExtent extent = request.extent.valid()
                ? request.extent
                : (request.color ? request.color->extent() : TextureExtent{});
            if (!built_ || !extent.valid())
            {
                result.degraded = true;
                ctx.report_diagnostic(request.view_id, "pipeline",
                    !built_ ? "pipeline executed before build()" : "view has no valid extent");
                return result;
            }

            ViewRecord& rec = *find_or_create_view(request.view_id);

            const AntiAliasingParams& params = request.params;
            ViewFrameState& st = rec.state;
            st.begin_frame();

            const bool resized = st.extent.valid() && st.extent != extent;
            const bool taa_on = params.taa.enable;
            st.extent = extent;
            st.projection = request.projection;
            st.history_invalid =
                resized ||
                (request.history_invalid && params.taa.reset_on_camera_cut) ||
                (taa_on && !rec.taa_active_last_frame);
            rec.taa_active_last_frame = taa_on;
            if (st.history_invalid) history_.invalidate(request.view_id);

            uint64_t generation = 0;
            uint64_t serial = 0;
            bool smaa_available = false;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                generation = graph_generation_;
                serial = timeline_.current_serial();
                smaa_available = report_.smaa_available;
            }
            if (rec.graph_generation != generation || rec.wired_source != params.taa.input_source || rec.passes.empty())
            {
                rebuild_graph(rec, params.taa.input_source);
            }
            result.graph_report = rec.graph.report();
            if (!rec.graph.report().valid)
            {
                result.degraded = true;
                const std::string why = rec.graph.report().errors.empty() ? std::string("frame graph invalid") : rec.graph.report().errors.front();
                ctx.report_diagnostic(request.view_id, "frame_graph", why);
                return result;
            }

            const bool smaa_on = params.smaa.enable && smaa_available;
            for (auto& pass : rec.passes)
            {
                switch (pass->pass_id())
                {
                    case PassId::SmaaEdgeDetection:
                    case PassId::SmaaBlendingWeights:
                    case PassId::SmaaNeighborhoodBlending:
                        pass->set_enabled(smaa_on);
                        break;
                    case PassId::TaaResolve:
                    case PassId::TaaHistoryCommit:
                        pass->set_enabled(taa_on);
                        break;
                    default:
                        pass->set_enabled(true);
                        break;
                }
            }

            FrameResourceTable& res = rec.resources;
            res.clear();
            if (request.color) res.bind_color(aa_resource::kSceneColor, request.color);
            if (request.depth) res.bind_depth(aa_resource::kSceneDepth, request.depth);
            if (request.velocity) res.bind_velocity(aa_resource::kSceneVelocity, request.velocity);
            res.bind(aa_resource::kTaaHistory, FrameResourceKind::History, &st.history);

            const AntiAliasingServices services{&jitter_, &history_, &smaa_, &budget_};
            PassExecutionContext pctx{ctx, jobs, st, res, params, services, serial};

            bool smaa_ran = true;
            for (size_t idx : rec.graph.execution_order())
            {
                const FrameGraphNode& node = rec.graph.nodes()[idx];
                if (!node.pass) continue;

                PassExecutionResult r{};
                if (!node.pass->enabled())
                {
                    r = PassExecutionResult::skipped("disabled");
                }
                else
                {
                    const std::string missing = first_unproduced_input(node, rec);
                    if (!missing.empty())
                    {
                        r = PassExecutionResult::skipped("upstream did not produce '" + missing + "'");
                    }
                    else
                    {
                        r = run_pass_guarded(*node.pass, pctx);
                    }
                }

                if (r.status != PassStatus::Executed) apply_fallbacks(node.io, res);
                if (r.status == PassStatus::Executed)
                {
                    st.stats.passes_executed++;
                }
                else if (r.status == PassStatus::Failed)
                {
                    st.stats.passes_failed++;
                    result.degraded = true;
                    ctx.report_diagnostic(request.view_id, node.pass_id, r.message);
                }

                const PassId pid = node.pass->pass_id();
                if (pid == PassId::SmaaEdgeDetection || pid == PassId::SmaaBlendingWeights || pid == PassId::SmaaNeighborhoodBlending)
                {
                    smaa_ran = smaa_ran && r.status == PassStatus::Executed;
                }
                if (pid == PassId::TaaResolve) result.taa_applied = r.status == PassStatus::Executed;

                result.passes.push_back(PassRecord{node.pass_id, r.status, r.message});
            }
            result.smaa_applied = smaa_on && smaa_ran;

            const ColorTexture* out = res.color(anti_aliasing_final_output(params.taa.input_source));
            if (!out) out = res.color(aa_resource::kSceneColor);
            result.output = out;
            result.ok = out != nullptr;

            result.jittered_projection = st.jitter.jittered_projection;
            result.jitter_px = st.jitter.offset_px;
            result.jitter_ndc = st.jitter.offset_ndc;
            result.jitter_index = st.jitter.sequence_index;
            result.mip_bias = st.jitter.mip_bias;
            result.history_reset = taa_on && (st.history_invalid || !st.history.history_valid);
            result.stats = st.stats;

            ctx.add_stats(st.stats);
            return result;
        }

        mutable std::mutex mtx_{};
        bool built_ = false;
        PipelineBuildReport report_{};

        TextureBudget budget_{};
        JitterSequence jitter_{};
        HistoryBufferManager history_{&budget_};
        SmaaPipeline smaa_{};
        FrameTimeline timeline_{};
        PassFactoryRegistry registry_ = make_standard_pass_registry();

        std::unordered_map<uint32_t, std::unique_ptr<ViewRecord>> views_{};
        std::vector<RetiredView> retired_views_{};
        std::vector<std::shared_ptr<IRenderPass>> external_passes_{};
        uint64_t graph_generation_ = 0;
    };
}
