#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "tsaa/core/context.hpp"
#include "tsaa/core/log.hpp"
#include "tsaa/frame/aa_presets.hpp"
#include "tsaa/job/thread_pool_job_system.hpp"
#include "tsaa/pipeline/antialiasing_pipeline.hpp"
#include "tsaa/smaa/smaa_lookup_tables.hpp"

namespace
{
    struct SceneInputs
    {
        tsaa::ColorTexture color{};
        tsaa::DepthTexture depth{};
        tsaa::VelocityTexture velocity{};

        SceneInputs(int w, int h)
            : color(w, h, glm::vec4(0.1f, 0.1f, 0.1f, 1.0f)),
              depth(w, h, 0.5f),
              velocity(w, h, glm::vec2(0.0f))
        {
            // Diagonal boundary so SMAA has something to find.
            for (int y = 0; y < h; ++y)
            {
                for (int x = 0; x < w; ++x)
                {
                    if (x >= y + w / 4) color.at(x, y) = glm::vec4(0.9f, 0.9f, 0.9f, 1.0f);
                }
            }
        }
    };

    tsaa::ViewFrameRequest make_request(uint32_t view_id, const SceneInputs& s, tsaa::AntiAliasingComposition composition)
    {
        tsaa::ViewFrameRequest req{};
        req.view_id = view_id;
        req.params = tsaa::make_anti_aliasing_params(composition);
        req.color = &s.color;
        req.depth = &s.depth;
        req.velocity = &s.velocity;
        return req;
    }

    tsaa::AntiAliasingPipelineDesc default_desc()
    {
        tsaa::AntiAliasingPipelineDesc desc{};
        desc.smaa_luts = tsaa::build_smaa_lookup_tables();
        return desc;
    }

    int pass_position(const tsaa::ViewFrameResult& r, const std::string& id)
    {
        for (size_t i = 0; i < r.passes.size(); ++i)
        {
            if (r.passes[i].pass_id == id) return (int)i;
        }
        return -1;
    }

    const tsaa::PassRecord* find_pass(const tsaa::ViewFrameResult& r, const std::string& id)
    {
        const int i = pass_position(r, id);
        return i < 0 ? nullptr : &r.passes[(size_t)i];
    }

    size_t order_of(const tsaa::FrameGraph& g, const std::string& id)
    {
        const auto& order = g.execution_order();
        for (size_t i = 0; i < order.size(); ++i)
        {
            if (g.nodes()[order[i]].pass_id == id) return i;
        }
        return order.size();
    }

    bool test_graph_orders_shuffled_nodes()
    {
        const tsaa::PassFactoryRegistry reg = tsaa::make_standard_pass_registry();
        std::vector<std::unique_ptr<tsaa::IRenderPass>> passes{};
        passes.push_back(reg.create(tsaa::PassId::TaaHistoryCommit));
        passes.push_back(reg.create(tsaa::PassId::SmaaNeighborhoodBlending));
        passes.push_back(reg.create(tsaa::PassId::TaaResolve, tsaa::PassWiring{tsaa::aa_resource::kSmaaColor}));
        passes.push_back(reg.create(tsaa::PassId::SmaaBlendingWeights));
        passes.push_back(reg.create(tsaa::PassId::JitterUpdate));
        passes.push_back(reg.create(tsaa::PassId::SmaaEdgeDetection));

        tsaa::FrameGraph graph{};
        for (auto& p : passes)
        {
            if (!p) return false;
            graph.add_pass(p.get());
        }
        const bool ok = graph.compile({
            tsaa::aa_resource::kSceneColor,
            tsaa::aa_resource::kSceneDepth,
            tsaa::aa_resource::kSceneVelocity,
            tsaa::aa_resource::kTaaHistory,
        });
        if (!ok || !graph.report().valid) return false;
        if (graph.execution_order().size() != passes.size()) return false;
        if (!graph.report().unresolved_reads.empty()) return false;

        const size_t edge = order_of(graph, "smaa_edge_detection");
        const size_t weights = order_of(graph, "smaa_blending_weights");
        const size_t blend = order_of(graph, "smaa_neighborhood_blending");
        const size_t resolve = order_of(graph, "taa_resolve");
        const size_t commit = order_of(graph, "taa_history_commit");
        if (!(edge < weights && weights < blend && blend < resolve && resolve < commit)) return false;

        const auto& w = graph.report().warnings;
        return std::find(w.begin(), w.end(), "FrameGraph reordered passes to satisfy resource dependencies.") != w.end();
    }

    bool test_graph_reports_cycles_and_unresolved_reads()
    {
        auto noop = [](tsaa::PassExecutionContext&) { return tsaa::PassExecutionResult::executed(); };

        tsaa::PassIODesc a_io{};
        a_io.read("x", tsaa::FrameResourceKind::Color);
        a_io.write("y", tsaa::FrameResourceKind::Color);
        tsaa::PassIODesc b_io{};
        b_io.read("y", tsaa::FrameResourceKind::Color);
        b_io.write("x", tsaa::FrameResourceKind::Color);
        tsaa::CallbackRenderPass a{"pass_a", a_io, noop};
        tsaa::CallbackRenderPass b{"pass_b", b_io, noop};

        tsaa::FrameGraph cyclic{};
        cyclic.add_pass(&a);
        cyclic.add_pass(&b);
        if (cyclic.compile()) return false;
        if (cyclic.report().valid || cyclic.report().errors.empty()) return false;
        if (!cyclic.execution_order().empty()) return false;
        const std::string& err = cyclic.report().errors.front();
        if (err.find("cycle") == std::string::npos || err.find("pass_a") == std::string::npos) return false;

        tsaa::PassIODesc c_io{};
        c_io.read("never.written", tsaa::FrameResourceKind::Color);
        c_io.write("z", tsaa::FrameResourceKind::Color);
        tsaa::CallbackRenderPass c{"pass_c", c_io, noop};
        tsaa::FrameGraph dangling{};
        dangling.add_pass(&c);
        if (!dangling.compile()) return false;
        const auto& unresolved = dangling.report().unresolved_reads;
        return unresolved.size() == 1u && unresolved.front() == "never.written" && dangling.produces("z");
    }

    bool test_registry()
    {
        tsaa::PassFactoryRegistry reg = tsaa::make_standard_pass_registry();
        const std::vector<std::string> ids = reg.ids();
        if (ids.size() != 6u) return false;
        if (!std::is_sorted(ids.begin(), ids.end())) return false;
        if (!reg.has(tsaa::PassId::TaaResolve) || !reg.has("smaa_edge_detection")) return false;
        if (reg.create("no_such_pass")) return false;
        if (reg.create(tsaa::PassId::Unknown)) return false;

        tsaa::PassWiring wiring{};
        wiring.color_input = tsaa::aa_resource::kSceneColor;
        auto taa = reg.create(tsaa::PassId::TaaResolve, wiring);
        if (!taa || taa->pass_id() != tsaa::PassId::TaaResolve) return false;
        bool reads_scene = false;
        for (const auto& r : taa->describe_io().resources)
        {
            if (r.name == tsaa::aa_resource::kSceneColor && r.access == tsaa::PassResourceAccess::Read) reads_scene = true;
        }
        if (!reads_scene) return false;

        if (reg.register_factory("", [](const tsaa::PassWiring&) { return std::unique_ptr<tsaa::IRenderPass>{}; })) return false;
        return reg.register_factory("custom", [](const tsaa::PassWiring&) {
            return std::make_unique<tsaa::JitterUpdatePass>();
        }) && reg.has("custom");
    }

    bool test_multi_frame_with_resize()
    {
        tsaa::AntiAliasingPipeline pipeline{};
        const auto& report = pipeline.build(default_desc());
        if (!report.valid || !report.smaa_available || !report.taa_available) return false;

        tsaa::Context ctx{};
        SceneInputs big{32, 16};
        SceneInputs small{24, 12};

        for (int frame = 0; frame < 4; ++frame)
        {
            pipeline.begin_frame(ctx);
            const tsaa::ViewFrameRequest req = make_request(1u, big, tsaa::AntiAliasingComposition::SmaaTaa);
            const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, req);
            pipeline.end_frame();

            if (!r.ok || r.degraded || !r.output) return false;
            if (r.output->extent() != big.color.extent()) return false;
            if (!r.smaa_applied || !r.taa_applied) return false;
            if (frame == 0 && !r.history_reset) return false;
            if (frame > 0 && r.history_reset) return false;
            if (pass_position(r, "smaa_neighborhood_blending") > pass_position(r, "taa_resolve")) return false;
        }

        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult resized = pipeline.execute_view(ctx, make_request(1u, small, tsaa::AntiAliasingComposition::SmaaTaa));
        pipeline.end_frame();
        if (!resized.ok || resized.degraded || !resized.output) return false;
        if (resized.output->extent() != small.color.extent()) return false;
        if (!resized.history_reset) return false;
        if (resized.stats.history_reallocations == 0) return false;
        return ctx.debug.passes_executed == 6u;
    }

    bool test_pre_smaa_order()
    {
        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(default_desc());
        tsaa::Context ctx{};
        SceneInputs s{16, 16};

        tsaa::ViewFrameRequest req = make_request(3u, s, tsaa::AntiAliasingComposition::SmaaTaa);
        req.params.taa.input_source = tsaa::TaaInputSource::PreSmaa;
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, req);
        pipeline.end_frame();
        if (!r.ok || r.degraded || !r.output) return false;
        if (!(pass_position(r, "taa_resolve") < pass_position(r, "smaa_edge_detection"))) return false;
        return r.smaa_applied && r.taa_applied;
    }

    bool test_budget_failure_degrades_to_pass_through()
    {
        tsaa::AntiAliasingPipelineDesc desc = default_desc();
        desc.texture_budget_bytes = 256;
        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(desc);

        tsaa::Context ctx{};
        SceneInputs s{32, 16};
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, make_request(1u, s, tsaa::AntiAliasingComposition::SmaaTaa));
        pipeline.end_frame();

        if (!r.ok || !r.degraded) return false;
        if (r.output != &s.color) return false;
        if (r.smaa_applied || r.taa_applied) return false;
        const tsaa::PassRecord* edge = find_pass(r, "smaa_edge_detection");
        const tsaa::PassRecord* weights = find_pass(r, "smaa_blending_weights");
        const tsaa::PassRecord* resolve = find_pass(r, "taa_resolve");
        if (!edge || edge->status != tsaa::PassStatus::Failed) return false;
        if (!weights || weights->status != tsaa::PassStatus::Skipped) return false;
        if (!resolve || resolve->status != tsaa::PassStatus::Failed) return false;
        if (ctx.diagnostics.size() < 2u) return false;
        return pipeline.texture_budget().used_bytes() <= 256u;
    }

    bool test_destroy_view_is_deferred()
    {
        tsaa::AntiAliasingPipelineDesc desc = default_desc();
        desc.timeline.frames_in_flight = 2;
        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(desc);

        tsaa::Context ctx{};
        SceneInputs s{16, 8};
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, make_request(9u, s, tsaa::AntiAliasingComposition::SmaaTaa));
        if (!r.ok) return false;
        if (!pipeline.destroy_view(9u)) return false;
        if (pipeline.destroy_view(9u)) return false;
        pipeline.end_frame();
        if (pipeline.has_view(9u) || pipeline.retired_view_count() != 1u) return false;
        if (pipeline.texture_budget().used_bytes() == 0u) return false;

        // Frame 1 is still in flight while frame 2 records.
        pipeline.begin_frame(ctx);
        pipeline.end_frame();
        if (pipeline.retired_view_count() != 1u) return false;

        pipeline.begin_frame(ctx);
        pipeline.end_frame();
        if (pipeline.retired_view_count() != 0u) return false;
        return pipeline.history_manager().live_slot_count() == 0u && pipeline.texture_budget().used_bytes() == 0u;
    }

    bool test_camera_cut_restarts_jitter()
    {
        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(default_desc());
        tsaa::Context ctx{};
        SceneInputs s{16, 16};

        for (uint32_t frame = 0; frame < 3; ++frame)
        {
            pipeline.begin_frame(ctx);
            const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, make_request(2u, s, tsaa::AntiAliasingComposition::Taa));
            pipeline.end_frame();
            if (!r.ok || r.jitter_index != frame) return false;
            if (frame == 0)
            {
                if (r.jitter_px != tsaa::jitter_term(0)) return false;
                if (r.jittered_projection == glm::mat4(1.0f)) return false;
            }
        }

        tsaa::ViewFrameRequest cut = make_request(2u, s, tsaa::AntiAliasingComposition::Taa);
        cut.history_invalid = true;
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, cut);
        pipeline.end_frame();
        if (!r.ok || r.jitter_index != 0u || !r.history_reset) return false;
        return r.stats.taa_history_pixels == 0u;
    }

    bool test_external_pass_runs_before_smaa()
    {
        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(default_desc());

        SceneInputs scene{16, 16};
        glm::vec2 seen_jitter{-9.0f};
        tsaa::PassIODesc io{};
        io.read(tsaa::aa_resource::kCameraJitter, tsaa::FrameResourceKind::Jitter);
        io.write(tsaa::aa_resource::kSceneColor, tsaa::FrameResourceKind::Color);
        io.write(tsaa::aa_resource::kSceneDepth, tsaa::FrameResourceKind::Depth);
        io.write(tsaa::aa_resource::kSceneVelocity, tsaa::FrameResourceKind::Velocity);
        pipeline.add_external_pass(std::make_shared<tsaa::CallbackRenderPass>(
            "scene_producer", io,
            [&](tsaa::PassExecutionContext& pctx) {
                const tsaa::JitterFrame* jf = pctx.resources.jitter(tsaa::aa_resource::kCameraJitter);
                if (!jf) return tsaa::PassExecutionResult::failed("no jitter");
                seen_jitter = jf->offset_px;
                pctx.resources.bind_color(tsaa::aa_resource::kSceneColor, &scene.color);
                pctx.resources.bind_depth(tsaa::aa_resource::kSceneDepth, &scene.depth);
                pctx.resources.bind_velocity(tsaa::aa_resource::kSceneVelocity, &scene.velocity);
                return tsaa::PassExecutionResult::executed();
            }));

        tsaa::Context ctx{};
        tsaa::ViewFrameRequest req{};
        req.view_id = 4u;
        req.extent = tsaa::TextureExtent{16, 16};
        req.params = tsaa::make_anti_aliasing_params(tsaa::AntiAliasingComposition::SmaaTaa);
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, req);
        pipeline.end_frame();

        if (!r.ok || r.degraded || !r.output) return false;
        const tsaa::PassRecord* producer = find_pass(r, "scene_producer");
        if (!producer || producer->status != tsaa::PassStatus::Executed) return false;
        if (!(pass_position(r, "jitter_update") < pass_position(r, "scene_producer"))) return false;
        if (!(pass_position(r, "scene_producer") < pass_position(r, "smaa_edge_detection"))) return false;
        if (seen_jitter != r.jitter_px) return false;
        return r.output->extent() == scene.color.extent() && r.smaa_applied && r.taa_applied;
    }

    bool test_missing_lookup_tables_disable_smaa()
    {
        std::vector<std::string> logged_errors{};
        tsaa::set_log_sink([&](tsaa::LogLevel level, const std::string& msg) {
            if (level == tsaa::LogLevel::Error) logged_errors.push_back(msg);
        });
        tsaa::AntiAliasingPipelineDesc desc{};
        tsaa::AntiAliasingPipeline pipeline{};
        const auto& report = pipeline.build(desc);
        tsaa::set_log_sink({});
        if (report.valid || report.smaa_available || report.errors.empty()) return false;
        if (logged_errors.size() != 1u || logged_errors.front().find("SMAA disabled") == std::string::npos) return false;
        if (!report.taa_available) return false;

        tsaa::Context ctx{};
        SceneInputs s{16, 16};
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, make_request(1u, s, tsaa::AntiAliasingComposition::Smaa));
        pipeline.end_frame();
        if (!r.ok || r.degraded || r.smaa_applied) return false;
        return r.output == &s.color;
    }

    bool test_off_composition_is_identity()
    {
        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(default_desc());
        tsaa::Context ctx{};
        SceneInputs s{8, 8};
        pipeline.begin_frame(ctx);
        const tsaa::ViewFrameResult r = pipeline.execute_view(ctx, make_request(1u, s, tsaa::AntiAliasingComposition::Off));
        pipeline.end_frame();
        if (!r.ok || r.degraded || r.output != &s.color) return false;
        if (r.smaa_applied || r.taa_applied || r.history_reset) return false;
        return r.jitter_px == glm::vec2(0.0f) && r.jitter_index == 0u;
    }

    bool test_execute_views_on_thread_pool()
    {
        tsaa::ThreadPoolJobSystem jobs{3};
        tsaa::Context ctx{};
        ctx.job_system = &jobs;

        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(default_desc());

        SceneInputs a{32, 16};
        SceneInputs b{16, 16};
        SceneInputs c{24, 8};
        std::vector<tsaa::ViewFrameRequest> requests{};
        requests.push_back(make_request(1u, a, tsaa::AntiAliasingComposition::SmaaTaa));
        requests.push_back(make_request(2u, b, tsaa::AntiAliasingComposition::Smaa));
        requests.push_back(make_request(3u, c, tsaa::AntiAliasingComposition::Taa));
        requests.push_back(make_request(1u, a, tsaa::AntiAliasingComposition::SmaaTaa));

        for (int frame = 0; frame < 3; ++frame)
        {
            pipeline.begin_frame(ctx);
            const std::vector<tsaa::ViewFrameResult> results = pipeline.execute_views(ctx, requests);
            pipeline.end_frame();
            if (results.size() != 4u) return false;
            for (size_t i = 0; i < 3; ++i)
            {
                if (!results[i].ok || results[i].degraded || !results[i].output) return false;
                if (results[i].output->extent() != requests[i].color->extent()) return false;
                if (results[i].view_id != requests[i].view_id) return false;
            }
            if (!results[3].degraded) return false;
            if (ctx.diagnostics.size() != 1u) return false;
        }
        return pipeline.view_count() == 3u;
    }

    bool test_views_with_different_jitter_and_depth()
    {
        tsaa::ThreadPoolJobSystem jobs{2};
        tsaa::Context ctx{};
        ctx.job_system = &jobs;

        tsaa::AntiAliasingPipeline pipeline{};
        pipeline.build(default_desc());

        SceneInputs a{16, 16};
        SceneInputs b{16, 16};
        // Closer block in front of the 0.5 background.
        for (int y = 5; y < 11; ++y)
        {
            for (int x = 5; x < 11; ++x) b.depth.at(x, y) = 0.2f;
        }

        std::vector<tsaa::ViewFrameRequest> requests{};
        requests.push_back(make_request(1u, a, tsaa::AntiAliasingComposition::SmaaTaa));
        requests.push_back(make_request(2u, b, tsaa::AntiAliasingComposition::SmaaTaa));
        requests[0].params.jitter.sequence_length = 8u;
        requests[1].params.jitter.sequence_length = 16u;

        for (uint32_t frame = 0; frame < 20u; ++frame)
        {
            pipeline.begin_frame(ctx);
            const std::vector<tsaa::ViewFrameResult> results = pipeline.execute_views(ctx, requests);
            pipeline.end_frame();
            if (results.size() != 2u) return false;
            if (!results[0].ok || !results[1].ok) return false;
            if (results[0].jitter_index != frame % 8u) return false;
            if (results[1].jitter_index != frame % 16u) return false;

            if (frame == 0u) continue;
            const tsaa::AntiAliasingDebugStats& st = results[1].stats;
            if (st.taa_depth_rejected_pixels != 0u) return false;
            if (st.taa_history_pixels != 16u * 16u) return false;
        }
        return true;
    }
}

int main()
{
    const bool ok_order = test_graph_orders_shuffled_nodes();
    const bool ok_cycle = test_graph_reports_cycles_and_unresolved_reads();
    const bool ok_registry = test_registry();
    const bool ok_frames = test_multi_frame_with_resize();
    const bool ok_pre = test_pre_smaa_order();
    const bool ok_budget = test_budget_failure_degrades_to_pass_through();
    const bool ok_destroy = test_destroy_view_is_deferred();
    const bool ok_cut = test_camera_cut_restarts_jitter();
    const bool ok_external = test_external_pass_runs_before_smaa();
    const bool ok_luts = test_missing_lookup_tables_disable_smaa();
    const bool ok_off = test_off_composition_is_identity();
    const bool ok_views = test_execute_views_on_thread_pool();
    const bool ok_mixed = test_views_with_different_jitter_and_depth();

    if (!ok_order) std::fprintf(stderr, "[pipeline-tests] graph ordering failed\n");
    if (!ok_cycle) std::fprintf(stderr, "[pipeline-tests] graph cycle/unresolved detection failed\n");
    if (!ok_registry) std::fprintf(stderr, "[pipeline-tests] pass registry failed\n");
    if (!ok_frames) std::fprintf(stderr, "[pipeline-tests] multi-frame/resize failed\n");
    if (!ok_pre) std::fprintf(stderr, "[pipeline-tests] pre-SMAA TAA wiring failed\n");
    if (!ok_budget) std::fprintf(stderr, "[pipeline-tests] budget degradation failed\n");
    if (!ok_destroy) std::fprintf(stderr, "[pipeline-tests] deferred view destroy failed\n");
    if (!ok_cut) std::fprintf(stderr, "[pipeline-tests] camera cut jitter reset failed\n");
    if (!ok_external) std::fprintf(stderr, "[pipeline-tests] external pass ordering failed\n");
    if (!ok_luts) std::fprintf(stderr, "[pipeline-tests] missing lookup tables failed\n");
    if (!ok_off) std::fprintf(stderr, "[pipeline-tests] off composition failed\n");
    if (!ok_views) std::fprintf(stderr, "[pipeline-tests] multi-view execution failed\n");
    if (!ok_mixed) std::fprintf(stderr, "[pipeline-tests] per-view jitter and depth edges failed\n");

    if (!(ok_order && ok_cycle && ok_registry && ok_frames && ok_pre && ok_budget && ok_destroy && ok_cut && ok_external && ok_luts && ok_off && ok_views && ok_mixed))
    {
        return 1;
    }
    std::fprintf(stderr, "[pipeline-tests] all tests passed\n");
    return 0;
}
