#define SDL_MAIN_HANDLED

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <thread>

#include <glm/glm.hpp>

#include <tsaa/core/context.hpp>
#include <tsaa/core/log.hpp>
#include <tsaa/frame/aa_presets.hpp>
#include <tsaa/job/thread_pool_job_system.hpp>
#include <tsaa/pipeline/antialiasing_pipeline.hpp>
#include <tsaa/platform/sdl/sdl_presenter.hpp>
#include <tsaa/smaa/smaa_lookup_tables.hpp>

/*
    HelloAntiAliasing demo
    - CPU "rasterizer": analytic rotating quad + sliding disc over a checker floor,
      point-sampled once per pixel at the jittered position
    - Pipeline: jitter -> SMAA (edge, weights, blend) -> TAA resolve -> history commit
    - Keys: 1 SMAA, 2 TAA, P preset, C clamp mode, I TAA input, R camera cut, SPACE pause
*/

namespace
{
    constexpr int WINDOW_W = 1280;
    constexpr int WINDOW_H = 720;
    constexpr int CANVAS_W = 320;
    constexpr int CANVAS_H = 180;

    struct SceneSample
    {
        glm::vec3 color{0.0f};
        float depth = 1.0f;
        // Canvas pixels, current - previous.
        glm::vec2 motion_px{0.0f};
    };

    struct AnimatedScene
    {
        float time = 0.0f;
        float prev_time = 0.0f;

        float quad_angle(float t) const { return 0.35f * t; }
        glm::vec2 disc_center(float t) const
        {
            return glm::vec2(CANVAS_W * (0.5f + 0.35f * std::sin(0.6f * t)), CANVAS_H * 0.72f);
        }

        // `p` in canvas pixel coordinates, y down.
        SceneSample sample(const glm::vec2& p) const
        {
            SceneSample s{};
            const int cx = (int)std::floor(p.x / 16.0f);
            const int cy = (int)std::floor(p.y / 16.0f);
            s.color = ((cx + cy) & 1) ? glm::vec3(0.18f, 0.2f, 0.24f) : glm::vec3(0.5f, 0.52f, 0.56f);

            const glm::vec2 dc = disc_center(time);
            if (glm::length(p - dc) <= 22.0f)
            {
                s.color = glm::vec3(1.6f, 0.55f, 0.12f);
                s.depth = 0.3f;
                s.motion_px = dc - disc_center(prev_time);
                return s;
            }

            const glm::vec2 qc(CANVAS_W * 0.5f, CANVAS_H * 0.42f);
            const float a = quad_angle(time);
            const glm::vec2 d = p - qc;
            const glm::vec2 local(std::cos(-a) * d.x - std::sin(-a) * d.y, std::sin(-a) * d.x + std::cos(-a) * d.y);
            if (std::abs(local.x) <= 48.0f && std::abs(local.y) <= 30.0f)
            {
                s.color = glm::vec3(0.92f, 0.95f, 1.0f);
                s.depth = 0.5f;
                const float pa = quad_angle(prev_time);
                const glm::vec2 prev(
                    std::cos(pa) * local.x - std::sin(pa) * local.y,
                    std::sin(pa) * local.x + std::cos(pa) * local.y);
                s.motion_px = p - (qc + prev);
            }
            return s;
        }
    };

    struct SceneTargets
    {
        tsaa::ColorTexture color{CANVAS_W, CANVAS_H, glm::vec4(0.0f)};
        tsaa::DepthTexture depth{CANVAS_W, CANVAS_H, 1.0f};
        tsaa::VelocityTexture velocity{CANVAS_W, CANVAS_H, glm::vec2(0.0f)};
    };

    // One sample per pixel at the jittered center. Velocity is written from unjittered
    // positions.
    void rasterize_scene(tsaa::IJobSystem* js, const AnimatedScene& scene, const glm::vec2& jitter_px, SceneTargets& out)
    {
        tsaa::parallel_for_rows(js, CANVAS_H, 8, [&](int y0, int y1) {
            for (int y = y0; y < y1; ++y)
            {
                for (int x = 0; x < CANVAS_W; ++x)
                {
                    const glm::vec2 center((float)x + 0.5f, (float)y + 0.5f);
                    const SceneSample jittered = scene.sample(center - jitter_px);
                    const SceneSample unjittered = scene.sample(center);
                    out.color.at(x, y) = glm::vec4(jittered.color, 1.0f);
                    out.depth.at(x, y) = jittered.depth;
                    out.velocity.at(x, y) = unjittered.motion_px / glm::vec2((float)CANVAS_W, (float)CANVAS_H);
                }
            }
        });
    }

    std::string make_title(const tsaa::AntiAliasingParams& p, const tsaa::ViewFrameResult& r, float ms)
    {
        std::string t = "HelloAntiAliasing | ";
        t += tsaa::anti_aliasing_composition_name(tsaa::anti_aliasing_composition_of(p));
        t += " | smaa ";
        t += tsaa::smaa_preset_name(p.smaa.preset);
        t += " | clamp ";
        t += tsaa::taa_clamp_mode_name(p.taa.clamp_mode);
        t += p.taa.input_source == tsaa::TaaInputSource::PostSmaa ? " | taa<-smaa" : " | taa<-scene";
        t += " | jitter " + std::to_string(r.jitter_index);
        if (r.degraded) t += " | DEGRADED";
        t += " | " + std::to_string((int)std::lround(ms)) + " ms";
        return t;
    }
}

int main()
{
    tsaa::PresenterDesc presenter_desc{};
    presenter_desc.title = "HelloAntiAliasing";
    presenter_desc.window_width = WINDOW_W;
    presenter_desc.window_height = WINDOW_H;
    presenter_desc.canvas = tsaa::TextureExtent{CANVAS_W, CANVAS_H};
    tsaa::SdlPresenter presenter{presenter_desc};
    if (!presenter.ready()) return 1;

    tsaa::Context ctx{};
    tsaa::ThreadPoolJobSystem jobs{std::max(1u, std::thread::hardware_concurrency())};
    ctx.job_system = &jobs;

    tsaa::AntiAliasingPipelineDesc desc{};
    desc.smaa_luts = tsaa::build_smaa_lookup_tables();
    tsaa::AntiAliasingPipeline pipeline{};
    const tsaa::PipelineBuildReport& report = pipeline.build(desc);
    for (const auto& e : report.errors) tsaa::log_error("build: " + e);

    constexpr uint32_t kViewId = 1;
    pipeline.create_view(kViewId);

    tsaa::AntiAliasingParams params = tsaa::make_anti_aliasing_params(tsaa::AntiAliasingComposition::SmaaTaa);
    AnimatedScene scene{};
    SceneTargets targets{};
    bool paused = false;

    // The jitter for a frame is published before geometry runs, so the scene is
    // rasterized inside an external node the graph orders after the jitter update.
    tsaa::PassIODesc geometry_io{};
    geometry_io.read(tsaa::aa_resource::kCameraJitter, tsaa::FrameResourceKind::Jitter);
    geometry_io.write(tsaa::aa_resource::kSceneColor, tsaa::FrameResourceKind::Color);
    geometry_io.write(tsaa::aa_resource::kSceneDepth, tsaa::FrameResourceKind::Depth);
    geometry_io.write(tsaa::aa_resource::kSceneVelocity, tsaa::FrameResourceKind::Velocity);
    pipeline.add_external_pass(std::make_shared<tsaa::CallbackRenderPass>(
        "demo_geometry", geometry_io,
        [&](tsaa::PassExecutionContext& pctx) {
            const tsaa::JitterFrame* jf = pctx.resources.jitter(tsaa::aa_resource::kCameraJitter);
            rasterize_scene(pctx.jobs, scene, jf ? jf->offset_px : glm::vec2(0.0f), targets);
            pctx.resources.bind_color(tsaa::aa_resource::kSceneColor, &targets.color);
            pctx.resources.bind_depth(tsaa::aa_resource::kSceneDepth, &targets.depth);
            pctx.resources.bind_velocity(tsaa::aa_resource::kSceneVelocity, &targets.velocity);
            return tsaa::PassExecutionResult::executed();
        }));

    auto last = std::chrono::steady_clock::now();
    float title_timer = 0.0f;
    tsaa::PlatformInputState input{};
    while (presenter.poll(input))
    {
        const auto now = std::chrono::steady_clock::now();
        const float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        if (input.toggle_smaa) params.smaa.enable = !params.smaa.enable;
        if (input.toggle_taa)
        {
            params.taa.enable = !params.taa.enable;
            params.jitter.enable = params.taa.enable;
        }
        if (input.cycle_smaa_preset) params.smaa.preset = tsaa::next_smaa_preset(params.smaa.preset);
        if (input.cycle_clamp_mode)
        {
            params.taa.clamp_mode = params.taa.clamp_mode == tsaa::TaaClampMode::VarianceClip
                ? tsaa::TaaClampMode::MinMax
                : tsaa::TaaClampMode::VarianceClip;
        }
        if (input.toggle_input_source)
        {
            params.taa.input_source = params.taa.input_source == tsaa::TaaInputSource::PostSmaa
                ? tsaa::TaaInputSource::PreSmaa
                : tsaa::TaaInputSource::PostSmaa;
        }
        if (input.pause_motion) paused = !paused;

        scene.prev_time = scene.time;
        if (!paused) scene.time += dt;

        const auto cpu_begin = std::chrono::steady_clock::now();
        pipeline.begin_frame(ctx);

        tsaa::ViewFrameRequest req{};
        req.view_id = kViewId;
        req.extent = tsaa::TextureExtent{CANVAS_W, CANVAS_H};
        req.params = params;
        req.history_invalid = input.camera_cut;
        req.projection = glm::mat4(1.0f);

        const tsaa::ViewFrameResult result = pipeline.execute_view(ctx, req);
        pipeline.end_frame();
        const float cpu_ms = std::chrono::duration<float, std::milli>(std::chrono::steady_clock::now() - cpu_begin).count();

        if (result.output) presenter.show(*result.output);

        title_timer += dt;
        if (title_timer > 0.25f)
        {
            presenter.set_caption(make_title(params, result, cpu_ms));
            title_timer = 0.0f;
        }
    }

    pipeline.shutdown();
    return 0;
}
