#include <algorithm>
#include <cmath>
#include <cstdio>

#include <glm/glm.hpp>

#include "tsaa/temporal/history_buffer.hpp"
#include "tsaa/temporal/taa_resolve.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    constexpr int W = 8;
    constexpr int H = 8;

    struct ResolveFixture
    {
        tsaa::ColorTexture current{W, H, glm::vec4(0.4f, 0.4f, 0.4f, 1.0f)};
        tsaa::DepthTexture depth{W, H, 0.5f};
        tsaa::VelocityTexture velocity{W, H, glm::vec2(0.0f)};
        tsaa::ColorTexture history_color{W, H, glm::vec4(0.9f, 0.1f, 0.1f, 5.0f)};
        tsaa::DepthTexture history_depth{W, H, 0.5f};

        tsaa::ColorTexture out_color{W, H, glm::vec4(0.0f)};
        tsaa::ColorTexture out_history_color{W, H, glm::vec4(0.0f)};
        tsaa::DepthTexture out_history_depth{W, H, 1.0f};

        tsaa::TaaResolveInputs inputs(bool history_valid) const
        {
            tsaa::TaaResolveInputs in{};
            in.current = &current;
            in.depth = &depth;
            in.velocity = &velocity;
            in.history_color = &history_color;
            in.history_depth = &history_depth;
            in.history_valid = history_valid;
            return in;
        }

        tsaa::TaaResolveOutputs outputs()
        {
            return tsaa::TaaResolveOutputs{&out_color, &out_history_color, &out_history_depth};
        }

        bool output_equals_current() const
        {
            for (int y = 0; y < H; ++y)
            {
                for (int x = 0; x < W; ++x)
                {
                    if (out_color.at(x, y) != current.at(x, y)) return false;
                }
            }
            return true;
        }
    };

    tsaa::TaaParams taa_params()
    {
        tsaa::TaaParams p{};
        p.enable = true;
        return p;
    }

    bool test_reset_outputs_current_exactly()
    {
        ResolveFixture f{};
        const auto r = tsaa::run_taa_resolve(nullptr, f.inputs(false), f.outputs(), taa_params());
        if (!r.ok) return false;
        if (r.value.reset_pixels != (uint64_t)(W * H) || r.value.accumulated_pixels != 0) return false;
        if (!f.output_equals_current()) return false;
        // History written for the next frame starts at confidence 1.
        if (f.out_history_color.at(3, 3).a != 1.0f) return false;
        return f.out_history_depth.at(3, 3) == 0.5f;
    }

    bool test_disocclusion_outputs_current_exactly()
    {
        ResolveFixture f{};
        // Every pixel reprojects off the left edge.
        f.velocity.clear(glm::vec2(1.0f, 0.0f));
        const auto r = tsaa::run_taa_resolve(nullptr, f.inputs(true), f.outputs(), taa_params());
        if (!r.ok) return false;
        if (r.value.disoccluded_pixels != (uint64_t)(W * H)) return false;
        if (!f.output_equals_current()) return false;
        return f.out_history_color.at(0, 0).a == 1.0f;
    }

    bool test_depth_mismatch_rejects_history()
    {
        ResolveFixture f{};
        f.history_depth.clear(0.9f);
        const auto r = tsaa::run_taa_resolve(nullptr, f.inputs(true), f.outputs(), taa_params());
        if (!r.ok) return false;
        if (r.value.depth_rejected_pixels != (uint64_t)(W * H)) return false;
        return f.output_equals_current();
    }

    bool test_static_pixels_converge_with_growing_confidence()
    {
        tsaa::HistoryBufferManager mgr{};
        const tsaa::TextureExtent e{W, H};
        const tsaa::ColorTexture current{W, H, glm::vec4(0.4f, 0.25f, 0.1f, 1.0f)};
        const tsaa::DepthTexture depth{W, H, 0.5f};
        const tsaa::VelocityTexture velocity{W, H, glm::vec2(0.0f)};
        tsaa::ColorTexture out{W, H, glm::vec4(0.0f)};
        const tsaa::TaaParams p = taa_params();

        const float expected_confidence[4] = {1.0f, 11.0f, 21.0f, 31.0f};
        for (uint64_t frame = 1; frame <= 4; ++frame)
        {
            auto acq = mgr.acquire(1u, e, frame);
            if (!acq.ok) return false;

            tsaa::TaaResolveInputs in{};
            in.current = &current;
            in.depth = &depth;
            in.velocity = &velocity;
            in.history_color = acq.value.read_color;
            in.history_depth = acq.value.read_depth;
            in.history_valid = acq.value.history_valid;
            const tsaa::TaaResolveOutputs outs{&out, acq.value.write_color, acq.value.write_depth};

            const auto r = tsaa::run_taa_resolve(nullptr, in, outs, p);
            if (!r.ok) return false;
            if (frame == 1 && r.value.reset_pixels != (uint64_t)(W * H)) return false;
            if (frame > 1 && r.value.accumulated_pixels != (uint64_t)(W * H)) return false;

            const float conf = acq.value.write_color->at(4, 4).a;
            if (!approx_eq(conf, expected_confidence[frame - 1])) return false;
            const glm::vec4 c = out.at(4, 4);
            if (!approx_eq(c.r, 0.4f) || !approx_eq(c.g, 0.25f) || !approx_eq(c.b, 0.1f)) return false;
            if (!mgr.commit(1u)) return false;
        }
        return true;
    }

    bool test_moving_pixels_keep_unit_confidence()
    {
        ResolveFixture f{};
        f.history_color.clear(glm::vec4(0.4f, 0.4f, 0.4f, 21.0f));
        // One pixel to the right per frame.
        f.velocity.clear(glm::vec2(1.0f / (float)W, 0.0f));
        const auto r = tsaa::run_taa_resolve(nullptr, f.inputs(true), f.outputs(), taa_params());
        if (!r.ok) return false;
        // Column 0 came from outside the previous frame.
        if (r.value.disoccluded_pixels != (uint64_t)H) return false;
        if (r.value.accumulated_pixels != (uint64_t)(W * H - H)) return false;
        if (f.out_history_color.at(5, 2).a != 1.0f) return false;
        return approx_eq(f.out_color.at(5, 2).r, 0.4f);
    }

    bool test_min_max_clamp_stays_inside_neighborhood()
    {
        ResolveFixture f{};
        for (int y = 0; y < H; ++y)
        {
            for (int x = 0; x < W; ++x)
            {
                const float v = 0.2f + 0.1f * (float)((x * 3 + y * 5) % 7) / 6.0f;
                f.current.at(x, y) = glm::vec4(v, v * 0.5f, v * 0.25f, 1.0f);
            }
        }
        f.history_color.clear(glm::vec4(1.0f, 1.0f, 1.0f, 1.0f));

        tsaa::TaaParams p = taa_params();
        p.clamp_mode = tsaa::TaaClampMode::MinMax;
        p.tonemapped_blend = false;
        p.history_filter = tsaa::TaaHistoryFilter::Bilinear;
        const auto r = tsaa::run_taa_resolve(nullptr, f.inputs(true), f.outputs(), p);
        if (!r.ok) return false;

        for (int y = 0; y < H; ++y)
        {
            for (int x = 0; x < W; ++x)
            {
                glm::vec3 lo(1e30f);
                glm::vec3 hi(-1e30f);
                for (int dy = -1; dy <= 1; ++dy)
                {
                    for (int dx = -1; dx <= 1; ++dx)
                    {
                        const glm::vec3 c(f.current.at_clamped(x + dx, y + dy));
                        lo = glm::min(lo, c);
                        hi = glm::max(hi, c);
                    }
                }
                const glm::vec3 o(f.out_color.at(x, y));
                for (int i = 0; i < 3; ++i)
                {
                    if (o[i] < lo[i] - 1e-5f || o[i] > hi[i] + 1e-5f) return false;
                }
            }
        }
        return true;
    }

    bool test_variance_clip_pulls_outlier_history()
    {
        ResolveFixture f{};
        f.history_color.clear(glm::vec4(8.0f, 8.0f, 8.0f, 1.0f));
        tsaa::TaaParams p = taa_params();
        p.clamp_mode = tsaa::TaaClampMode::VarianceClip;
        const auto r = tsaa::run_taa_resolve(nullptr, f.inputs(true), f.outputs(), p);
        if (!r.ok) return false;
        // A flat neighborhood collapses the box onto the current color.
        const glm::vec4 c = f.out_color.at(3, 3);
        return approx_eq(c.r, 0.4f, 1e-3f) && approx_eq(c.g, 0.4f, 1e-3f) && approx_eq(c.b, 0.4f, 1e-3f);
    }

    // 0.9 background with a 0.3 block covering [x0, x0 + 4) x [6, 10).
    void fill_two_depth_scene(tsaa::DepthTexture& depth, tsaa::ColorTexture& color, int x0)
    {
        for (int y = 0; y < depth.h; ++y)
        {
            for (int x = 0; x < depth.w; ++x)
            {
                const bool block = x >= x0 && x < x0 + 4 && y >= 6 && y < 10;
                depth.at(x, y) = block ? 0.3f : 0.9f;
                color.at(x, y) = block ? glm::vec4(0.8f, 0.6f, 0.2f, 1.0f) : glm::vec4(0.1f, 0.2f, 0.3f, 1.0f);
            }
        }
    }

    struct TwoDepthFrames
    {
        static constexpr int S = 16;
        tsaa::ColorTexture current{S, S, glm::vec4(0.0f)};
        tsaa::DepthTexture depth{S, S, 1.0f};
        const tsaa::VelocityTexture velocity{S, S, glm::vec2(0.0f)};
        tsaa::ColorTexture out{S, S, glm::vec4(0.0f)};
        tsaa::ColorTexture history_color[2] = {{S, S, glm::vec4(0.0f)}, {S, S, glm::vec4(0.0f)}};
        tsaa::DepthTexture history_depth[2] = {{S, S, 1.0f}, {S, S, 1.0f}};

        tsaa::Result<tsaa::TaaResolveStats> run(int frame, bool history_valid)
        {
            const int rd = frame & 1;
            const int wr = rd ^ 1;
            tsaa::TaaResolveInputs in{};
            in.current = &current;
            in.depth = &depth;
            in.velocity = &velocity;
            in.history_color = &history_color[rd];
            in.history_depth = &history_depth[rd];
            in.history_valid = history_valid;
            const tsaa::TaaResolveOutputs outs{&out, &history_color[wr], &history_depth[wr]};
            return tsaa::run_taa_resolve(nullptr, in, outs, taa_params());
        }
    };

    bool test_pixels_beside_closer_surface_accumulate()
    {
        TwoDepthFrames f{};
        fill_two_depth_scene(f.depth, f.current, 6);
        if (!f.run(0, false).ok) return false;

        for (int frame = 1; frame <= 3; ++frame)
        {
            const auto r = f.run(frame, true);
            if (!r.ok) return false;
            if (r.value.depth_rejected_pixels != 0) return false;
            if (r.value.accumulated_pixels != (uint64_t)(TwoDepthFrames::S * TwoDepthFrames::S)) return false;
        }

        // Background texel left of the block, and the block texel beside it.
        const int wr = 0;
        if (f.history_color[wr].at(5, 7).a <= 1.0f) return false;
        if (f.history_color[wr].at(6, 7).a <= 1.0f) return false;

        tsaa::TaaResolveInputs in{};
        in.current = &f.current;
        in.depth = &f.depth;
        in.velocity = &f.velocity;
        in.history_color = &f.history_color[wr];
        in.history_depth = &f.history_depth[wr];
        in.history_valid = true;
        return tsaa::taa_resolve_pixel(in, taa_params(), 5, 7).outcome == tsaa::TaaPixelOutcome::Accumulated;
    }

    bool test_one_pixel_edge_shift_keeps_history()
    {
        TwoDepthFrames f{};
        fill_two_depth_scene(f.depth, f.current, 6);
        if (!f.run(0, false).ok) return false;

        // Jittered rasterization moves the silhouette by a texel between frames.
        fill_two_depth_scene(f.depth, f.current, 5);
        const auto r = f.run(1, true);
        if (!r.ok) return false;
        return r.value.depth_rejected_pixels == 0;
    }

    bool test_history_depth_stores_dilated_depth()
    {
        TwoDepthFrames f{};
        fill_two_depth_scene(f.depth, f.current, 6);
        if (!f.run(0, false).ok) return false;
        const tsaa::DepthTexture& written = f.history_depth[1];
        return written.at(5, 7) == 0.3f && written.at(3, 7) == 0.9f && written.at(7, 7) == 0.3f;
    }

    bool test_invalid_io_is_rejected()
    {
        ResolveFixture f{};
        tsaa::TaaResolveInputs in = f.inputs(true);
        tsaa::TaaResolveOutputs out = f.outputs();

        tsaa::TaaResolveOutputs aliased = out;
        aliased.history_color = &f.history_color;
        if (tsaa::run_taa_resolve(nullptr, in, aliased, taa_params()).ok) return false;

        tsaa::TaaResolveInputs missing = in;
        missing.velocity = nullptr;
        if (tsaa::run_taa_resolve(nullptr, missing, out, taa_params()).ok) return false;

        tsaa::DepthTexture small_depth{W / 2, H, 0.5f};
        tsaa::TaaResolveInputs mismatched = in;
        mismatched.depth = &small_depth;
        const auto r = tsaa::run_taa_resolve(nullptr, mismatched, out, taa_params());
        return !r.ok && !r.error.empty();
    }
}

int main()
{
    const bool ok_reset = test_reset_outputs_current_exactly();
    const bool ok_disocc = test_disocclusion_outputs_current_exactly();
    const bool ok_depth = test_depth_mismatch_rejects_history();
    const bool ok_static = test_static_pixels_converge_with_growing_confidence();
    const bool ok_moving = test_moving_pixels_keep_unit_confidence();
    const bool ok_minmax = test_min_max_clamp_stays_inside_neighborhood();
    const bool ok_variance = test_variance_clip_pulls_outlier_history();
    const bool ok_io = test_invalid_io_is_rejected();
    const bool ok_two_depth = test_pixels_beside_closer_surface_accumulate();
    const bool ok_edge_shift = test_one_pixel_edge_shift_keeps_history();
    const bool ok_dilated = test_history_depth_stores_dilated_depth();

    if (!ok_reset) std::fprintf(stderr, "[taa-tests] reset resolve failed\n");
    if (!ok_disocc) std::fprintf(stderr, "[taa-tests] disocclusion resolve failed\n");
    if (!ok_depth) std::fprintf(stderr, "[taa-tests] depth rejection failed\n");
    if (!ok_static) std::fprintf(stderr, "[taa-tests] static convergence failed\n");
    if (!ok_moving) std::fprintf(stderr, "[taa-tests] moving pixel confidence failed\n");
    if (!ok_minmax) std::fprintf(stderr, "[taa-tests] min/max clamp bounds failed\n");
    if (!ok_variance) std::fprintf(stderr, "[taa-tests] variance clip failed\n");
    if (!ok_io) std::fprintf(stderr, "[taa-tests] io validation failed\n");
    if (!ok_two_depth) std::fprintf(stderr, "[taa-tests] accumulation beside closer surface failed\n");
    if (!ok_edge_shift) std::fprintf(stderr, "[taa-tests] one pixel edge shift failed\n");
    if (!ok_dilated) std::fprintf(stderr, "[taa-tests] dilated history depth failed\n");

    if (!(ok_reset && ok_disocc && ok_depth && ok_static && ok_moving && ok_minmax && ok_variance && ok_io
          && ok_two_depth && ok_edge_shift && ok_dilated)) return 1;
    std::fprintf(stderr, "[taa-tests] all tests passed\n");
    return 0;
}
