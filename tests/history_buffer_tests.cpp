#include <cstdio>
#include <string>

#include <glm/glm.hpp>

#include "tsaa/gfx/texture_budget.hpp"
#include "tsaa/rhi/frame_timeline.hpp"
#include "tsaa/temporal/history_buffer.hpp"

namespace
{
    bool test_lazy_allocation_and_first_use_invalid()
    {
        tsaa::HistoryBufferManager mgr{};
        if (mgr.live_slot_count() != 0) return false;

        auto acq = mgr.acquire(1u, tsaa::TextureExtent{16, 8}, 1u);
        if (!acq.ok) return false;
        if (mgr.live_slot_count() != 2) return false;
        if (acq.value.history_valid) return false;
        if (!acq.value.reallocated) return false;
        if (acq.value.read_handle == acq.value.write_handle) return false;
        if (acq.value.write_color->w != 16 || acq.value.write_color->h != 8) return false;
        return acq.value.read_depth->extent() == (tsaa::TextureExtent{16, 8});
    }

    bool test_ping_pong_never_aliases()
    {
        tsaa::HistoryBufferManager mgr{};
        const tsaa::TextureExtent e{8, 8};

        tsaa::HistoryHandle prev_write{};
        for (uint64_t frame = 1; frame <= 6; ++frame)
        {
            auto acq = mgr.acquire(4u, e, frame);
            if (!acq.ok) return false;
            if (acq.value.read_handle == acq.value.write_handle) return false;
            if (acq.value.read_color == acq.value.write_color) return false;
            if (frame > 1)
            {
                if (acq.value.read_handle != prev_write) return false;
                if (!acq.value.history_valid) return false;
            }
            prev_write = acq.value.write_handle;
            if (!mgr.commit(4u)) return false;
        }
        return true;
    }

    bool test_reacquire_before_commit_is_stable()
    {
        tsaa::HistoryBufferManager mgr{};
        auto a = mgr.acquire(2u, tsaa::TextureExtent{4, 4}, 1u);
        auto b = mgr.acquire(2u, tsaa::TextureExtent{4, 4}, 1u);
        if (!a.ok || !b.ok) return false;
        if (a.value.read_handle != b.value.read_handle) return false;
        return a.value.write_handle == b.value.write_handle && !b.value.reallocated;
    }

    bool test_invalidate_and_resize()
    {
        tsaa::HistoryBufferManager mgr{};
        auto a = mgr.acquire(9u, tsaa::TextureExtent{8, 8}, 1u);
        if (!a.ok || !mgr.commit(9u)) return false;

        mgr.invalidate(9u);
        auto b = mgr.acquire(9u, tsaa::TextureExtent{8, 8}, 2u);
        if (!b.ok || b.value.history_valid || b.value.reallocated) return false;
        if (!mgr.commit(9u)) return false;

        const tsaa::HistoryHandle old_read = b.value.write_handle;
        auto c = mgr.acquire(9u, tsaa::TextureExtent{12, 6}, 3u);
        if (!c.ok) return false;
        if (!c.value.reallocated || c.value.history_valid) return false;
        if (c.value.read_color->w != 12 || c.value.read_color->h != 6) return false;
        if (c.value.write_depth->w != 12 || c.value.write_depth->h != 6) return false;
        if (c.value.read_handle == old_read) return false;
        if (mgr.reallocation_count() != 2u) return false;

        // Old pair stays alive until its last frame completes.
        if (mgr.retired_slot_count() != 2u) return false;
        if (!mgr.is_alive(old_read)) return false;
        if (mgr.collect(1u) != 0u) return false;
        if (mgr.collect(2u) != 2u) return false;
        return !mgr.is_alive(old_read) && mgr.live_slot_count() == 2u;
    }

    bool test_zero_extent_fails()
    {
        tsaa::HistoryBufferManager mgr{};
        auto acq = mgr.acquire(1u, tsaa::TextureExtent{0, 4}, 1u);
        return !acq.ok && !acq.error.empty() && mgr.live_slot_count() == 0u;
    }

    bool test_budget_exhaustion_fails_cleanly()
    {
        // Room for exactly one slot at 8x8: rgba32f color + r32f depth.
        const size_t slot_bytes = tsaa::texture_bytes_for<glm::vec4>(tsaa::TextureExtent{8, 8})
            + tsaa::texture_bytes_for<float>(tsaa::TextureExtent{8, 8});
        tsaa::TextureBudget budget{slot_bytes};
        tsaa::HistoryBufferManager mgr{&budget};

        auto acq = mgr.acquire(1u, tsaa::TextureExtent{8, 8}, 1u);
        if (acq.ok) return false;
        if (acq.error.find("budget") == std::string::npos) return false;
        if (budget.used_bytes() != 0u) return false;

        budget.set_limit(slot_bytes * 2u);
        auto retry = mgr.acquire(1u, tsaa::TextureExtent{8, 8}, 2u);
        return retry.ok && budget.used_bytes() == slot_bytes * 2u;
    }

    bool test_release_view_defers_until_fence()
    {
        tsaa::FrameTimeline timeline{tsaa::FrameTimelineConfig{2}};
        tsaa::HistoryBufferManager mgr{};

        const uint64_t s1 = timeline.begin_frame();
        auto acq = mgr.acquire(5u, tsaa::TextureExtent{4, 4}, s1);
        if (!acq.ok) return false;
        const tsaa::HistoryHandle read = acq.value.read_handle;

        // View destroyed while frame s1 is still being recorded.
        mgr.release_view(5u, s1);
        timeline.end_frame();
        if (mgr.has_view(5u)) return false;
        if (mgr.retired_slot_count() != 2u) return false;

        mgr.collect(timeline.completed_serial());
        if (!mgr.is_alive(read)) return false;

        // Frame s1 + 2 reuses s1's slot and therefore waits for it.
        timeline.begin_frame();
        timeline.end_frame();
        mgr.collect(timeline.completed_serial());
        if (mgr.retired_slot_count() != 2u) return false;

        timeline.begin_frame();
        if (timeline.completed_serial() < s1) return false;
        mgr.collect(timeline.completed_serial());
        timeline.end_frame();
        return mgr.retired_slot_count() == 0u && !mgr.is_alive(read) && timeline.stats().slot_waits >= 1u;
    }
}

int main()
{
    const bool ok_lazy = test_lazy_allocation_and_first_use_invalid();
    const bool ok_pingpong = test_ping_pong_never_aliases();
    const bool ok_stable = test_reacquire_before_commit_is_stable();
    const bool ok_resize = test_invalidate_and_resize();
    const bool ok_zero = test_zero_extent_fails();
    const bool ok_budget = test_budget_exhaustion_fails_cleanly();
    const bool ok_deferred = test_release_view_defers_until_fence();

    if (!ok_lazy) std::fprintf(stderr, "[history-tests] lazy allocation failed\n");
    if (!ok_pingpong) std::fprintf(stderr, "[history-tests] ping-pong aliasing failed\n");
    if (!ok_stable) std::fprintf(stderr, "[history-tests] re-acquire before commit failed\n");
    if (!ok_resize) std::fprintf(stderr, "[history-tests] invalidate/resize failed\n");
    if (!ok_zero) std::fprintf(stderr, "[history-tests] zero extent failed\n");
    if (!ok_budget) std::fprintf(stderr, "[history-tests] budget exhaustion failed\n");
    if (!ok_deferred) std::fprintf(stderr, "[history-tests] deferred release failed\n");

    if (!(ok_lazy && ok_pingpong && ok_stable && ok_resize && ok_zero && ok_budget && ok_deferred)) return 1;
    std::fprintf(stderr, "[history-tests] all tests passed\n");
    return 0;
}
