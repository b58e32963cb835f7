#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: jitter_sequence.hpp
    MODULE: temporal
    PURPOSE: Per-view Halton(2,3) sub-pixel jitter sequence and the projection helpers
             that apply it.
*/


#include <algorithm>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include <glm/glm.hpp>

#include "tsaa/gfx/texture.hpp"

namespace tsaa
{
    inline constexpr uint32_t kJitterSequenceMinLength = 1u;
    inline constexpr uint32_t kJitterSequenceMaxLength = 16u;

    inline float halton(uint64_t index, uint32_t base)
    {
        if (base < 2u) return 0.0f;
        float f = 1.0f;
        float r = 0.0f;
        uint64_t i = index;
        while (i > 0u)
        {
            f /= static_cast<float>(base);
            r += f * static_cast<float>(i % base);
            i /= base;
        }
        return r;
    }

    // Term `index` of the sequence in pixel units, within [-0.5, 0.5].
    // Halton index 0 is zero for every base, so the sequence starts at 1.
    inline glm::vec2 jitter_term(uint32_t index)
    {
        const uint64_t i = (uint64_t)index + 1u;
        return glm::vec2(halton(i, 2u), halton(i, 3u)) - glm::vec2(0.5f);
    }

    // Image-space pixels (y down) to NDC (y up).
    inline glm::vec2 compute_jitter_ndc(const glm::vec2& offset_px, TextureExtent extent)
    {
        if (!extent.valid()) return glm::vec2(0.0f);
        return glm::vec2(
            (2.0f * offset_px.x) / static_cast<float>(extent.w),
            (-2.0f * offset_px.y) / static_cast<float>(extent.h));
    }

    // Shifts clip-space xy by jitter_ndc * w, i.e. the projected image by jitter_ndc.
    // Exact for perspective and orthographic projections.
    inline glm::mat4 jitter_projection(const glm::mat4& proj, const glm::vec2& jitter_ndc)
    {
        glm::mat4 out = proj;
        for (int c = 0; c < 4; ++c)
        {
            out[c][0] += jitter_ndc.x * proj[c][3];
            out[c][1] += jitter_ndc.y * proj[c][3];
        }
        return out;
    }

    struct JitterState
    {
        // Index of the term currently applied.
        uint32_t index = 0;
        bool primed = false;
        uint32_t length = 8u;
        float scale = 1.0f;
        // Length as last requested, before clamping.
        uint32_t requested_length = 8u;
        glm::vec2 offset_px{0.0f};
        glm::vec2 offset_ndc{0.0f};
    };

    enum class JitterConfigChange : uint8_t
    {
        Unchanged = 0,
        Applied = 1,
        Clamped = 2
    };

    inline uint32_t clamp_jitter_length(uint32_t length)
    {
        return std::clamp(length, kJitterSequenceMinLength, kJitterSequenceMaxLength);
    }

    class JitterSequence
    {
    public:
        explicit JitterSequence(uint32_t length = 8u, float scale = 1.0f)
        {
            configure(length, scale);
        }

        // Sets the default every view starts with and applies it to existing views.
        // Views whose length changes restart at index 0. Returns false when `length`
        // had to be clamped.
        bool configure(uint32_t length, float scale)
        {
            const uint32_t clamped = clamp_jitter_length(length);
            std::lock_guard<std::mutex> lock(mtx_);
            length_ = clamped;
            requested_length_ = length;
            scale_ = std::max(0.0f, scale);
            for (auto& kv : views_) apply(kv.second, length, clamped, scale_);
            return clamped == length;
        }

        // Per-view override. Only this view restarts when its length changes.
        JitterConfigChange configure_view(uint32_t view_id, uint32_t length, float scale)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            JitterState& s = view_state(view_id);
            const float sc = std::max(0.0f, scale);
            if (s.requested_length == length && s.scale == sc) return JitterConfigChange::Unchanged;

            const uint32_t clamped = clamp_jitter_length(length);
            apply(s, length, clamped, sc);
            return clamped == length ? JitterConfigChange::Applied : JitterConfigChange::Clamped;
        }

        uint32_t length() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return length_;
        }

        glm::vec2 sample(uint32_t index) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return jitter_term(index % length_) * scale_;
        }

        // Advances the view's counter and returns the new pixel offset. The first call
        // after creation or reset yields term 0.
        glm::vec2 next(uint32_t view_id, TextureExtent extent = {})
        {
            std::lock_guard<std::mutex> lock(mtx_);
            JitterState& s = view_state(view_id);
            if (s.primed) s.index = (s.index + 1u) % s.length;
            s.primed = true;
            s.offset_px = jitter_term(s.index) * s.scale;
            s.offset_ndc = compute_jitter_ndc(s.offset_px, extent);
            return s.offset_px;
        }

        // Restarts the view at term 0; its length and scale are kept.
        void reset(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            restart(view_state(view_id));
        }

        JitterState state(uint32_t view_id) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            const auto it = views_.find(view_id);
            return it == views_.end() ? default_state() : it->second;
        }

        void remove_view(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            views_.erase(view_id);
        }

    private:
        static void restart(JitterState& s)
        {
            s.index = 0;
            s.primed = false;
            s.offset_px = glm::vec2(0.0f);
            s.offset_ndc = glm::vec2(0.0f);
        }

        static void apply(JitterState& s, uint32_t requested, uint32_t clamped, float scale)
        {
            if (s.length != clamped) restart(s);
            s.length = clamped;
            s.requested_length = requested;
            s.scale = scale;
        }

        JitterState default_state() const
        {
            JitterState s{};
            s.length = length_;
            s.requested_length = requested_length_;
            s.scale = scale_;
            return s;
        }

        JitterState& view_state(uint32_t view_id)
        {
            auto it = views_.find(view_id);
            if (it == views_.end()) it = views_.emplace(view_id, default_state()).first;
            return it->second;
        }

        mutable std::mutex mtx_{};
        uint32_t length_ = 8u;
        uint32_t requested_length_ = 8u;
        float scale_ = 1.0f;
        std::unordered_map<uint32_t, JitterState> views_{};
    };
}
