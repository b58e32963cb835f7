#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: texture_budget.hpp
    MODULE: gfx
    PURPOSE: Byte budget for anti-aliasing render targets, plus ensure-style
             (re)allocation helpers that report failure instead of throwing.
*/


#include <atomic>
#include <cstddef>
#include <new>
#include <string>

#include "tsaa/core/result.hpp"
#include "tsaa/gfx/texture.hpp"

namespace tsaa
{
    // limit_bytes == 0 means unlimited.
    class TextureBudget
    {
    public:
        TextureBudget() = default;
        explicit TextureBudget(size_t limit_bytes) : limit_(limit_bytes) {}

        void set_limit(size_t limit_bytes) { limit_.store(limit_bytes, std::memory_order_relaxed); }
        size_t limit_bytes() const { return limit_.load(std::memory_order_relaxed); }
        size_t used_bytes() const { return used_.load(std::memory_order_relaxed); }

        bool try_reserve(size_t bytes)
        {
            size_t cur = used_.load(std::memory_order_relaxed);
            for (;;)
            {
                const size_t limit = limit_.load(std::memory_order_relaxed);
                if (limit != 0 && (bytes > limit || cur > limit - bytes)) return false;
                if (used_.compare_exchange_weak(cur, cur + bytes, std::memory_order_acq_rel)) return true;
            }
        }

        void release(size_t bytes)
        {
            size_t cur = used_.load(std::memory_order_relaxed);
            for (;;)
            {
                const size_t next = bytes > cur ? 0 : cur - bytes;
                if (used_.compare_exchange_weak(cur, next, std::memory_order_acq_rel)) return;
            }
        }

    private:
        std::atomic<size_t> limit_{0};
        std::atomic<size_t> used_{0};
    };

    // Resizes `tex` to `extent` when it differs. Keeps the old texture untouched on
    // failure. Budget accounting follows the texture's byte size.
    template<typename TTexel>
    inline Status ensure_texture(
        Texture2D<TTexel>& tex,
        TextureExtent extent,
        const TTexel& clear_value,
        TextureBudget* budget,
        const char* debug_name
    )
    {
        if (!extent.valid())
        {
            return status_error(std::string("invalid extent for '") + debug_name + "'");
        }
        if (tex.extent() == extent && !tex.empty()) return status_ok();

        const size_t new_bytes = texture_bytes_for<TTexel>(extent);
        const size_t old_bytes = tex.size_bytes();
        if (budget && !budget->try_reserve(new_bytes))
        {
            return status_error(
                std::string("texture budget exhausted allocating '") + debug_name + "' ("
                + std::to_string(new_bytes) + " bytes)");
        }

        try
        {
            Texture2D<TTexel> fresh(extent.w, extent.h, clear_value);
            tex = std::move(fresh);
        }
        catch (const std::bad_alloc&)
        {
            if (budget) budget->release(new_bytes);
            return status_error(std::string("out of memory allocating '") + debug_name + "'");
        }

        if (budget) budget->release(old_bytes);
        return status_ok();
    }

    template<typename TTexel>
    inline void release_texture(Texture2D<TTexel>& tex, TextureBudget* budget)
    {
        if (budget) budget->release(tex.size_bytes());
        tex.release();
    }
}
