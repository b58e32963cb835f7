#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: history_buffer.hpp
    MODULE: temporal
    PURPOSE: Per-view ping-pong history ownership for the TAA resolve. Slots replaced
             by a resize or a view teardown are retired and only freed once the frame
             that last referenced them has completed.
*/


#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "tsaa/core/result.hpp"
#include "tsaa/gfx/texture.hpp"
#include "tsaa/gfx/texture_budget.hpp"

namespace tsaa
{
    struct HistoryHandle
    {
        uint32_t id = 0;

        bool valid() const { return id != 0; }
        bool operator==(const HistoryHandle& o) const { return id == o.id; }
        bool operator!=(const HistoryHandle& o) const { return id != o.id; }
    };

    struct HistorySlot
    {
        HistoryHandle handle{};
        ColorTexture color{};
        DepthTexture depth{};
        // Frame serial of the last frame that bound this slot.
        uint64_t last_use_serial = 0;

        size_t size_bytes() const { return color.size_bytes() + depth.size_bytes(); }
    };

    struct HistoryAcquisition
    {
        HistoryHandle read_handle{};
        HistoryHandle write_handle{};
        const ColorTexture* read_color = nullptr;
        const DepthTexture* read_depth = nullptr;
        ColorTexture* write_color = nullptr;
        DepthTexture* write_depth = nullptr;
        TextureExtent extent{};
        // False on first use, after a reallocation and after invalidate().
        bool history_valid = false;
        bool reallocated = false;
    };

    class HistoryBufferManager
    {
    public:
        explicit HistoryBufferManager(TextureBudget* budget = nullptr)
            : budget_(budget)
        {}

        HistoryBufferManager(const HistoryBufferManager&) = delete;
        HistoryBufferManager& operator=(const HistoryBufferManager&) = delete;

        ~HistoryBufferManager()
        {
            release_all();
        }

        // Read slot is the one written by the last committed frame, write slot is the
        // other one. Calling acquire again before commit returns the same pair.
        Result<HistoryAcquisition> acquire(uint32_t view_id, TextureExtent extent, uint64_t frame_serial)
        {
            if (!extent.valid())
            {
                return Result<HistoryAcquisition>::failure(
                    "history acquire with invalid extent " + std::to_string(extent.w) + "x" + std::to_string(extent.h));
            }

            std::lock_guard<std::mutex> lock(mtx_);
            ViewHistory& vh = views_[view_id];

            bool reallocated = false;
            if (!vh.slots[0] || !vh.slots[1] || vh.extent != extent)
            {
                retire_slots_locked(vh);
                std::array<std::unique_ptr<HistorySlot>, 2> fresh{};
                for (auto& slot : fresh)
                {
                    auto made = allocate_slot_locked(extent);
                    if (!made.ok)
                    {
                        for (auto& s : fresh)
                        {
                            if (s) free_slot_locked(*s);
                        }
                        vh.extent = TextureExtent{};
                        vh.history_valid = false;
                        return made.forward_error<HistoryAcquisition>("history allocation for view " + std::to_string(view_id));
                    }
                    slot = std::move(made.value);
                }
                vh.slots = std::move(fresh);
                vh.current = 0;
                vh.extent = extent;
                vh.history_valid = false;
                reallocated = true;
                ++reallocation_count_;
            }

            HistorySlot& read = *vh.slots[vh.current];
            HistorySlot& write = *vh.slots[1u - vh.current];
            read.last_use_serial = std::max(read.last_use_serial, frame_serial);
            write.last_use_serial = std::max(write.last_use_serial, frame_serial);

            HistoryAcquisition out{};
            out.read_handle = read.handle;
            out.write_handle = write.handle;
            out.read_color = &read.color;
            out.read_depth = &read.depth;
            out.write_color = &write.color;
            out.write_depth = &write.depth;
            out.extent = extent;
            out.history_valid = vh.history_valid;
            out.reallocated = reallocated;
            return Result<HistoryAcquisition>::success(out);
        }

        // Flips the pair after the write slot has been fully written for this frame.
        bool commit(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = views_.find(view_id);
            if (it == views_.end() || !it->second.slots[0]) return false;
            it->second.current = 1u - it->second.current;
            it->second.history_valid = true;
            return true;
        }

        void invalidate(uint32_t view_id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = views_.find(view_id);
            if (it != views_.end()) it->second.history_valid = false;
        }

        // View teardown. Textures stay alive until collect() sees `frame_serial` complete.
        void release_view(uint32_t view_id, uint64_t frame_serial)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = views_.find(view_id);
            if (it == views_.end()) return;
            for (auto& slot : it->second.slots)
            {
                if (slot) slot->last_use_serial = std::max(slot->last_use_serial, frame_serial);
            }
            retire_slots_locked(it->second);
            views_.erase(it);
        }

        // Frees retired slots whose last use has completed. Returns the number freed.
        size_t collect(uint64_t completed_serial)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            size_t freed = 0;
            auto keep = retired_.begin();
            for (auto it = retired_.begin(); it != retired_.end(); ++it)
            {
                if ((*it)->last_use_serial <= completed_serial)
                {
                    free_slot_locked(**it);
                    ++freed;
                    continue;
                }
                if (keep != it) *keep = std::move(*it);
                ++keep;
            }
            retired_.erase(keep, retired_.end());
            return freed;
        }

        // Only valid once the device is idle.
        void release_all()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto& kv : views_) retire_slots_locked(kv.second);
            views_.clear();
            for (auto& slot : retired_) free_slot_locked(*slot);
            retired_.clear();
        }

        bool has_view(uint32_t view_id) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return views_.find(view_id) != views_.end();
        }

        bool is_alive(HistoryHandle handle) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (const auto& kv : views_)
            {
                for (const auto& slot : kv.second.slots)
                {
                    if (slot && slot->handle == handle) return true;
                }
            }
            for (const auto& slot : retired_)
            {
                if (slot->handle == handle) return true;
            }
            return false;
        }

        size_t live_slot_count() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            size_t n = 0;
            for (const auto& kv : views_)
            {
                for (const auto& slot : kv.second.slots)
                {
                    if (slot) ++n;
                }
            }
            return n;
        }

        size_t retired_slot_count() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return retired_.size();
        }

        uint64_t reallocation_count() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return reallocation_count_;
        }

    private:
        struct ViewHistory
        {
            std::array<std::unique_ptr<HistorySlot>, 2> slots{};
            uint32_t current = 0;
            TextureExtent extent{};
            bool history_valid = false;
        };

        Result<std::unique_ptr<HistorySlot>> allocate_slot_locked(TextureExtent extent)
        {
            auto slot = std::make_unique<HistorySlot>();
            slot->handle = HistoryHandle{next_handle_id_++};
            const Status color_ok = ensure_texture(slot->color, extent, glm::vec4(0.0f), budget_, "history.color");
            if (!color_ok.ok)
            {
                return color_ok.forward_error<std::unique_ptr<HistorySlot>>();
            }
            const Status depth_ok = ensure_texture(slot->depth, extent, 1.0f, budget_, "history.depth");
            if (!depth_ok.ok)
            {
                release_texture(slot->color, budget_);
                return depth_ok.forward_error<std::unique_ptr<HistorySlot>>();
            }
            return Result<std::unique_ptr<HistorySlot>>::success(std::move(slot));
        }

        void free_slot_locked(HistorySlot& slot)
        {
            release_texture(slot.color, budget_);
            release_texture(slot.depth, budget_);
        }

        void retire_slots_locked(ViewHistory& vh)
        {
            for (auto& slot : vh.slots)
            {
                if (slot) retired_.push_back(std::move(slot));
                slot.reset();
            }
        }

        TextureBudget* budget_ = nullptr;
        mutable std::mutex mtx_{};
        std::unordered_map<uint32_t, ViewHistory> views_{};
        std::vector<std::unique_ptr<HistorySlot>> retired_{};
        uint32_t next_handle_id_ = 1;
        uint64_t reallocation_count_ = 0;
    };
}
