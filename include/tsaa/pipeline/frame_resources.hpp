#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: frame_resources.hpp
    MODULE: pipeline
    PURPOSE: Logical resource names of the anti-aliasing graph and the per-view,
             per-frame table binding those names to concrete textures.
*/


#include <cstdint>
#include <string>
#include <unordered_map>

#include "tsaa/gfx/texture.hpp"

namespace tsaa
{
    struct HistoryAcquisition;
    struct JitterFrame;

    namespace aa_resource
    {
        // Imported from the geometry/velocity producer.
        inline constexpr const char* kSceneColor = "scene.color";
        inline constexpr const char* kSceneDepth = "scene.depth";
        inline constexpr const char* kSceneVelocity = "scene.velocity";

        inline constexpr const char* kCameraJitter = "camera.jitter";
        inline constexpr const char* kSmaaEdges = "smaa.edges";
        inline constexpr const char* kSmaaWeights = "smaa.weights";
        inline constexpr const char* kSmaaColor = "smaa.color";
        inline constexpr const char* kTaaColor = "taa.color";
        // Slot holding last frame's resolve, and the slot this frame writes.
        inline constexpr const char* kTaaHistory = "taa.history";
        inline constexpr const char* kTaaHistoryNext = "taa.history_next";
    }

    enum class FrameResourceKind : uint8_t
    {
        Unknown = 0,
        Color = 1,
        Depth = 2,
        Velocity = 3,
        Edges = 4,
        BlendWeights = 5,
        History = 6,
        Jitter = 7
    };

    inline const char* frame_resource_kind_name(FrameResourceKind k)
    {
        switch (k)
        {
            case FrameResourceKind::Color: return "color";
            case FrameResourceKind::Depth: return "depth";
            case FrameResourceKind::Velocity: return "velocity";
            case FrameResourceKind::Edges: return "edges";
            case FrameResourceKind::BlendWeights: return "blend_weights";
            case FrameResourceKind::History: return "history";
            case FrameResourceKind::Jitter: return "jitter";
            case FrameResourceKind::Unknown:
            default:
                return "unknown";
        }
    }

    class FrameResourceTable
    {
    public:
        void clear()
        {
            entries_.clear();
        }

        void bind(const std::string& name, FrameResourceKind kind, const void* ptr)
        {
            if (name.empty() || !ptr) return;
            entries_[name] = Entry{kind, ptr};
        }

        void bind_color(const std::string& name, const ColorTexture* tex) { bind(name, FrameResourceKind::Color, tex); }
        void bind_depth(const std::string& name, const DepthTexture* tex) { bind(name, FrameResourceKind::Depth, tex); }
        void bind_velocity(const std::string& name, const VelocityTexture* tex) { bind(name, FrameResourceKind::Velocity, tex); }
        void bind_edges(const std::string& name, const EdgeTexture* tex) { bind(name, FrameResourceKind::Edges, tex); }
        void bind_weights(const std::string& name, const BlendWeightTexture* tex) { bind(name, FrameResourceKind::BlendWeights, tex); }

        // `dst` resolves to whatever `src` is bound to. Returns false when src is unbound.
        bool alias(const std::string& dst, const std::string& src)
        {
            const auto it = entries_.find(src);
            if (it == entries_.end()) return false;
            const Entry e = it->second;
            entries_[dst] = e;
            return true;
        }

        void unbind(const std::string& name)
        {
            entries_.erase(name);
        }

        bool has(const std::string& name) const
        {
            return entries_.find(name) != entries_.end();
        }

        FrameResourceKind kind(const std::string& name) const
        {
            const auto it = entries_.find(name);
            return it == entries_.end() ? FrameResourceKind::Unknown : it->second.kind;
        }

        // Null when unbound or bound with another kind.
        template<typename T>
        const T* get(const std::string& name, FrameResourceKind kind) const
        {
            const auto it = entries_.find(name);
            if (it == entries_.end() || it->second.kind != kind) return nullptr;
            return static_cast<const T*>(it->second.ptr);
        }

        const ColorTexture* color(const std::string& name) const { return get<ColorTexture>(name, FrameResourceKind::Color); }
        const DepthTexture* depth(const std::string& name) const { return get<DepthTexture>(name, FrameResourceKind::Depth); }
        const VelocityTexture* velocity(const std::string& name) const { return get<VelocityTexture>(name, FrameResourceKind::Velocity); }
        const EdgeTexture* edges(const std::string& name) const { return get<EdgeTexture>(name, FrameResourceKind::Edges); }
        const BlendWeightTexture* weights(const std::string& name) const { return get<BlendWeightTexture>(name, FrameResourceKind::BlendWeights); }
        const HistoryAcquisition* history(const std::string& name) const { return get<HistoryAcquisition>(name, FrameResourceKind::History); }
        const JitterFrame* jitter(const std::string& name) const { return get<JitterFrame>(name, FrameResourceKind::Jitter); }

        size_t size() const { return entries_.size(); }

    private:
        struct Entry
        {
            FrameResourceKind kind = FrameResourceKind::Unknown;
            const void* ptr = nullptr;
        };

        std::unordered_map<std::string, Entry> entries_{};
    };
}
