#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: pass_registry.hpp
    MODULE: pipeline
    PURPOSE: Registers anti-aliasing nodes by id and creates them at runtime through
             factories.
*/


#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "tsaa/pipeline/pass_adapters.hpp"
#include "tsaa/pipeline/pass_id.hpp"
#include "tsaa/pipeline/render_pass.hpp"

namespace tsaa
{
    // Which color a node reads. Lets the same factory build SMAA->TAA and TAA-only chains.
    struct PassWiring
    {
        std::string color_input = aa_resource::kSceneColor;
    };

    class PassFactoryRegistry
    {
    public:
        using Factory = std::function<std::unique_ptr<IRenderPass>(const PassWiring&)>;

        bool register_factory(const std::string& id, Factory factory)
        {
            if (id.empty() || !factory) return false;
            factories_[id] = std::move(factory);
            return true;
        }

        bool register_factory(PassId id, Factory factory)
        {
            if (!pass_id_is_standard(id)) return false;
            return register_factory(pass_id_string(id), std::move(factory));
        }

        bool has(const std::string& id) const
        {
            return factories_.find(id) != factories_.end();
        }

        bool has(PassId id) const
        {
            if (!pass_id_is_standard(id)) return false;
            return has(pass_id_string(id));
        }

        std::unique_ptr<IRenderPass> create(const std::string& id, const PassWiring& wiring = {}) const
        {
            auto it = factories_.find(id);
            if (it == factories_.end() || !it->second) return nullptr;
            return it->second(wiring);
        }

        std::unique_ptr<IRenderPass> create(PassId id, const PassWiring& wiring = {}) const
        {
            if (!pass_id_is_standard(id)) return nullptr;
            return create(pass_id_string(id), wiring);
        }

        std::vector<std::string> ids() const
        {
            std::vector<std::string> out{};
            out.reserve(factories_.size());
            for (const auto& kv : factories_) out.push_back(kv.first);
            std::sort(out.begin(), out.end());
            return out;
        }

    private:
        std::unordered_map<std::string, Factory> factories_{};
    };

    inline PassFactoryRegistry make_standard_pass_registry()
    {
        PassFactoryRegistry reg{};
        reg.register_factory(PassId::JitterUpdate, [](const PassWiring&) {
            return std::make_unique<JitterUpdatePass>();
        });
        reg.register_factory(PassId::SmaaEdgeDetection, [](const PassWiring& w) {
            return std::make_unique<SmaaEdgeDetectionPass>(w.color_input);
        });
        reg.register_factory(PassId::SmaaBlendingWeights, [](const PassWiring&) {
            return std::make_unique<SmaaBlendingWeightsPass>();
        });
        reg.register_factory(PassId::SmaaNeighborhoodBlending, [](const PassWiring& w) {
            return std::make_unique<SmaaNeighborhoodBlendingPass>(w.color_input);
        });
        reg.register_factory(PassId::TaaResolve, [](const PassWiring& w) {
            return std::make_unique<TaaResolvePass>(w.color_input);
        });
        reg.register_factory(PassId::TaaHistoryCommit, [](const PassWiring&) {
            return std::make_unique<TaaHistoryCommitPass>();
        });
        return reg;
    }
}
