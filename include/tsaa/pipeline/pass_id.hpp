#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: pass_id.hpp
    MODULE: pipeline
    PURPOSE: Stable identifiers of the anti-aliasing graph nodes.
*/


#include <cstdint>
#include <string>
#include <string_view>

namespace tsaa
{
    enum class PassId : uint16_t
    {
        Unknown = 0,
        JitterUpdate = 1,
        SmaaEdgeDetection = 2,
        SmaaBlendingWeights = 3,
        SmaaNeighborhoodBlending = 4,
        TaaResolve = 5,
        TaaHistoryCommit = 6
    };

    inline const char* pass_id_name(PassId id)
    {
        switch (id)
        {
            case PassId::JitterUpdate: return "jitter_update";
            case PassId::SmaaEdgeDetection: return "smaa_edge_detection";
            case PassId::SmaaBlendingWeights: return "smaa_blending_weights";
            case PassId::SmaaNeighborhoodBlending: return "smaa_neighborhood_blending";
            case PassId::TaaResolve: return "taa_resolve";
            case PassId::TaaHistoryCommit: return "taa_history_commit";
            case PassId::Unknown:
            default:
                return "unknown";
        }
    }

    inline PassId parse_pass_id(std::string_view id)
    {
        if (id == "jitter_update") return PassId::JitterUpdate;
        if (id == "smaa_edge_detection") return PassId::SmaaEdgeDetection;
        if (id == "smaa_blending_weights") return PassId::SmaaBlendingWeights;
        if (id == "smaa_neighborhood_blending") return PassId::SmaaNeighborhoodBlending;
        if (id == "taa_resolve") return PassId::TaaResolve;
        if (id == "taa_history_commit") return PassId::TaaHistoryCommit;
        return PassId::Unknown;
    }

    inline bool pass_id_is_standard(PassId id)
    {
        return id != PassId::Unknown;
    }

    inline std::string pass_id_string(PassId id)
    {
        return std::string(pass_id_name(id));
    }
}
