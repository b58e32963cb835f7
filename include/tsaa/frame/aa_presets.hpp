#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: aa_presets.hpp
    MODULE: frame
    PURPOSE: Named SMAA quality presets, composition presets and their string names.
*/


#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tsaa/frame/aa_params.hpp"

namespace tsaa
{
    // Constants one preset resolves to.
    struct SmaaQualitySettings
    {
        float threshold = 0.1f;
        int max_search_steps = 16;
        bool corner_detection = true;
        int corner_rounding = 25;
        float local_contrast_adaptation_factor = 2.0f;
    };

    inline SmaaQualitySettings smaa_preset_settings(SmaaPreset preset)
    {
        switch (preset)
        {
            case SmaaPreset::Low: return SmaaQualitySettings{0.15f, 4, false, 0, 2.0f};
            case SmaaPreset::Medium: return SmaaQualitySettings{0.1f, 8, false, 0, 2.0f};
            case SmaaPreset::High: return SmaaQualitySettings{0.1f, 16, true, 25, 2.0f};
            case SmaaPreset::Ultra: return SmaaQualitySettings{0.05f, 32, true, 25, 2.0f};
        }
        return SmaaQualitySettings{};
    }

    inline SmaaQualitySettings resolve_smaa_quality(const SmaaParams& p)
    {
        SmaaQualitySettings out = smaa_preset_settings(p.preset);
        if (p.threshold_override >= 0.0f) out.threshold = std::clamp(p.threshold_override, 0.001f, 0.5f);
        if (p.max_search_steps_override >= 0) out.max_search_steps = std::clamp(p.max_search_steps_override, 0, 112);
        if (p.corner_rounding_override >= 0)
        {
            out.corner_rounding = std::clamp(p.corner_rounding_override, 0, 100);
            out.corner_detection = true;
        }
        out.local_contrast_adaptation_factor = std::max(1.0f, p.local_contrast_adaptation_factor);
        return out;
    }

    inline const char* smaa_preset_name(SmaaPreset preset)
    {
        switch (preset)
        {
            case SmaaPreset::Low: return "low";
            case SmaaPreset::Medium: return "medium";
            case SmaaPreset::High: return "high";
            case SmaaPreset::Ultra: return "ultra";
        }
        return "high";
    }

    inline const char* smaa_edge_mode_name(SmaaEdgeMode mode)
    {
        return mode == SmaaEdgeMode::Color ? "color" : "luma";
    }

    inline const char* taa_clamp_mode_name(TaaClampMode mode)
    {
        return mode == TaaClampMode::MinMax ? "min_max" : "variance_clip";
    }

    namespace detail
    {
        inline std::string lowercase_ascii(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
                return (char)std::tolower(c);
            });
            return out;
        }
    }

    inline std::optional<SmaaPreset> parse_smaa_preset(std::string_view name)
    {
        const std::string n = detail::lowercase_ascii(name);
        if (n == "low") return SmaaPreset::Low;
        if (n == "medium") return SmaaPreset::Medium;
        if (n == "high") return SmaaPreset::High;
        if (n == "ultra") return SmaaPreset::Ultra;
        return std::nullopt;
    }

    inline SmaaPreset next_smaa_preset(SmaaPreset preset)
    {
        return (SmaaPreset)(((uint8_t)preset + 1u) % 4u);
    }

    enum class AntiAliasingComposition : uint8_t
    {
        Off = 0,
        Smaa = 1,
        Taa = 2,
        SmaaTaa = 3
    };

    inline const char* anti_aliasing_composition_name(AntiAliasingComposition c)
    {
        switch (c)
        {
            case AntiAliasingComposition::Off: return "off";
            case AntiAliasingComposition::Smaa: return "smaa";
            case AntiAliasingComposition::Taa: return "taa";
            case AntiAliasingComposition::SmaaTaa: return "smaa_taa";
        }
        return "off";
    }

    inline std::optional<AntiAliasingComposition> parse_anti_aliasing_composition(std::string_view name)
    {
        const std::string n = detail::lowercase_ascii(name);
        if (n == "off" || n == "none") return AntiAliasingComposition::Off;
        if (n == "smaa") return AntiAliasingComposition::Smaa;
        if (n == "taa") return AntiAliasingComposition::Taa;
        if (n == "smaa_taa" || n == "smaa+taa") return AntiAliasingComposition::SmaaTaa;
        return std::nullopt;
    }

    // Toggles only. Quality knobs already present in `base` are kept.
    inline AntiAliasingParams make_anti_aliasing_params(
        AntiAliasingComposition composition,
        AntiAliasingParams base = {}
    )
    {
        base.smaa.enable = composition == AntiAliasingComposition::Smaa || composition == AntiAliasingComposition::SmaaTaa;
        base.taa.enable = composition == AntiAliasingComposition::Taa || composition == AntiAliasingComposition::SmaaTaa;
        base.jitter.enable = base.taa.enable;
        return base;
    }

    inline AntiAliasingComposition anti_aliasing_composition_of(const AntiAliasingParams& p)
    {
        if (p.smaa.enable && p.taa.enable) return AntiAliasingComposition::SmaaTaa;
        if (p.smaa.enable) return AntiAliasingComposition::Smaa;
        if (p.taa.enable) return AntiAliasingComposition::Taa;
        return AntiAliasingComposition::Off;
    }
}
