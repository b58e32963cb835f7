#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: platform_input.hpp
    MODULE: platform
    PURPOSE: Per-frame input edges the demo host reacts to.
*/


namespace tsaa
{
    struct PlatformInputState
    {
        bool quit = false;
        bool toggle_smaa = false;
        bool toggle_taa = false;
        bool cycle_smaa_preset = false;
        bool cycle_clamp_mode = false;
        bool toggle_input_source = false;
        bool camera_cut = false;
        bool pause_motion = false;
    };
}
