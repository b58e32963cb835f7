/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: tsaa_lib.cpp
    MODULE: tsaa-lib
    PURPOSE: Compiled library target anchor translation unit.
*/

#include "tsaa/pipeline/antialiasing_pipeline.hpp"
#include "tsaa/job/thread_pool_job_system.hpp"

namespace tsaa
{
    int tsaa_compiled_target_anchor()
    {
        return 0;
    }
}
