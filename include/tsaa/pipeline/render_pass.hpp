#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: render_pass.hpp
    MODULE: pipeline
    PURPOSE: Render-graph node contract: declared resource IO, identity fallbacks and
             the execute entry point.
*/


#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "tsaa/core/context.hpp"
#include "tsaa/frame/aa_params.hpp"
#include "tsaa/pipeline/frame_resources.hpp"
#include "tsaa/pipeline/pass_id.hpp"
#include "tsaa/pipeline/view_frame_state.hpp"

namespace tsaa
{
    enum class PassResourceAccess : uint8_t
    {
        Read = 1,
        Write = 2,
        // Consumes the incoming version and replaces it.
        ReadWrite = 3
    };

    inline bool pass_access_has_read(PassResourceAccess a)
    {
        return a == PassResourceAccess::Read || a == PassResourceAccess::ReadWrite;
    }

    inline bool pass_access_has_write(PassResourceAccess a)
    {
        return a == PassResourceAccess::Write || a == PassResourceAccess::ReadWrite;
    }

    constexpr uint64_t pass_named_resource_flag()
    {
        return (1ull << 63ull);
    }

    inline uint64_t pass_resource_key(const std::string& name)
    {
        if (name.empty()) return 0ull;
        return pass_named_resource_flag() | (std::hash<std::string>{}(name) & ~pass_named_resource_flag());
    }

    struct PassResourceRef
    {
        uint64_t key = 0;
        FrameResourceKind kind = FrameResourceKind::Unknown;
        PassResourceAccess access = PassResourceAccess::Read;
        std::string name{};
    };

    // On failure or when disabled, `output` is bound to whatever `input` resolves to.
    struct PassIdentityFallback
    {
        std::string output{};
        std::string input{};
    };

    struct PassIODesc
    {
        std::vector<PassResourceRef> resources{};
        std::vector<PassIdentityFallback> fallbacks{};

        void read(const std::string& name, FrameResourceKind kind) { add(name, kind, PassResourceAccess::Read); }
        void write(const std::string& name, FrameResourceKind kind) { add(name, kind, PassResourceAccess::Write); }
        void read_write(const std::string& name, FrameResourceKind kind) { add(name, kind, PassResourceAccess::ReadWrite); }

        void identity_fallback(const std::string& output, const std::string& input)
        {
            fallbacks.push_back(PassIdentityFallback{output, input});
        }

    private:
        void add(const std::string& name, FrameResourceKind kind, PassResourceAccess access)
        {
            resources.push_back(PassResourceRef{pass_resource_key(name), kind, access, name});
        }
    };

    enum class PassStatus : uint8_t
    {
        Executed = 0,
        Skipped = 1,
        Failed = 2
    };

    inline const char* pass_status_name(PassStatus s)
    {
        switch (s)
        {
            case PassStatus::Executed: return "executed";
            case PassStatus::Skipped: return "skipped";
            case PassStatus::Failed: return "failed";
        }
        return "unknown";
    }

    struct PassExecutionResult
    {
        PassStatus status = PassStatus::Skipped;
        std::string message{};

        static PassExecutionResult executed()
        {
            return PassExecutionResult{PassStatus::Executed, {}};
        }

        static PassExecutionResult skipped(std::string why)
        {
            return PassExecutionResult{PassStatus::Skipped, std::move(why)};
        }

        static PassExecutionResult failed(std::string why)
        {
            return PassExecutionResult{PassStatus::Failed, std::move(why)};
        }
    };

    struct PassExecutionContext
    {
        Context& ctx;
        // Job system for the row-parallel kernels. Null when views run concurrently.
        IJobSystem* jobs = nullptr;
        ViewFrameState& view;
        FrameResourceTable& resources;
        const AntiAliasingParams& params;
        const AntiAliasingServices& services;
        uint64_t frame_serial = 0;
    };

    class IRenderPass
    {
    public:
        virtual ~IRenderPass() = default;

        virtual const char* id() const = 0;
        virtual PassId pass_id() const { return parse_pass_id(id()); }
        virtual bool enabled() const { return enabled_; }
        virtual void set_enabled(bool enabled) { enabled_ = enabled; }
        virtual PassIODesc describe_io() const = 0;
        virtual PassExecutionResult execute(PassExecutionContext& pctx) = 0;
        virtual void on_view_destroyed(uint32_t view_id) { (void)view_id; }

    protected:
        bool enabled_ = true;
    };
}
