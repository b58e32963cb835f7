#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: sdl_presenter.hpp
    MODULE: platform
    PURPOSE: SDL2 presenter. The canvas lives in a streaming RGBA32 texture that
             is stretched over the window so aliasing stays visible.
*/


#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <SDL2/SDL.h>

#include "tsaa/core/log.hpp"
#include "tsaa/platform/frame_presenter.hpp"

namespace tsaa
{
    class SdlPresenter final : public IFramePresenter
    {
    public:
        explicit SdlPresenter(const PresenterDesc& desc)
            : canvas_(desc.canvas)
        {
            if (SDL_Init(SDL_INIT_VIDEO) != 0)
            {
                fail("SDL_Init");
                return;
            }
            sdl_initialized_ = true;

            window_ = SDL_CreateWindow(
                desc.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                desc.window_width,
                desc.window_height,
                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
            );
            if (!window_)
            {
                fail("SDL_CreateWindow");
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                fail("SDL_CreateRenderer");
                return;
            }
            SDL_RenderSetLogicalSize(renderer_, canvas_.w, canvas_.h);

            SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");
            canvas_texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                canvas_.w,
                canvas_.h
            );
            if (!canvas_texture_)
            {
                fail("SDL_CreateTexture");
                return;
            }
        }

        ~SdlPresenter() override
        {
            if (canvas_texture_) SDL_DestroyTexture(canvas_texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_initialized_) SDL_Quit();
        }

        SdlPresenter(const SdlPresenter&) = delete;
        SdlPresenter& operator=(const SdlPresenter&) = delete;

        bool ready() const override { return canvas_texture_ != nullptr; }

        bool poll(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event ev;
            while (SDL_PollEvent(&ev))
            {
                if (ev.type == SDL_QUIT)
                {
                    out.quit = true;
                    continue;
                }
                if (ev.type == SDL_KEYDOWN && ev.key.repeat == 0) map_key(ev.key.keysym.sym, out);
            }
            return !out.quit;
        }

        void set_caption(const std::string& caption) override
        {
            if (window_) SDL_SetWindowTitle(window_, caption.c_str());
        }

        bool show(const ColorTexture& color) override
        {
            if (!ready()) return false;
            if (color.extent() != canvas_)
            {
                log_warn("presenter: color extent does not match the canvas, frame dropped");
                return false;
            }

            encode_display_rgba8(color, staging_);
            void* pixels = nullptr;
            int pitch = 0;
            if (SDL_LockTexture(canvas_texture_, nullptr, &pixels, &pitch) != 0)
            {
                log_warn(std::string("SDL_LockTexture failed: ") + SDL_GetError());
                return false;
            }
            const size_t row_bytes = (size_t)canvas_.w * 4;
            auto* dst = static_cast<uint8_t*>(pixels);
            for (int y = 0; y < canvas_.h; ++y)
            {
                std::memcpy(dst + (size_t)y * (size_t)pitch, staging_.data() + (size_t)y * row_bytes, row_bytes);
            }
            SDL_UnlockTexture(canvas_texture_);

            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, canvas_texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
            return true;
        }

    private:
        static void map_key(SDL_Keycode key, PlatformInputState& out)
        {
            switch (key)
            {
                case SDLK_ESCAPE: out.quit = true; break;
                case SDLK_1: out.toggle_smaa = true; break;
                case SDLK_2: out.toggle_taa = true; break;
                case SDLK_p: out.cycle_smaa_preset = true; break;
                case SDLK_c: out.cycle_clamp_mode = true; break;
                case SDLK_i: out.toggle_input_source = true; break;
                case SDLK_r: out.camera_cut = true; break;
                case SDLK_SPACE: out.pause_motion = true; break;
                default: break;
            }
        }

        void fail(const char* what)
        {
            log_error(std::string(what) + " failed: " + SDL_GetError());
        }

        TextureExtent canvas_{};
        bool sdl_initialized_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* canvas_texture_ = nullptr;
        std::vector<uint8_t> staging_{};
    };
}
