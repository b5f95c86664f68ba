#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: sdl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 дээрх IPlatformRuntime хэрэгжүүлэлт. Streaming texture руу RGBA8
            surface хуулж, цонхны хэмжээнд сунгаж харуулна.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>

#include "ember/core/log.hpp"
#include "ember/platform/platform_runtime.hpp"

namespace ember
{
    class SdlRuntime final : public IPlatformRuntime
    {
    public:
        SdlRuntime(const WindowDesc& win, const SurfaceDesc& surface)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }
            sdl_initialized_ = true;

            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                SDL_WINDOW_SHOWN
            );
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                log_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                return;
            }

            texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                surface.width,
                surface.height
            );
            if (!texture_)
            {
                log_error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
                return;
            }

            valid_ = true;
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        ~SdlRuntime() override
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_initialized_) SDL_Quit();
        }

        bool valid() const override { return valid_; }

        bool pump_input(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type != SDL_KEYDOWN) continue;
                switch (e.key.keysym.sym)
                {
                    case SDLK_ESCAPE: out.quit = true; break;
                    case SDLK_RIGHT: out.next_light = true; break;
                    case SDLK_LEFT: out.prev_light = true; break;
                    case SDLK_UP: out.next_background = true; break;
                    case SDLK_DOWN: out.prev_background = true; break;
                    case SDLK_F1: out.cycle_debug_view = true; break;
                    case SDLK_SPACE: out.toggle_pause = true; break;
                    default: break;
                }
            }
            return !out.quit;
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) override
        {
            if (!texture_ || !src) return;
            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0) return;

            const size_t copy_bytes = (size_t)width * 4u;
            auto* d = static_cast<uint8_t*>(dst);
            for (int y = 0; y < height; ++y)
            {
                std::memcpy(d + (size_t)y * (size_t)dst_pitch, src + (size_t)y * (size_t)src_pitch_bytes, copy_bytes);
            }
            SDL_UnlockTexture(texture_);
        }

        void present() override
        {
            if (!renderer_ || !texture_) return;
            SDL_SetRenderDrawColor(renderer_, 10, 10, 14, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        bool valid_ = false;
        bool sdl_initialized_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
    };
}
