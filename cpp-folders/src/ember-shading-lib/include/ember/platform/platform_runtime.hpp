#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Цонх үүсгэх, оролт унших, RGBA8 surface-ийг дэлгэцэнд гаргах платформын интерфэйс.
*/


#include <cstdint>
#include <string>

#include "ember/platform/platform_input.hpp"

namespace ember
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
    };

    struct SurfaceDesc
    {
        int width = 640;
        int height = 480;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) = 0;
        virtual void present() = 0;
    };
}
