#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: ppm_writer.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: HDR canvas-ийг RGBA8 дэлгэцийн дараалал руу хөрвүүлж, headless горимд
            binary PPM (P6) файл болгон бичнэ.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "ember/core/result.hpp"
#include "ember/gfx/rt_types.hpp"

namespace ember
{
    // Canvas доороос дээш хадгалагддаг тул мөрүүдийг дэлгэцийн (дээрээс доош) дараалалд эргүүлнэ.
    inline void hdr_to_rgba8(std::vector<uint8_t>& rgba, const RT_ColorHDR& hdr)
    {
        rgba.resize(static_cast<size_t>(hdr.w) * static_cast<size_t>(hdr.h) * 4u);
        for (int y_screen = 0; y_screen < hdr.h; ++y_screen)
        {
            const int y_canvas = hdr.h - 1 - y_screen;
            uint8_t* row = rgba.data() + static_cast<size_t>(y_screen) * static_cast<size_t>(hdr.w) * 4u;
            for (int x = 0; x < hdr.w; ++x)
            {
                const ColorF c = hdr.color.at(x, y_canvas);
                const int i = x * 4;
                row[i + 0] = static_cast<uint8_t>(std::lround(std::clamp(c.r, 0.0f, 1.0f) * 255.0f));
                row[i + 1] = static_cast<uint8_t>(std::lround(std::clamp(c.g, 0.0f, 1.0f) * 255.0f));
                row[i + 2] = static_cast<uint8_t>(std::lround(std::clamp(c.b, 0.0f, 1.0f) * 255.0f));
                row[i + 3] = static_cast<uint8_t>(std::lround(std::clamp(c.a, 0.0f, 1.0f) * 255.0f));
            }
        }
    }

    inline Result<size_t> write_ppm(const std::string& path, const std::vector<uint8_t>& rgba, int w, int h)
    {
        if (w <= 0 || h <= 0) return Result<size_t>::failure("invalid image size");
        if (rgba.size() < (size_t)w * (size_t)h * 4u) return Result<size_t>::failure("rgba buffer is smaller than image");

        std::ofstream out(path, std::ios::binary);
        if (!out) return Result<size_t>::failure("cannot open " + path);

        const std::string header = "P6\n" + std::to_string(w) + " " + std::to_string(h) + "\n255\n";
        out << header;
        for (size_t i = 0; i < (size_t)w * (size_t)h; ++i)
        {
            const char rgb[3] = {
                (char)rgba[i * 4 + 0],
                (char)rgba[i * 4 + 1],
                (char)rgba[i * 4 + 2]
            };
            out.write(rgb, 3);
        }
        if (!out.good()) return Result<size_t>::failure("write failed: " + path);
        return Result<size_t>::success(header.size() + (size_t)w * (size_t)h * 3u);
    }
}
