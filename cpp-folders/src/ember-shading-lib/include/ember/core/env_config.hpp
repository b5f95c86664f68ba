#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: env_config.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Орчны хувьсагчаас (EMBER_*) demo болон headless рендерийн тохиргоог уншина.
            Буруу эсвэл хоосон утга ирвэл fallback утга хэвээр үлдэнэ.
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <thread>

namespace ember
{
    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    // Сөрөг тоог strtoul эргүүлж их утга болгодог тул fallback руу буцаана.
    inline uint32_t parse_env_u32(
        const char* value,
        uint32_t fallback,
        uint32_t min_value = 1u,
        uint32_t max_value = std::numeric_limits<uint32_t>::max()
    )
    {
        if (!value || *value == '\0') return fallback;
        const char* p = value;
        while (std::isspace(static_cast<unsigned char>(*p))) ++p;
        if (*p == '-') return fallback;
        char* end = nullptr;
        const unsigned long parsed = std::strtoul(p, &end, 10);
        if (end == p) return fallback;
        const uint32_t out = static_cast<uint32_t>(std::min<unsigned long>(
            parsed,
            static_cast<unsigned long>(max_value)));
        return std::clamp(out, min_value, max_value);
    }

    inline float parse_env_f32(const char* value, float fallback, float min_value = 0.0f)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const float parsed = std::strtof(value, &end);
        if (end == value || !std::isfinite(parsed)) return fallback;
        return std::max(min_value, parsed);
    }

    constexpr uint32_t EMBER_MAX_SURFACE_DIM = 16384u;
    constexpr uint32_t EMBER_MAX_WORKERS = 256u;

    struct DemoConfig
    {
        uint32_t surface_w = 640;
        uint32_t surface_h = 480;
        uint32_t threads = 0;
        bool headless = false;
        uint32_t frames = 1;
        float effect_speed = 1.0f;
        std::string output_path = "ember_out.ppm";
    };

    inline uint32_t default_worker_count()
    {
        const unsigned hc = std::thread::hardware_concurrency();
        return hc == 0u ? 1u : (uint32_t)hc;
    }

    inline DemoConfig load_demo_config_from_env()
    {
        DemoConfig cfg{};
        cfg.threads = std::min(default_worker_count(), EMBER_MAX_WORKERS);
        cfg.surface_w = parse_env_u32(std::getenv("EMBER_SURFACE_W"), cfg.surface_w, 16u, EMBER_MAX_SURFACE_DIM);
        cfg.surface_h = parse_env_u32(std::getenv("EMBER_SURFACE_H"), cfg.surface_h, 16u, EMBER_MAX_SURFACE_DIM);
        // 0 бол rasterizer serial замаар явна.
        cfg.threads = parse_env_u32(std::getenv("EMBER_THREADS"), cfg.threads, 0u, EMBER_MAX_WORKERS);
        cfg.headless = parse_env_bool(std::getenv("EMBER_HEADLESS"), cfg.headless);
        cfg.frames = parse_env_u32(std::getenv("EMBER_FRAMES"), cfg.frames, 1u);
        cfg.effect_speed = parse_env_f32(std::getenv("EMBER_EFFECT_SPEED"), cfg.effect_speed, 0.0f);
        if (const char* output_env = std::getenv("EMBER_OUTPUT"))
        {
            if (*output_env != '\0') cfg.output_path = output_env;
        }
        return cfg;
    }
}
