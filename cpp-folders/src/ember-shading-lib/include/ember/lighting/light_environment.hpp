#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: light_environment.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Үзэгдлийн гэрэл цацруулагчдын байрлал, нийтлэг гэрлийн өнгө, арын өнгийг
            FragmentArgsBlock + LightsBlock руу pack хийнэ.
*/


#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/log.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    struct LightEnvironment
    {
        glm::vec4 light_color{1.0f};
        std::vector<glm::vec3> light_positions{};
        glm::vec4 background_color{0.05f, 0.07f, 0.1f, 1.0f};
    };

    struct PackedLights
    {
        FragmentArgsBlock args{};
        LightsBlock lights{};
        size_t dropped = 0;
    };

    // propagation-ийн утгыг fragment томьёо одоогоор уншихгүй; caller-ийн өгснөөр дамжина.
    inline PackedLights pack_light_environment(
        const LightEnvironment& env,
        const glm::vec4& propagation = glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)
    )
    {
        PackedLights out{};
        const size_t n = std::min(env.light_positions.size(), (size_t)EMBER_MAX_LIGHTS);
        for (size_t i = 0; i < n; ++i)
        {
            LightRecord& rec = out.lights.lights[i];
            rec.propagation = propagation;
            rec.center = glm::vec4(env.light_positions[i], 1.0f);
            rec.color = env.light_color;
        }
        out.args.light_count = (int32_t)n;
        out.dropped = env.light_positions.size() - n;
        if (out.dropped > 0)
        {
            log_warn("light environment has " + std::to_string(env.light_positions.size()) +
                     " emitters, packing first " + std::to_string(EMBER_MAX_LIGHTS));
        }
        return out;
    }
}
