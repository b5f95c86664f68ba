#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: fragment_stage.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Fragment шат. Texcoord-оос радиаль зай, effect параметрээс эрчмийн gate
            болон cos/sin долгионы envelope тооцож emissive өнгийг масштаблана.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

#include "ember/lighting/lighting_contribution.hpp"
#include "ember/shader/types.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    struct EmissiveTerms
    {
        float dx = 0.0f;
        float dy = 0.0f;
        // dx^2 + dy^2, нэгж тойргоор хязгаарлагдсан.
        float r = 0.0f;
        float f = 0.0f;
        float e = 0.0f;
    };

    inline float remap_signed_unit(float c)
    {
        // Wrap/clamp sampler зөрүүнээс [0,1]-ээс гарсан texcoord-ыг эхлээд хавчина.
        return 2.0f * std::clamp(c, 0.0f, 1.0f) - 1.0f;
    }

    inline EmissiveTerms eval_emissive_terms(const glm::vec2& texcoord, const glm::vec4& effect)
    {
        EmissiveTerms t{};
        t.dx = remap_signed_unit(texcoord.x);
        t.dy = remap_signed_unit(texcoord.y);
        t.r = std::min(t.dx * t.dx + t.dy * t.dy, 1.0f);
        t.f = std::clamp(effect.x * 2.0f, 0.0f, 1.0f);
        t.e = std::clamp(std::abs(std::cos(t.r - effect.y) + std::sin(t.dy - 2.0f * effect.y)), 0.0f, 1.0f);
        return t;
    }

    inline glm::vec4 shade_emissive(const glm::vec2& texcoord, const MaterialBlock& material)
    {
        const EmissiveTerms t = eval_emissive_terms(texcoord, material.effect);
        return material.emissive * t.e * t.f;
    }

    inline glm::vec4 run_fragment_stage(
        const StageVaryings& in,
        const MaterialBlock& material,
        const FragmentArgsBlock& args,
        const LightsBlock& lights,
        const ILightingContribution& lighting
    )
    {
        return shade_emissive(in.texcoord, material) + lighting.evaluate(in, args, lights);
    }

    inline glm::vec4 run_fragment_stage(
        const StageVaryings& in,
        const MaterialBlock& material,
        const FragmentArgsBlock& args,
        const LightsBlock& lights
    )
    {
        return run_fragment_stage(in, material, args, lights, null_lighting_contribution());
    }
}
