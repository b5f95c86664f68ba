#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: program.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Rasterizer-ийн дуудах vertex/fragment функцийн хос болон нэг draw-ийн
            туршид хувиршгүй uniform багц.
*/


#include <functional>

#include "ember/lighting/lighting_contribution.hpp"
#include "ember/math/model_transform.hpp"
#include "ember/shader/types.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    // Draw хооронд л caller өөрчилнө; шатууд зөвхөн const reference-ээр уншина.
    struct ShaderUniforms
    {
        CameraBlock camera{};
        ModelTransform model{};
        MaterialBlock material{};
        FragmentArgsBlock fragment_args{};
        LightsBlock lights{};
        const ILightingContribution* lighting = nullptr;

        const ILightingContribution& lighting_or_null() const
        {
            return lighting ? *lighting : null_lighting_contribution();
        }
    };

    using VertexShaderFn = std::function<VertexOut(const VertexAttributes&, const ShaderUniforms&)>;
    using FragmentShaderFn = std::function<FragmentOut(const FragmentIn&, const ShaderUniforms&)>;

    struct ShaderProgram
    {
        VertexShaderFn vs{};
        FragmentShaderFn fs{};

        bool valid() const
        {
            return (bool)vs && (bool)fs;
        }
    };
}
