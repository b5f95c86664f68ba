#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: lighting_contribution.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Fragment шатанд гэрлийн массиваас нэмэгдэх хувь нэмрийг тооцох өргөтгөлийн цэг.
            Одоогийн fragment томьёо гэрлийн block-ийг уншдаггүй тул үндсэн хэрэгжүүлэлт тэг буцаана.
*/


#include <algorithm>
#include <cstdint>

#include <glm/glm.hpp>

#include "ember/shader/types.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    inline uint32_t active_light_count(const FragmentArgsBlock& args)
    {
        return (uint32_t)std::clamp<int32_t>(args.light_count, 0, (int32_t)EMBER_MAX_LIGHTS);
    }

    class ILightingContribution
    {
    public:
        virtual ~ILightingContribution() = default;
        virtual const char* name() const = 0;
        virtual glm::vec4 evaluate(const StageVaryings& in, const FragmentArgsBlock& args, const LightsBlock& lights) const = 0;
    };

    class NullLightingContribution final : public ILightingContribution
    {
    public:
        const char* name() const override { return "null"; }

        glm::vec4 evaluate(const StageVaryings&, const FragmentArgsBlock&, const LightsBlock&) const override
        {
            return glm::vec4(0.0f);
        }
    };

    inline const ILightingContribution& null_lighting_contribution()
    {
        static const NullLightingContribution k_null{};
        return k_null;
    }
}
