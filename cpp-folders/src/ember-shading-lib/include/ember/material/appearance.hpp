#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: appearance.hpp
    МОДУЛЬ: material
    ЗОРИЛГО: Объект бүрийн emissive өнгө болон effect параметрийг MaterialBlock болгоно.
            effect.x нь эрчмийн gate (жишээ нь үлдсэн энерги), effect.y нь фаз (нас/цаг).
*/


#include <glm/glm.hpp>

#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    struct Appearance
    {
        glm::vec4 emissive{1.0f};
        glm::vec4 effect{1.0f, 0.0f, 0.0f, 0.0f};

        // Бүтэн gate, тэг фаз.
        static Appearance rgba(const glm::vec4& color)
        {
            return Appearance{color, glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)};
        }

        static Appearance with_effect(const glm::vec4& color, const glm::vec4& effect)
        {
            return Appearance{color, effect};
        }

        MaterialBlock to_material_block() const
        {
            MaterialBlock m{};
            m.emissive = emissive;
            m.effect = effect;
            return m;
        }
    };

    inline glm::vec4 make_agent_effect(float energy_left, float age)
    {
        return glm::vec4(energy_left, age, 0.0f, 0.0f);
    }
}
