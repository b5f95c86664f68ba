#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: tangent_space.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь ember-shading-lib-ийн shader модульд хамаарах tangent space
            туслах функцүүдийг тодорхойлно.
*/


#include <glm/glm.hpp>

namespace ember
{
    // [0,1] normal map дээжийг [-1,1] чиглэл болгоно.
    inline glm::vec3 decode_normal_sample(const glm::vec3& rgb)
    {
        return rgb * 2.0f - glm::vec3(1.0f);
    }

    inline glm::vec3 tangent_to_world(const glm::mat3& tbn, const glm::vec3& local_dir)
    {
        return tbn * local_dir;
    }

    inline glm::vec3 perturb_normal(const glm::mat3& tbn, const glm::vec3& normal_sample_rgb)
    {
        return glm::normalize(tangent_to_world(tbn, decode_normal_sample(normal_sample_rgb)));
    }
}
