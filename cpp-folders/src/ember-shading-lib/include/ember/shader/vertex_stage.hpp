#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: vertex_stage.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex шат. Оройн байрлалыг world space руу, normal/tangent-ийг model
            матрицын 3x3 хэсгээр хувиргаж TBN суурийг угсарна, clip-space байрлал гаргана.
*/


#include <glm/glm.hpp>

#include "ember/math/model_transform.hpp"
#include "ember/shader/types.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    struct VertexStageOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        StageVaryings varyings{};
    };

    // bitangent = cross(n, t). Normalize хийхгүй: урт нь n, t хоорондын өнцгөөс хамаарна.
    inline glm::mat3 build_tbn(const glm::vec3& normal_ws, const glm::vec3& tangent_ws)
    {
        const glm::vec3 bitangent = glm::cross(normal_ws, tangent_ws);
        return glm::mat3(tangent_ws, bitangent, normal_ws);
    }

    /*
        Урьдчилсан нөхцөл: normal, tangent тэг урттай биш байх; model нь rigid эсвэл
        жигд масштабтай байх (ModelTransform үүнийг төрлөөр нь илэрхийлнэ).
        Тэг урттай оролт NaN гаргана, энд илрүүлэхгүй.
    */
    inline VertexStageOut run_vertex_stage(const VertexAttributes& vin, const CameraBlock& camera, const ModelTransform& model)
    {
        VertexStageOut o{};
        const glm::vec4 world = model.matrix() * glm::vec4(vin.position, 1.0f);

        const glm::mat3 m3 = model.linear();
        const glm::vec3 n = glm::normalize(m3 * vin.normal);
        const glm::vec3 t = glm::normalize(m3 * vin.tangent);

        o.varyings.position = world;
        o.varyings.normal = n;
        o.varyings.tbn = build_tbn(n, t);
        o.varyings.texcoord = vin.texcoord;
        o.clip = camera.projection * camera.view * world;
        return o;
    }
}
