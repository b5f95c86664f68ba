#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Vertex шатны attribute-уудыг (position, normal, tangent, texcoord) хадгалах
            mesh өгөгдөл, quad үүсгэгч, UV-ээс tangent тооцоолол болон урьдчилсан нөхцөлийн шалгалт.
*/


#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/result.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    struct MeshData
    {
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec3> tangents{};
        std::vector<glm::vec2> uvs{};
        std::vector<uint32_t> indices{};

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        size_t triangle_count() const
        {
            return indices.size() / 3;
        }

        // Дутуу attribute-ийг VertexAttributes-ийн default утгаар бөглөнө.
        VertexAttributes vertex(uint32_t idx) const
        {
            VertexAttributes v{};
            v.position = positions[(size_t)idx];
            if (idx < normals.size()) v.normal = normals[(size_t)idx];
            if (idx < tangents.size()) v.tangent = tangents[(size_t)idx];
            if (idx < uvs.size()) v.texcoord = uvs[(size_t)idx];
            return v;
        }
    };

    // XY хавтгайд, -Z рүү харсан, UV нь (0,0)-(1,1) мужийг бүрхсэн quad.
    inline MeshData make_quad_mesh(float half_extent = 1.0f)
    {
        const float h = half_extent;
        MeshData m{};
        m.positions = {
            {-h, -h, 0.0f},
            { h, -h, 0.0f},
            { h,  h, 0.0f},
            {-h,  h, 0.0f}
        };
        m.normals.assign(4, glm::vec3(0.0f, 0.0f, -1.0f));
        m.tangents.assign(4, glm::vec3(1.0f, 0.0f, 0.0f));
        m.uvs = {
            {0.0f, 0.0f},
            {1.0f, 0.0f},
            {1.0f, 1.0f},
            {0.0f, 1.0f}
        };
        m.indices = {0, 1, 2, 0, 2, 3};
        return m;
    }

    inline glm::vec3 any_perpendicular(const glm::vec3& n)
    {
        const glm::vec3 axis = (std::abs(n.x) < 0.9f) ? glm::vec3(1.0f, 0.0f, 0.0f) : glm::vec3(0.0f, 1.0f, 0.0f);
        return glm::normalize(glm::cross(axis, n));
    }

    /*
        Гурвалжин бүрийн UV уламжлалаас tangent тооцож оройгоор хуримтлуулна.
        Дараа нь normal-тай Gram-Schmidt хийж, vertex шатны "tangent ойролцоогоор
        перпендикуляр" гэсэн таамаглалыг mesh талаас нь хангана.
    */
    inline void compute_tangents(MeshData& mesh)
    {
        std::vector<glm::vec3> accum(mesh.positions.size(), glm::vec3(0.0f));
        for (size_t ti = 0; ti + 2 < mesh.indices.size(); ti += 3)
        {
            const uint32_t i0 = mesh.indices[ti + 0];
            const uint32_t i1 = mesh.indices[ti + 1];
            const uint32_t i2 = mesh.indices[ti + 2];
            if (i0 >= mesh.positions.size() || i1 >= mesh.positions.size() || i2 >= mesh.positions.size()) continue;
            if (i0 >= mesh.uvs.size() || i1 >= mesh.uvs.size() || i2 >= mesh.uvs.size()) continue;

            const glm::vec3 e1 = mesh.positions[i1] - mesh.positions[i0];
            const glm::vec3 e2 = mesh.positions[i2] - mesh.positions[i0];
            const glm::vec2 duv1 = mesh.uvs[i1] - mesh.uvs[i0];
            const glm::vec2 duv2 = mesh.uvs[i2] - mesh.uvs[i0];
            const float det = duv1.x * duv2.y - duv2.x * duv1.y;
            if (std::abs(det) < 1e-12f) continue;

            const glm::vec3 t = (e1 * duv2.y - e2 * duv1.y) / det;
            accum[i0] += t;
            accum[i1] += t;
            accum[i2] += t;
        }

        mesh.tangents.resize(mesh.positions.size());
        for (size_t i = 0; i < mesh.positions.size(); ++i)
        {
            const glm::vec3 raw_n = (i < mesh.normals.size()) ? mesh.normals[i] : glm::vec3(0.0f, 0.0f, -1.0f);
            // MeshData нэгж урттай normal шаарддаггүй; projection-ийг нэгж n дээр хийнэ.
            const float n_len2 = glm::dot(raw_n, raw_n);
            const glm::vec3 n = (n_len2 > 1e-12f) ? raw_n / std::sqrt(n_len2) : glm::vec3(0.0f, 0.0f, -1.0f);
            const glm::vec3 t = accum[i] - n * glm::dot(n, accum[i]);
            const float len2 = glm::dot(t, t);
            mesh.tangents[i] = (len2 > 1e-12f) ? t / std::sqrt(len2) : any_perpendicular(n);
        }
    }

    // Vertex шат тэг урттай normal/tangent-ийг илрүүлдэггүй тул draw-оос өмнө энд шалгана.
    inline Result<size_t> validate_mesh(const MeshData& mesh)
    {
        const size_t n = mesh.positions.size();
        if (n == 0) return Result<size_t>::failure("mesh has no positions");
        if (mesh.normals.size() != n) return Result<size_t>::failure("normal count does not match position count");
        if (mesh.tangents.size() != n) return Result<size_t>::failure("tangent count does not match position count");
        if (mesh.uvs.size() != n) return Result<size_t>::failure("uv count does not match position count");
        if (mesh.indices.size() % 3 != 0) return Result<size_t>::failure("index count is not a multiple of 3");

        for (size_t i = 0; i < mesh.indices.size(); ++i)
        {
            if (mesh.indices[i] >= n)
            {
                return Result<size_t>::failure("index " + std::to_string(i) + " is out of range");
            }
        }
        for (size_t i = 0; i < n; ++i)
        {
            if (glm::dot(mesh.normals[i], mesh.normals[i]) < 1e-12f)
            {
                return Result<size_t>::failure("vertex " + std::to_string(i) + ": zero-length normal");
            }
            if (glm::dot(mesh.tangents[i], mesh.tangents[i]) < 1e-12f)
            {
                return Result<size_t>::failure("vertex " + std::to_string(i) + ": zero-length tangent");
            }
        }
        return Result<size_t>::success(n);
    }
}
