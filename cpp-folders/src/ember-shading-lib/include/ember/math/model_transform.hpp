#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: model_transform.hpp
    МОДУЛЬ: math
    ЗОРИЛГО: Зөвхөн эргэлт + шилжилт + жигд (uniform) масштабтай model матрицыг
            төрлөөр нь баталгаажуулах wrapper. Vertex шат normal/tangent-ийг
            inverse-transpose-гүйгээр 3x3 хэсгээр нь хувиргадаг тул энэ нөхцөл заавал биелнэ.
*/


#include <algorithm>
#include <cmath>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include "ember/core/result.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    class ModelTransform
    {
    public:
        ModelTransform() = default;

        static ModelTransform from_trs(const glm::vec3& translation, const glm::quat& rotation, float uniform_scale)
        {
            const glm::mat4 t = glm::translate(glm::mat4(1.0f), translation);
            const glm::mat4 r = glm::mat4_cast(glm::normalize(rotation));
            const glm::mat4 s = glm::scale(glm::mat4(1.0f), glm::vec3(uniform_scale));
            return ModelTransform(t * r * s);
        }

        static Result<ModelTransform> try_from_matrix(const glm::mat4& m, float tolerance = 1e-4f)
        {
            for (int c = 0; c < 4; ++c)
            {
                for (int r = 0; r < 4; ++r)
                {
                    if (!std::isfinite(m[c][r])) return Result<ModelTransform>::failure("model matrix has non-finite element");
                }
            }
            if (m[0][3] != 0.0f || m[1][3] != 0.0f || m[2][3] != 0.0f || m[3][3] != 1.0f)
            {
                return Result<ModelTransform>::failure("model matrix is not affine");
            }

            const glm::vec3 c0 = glm::vec3(m[0]);
            const glm::vec3 c1 = glm::vec3(m[1]);
            const glm::vec3 c2 = glm::vec3(m[2]);
            const float l0 = glm::length(c0);
            const float l1 = glm::length(c1);
            const float l2 = glm::length(c2);
            if (std::min({l0, l1, l2}) <= 1e-8f)
            {
                return Result<ModelTransform>::failure("model matrix has zero scale");
            }

            const float len_tol = tolerance * std::max(1.0f, l0);
            if (std::abs(l1 - l0) > len_tol || std::abs(l2 - l0) > len_tol)
            {
                return Result<ModelTransform>::failure(
                    "model matrix has non-uniform scale (" + std::to_string(l0) + ", " +
                    std::to_string(l1) + ", " + std::to_string(l2) + ")");
            }

            // Баганууд хоорондоо перпендикуляр биш бол shear байна.
            const float dot_tol = tolerance * l0 * l0;
            if (std::abs(glm::dot(c0, c1)) > dot_tol ||
                std::abs(glm::dot(c0, c2)) > dot_tol ||
                std::abs(glm::dot(c1, c2)) > dot_tol)
            {
                return Result<ModelTransform>::failure("model matrix has shear");
            }
            return Result<ModelTransform>::success(ModelTransform(m));
        }

        // Caller өөрөө rigid/uniform scale гэдгийг баталгаажуулсан үед шалгалтгүй үүсгэнэ.
        static ModelTransform assume_rigid_or_uniform_scale(const glm::mat4& m)
        {
            return ModelTransform(m);
        }

        const glm::mat4& matrix() const { return model_; }
        glm::mat3 linear() const { return glm::mat3(model_); }
        float uniform_scale() const { return glm::length(glm::vec3(model_[0])); }

        ModelBlock block() const
        {
            ModelBlock b{};
            b.model = model_;
            return b;
        }

    private:
        explicit ModelTransform(const glm::mat4& m)
            : model_(m)
        {}

        glm::mat4 model_{1.0f};
    };
}
