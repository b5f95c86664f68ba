#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: camera_math.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Зүүн гарын дүрэмтэй (LH) харах/проекцийн матрицууд болон CameraBlock угсралт.
            NDC Z-тэнхлэг нь [-1, 1].
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    inline glm::mat4 look_at_lh(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
    {
        return glm::lookAtLH(eye, target, up);
    }

    inline glm::mat4 perspective_lh_no(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveLH_NO(fovy_radians, aspect, znear, zfar);
    }

    inline CameraBlock make_camera_block(
        const glm::vec3& eye,
        const glm::vec3& target,
        float fovy_radians,
        float aspect,
        float znear = 0.1f,
        float zfar = 100.0f
    )
    {
        CameraBlock c{};
        c.projection = perspective_lh_no(fovy_radians, aspect, znear, zfar);
        c.view = look_at_lh(eye, target, glm::vec3(0.0f, 1.0f, 0.0f));
        return c;
    }
}
