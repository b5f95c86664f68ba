/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: ember_shading_lib.cpp
    МОДУЛЬ: ember-shading-lib
    ЗОРИЛГО: Compiled library target. Процесс даяарх лог түвшинг хадгалж, SDL-ээс
            хамааралгүй нийтийн header-уудыг нэг удаа compile хийлгэнэ.
*/

#include "ember/camera/camera_math.hpp"
#include "ember/color/color_space.hpp"
#include "ember/core/env_config.hpp"
#include "ember/core/log.hpp"
#include "ember/gfx/ppm_writer.hpp"
#include "ember/lighting/light_environment.hpp"
#include "ember/lighting/preset_cycle.hpp"
#include "ember/material/appearance.hpp"
#include "ember/render/rasterizer.hpp"
#include "ember/shader/emissive_program.hpp"
#include "ember/shader/std140.hpp"

namespace ember
{
    LogLevel& log_level_storage()
    {
        static LogLevel level = LogLevel::Info;
        return level;
    }
}
