#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь ember-shading-lib-ийн core модульд хамаарах лог бичих
            функцүүд болон процесс даяарх хамгийн бага лог түвшинг тодорхойлно.
*/


#include <cstdint>
#include <iostream>
#include <string>

namespace ember
{
    enum class LogLevel : uint32_t
    {
        Info = 0,
        Warn = 1,
        Error = 2,
        Silent = 3
    };

    // src/ember_shading_lib.cpp дотор нэг л хувь хадгалагдана.
    LogLevel& log_level_storage();

    inline void set_log_level(LogLevel level)
    {
        log_level_storage() = level;
    }

    inline LogLevel log_level()
    {
        return log_level_storage();
    }

    inline bool log_enabled(LogLevel level)
    {
        return (uint32_t)level >= (uint32_t)log_level();
    }

    inline void log_info(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Error)) return;
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
