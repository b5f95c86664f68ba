#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Хэрэглэгчийн өгсөн утгыг татгалзаж болох (hot path-аас гадуурх) функцүүдийн
            буцаах утгын төрөл. Амжилт эсвэл алдааны тайлбарыг хамт зөөнө.
*/


#include <string>
#include <utility>

namespace ember
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        explicit operator bool() const { return ok; }
    };
}
