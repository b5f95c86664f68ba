#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: preset_cycle.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Урагш/хойш эргэлддэг preset цагираг, мөн гэрэл болон арын өнгөний үндсэн preset-үүд.
*/


#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

namespace ember
{
    template<typename T>
    class PresetCycle
    {
    public:
        explicit PresetCycle(std::vector<T> items)
            : items_(std::move(items))
        {
            if (items_.empty()) throw std::invalid_argument("PresetCycle requires at least one preset");
        }

        PresetCycle(std::initializer_list<T> items)
            : PresetCycle(std::vector<T>(items))
        {}

        const T& get() const { return items_[index_]; }
        size_t index() const { return index_; }
        size_t size() const { return items_.size(); }

        const T& next()
        {
            index_ = (index_ + 1) % items_.size();
            return get();
        }

        const T& prev()
        {
            index_ = (index_ + items_.size() - 1) % items_.size();
            return get();
        }

    private:
        std::vector<T> items_{};
        size_t index_ = 0;
    };

    // HDR гэрлийн өнгө: 1-ээс 100 хүртэл, дараа нь маш бүдэг түвшнүүд.
    inline PresetCycle<glm::vec4> default_light_presets()
    {
        return PresetCycle<glm::vec4>{
            glm::vec4(1.0f, 1.0f, 1.0f, 1.0f),
            glm::vec4(3.1f, 3.1f, 3.1f, 1.0f),
            glm::vec4(10.0f, 10.0f, 10.0f, 1.0f),
            glm::vec4(31.0f, 31.0f, 31.0f, 1.0f),
            glm::vec4(100.0f, 100.0f, 100.0f, 1.0f),
            glm::vec4(0.001f, 0.001f, 0.001f, 1.0f),
            glm::vec4(0.01f, 0.01f, 0.01f, 1.0f),
            glm::vec4(0.1f, 0.1f, 0.1f, 1.0f),
            glm::vec4(0.31f, 0.31f, 0.31f, 0.5f)
        };
    }

    inline PresetCycle<glm::vec4> default_background_presets()
    {
        return PresetCycle<glm::vec4>{
            glm::vec4(0.05f, 0.07f, 0.1f, 1.0f),
            glm::vec4(0.5f, 0.5f, 0.5f, 0.5f),
            glm::vec4(1.0f, 1.0f, 1.0f, 1.0f),
            glm::vec4(3.1f, 3.1f, 3.1f, 1.0f),
            glm::vec4(10.0f, 10.0f, 10.0f, 1.0f),
            glm::vec4(0.0f, 0.0f, 0.0f, 1.0f),
            glm::vec4(0.01f, 0.01f, 0.01f, 1.0f)
        };
    }
}
