#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: uniform_blocks.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex/fragment шатны uniform block-ууд болон vertex attribute-ийн
            байршлыг std140 layout-тай тааруулж нэг цэгт тодорхойлно.
            Талбаруудын дараалал caller талын buffer pack-тэй binary нийцтэй байх ёстой.
*/


#include <array>
#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

namespace ember
{
    constexpr uint32_t EMBER_MAX_LIGHTS = 16;

    enum class VertexAttributeSlot : uint32_t
    {
        Position = 0,
        Normal = 1,
        Tangent = 2,
        TexCoord = 3
    };

    struct VertexAttributes
    {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 0.0f, -1.0f};
        glm::vec3 tangent{1.0f, 0.0f, 0.0f};
        glm::vec2 texcoord{0.0f};
    };

    struct alignas(16) CameraBlock
    {
        glm::mat4 projection{1.0f};
        glm::mat4 view{1.0f};
    };
    static_assert(sizeof(CameraBlock) == 128, "CameraBlock must stay 128 bytes (2 x mat4)");
    static_assert(offsetof(CameraBlock, view) == 64, "CameraBlock.view must follow projection");

    struct alignas(16) ModelBlock
    {
        glm::mat4 model{1.0f};
    };
    static_assert(sizeof(ModelBlock) == 64, "ModelBlock must stay 64 bytes");

    struct alignas(16) FragmentArgsBlock
    {
        // std140 дээр int нь бүтэн 16 байтын slot эзэлнэ.
        int32_t light_count = 0;
        int32_t pad0_ = 0;
        int32_t pad1_ = 0;
        int32_t pad2_ = 0;
    };
    static_assert(sizeof(FragmentArgsBlock) == 16, "FragmentArgsBlock must occupy one 16-byte slot");

    struct alignas(16) LightRecord
    {
        glm::vec4 propagation{0.0f};
        glm::vec4 center{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec4 color{0.0f};
    };
    static_assert(sizeof(LightRecord) == 48, "LightRecord must stay 3 x vec4");
    static_assert(offsetof(LightRecord, center) == 16, "LightRecord.center must follow propagation");
    static_assert(offsetof(LightRecord, color) == 32, "LightRecord.color must follow center");

    struct alignas(16) LightsBlock
    {
        std::array<LightRecord, EMBER_MAX_LIGHTS> lights{};
    };
    static_assert(sizeof(LightsBlock) == 48 * EMBER_MAX_LIGHTS, "LightsBlock must be a tight LightRecord array");

    struct alignas(16) MaterialBlock
    {
        glm::vec4 emissive{1.0f};
        // x: intensity gate, y: phase. zw ашиглагдахгүй.
        glm::vec4 effect{0.0f};
    };
    static_assert(sizeof(MaterialBlock) == 32, "MaterialBlock must stay 2 x vec4");
    static_assert(offsetof(MaterialBlock, effect) == 16, "MaterialBlock.effect must follow emissive");
}
