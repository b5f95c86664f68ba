#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex шатаас fragment шат руу дамжих varying интерфэйс. Нэрлэсэн
            талбаруудыг (position, normal, tbn, texcoord) rasterizer-ийн semantic
            slot-уудад тогтмол дарааллаар pack/unpack хийнэ.
*/


#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "ember/gfx/rt_types.hpp"

namespace ember
{
    constexpr uint32_t EMBER_MAX_VARYINGS = 8;

    enum class VaryingSemantic : uint32_t
    {
        WorldPos = 0,
        NormalWS = 1,
        TangentWS = 2,
        BitangentWS = 3,
        UV0 = 4,
        Custom0 = 5,
        Custom1 = 6,
        Custom2 = 7
    };

    inline constexpr uint32_t varying_bit(uint32_t slot) { return (1u << slot); }

    struct StageVaryings
    {
        glm::vec4 position{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec3 normal{0.0f, 0.0f, -1.0f};
        // Баганууд: tangent, bitangent, normal.
        glm::mat3 tbn{1.0f};
        glm::vec2 texcoord{0.0f};
    };

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        std::array<glm::vec4, EMBER_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
    };

    struct FragmentIn
    {
        std::array<glm::vec4, EMBER_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    inline void set_varying(VertexOut& out, VaryingSemantic semantic, const glm::vec4& v)
    {
        const uint32_t i = (uint32_t)semantic;
        out.varyings[i] = v;
        out.varying_mask |= varying_bit(i);
    }

    inline glm::vec4 get_varying(const FragmentIn& in, VaryingSemantic semantic, const glm::vec4& fallback = glm::vec4(0.0f))
    {
        const uint32_t i = (uint32_t)semantic;
        if ((in.varying_mask & varying_bit(i)) == 0u) return fallback;
        return in.varyings[i];
    }

    inline void pack_stage_varyings(VertexOut& out, const StageVaryings& v)
    {
        set_varying(out, VaryingSemantic::WorldPos, v.position);
        set_varying(out, VaryingSemantic::NormalWS, glm::vec4(v.normal, 0.0f));
        set_varying(out, VaryingSemantic::TangentWS, glm::vec4(v.tbn[0], 0.0f));
        set_varying(out, VaryingSemantic::BitangentWS, glm::vec4(v.tbn[1], 0.0f));
        set_varying(out, VaryingSemantic::UV0, glm::vec4(v.texcoord, 0.0f, 0.0f));
    }

    // TBN-ийн гурав дахь багана нь normal varying-тай ижил тул тусдаа slot эзлэхгүй.
    // Interpolation-ы дараа дахин normalize хийхгүй: fragment шат утгыг байгаагаар нь авна.
    inline StageVaryings unpack_stage_varyings(const FragmentIn& in)
    {
        StageVaryings v{};
        v.position = get_varying(in, VaryingSemantic::WorldPos, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
        v.normal = glm::vec3(get_varying(in, VaryingSemantic::NormalWS, glm::vec4(0.0f, 0.0f, -1.0f, 0.0f)));
        const glm::vec3 t = glm::vec3(get_varying(in, VaryingSemantic::TangentWS, glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)));
        const glm::vec3 b = glm::vec3(get_varying(in, VaryingSemantic::BitangentWS, glm::vec4(0.0f, 1.0f, 0.0f, 0.0f)));
        v.tbn = glm::mat3(t, b, v.normal);
        const glm::vec4 uv = get_varying(in, VaryingSemantic::UV0);
        v.texcoord = glm::vec2(uv.x, uv.y);
        return v;
    }
}
