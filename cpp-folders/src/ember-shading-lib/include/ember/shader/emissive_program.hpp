#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: emissive_program.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex/fragment шатуудыг rasterizer-т залгах ShaderProgram-ууд:
            үндсэн emissive програм болон TBN суурийг өнгөөр харуулах debug програм.
*/


#include <cstdint>

#include <glm/glm.hpp>

#include "ember/shader/fragment_stage.hpp"
#include "ember/shader/program.hpp"
#include "ember/shader/tangent_space.hpp"
#include "ember/shader/vertex_stage.hpp"

namespace ember
{
    enum class TbnDebugView : uint32_t
    {
        Tangent = 0,
        Bitangent = 1,
        Normal = 2,
        // Хавтгай (0.5, 0.5, 1) normal map дээжийг TBN-ээр дамжуулсан үр дүн.
        PerturbedFlatNormal = 3
    };

    inline const char* tbn_debug_view_name(TbnDebugView view)
    {
        switch (view)
        {
            case TbnDebugView::Tangent: return "tangent";
            case TbnDebugView::Bitangent: return "bitangent";
            case TbnDebugView::Normal: return "normal";
            case TbnDebugView::PerturbedFlatNormal: return "perturbed_flat_normal";
        }
        return "unknown";
    }

    inline VertexOut run_vertex_stage_packed(const VertexAttributes& vin, const ShaderUniforms& u)
    {
        const VertexStageOut stage = run_vertex_stage(vin, u.camera, u.model);
        VertexOut o{};
        o.clip = stage.clip;
        pack_stage_varyings(o, stage.varyings);
        return o;
    }

    inline ShaderProgram make_emissive_program()
    {
        ShaderProgram p{};
        p.vs = [](const VertexAttributes& vin, const ShaderUniforms& u) -> VertexOut {
            return run_vertex_stage_packed(vin, u);
        };
        p.fs = [](const FragmentIn& fin, const ShaderUniforms& u) -> FragmentOut {
            const StageVaryings in = unpack_stage_varyings(fin);
            const glm::vec4 c = run_fragment_stage(in, u.material, u.fragment_args, u.lights, u.lighting_or_null());
            FragmentOut o{};
            o.color = ColorF{c.r, c.g, c.b, c.a};
            return o;
        };
        return p;
    }

    inline ShaderProgram make_tbn_debug_program(TbnDebugView view)
    {
        ShaderProgram p = make_emissive_program();
        p.fs = [view](const FragmentIn& fin, const ShaderUniforms&) -> FragmentOut {
            const StageVaryings in = unpack_stage_varyings(fin);
            glm::vec3 d{0.0f};
            switch (view)
            {
                case TbnDebugView::Tangent: d = in.tbn[0]; break;
                case TbnDebugView::Bitangent: d = in.tbn[1]; break;
                case TbnDebugView::Normal: d = in.tbn[2]; break;
                case TbnDebugView::PerturbedFlatNormal: d = perturb_normal(in.tbn, glm::vec3(0.5f, 0.5f, 1.0f)); break;
            }
            // [-1,1] чиглэлийг [0,1] өнгө рүү.
            const glm::vec3 c = d * 0.5f + glm::vec3(0.5f);
            FragmentOut o{};
            o.color = ColorF{c.r, c.g, c.b, 1.0f};
            return o;
        };
        return p;
    }
}
