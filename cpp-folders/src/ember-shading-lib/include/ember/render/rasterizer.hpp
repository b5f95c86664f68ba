#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Vertex/fragment шатуудыг CPU дээр гүйцэтгэх rasterizer. Clip space-д
            frustum clipping, fan triangulation, culling, perspective-correct varying
            interpolation, сонголтот depth test болон мөрөөр зэрэгцүүлэлт хийнэ.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "ember/gfx/rt_types.hpp"
#include "ember/job/parallel_for.hpp"
#include "ember/resources/mesh.hpp"
#include "ember/shader/program.hpp"

namespace ember
{
    enum class RasterizerCullMode
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    struct RasterizerConfig
    {
        RasterizerCullMode cull_mode = RasterizerCullMode::Back;
        bool front_face_ccw = true;
        IJobSystem* job_system = nullptr;
        int parallel_min_rows = 8;
        int parallel_min_pixels = 128 * 128;
    };

    struct RasterizerTarget
    {
        RT_ColorHDR* hdr = nullptr;
        RT_DepthBuffer* depth = nullptr;
    };

    struct RasterizerStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
    };

    namespace detail
    {
        struct ClipVertex
        {
            glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
            std::array<glm::vec4, EMBER_MAX_VARYINGS> varyings{};
            uint32_t varying_mask = 0u;
        };

        inline ClipVertex to_clip_vertex(const VertexOut& v)
        {
            return ClipVertex{v.clip, v.varyings, v.varying_mask};
        }

        inline ClipVertex lerp_clip_vertex(const ClipVertex& a, const ClipVertex& b, float t)
        {
            ClipVertex o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.varying_mask = a.varying_mask | b.varying_mask;
            for (uint32_t i = 0; i < EMBER_MAX_VARYINGS; ++i) o.varyings[i] = glm::mix(a.varyings[i], b.varyings[i], t);
            return o;
        }

        // Clip space-ийн 6 хавтгай: x, y, z бүрийн -w ба +w хил.
        inline float plane_distance(const glm::vec4& c, int plane)
        {
            switch (plane)
            {
                case 0: return c.x + c.w;
                case 1: return c.w - c.x;
                case 2: return c.y + c.w;
                case 3: return c.w - c.y;
                case 4: return c.z + c.w;
                default: return c.w - c.z;
            }
        }

        inline std::vector<ClipVertex> clip_polygon_plane(const std::vector<ClipVertex>& in_poly, int plane)
        {
            std::vector<ClipVertex> out{};
            if (in_poly.empty()) return out;

            out.reserve(in_poly.size() + 2);
            for (size_t i = 0; i < in_poly.size(); ++i)
            {
                const ClipVertex& cur = in_poly[i];
                const ClipVertex& nxt = in_poly[(i + 1) % in_poly.size()];
                const float da = plane_distance(cur.clip, plane);
                const float db = plane_distance(nxt.clip, plane);
                const bool cur_in = da >= 0.0f;
                const bool nxt_in = db >= 0.0f;

                if (cur_in != nxt_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_clip_vertex(cur, nxt, da / denom));
                }
                if (nxt_in) out.push_back(nxt);
            }
            return out;
        }

        inline std::vector<ClipVertex> clip_polygon_frustum(std::vector<ClipVertex> poly)
        {
            for (int plane = 0; plane < 6 && poly.size() >= 3; ++plane)
            {
                poly = clip_polygon_plane(poly, plane);
            }
            return poly;
        }

        inline bool fully_inside_clip(const ClipVertex& v)
        {
            const glm::vec4 c = v.clip;
            if (!(c.w > 0.0f)) return false;
            return
                (c.x >= -c.w && c.x <= c.w) &&
                (c.y >= -c.w && c.y <= c.w) &&
                (c.z >= -c.w && c.z <= c.w);
        }

        inline bool finite3(const glm::vec3& v)
        {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-8f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        const float u = 1.0f - v - w;
        return glm::vec3(u, v, w);
    }

    inline RasterizerStats rasterize_mesh(
        const MeshData& mesh,
        const ShaderProgram& program,
        const ShaderUniforms& uniforms,
        RasterizerTarget target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!target.hdr || !program.valid()) return stats;
        if (mesh.positions.empty()) return stats;
        const int W = target.hdr->w;
        const int H = target.hdr->h;
        if (W <= 0 || H <= 0) return stats;
        if (target.depth && (target.depth->w != W || target.depth->h != H)) return stats;

        const bool indexed = !mesh.indices.empty();
        const size_t tri_count = indexed ? (mesh.indices.size() / 3) : (mesh.positions.size() / 3);
        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            stats.tri_input++;
            std::array<uint32_t, 3> idx{};
            for (size_t k = 0; k < 3; ++k)
            {
                idx[k] = indexed ? mesh.indices[ti * 3 + k] : (uint32_t)(ti * 3 + k);
            }
            if (idx[0] >= mesh.positions.size() || idx[1] >= mesh.positions.size() || idx[2] >= mesh.positions.size()) continue;

            std::vector<detail::ClipVertex> poly = {
                detail::to_clip_vertex(program.vs(mesh.vertex(idx[0]), uniforms)),
                detail::to_clip_vertex(program.vs(mesh.vertex(idx[1]), uniforms)),
                detail::to_clip_vertex(program.vs(mesh.vertex(idx[2]), uniforms))
            };
            // Бүтэн дотор байгаа гурвалжинд clip алгасна.
            if (!(detail::fully_inside_clip(poly[0]) && detail::fully_inside_clip(poly[1]) && detail::fully_inside_clip(poly[2])))
            {
                poly = detail::clip_polygon_frustum(std::move(poly));
            }
            if (poly.size() < 3) continue;

            for (size_t k = 1; k + 1 < poly.size(); ++k)
            {
                stats.tri_after_clip++;
                const detail::ClipVertex& rv0 = poly[0];
                const detail::ClipVertex& rv1 = poly[k];
                const detail::ClipVertex& rv2 = poly[k + 1];

                const glm::vec3 n0 = glm::vec3(rv0.clip) / rv0.clip.w;
                const glm::vec3 n1 = glm::vec3(rv1.clip) / rv1.clip.w;
                const glm::vec3 n2 = glm::vec3(rv2.clip) / rv2.clip.w;
                if (!detail::finite3(n0) || !detail::finite3(n1) || !detail::finite3(n2)) continue;

                const glm::vec2 s0{(n0.x * 0.5f + 0.5f) * (float)(W - 1), (n0.y * 0.5f + 0.5f) * (float)(H - 1)};
                const glm::vec2 s1{(n1.x * 0.5f + 0.5f) * (float)(W - 1), (n1.y * 0.5f + 0.5f) * (float)(H - 1)};
                const glm::vec2 s2{(n2.x * 0.5f + 0.5f) * (float)(W - 1), (n2.y * 0.5f + 0.5f) * (float)(H - 1)};

                const glm::vec2 e0 = s1 - s0;
                const glm::vec2 e1 = s2 - s0;
                const float signed_area2 = e0.x * e1.y - e0.y * e1.x;
                if (std::abs(signed_area2) < 1e-10f) continue;
                const bool is_front = ((signed_area2 > 0.0f) == config.front_face_ccw);
                if (config.cull_mode == RasterizerCullMode::Back && !is_front) continue;
                if (config.cull_mode == RasterizerCullMode::Front && is_front) continue;

                const int minx = std::max(0, (int)std::floor(std::min({s0.x, s1.x, s2.x})));
                const int maxx = std::min(W - 1, (int)std::ceil(std::max({s0.x, s1.x, s2.x})));
                const int miny = std::max(0, (int)std::floor(std::min({s0.y, s1.y, s2.y})));
                const int maxy = std::min(H - 1, (int)std::ceil(std::max({s0.y, s1.y, s2.y})));
                if (minx > maxx || miny > maxy) continue;
                stats.tri_raster++;

                const float invw0 = 1.0f / rv0.clip.w;
                const float invw1 = 1.0f / rv1.clip.w;
                const float invw2 = 1.0f / rv2.clip.w;
                const uint32_t varying_mask = rv0.varying_mask | rv1.varying_mask | rv2.varying_mask;
                std::array<glm::vec4, EMBER_MAX_VARYINGS> varw0{};
                std::array<glm::vec4, EMBER_MAX_VARYINGS> varw1{};
                std::array<glm::vec4, EMBER_MAX_VARYINGS> varw2{};
                for (uint32_t i = 0; i < EMBER_MAX_VARYINGS; ++i)
                {
                    if ((varying_mask & varying_bit(i)) == 0u) continue;
                    varw0[i] = rv0.varyings[i] * invw0;
                    varw1[i] = rv1.varyings[i] * invw1;
                    varw2[i] = rv2.varyings[i] * invw2;
                }

                // Мөр бүр өөр pixel-үүдэд бичдэг тул worker-ууд хоорондоо давхцахгүй.
                auto raster_rows = [&](int yb, int ye)
                {
                    for (int y = yb; y < ye; ++y)
                    {
                        for (int x = minx; x <= maxx; ++x)
                        {
                            const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                            const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                            if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;

                            // 1/w interpolation: perspective-correct varying.
                            const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                            if (denom <= 1e-10f) continue;
                            const float inv_denom = 1.0f / denom;

                            const float z_ndc = (bc.x * (rv0.clip.z * invw0) + bc.y * (rv1.clip.z * invw1) + bc.z * (rv2.clip.z * invw2)) * inv_denom;
                            const float z01 = glm::clamp(z_ndc * 0.5f + 0.5f, 0.0f, 1.0f);
                            if (target.depth)
                            {
                                float& zbuf = target.depth->depth.at(x, y);
                                if (z01 >= zbuf) continue;
                                zbuf = z01;
                            }

                            FragmentIn fin{};
                            fin.varying_mask = varying_mask;
                            for (uint32_t i = 0; i < EMBER_MAX_VARYINGS; ++i)
                            {
                                if ((varying_mask & varying_bit(i)) == 0u) continue;
                                fin.varyings[i] = (bc.x * varw0[i] + bc.y * varw1[i] + bc.z * varw2[i]) * inv_denom;
                            }
                            fin.depth01 = z01;
                            fin.px = x;
                            fin.py = y;

                            const FragmentOut fout = program.fs(fin, uniforms);
                            if (fout.discard) continue;
                            target.hdr->color.at(x, y) = fout.color;
                        }
                    }
                };

                const int bbox_rows = maxy - miny + 1;
                const int bbox_pixels = (maxx - minx + 1) * bbox_rows;
                // Жижиг bbox дээр scheduling overhead-оос зайлсхийнэ.
                const bool use_parallel =
                    config.job_system &&
                    bbox_rows >= std::max(1, config.parallel_min_rows) &&
                    bbox_pixels >= std::max(1, config.parallel_min_pixels);
                if (use_parallel)
                {
                    parallel_for_1d(config.job_system, miny, maxy + 1, std::max(1, config.parallel_min_rows), raster_rows);
                }
                else
                {
                    raster_rows(miny, maxy + 1);
                }
            }
        }
        return stats;
    }
}
