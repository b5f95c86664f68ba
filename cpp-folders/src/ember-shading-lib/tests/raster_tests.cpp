#include <cmath>
#include <cstdio>
#include <cstring>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "ember/camera/camera_math.hpp"
#include "ember/job/job_system.hpp"
#include "ember/render/rasterizer.hpp"
#include "ember/resources/mesh.hpp"
#include "ember/shader/emissive_program.hpp"

namespace
{
    constexpr int kW = 32;
    constexpr int kH = 32;
    const ember::ColorF kClear{0.25f, 0.5f, 0.75f, 1.0f};

    struct OffsetLighting final : ember::ILightingContribution
    {
        const char* name() const override { return "offset"; }
        glm::vec4 evaluate(const ember::StageVaryings&, const ember::FragmentArgsBlock&, const ember::LightsBlock&) const override
        {
            return glm::vec4(0.125f);
        }
    };

    bool same_color(const ember::ColorF& a, const ember::ColorF& b)
    {
        return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
    }

    // Identity camera + model: quad нь NDC-г бүтэн бүрхэнэ.
    ember::ShaderUniforms fullscreen_uniforms(const glm::vec4& emissive, const glm::vec4& effect)
    {
        ember::ShaderUniforms u{};
        u.material.emissive = emissive;
        u.material.effect = effect;
        return u;
    }

    struct Canvas
    {
        ember::RT_ColorHDR hdr{kW, kH, kClear};
        ember::RT_DepthBuffer depth{kW, kH};

        ember::RasterizerTarget target(bool with_depth = true)
        {
            ember::RasterizerTarget t{};
            t.hdr = &hdr;
            t.depth = with_depth ? &depth : nullptr;
            return t;
        }
    };

    bool test_center_pixel_is_pure_emissive()
    {
        const glm::vec4 emissive(0.8f, 0.6f, 0.2f, 1.0f);
        // Phase -0.3 үед төв орчимд envelope 1-ээр хязгаарлагдана.
        const ember::ShaderUniforms u = fullscreen_uniforms(emissive, glm::vec4(0.5f, -0.3f, 0.0f, 0.0f));
        Canvas c{};
        ember::RasterizerConfig cfg{};
        cfg.cull_mode = ember::RasterizerCullMode::None;
        const ember::RasterizerStats stats = ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::make_emissive_program(), u, c.target(), cfg);
        if (stats.tri_input != 2 || stats.tri_after_clip != 2 || stats.tri_raster != 2) return false;

        const ember::ColorF center = c.hdr.color.at(kW / 2 - 1, kH / 2 - 1);
        if (!same_color(center, ember::ColorF{emissive.r, emissive.g, emissive.b, emissive.a})) return false;

        // Булан руу r -> 1 болж envelope суларна.
        const ember::ColorF corner = c.hdr.color.at(0, 0);
        if (!(corner.r < center.r)) return false;
        // Баруун дээд мөр, багана pixel төвөөр хамрагдахгүй.
        return same_color(c.hdr.color.at(kW - 1, kH - 1), kClear);
    }

    bool test_zero_gate_renders_black()
    {
        const ember::ShaderUniforms u = fullscreen_uniforms(glm::vec4(4.0f, 4.0f, 4.0f, 1.0f), glm::vec4(0.0f, 1.7f, 0.0f, 0.0f));
        Canvas c{};
        ember::RasterizerConfig cfg{};
        cfg.cull_mode = ember::RasterizerCullMode::None;
        ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::make_emissive_program(), u, c.target(), cfg);
        for (int y = 0; y < kH - 1; ++y)
        {
            for (int x = 0; x < kW - 1; ++x)
            {
                if (!same_color(c.hdr.color.at(x, y), ember::ColorF{0.0f, 0.0f, 0.0f, 0.0f})) return false;
            }
        }
        return true;
    }

    bool test_lighting_hook_reaches_pixels()
    {
        const glm::vec4 emissive(0.5f, 0.5f, 0.5f, 1.0f);
        ember::ShaderUniforms u = fullscreen_uniforms(emissive, glm::vec4(0.5f, -0.3f, 0.0f, 0.0f));
        const OffsetLighting lighting{};
        u.lighting = &lighting;
        Canvas c{};
        ember::RasterizerConfig cfg{};
        cfg.cull_mode = ember::RasterizerCullMode::None;
        ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::make_emissive_program(), u, c.target(), cfg);
        return same_color(c.hdr.color.at(kW / 2 - 1, kH / 2 - 1), ember::ColorF{0.625f, 0.625f, 0.625f, 1.125f});
    }

    bool test_depth_rejects_coplanar_redraw()
    {
        const ember::MeshData quad = ember::make_quad_mesh(1.0f);
        const ember::ShaderProgram program = ember::make_emissive_program();
        ember::RasterizerConfig cfg{};
        cfg.cull_mode = ember::RasterizerCullMode::None;

        Canvas c{};
        ember::rasterize_mesh(quad, program, fullscreen_uniforms(glm::vec4(1.0f), glm::vec4(0.5f, -0.3f, 0.0f, 0.0f)), c.target(), cfg);
        ember::rasterize_mesh(quad, program, fullscreen_uniforms(glm::vec4(1.0f), glm::vec4(0.0f)), c.target(), cfg);
        if (!same_color(c.hdr.color.at(kW / 2 - 1, kH / 2 - 1), ember::ColorF{1.0f, 1.0f, 1.0f, 1.0f})) return false;
        if (c.depth.depth.at(kW / 2 - 1, kH / 2 - 1) != 0.5f) return false;

        // Depth target-гүй үед сүүлийн зураг дарна.
        ember::rasterize_mesh(quad, program, fullscreen_uniforms(glm::vec4(1.0f), glm::vec4(0.0f)), c.target(false), cfg);
        return same_color(c.hdr.color.at(kW / 2 - 1, kH / 2 - 1), ember::ColorF{0.0f, 0.0f, 0.0f, 0.0f});
    }

    bool test_back_face_culling()
    {
        const ember::MeshData quad = ember::make_quad_mesh(1.0f);
        const ember::ShaderUniforms u = fullscreen_uniforms(glm::vec4(1.0f), glm::vec4(1.0f, 0.0f, 0.0f, 0.0f));
        ember::RasterizerConfig cfg{};

        Canvas front{};
        cfg.cull_mode = ember::RasterizerCullMode::Back;
        if (ember::rasterize_mesh(quad, ember::make_emissive_program(), u, front.target(), cfg).tri_raster != 2) return false;

        Canvas back{};
        cfg.cull_mode = ember::RasterizerCullMode::Front;
        if (ember::rasterize_mesh(quad, ember::make_emissive_program(), u, back.target(), cfg).tri_raster != 0) return false;
        return same_color(back.hdr.color.at(kW / 2, kH / 2), kClear);
    }

    bool test_geometry_behind_camera_is_clipped()
    {
        ember::ShaderUniforms u{};
        u.camera = ember::make_camera_block(glm::vec3(0.0f, 0.0f, -3.0f), glm::vec3(0.0f), glm::radians(60.0f), 1.0f);
        u.model = ember::ModelTransform::from_trs(glm::vec3(0.0f, 0.0f, -10.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), 1.0f);
        u.material.effect = glm::vec4(1.0f, 0.0f, 0.0f, 0.0f);
        Canvas c{};
        ember::RasterizerConfig cfg{};
        cfg.cull_mode = ember::RasterizerCullMode::None;
        const ember::RasterizerStats stats = ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::make_emissive_program(), u, c.target(), cfg);
        return stats.tri_input == 2 && stats.tri_after_clip == 0 && stats.tri_raster == 0;
    }

    bool test_parallel_matches_serial()
    {
        ember::ShaderUniforms u{};
        u.camera = ember::make_camera_block(glm::vec3(0.0f, 0.0f, -3.0f), glm::vec3(0.0f), glm::radians(60.0f), 1.0f);
        u.model = ember::ModelTransform::from_trs(glm::vec3(0.2f, -0.1f, 0.0f), glm::angleAxis(0.6f, glm::normalize(glm::vec3(0.3f, 1.0f, 0.0f))), 1.2f);
        u.material.emissive = glm::vec4(0.9f, 0.3f, 0.6f, 1.0f);
        u.material.effect = glm::vec4(0.35f, 0.8f, 0.0f, 0.0f);
        const ember::MeshData quad = ember::make_quad_mesh(1.0f);
        const ember::ShaderProgram program = ember::make_emissive_program();

        Canvas serial{};
        ember::RasterizerConfig cfg{};
        cfg.cull_mode = ember::RasterizerCullMode::None;
        const ember::RasterizerStats s0 = ember::rasterize_mesh(quad, program, u, serial.target(), cfg);

        ember::ThreadPoolJobSystem jobs(4);
        Canvas parallel{};
        cfg.job_system = &jobs;
        cfg.parallel_min_rows = 1;
        cfg.parallel_min_pixels = 1;
        const ember::RasterizerStats s1 = ember::rasterize_mesh(quad, program, u, parallel.target(), cfg);

        if (s0.tri_raster == 0 || s0.tri_raster != s1.tri_raster) return false;
        const size_t n = serial.hdr.color.data.size();
        if (std::memcmp(serial.hdr.color.data.data(), parallel.hdr.color.data.data(), n * sizeof(ember::ColorF)) != 0) return false;
        return std::memcmp(serial.depth.depth.data.data(), parallel.depth.depth.data.data(), n * sizeof(float)) == 0;
    }

    // Нэг canvas дээр дараалсан frame-ууд: parallel_for_1d гурвалжин бүрт дахин дуудагдана.
    bool test_consecutive_parallel_frames_match_serial()
    {
        const ember::MeshData quad = ember::make_quad_mesh(1.0f);
        const ember::ShaderProgram program = ember::make_emissive_program();
        ember::ThreadPoolJobSystem jobs(4);

        Canvas serial{};
        Canvas parallel{};
        ember::RasterizerConfig serial_cfg{};
        serial_cfg.cull_mode = ember::RasterizerCullMode::None;
        ember::RasterizerConfig parallel_cfg = serial_cfg;
        parallel_cfg.job_system = &jobs;
        parallel_cfg.parallel_min_rows = 1;
        parallel_cfg.parallel_min_pixels = 1;

        for (int frame = 0; frame < 64; ++frame)
        {
            const float t = (float)frame / 60.0f;
            ember::ShaderUniforms u{};
            u.camera = ember::make_camera_block(glm::vec3(0.0f, 0.0f, -3.0f), glm::vec3(0.0f), glm::radians(60.0f), 1.0f);
            u.model = ember::ModelTransform::from_trs(glm::vec3(0.0f), glm::angleAxis(t * 2.0f, glm::vec3(0.0f, 1.0f, 0.0f)), 1.0f);
            u.material.emissive = glm::vec4(1.0f, 0.7f, 0.3f, 1.0f);
            u.material.effect = glm::vec4(1.0f - t * 0.5f, t * 3.0f, 0.0f, 0.0f);

            serial.hdr.clear(kClear);
            serial.depth.clear();
            parallel.hdr.clear(kClear);
            parallel.depth.clear();
            const ember::RasterizerStats s0 = ember::rasterize_mesh(quad, program, u, serial.target(), serial_cfg);
            const ember::RasterizerStats s1 = ember::rasterize_mesh(quad, program, u, parallel.target(), parallel_cfg);
            if (s0.tri_raster != s1.tri_raster) return false;

            const size_t n = serial.hdr.color.data.size();
            if (std::memcmp(serial.hdr.color.data.data(), parallel.hdr.color.data.data(), n * sizeof(ember::ColorF)) != 0) return false;
            if (std::memcmp(serial.depth.depth.data.data(), parallel.depth.depth.data.data(), n * sizeof(float)) != 0) return false;
        }
        return true;
    }

    bool test_invalid_targets_are_ignored()
    {
        const ember::ShaderUniforms u = fullscreen_uniforms(glm::vec4(1.0f), glm::vec4(1.0f, 0.0f, 0.0f, 0.0f));
        ember::RasterizerTarget none{};
        if (ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::make_emissive_program(), u, none).tri_input != 0) return false;

        Canvas c{};
        ember::RT_DepthBuffer small(4, 4);
        ember::RasterizerTarget mismatched{};
        mismatched.hdr = &c.hdr;
        mismatched.depth = &small;
        if (ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::make_emissive_program(), u, mismatched).tri_input != 0) return false;

        return ember::rasterize_mesh(ember::make_quad_mesh(1.0f), ember::ShaderProgram{}, u, c.target()).tri_input == 0;
    }
}

int main()
{
    const bool ok_center = test_center_pixel_is_pure_emissive();
    const bool ok_black = test_zero_gate_renders_black();
    const bool ok_hook = test_lighting_hook_reaches_pixels();
    const bool ok_depth = test_depth_rejects_coplanar_redraw();
    const bool ok_cull = test_back_face_culling();
    const bool ok_clip = test_geometry_behind_camera_is_clipped();
    const bool ok_parallel = test_parallel_matches_serial();
    const bool ok_frames = test_consecutive_parallel_frames_match_serial();
    const bool ok_invalid = test_invalid_targets_are_ignored();

    if (!ok_center) std::fprintf(stderr, "[ember-tests] center pixel emissive failed\n");
    if (!ok_black) std::fprintf(stderr, "[ember-tests] zero gate black failed\n");
    if (!ok_hook) std::fprintf(stderr, "[ember-tests] lighting hook raster failed\n");
    if (!ok_depth) std::fprintf(stderr, "[ember-tests] depth test failed\n");
    if (!ok_cull) std::fprintf(stderr, "[ember-tests] back-face culling failed\n");
    if (!ok_clip) std::fprintf(stderr, "[ember-tests] near-plane clipping failed\n");
    if (!ok_parallel) std::fprintf(stderr, "[ember-tests] parallel raster determinism failed\n");
    if (!ok_frames) std::fprintf(stderr, "[ember-tests] consecutive parallel frames failed\n");
    if (!ok_invalid) std::fprintf(stderr, "[ember-tests] invalid target handling failed\n");

    const bool all_ok = ok_center && ok_black && ok_hook && ok_depth && ok_cull && ok_clip && ok_parallel && ok_frames && ok_invalid;
    if (!all_ok) return 1;

    std::fprintf(stderr, "[ember-tests] raster: all tests passed\n");
    return 0;
}
