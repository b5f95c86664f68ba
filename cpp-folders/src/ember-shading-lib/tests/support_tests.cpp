#include <atomic>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ember/color/color_space.hpp"
#include "ember/core/env_config.hpp"
#include "ember/core/log.hpp"
#include "ember/gfx/ppm_writer.hpp"
#include "ember/job/job_system.hpp"
#include "ember/job/parallel_for.hpp"
#include "ember/lighting/preset_cycle.hpp"
#include "ember/material/appearance.hpp"
#include "ember/resources/mesh.hpp"
#include "ember/shader/tangent_space.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_vec3(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    bool test_preset_cycle_wraps()
    {
        ember::PresetCycle<int> c{10, 20, 30};
        if (c.get() != 10 || c.size() != 3) return false;
        if (c.next() != 20) return false;
        c.next();
        if (c.next() != 10 || c.index() != 0) return false;
        if (c.prev() != 30 || c.index() != 2) return false;

        bool threw = false;
        try
        {
            ember::PresetCycle<int> empty(std::vector<int>{});
            (void)empty;
        }
        catch (const std::invalid_argument&)
        {
            threw = true;
        }
        return threw;
    }

    bool test_default_presets()
    {
        ember::PresetCycle<glm::vec4> lights = ember::default_light_presets();
        ember::PresetCycle<glm::vec4> bgs = ember::default_background_presets();
        if (lights.size() != 9 || bgs.size() != 7) return false;
        if (lights.get() != glm::vec4(1.0f)) return false;
        if (lights.prev() != glm::vec4(0.31f, 0.31f, 0.31f, 0.5f)) return false;
        return bgs.get() == glm::vec4(0.05f, 0.07f, 0.1f, 1.0f);
    }

    bool test_hsl_reference_values()
    {
        if (!approx_vec3(ember::Hsl{0.0f, 1.0f, 0.5f}.to_rgb(), glm::vec3(1.0f, 0.0f, 0.0f))) return false;
        if (!approx_vec3(ember::Hsl{1.0f / 3.0f, 1.0f, 0.5f}.to_rgb(), glm::vec3(0.0f, 1.0f, 0.0f))) return false;
        if (!approx_vec3(ember::Hsl{2.0f / 3.0f, 1.0f, 0.25f}.to_rgb(), glm::vec3(0.0f, 0.0f, 0.5f))) return false;
        // Saturation 0 бол hue-ээс үл хамааран саарал.
        if (!approx_vec3(ember::Hsl{0.7f, 0.0f, 0.3f}.to_rgb(), glm::vec3(0.3f))) return false;

        const ember::Hsl orange = ember::Hsl::from_rgb(glm::vec3(1.0f, 0.5f, 0.0f));
        if (!approx_eq(orange.h, 1.0f / 12.0f) || !approx_eq(orange.s, 1.0f) || !approx_eq(orange.l, 0.5f)) return false;
        // l > 0.5 салбар.
        const ember::Hsl pale = ember::Hsl::from_rgb(glm::vec3(1.0f, 0.8f, 0.8f));
        if (!approx_eq(pale.s, 1.0f) || !approx_eq(pale.l, 0.9f)) return false;
        if (!approx_vec3(pale.to_rgb(), glm::vec3(1.0f, 0.8f, 0.8f))) return false;
        return ember::Hsl{0.5f, 0.5f, 0.5f}.to_rgba().a == 1.0f;
    }

    bool test_ypbpr_reference_values()
    {
        const ember::YPbPr white = ember::YPbPr::from_rgb(glm::vec3(1.0f));
        if (!approx_eq(white.y, 1.0f) || !approx_eq(white.pb, 0.0f) || !approx_eq(white.pr, 0.0f)) return false;
        const ember::YPbPr red = ember::YPbPr::from_rgb(glm::vec3(1.0f, 0.0f, 0.0f));
        if (!approx_eq(red.y, 0.299f) || !approx_eq(red.pr, 0.5f)) return false;
        if (!approx_vec3(red.to_rgb(), glm::vec3(1.0f, 0.0f, 0.0f), 1e-3f)) return false;
        // Гамутаас гарсан утгыг [0,1] рүү хавчина.
        const glm::vec3 clamped = ember::YPbPr{1.0f, 0.5f, 0.5f}.to_rgb();
        return clamped.r == 1.0f && clamped.b == 1.0f && clamped.g >= 0.0f;
    }

    bool test_appearance()
    {
        const ember::Appearance a = ember::Appearance::rgba(glm::vec4(0.2f, 0.4f, 0.6f, 1.0f));
        const ember::MaterialBlock m = a.to_material_block();
        if (m.emissive != glm::vec4(0.2f, 0.4f, 0.6f, 1.0f)) return false;
        if (m.effect != glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)) return false;

        const ember::Appearance agent = ember::Appearance::with_effect(glm::vec4(1.0f), ember::make_agent_effect(0.4f, 2.5f));
        return agent.to_material_block().effect == glm::vec4(0.4f, 2.5f, 0.0f, 0.0f);
    }

    bool test_quad_tangents_and_validation()
    {
        ember::MeshData quad = ember::make_quad_mesh(2.0f);
        quad.tangents.clear();
        ember::compute_tangents(quad);
        if (quad.tangents.size() != 4) return false;
        for (const glm::vec3& t : quad.tangents)
        {
            if (!approx_vec3(t, glm::vec3(1.0f, 0.0f, 0.0f))) return false;
        }
        const ember::Result<size_t> ok = ember::validate_mesh(quad);
        if (!ok.ok || ok.value != 4) return false;
        if (quad.triangle_count() != 2) return false;

        ember::MeshData bad_index = quad;
        bad_index.indices[4] = 9;
        const ember::Result<size_t> r0 = ember::validate_mesh(bad_index);
        if (r0.ok || r0.error != "index 4 is out of range") return false;

        ember::MeshData zero_normal = quad;
        zero_normal.normals[2] = glm::vec3(0.0f);
        const ember::Result<size_t> r1 = ember::validate_mesh(zero_normal);
        if (r1.ok || r1.error != "vertex 2: zero-length normal") return false;

        ember::MeshData ragged = quad;
        ragged.indices.pop_back();
        if (ember::validate_mesh(ragged).ok) return false;

        ember::MeshData missing_uv = quad;
        missing_uv.uvs.pop_back();
        return !ember::validate_mesh(missing_uv).ok;
    }

    bool test_degenerate_uv_falls_back_to_perpendicular()
    {
        ember::MeshData quad = ember::make_quad_mesh(1.0f);
        quad.uvs.assign(4, glm::vec2(0.5f));
        ember::compute_tangents(quad);
        for (size_t i = 0; i < quad.tangents.size(); ++i)
        {
            if (!approx_eq(glm::length(quad.tangents[i]), 1.0f)) return false;
            if (!approx_eq(glm::dot(quad.tangents[i], quad.normals[i]), 0.0f)) return false;
        }
        return true;
    }

    bool test_tangents_ignore_normal_length()
    {
        ember::MeshData quad = ember::make_quad_mesh(1.0f);
        // Normal нь нэгж биш, UV тэнхлэг нь normal-тай перпендикуляр биш.
        quad.normals.assign(4, glm::vec3(0.0f, 0.0f, -3.0f));
        quad.positions[1].z = 0.5f;
        quad.positions[2].z = 0.5f;
        ember::compute_tangents(quad);
        for (size_t i = 0; i < quad.tangents.size(); ++i)
        {
            if (!approx_eq(glm::length(quad.tangents[i]), 1.0f)) return false;
            if (!approx_eq(glm::dot(quad.tangents[i], glm::normalize(quad.normals[i])), 0.0f)) return false;
            if (!(quad.tangents[i].x > 0.0f)) return false;
        }
        return true;
    }

    bool test_tangent_space()
    {
        const glm::mat3 tbn(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 0.0f, -1.0f));
        // Хавтгай normal map дээж нь surface normal-ийг өөрчлөхгүй.
        if (!approx_vec3(ember::perturb_normal(tbn, glm::vec3(0.5f, 0.5f, 1.0f)), glm::vec3(0.0f, 0.0f, -1.0f))) return false;
        if (!approx_vec3(ember::decode_normal_sample(glm::vec3(1.0f, 0.0f, 0.5f)), glm::vec3(1.0f, -1.0f, 0.0f))) return false;
        return approx_vec3(ember::tangent_to_world(tbn, glm::vec3(0.0f, 2.0f, 0.0f)), glm::vec3(0.0f, 2.0f, 0.0f));
    }

    bool test_env_parsers()
    {
        if (!ember::parse_env_bool("YES", false)) return false;
        if (ember::parse_env_bool("off", true)) return false;
        if (!ember::parse_env_bool("maybe", true)) return false;
        if (ember::parse_env_bool(nullptr, false)) return false;

        if (ember::parse_env_u32("320", 640u, 16u) != 320u) return false;
        if (ember::parse_env_u32("4", 640u, 16u) != 16u) return false;
        if (ember::parse_env_u32("abc", 640u, 16u) != 640u) return false;
        if (ember::parse_env_u32("0", 8u, 0u) != 0u) return false;
        if (ember::parse_env_u32("-5", 640u, 16u) != 640u) return false;
        if (ember::parse_env_u32("  -1", 3u, 0u) != 3u) return false;
        if (ember::parse_env_u32("99999999999", 640u, 16u, 16384u) != 16384u) return false;

        if (!approx_eq(ember::parse_env_f32("2.5", 1.0f), 2.5f)) return false;
        if (ember::parse_env_f32("-3", 1.0f) != 0.0f) return false;
        if (ember::parse_env_f32("", 1.0f) != 1.0f) return false;
        return ember::parse_env_f32("nan", 1.0f) == 1.0f;
    }

    bool test_demo_config_bounds_surface()
    {
        ::setenv("EMBER_SURFACE_W", "-5", 1);
        ::setenv("EMBER_SURFACE_H", "4000000000", 1);
        ::setenv("EMBER_THREADS", "-2", 1);
        const ember::DemoConfig cfg = ember::load_demo_config_from_env();
        ::unsetenv("EMBER_SURFACE_W");
        ::unsetenv("EMBER_SURFACE_H");
        ::unsetenv("EMBER_THREADS");

        if (cfg.surface_w != 640u) return false;
        if (cfg.surface_h != ember::EMBER_MAX_SURFACE_DIM) return false;
        if (cfg.threads > ember::EMBER_MAX_WORKERS) return false;
        // Demo нь int руу хувиргадаг.
        return (int)cfg.surface_w > 0 && (int)cfg.surface_h > 0;
    }

    bool test_ppm_writer()
    {
        ember::RT_ColorHDR hdr(2, 2, ember::ColorF{0.0f, 0.0f, 0.0f, 1.0f});
        // Canvas-ийн доод зүүн pixel нь зургийн сүүлийн мөрөнд гарна.
        hdr.color.at(0, 0) = ember::ColorF{2.0f, 0.5f, -1.0f, 1.0f};
        std::vector<uint8_t> rgba{};
        ember::hdr_to_rgba8(rgba, hdr);
        if (rgba.size() != 16) return false;
        const size_t bottom_left = (size_t)(1 * 2 + 0) * 4u;
        if (rgba[bottom_left + 0] != 255 || rgba[bottom_left + 1] != 128 || rgba[bottom_left + 2] != 0) return false;

        const std::filesystem::path path = std::filesystem::temp_directory_path() / "ember_support_test.ppm";
        const ember::Result<size_t> written = ember::write_ppm(path.string(), rgba, 2, 2);
        if (!written.ok) return false;
        const std::string header = "P6\n2 2\n255\n";
        if (written.value != header.size() + 12) return false;
        if (std::filesystem::file_size(path) != written.value) return false;
        std::filesystem::remove(path);

        if (ember::write_ppm(path.string(), rgba, 4, 4).ok) return false;
        return !ember::write_ppm(path.string(), rgba, 0, 2).ok;
    }

    bool test_parallel_for_covers_range()
    {
        ember::ThreadPoolJobSystem jobs(3);
        std::vector<std::atomic<int>> hits(1000);
        for (std::atomic<int>& h : hits) h.store(0);
        ember::parallel_for_1d(&jobs, 0, 1000, 16, [&](int b, int e) {
            for (int i = b; i < e; ++i) hits[(size_t)i].fetch_add(1);
        });
        for (const std::atomic<int>& h : hits)
        {
            if (h.load() != 1) return false;
        }
        return jobs.worker_count() == 3;
    }

    // Богино job-уудтай олон дараалсан дуудлага: wait() буцсаны дараа WaitGroup устгагдана.
    bool test_parallel_for_back_to_back_small_ranges()
    {
        ember::ThreadPoolJobSystem jobs(4);
        std::atomic<int> hits[8];
        for (int iter = 0; iter < 20000; ++iter)
        {
            for (std::atomic<int>& h : hits) h.store(0, std::memory_order_relaxed);
            ember::parallel_for_1d(&jobs, 0, 8, 1, [&](int b, int e) {
                for (int i = b; i < e; ++i) hits[i].fetch_add(1, std::memory_order_relaxed);
            });
            for (const std::atomic<int>& h : hits)
            {
                if (h.load(std::memory_order_relaxed) != 1) return false;
            }
        }
        jobs.wait_idle();
        return true;
    }

    bool test_log_level()
    {
        ember::set_log_level(ember::LogLevel::Warn);
        const bool ok = !ember::log_enabled(ember::LogLevel::Info) &&
                        ember::log_enabled(ember::LogLevel::Warn) &&
                        ember::log_enabled(ember::LogLevel::Error);
        ember::set_log_level(ember::LogLevel::Info);
        return ok && ember::log_level() == ember::LogLevel::Info;
    }

    struct TestCase
    {
        const char* name;
        bool (*fn)();
    };
}

int main()
{
    const TestCase cases[] = {
        {"preset cycle wraps", test_preset_cycle_wraps},
        {"default presets", test_default_presets},
        {"hsl reference values", test_hsl_reference_values},
        {"ypbpr reference values", test_ypbpr_reference_values},
        {"appearance", test_appearance},
        {"quad tangents and validation", test_quad_tangents_and_validation},
        {"degenerate uv tangent fallback", test_degenerate_uv_falls_back_to_perpendicular},
        {"tangents ignore normal length", test_tangents_ignore_normal_length},
        {"tangent space", test_tangent_space},
        {"env parsers", test_env_parsers},
        {"demo config bounds surface", test_demo_config_bounds_surface},
        {"ppm writer", test_ppm_writer},
        {"parallel_for covers range", test_parallel_for_covers_range},
        {"parallel_for back-to-back small ranges", test_parallel_for_back_to_back_small_ranges},
        {"log level", test_log_level},
    };

    int failed = 0;
    for (const TestCase& c : cases)
    {
        if (!c.fn())
        {
            std::fprintf(stderr, "[ember-tests] %s failed\n", c.name);
            ++failed;
        }
    }
    if (failed != 0) return 1;
    std::fprintf(stderr, "[ember-tests] support: all tests passed\n");
    return 0;
}
