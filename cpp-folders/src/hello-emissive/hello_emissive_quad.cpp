/*
    hello_emissive_quad.cpp

    EMBER - Emissive radial falloff demo (CPU rasterizer)
    - Rotating quad drawn with the emissive vertex/fragment stages
    - effect.x follows a decaying "energy", effect.y follows "age" (phase)
    - Left/Right : cycle light presets (emissive color)
    - Up/Down    : cycle background presets
    - F1         : emissive -> tangent -> bitangent -> normal -> perturbed normal views
    - Space      : pause
    - EMBER_HEADLESS=1 renders EMBER_FRAMES frames and writes EMBER_OUTPUT (PPM)
*/

#define SDL_MAIN_HANDLED

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include <ember/camera/camera_math.hpp>
#include <ember/color/color_space.hpp>
#include <ember/core/env_config.hpp>
#include <ember/core/log.hpp>
#include <ember/gfx/ppm_writer.hpp>
#include <ember/gfx/rt_types.hpp>
#include <ember/job/job_system.hpp>
#include <ember/lighting/light_environment.hpp>
#include <ember/lighting/preset_cycle.hpp>
#include <ember/material/appearance.hpp>
#include <ember/platform/sdl/sdl_runtime.hpp>
#include <ember/render/rasterizer.hpp>
#include <ember/resources/mesh.hpp>
#include <ember/shader/emissive_program.hpp>

namespace
{
constexpr int kWindowW = 960;
constexpr int kWindowH = 720;
constexpr float kFixedDt = 1.0f / 60.0f;
constexpr int kEmitterCount = 5;

// Энерги 1-ээс 0 хүртэл буурч, дуусахад дахин төрнө.
struct AgentClock
{
    float energy_left = 1.0f;
    float age = 0.0f;
    float decay_per_sec = 0.08f;

    void step(float dt, float phase_speed)
    {
        age += dt * phase_speed;
        energy_left -= dt * decay_per_sec;
        if (energy_left <= 0.0f)
        {
            energy_left = 1.0f;
            age = 0.0f;
        }
    }
};

class HelloEmissiveQuadApp
{
public:
    explicit HelloEmissiveQuadApp(const ember::DemoConfig& cfg)
        : cfg_(cfg)
        , color_hdr_((int)cfg.surface_w, (int)cfg.surface_h)
        , depth_((int)cfg.surface_w, (int)cfg.surface_h)
    {}

    int run()
    {
        init_jobs();
        init_scene();
        if (cfg_.headless) return run_headless();
        init_runtime();
        main_loop();
        return 0;
    }

private:
    void init_jobs()
    {
        if (cfg_.threads == 0)
        {
            ember::log_info("rasterizer: serial");
            return;
        }
        jobs_ = std::make_unique<ember::ThreadPoolJobSystem>(cfg_.threads);
        rast_cfg_.job_system = jobs_.get();
        ember::log_info("rasterizer: " + std::to_string(jobs_->worker_count()) + " workers");
    }

    void init_scene()
    {
        quad_ = ember::make_quad_mesh(1.0f);
        ember::compute_tangents(quad_);
        const ember::Result<size_t> valid = ember::validate_mesh(quad_);
        if (!valid.ok)
        {
            throw std::runtime_error("quad mesh failed validation: " + valid.error);
        }

        const float aspect = (float)cfg_.surface_w / (float)cfg_.surface_h;
        uniforms_.camera = ember::make_camera_block(glm::vec3(0.0f, 0.0f, -3.0f), glm::vec3(0.0f), glm::radians(60.0f), aspect);

        // Үндсэн өнгө. Эрчмийг гэрлийн preset өгнө.
        base_tint_ = ember::Hsl{0.11f, 0.85f, 0.55f}.to_rgba();

        rast_cfg_.cull_mode = ember::RasterizerCullMode::None;
        program_ = ember::make_emissive_program();
        update_uniforms();
    }

    void init_runtime()
    {
        ember::WindowDesc win{};
        win.title = "HelloEmissiveQuad";
        win.width = kWindowW;
        win.height = kWindowH;

        ember::SurfaceDesc surface{};
        surface.width = (int)cfg_.surface_w;
        surface.height = (int)cfg_.surface_h;

        runtime_ = std::make_unique<ember::SdlRuntime>(win, surface);
        if (!runtime_->valid())
        {
            throw std::runtime_error("SdlRuntime init failed");
        }
    }

    void update_uniforms()
    {
        const float angle = time_ * 0.6f;
        const glm::quat rot = glm::angleAxis(angle, glm::vec3(0.0f, 1.0f, 0.0f));
        uniforms_.model = ember::ModelTransform::from_trs(glm::vec3(0.0f), rot, 1.0f);

        const glm::vec4 light = lights_.get();
        const ember::Appearance look = ember::Appearance::with_effect(
            base_tint_ * glm::vec4(glm::vec3(light), light.a),
            ember::make_agent_effect(clock_.energy_left, clock_.age));
        uniforms_.material = look.to_material_block();

        ember::LightEnvironment env{};
        env.light_color = light;
        env.background_color = backgrounds_.get();
        for (int i = 0; i < kEmitterCount; ++i)
        {
            const float a = time_ * 0.3f + glm::two_pi<float>() * (float)i / (float)kEmitterCount;
            env.light_positions.emplace_back(std::cos(a) * 2.0f, std::sin(a) * 2.0f, 0.5f);
        }
        const ember::PackedLights packed = ember::pack_light_environment(env);
        uniforms_.fragment_args = packed.args;
        uniforms_.lights = packed.lights;
    }

    void step(float dt)
    {
        if (paused_) return;
        time_ += dt;
        clock_.step(dt, cfg_.effect_speed);
        update_uniforms();
    }

    ember::RasterizerStats draw_frame()
    {
        const glm::vec4 bg = backgrounds_.get();
        color_hdr_.clear({bg.r, bg.g, bg.b, 1.0f});
        depth_.clear();

        ember::RasterizerTarget target{};
        target.hdr = &color_hdr_;
        target.depth = &depth_;
        return ember::rasterize_mesh(quad_, program_, uniforms_, target, rast_cfg_);
    }

    int run_headless()
    {
        ember::RasterizerStats stats{};
        for (uint32_t i = 0; i < cfg_.frames; ++i)
        {
            step(kFixedDt);
            stats = draw_frame();
        }
        ember::hdr_to_rgba8(rgba_staging_, color_hdr_);
        const ember::Result<size_t> written = ember::write_ppm(cfg_.output_path, rgba_staging_, color_hdr_.w, color_hdr_.h);
        if (!written.ok)
        {
            ember::log_error("headless capture failed: " + written.error);
            return 2;
        }
        ember::log_info("wrote " + cfg_.output_path + " (" + std::to_string(written.value) + " bytes, " +
                        std::to_string(stats.tri_raster) + " triangles rasterized)");
        return 0;
    }

    void apply_input(const ember::PlatformInputState& input)
    {
        if (input.next_light) lights_.next();
        if (input.prev_light) lights_.prev();
        if (input.next_background) backgrounds_.next();
        if (input.prev_background) backgrounds_.prev();
        if (input.toggle_pause) paused_ = !paused_;
        if (input.cycle_debug_view)
        {
            debug_view_ = (debug_view_ + 1) % 5;
            if (debug_view_ == 0)
            {
                program_ = ember::make_emissive_program();
                ember::log_info("view: emissive");
            }
            else
            {
                const auto view = (ember::TbnDebugView)(debug_view_ - 1);
                program_ = ember::make_tbn_debug_program(view);
                ember::log_info(std::string("view: ") + ember::tbn_debug_view_name(view));
            }
        }
    }

    void main_loop()
    {
        uint64_t frames = 0;
        float title_accum = 0.0f;
        while (true)
        {
            ember::PlatformInputState input{};
            if (!runtime_->pump_input(input)) break;
            apply_input(input);

            step(kFixedDt);
            const ember::RasterizerStats stats = draw_frame();

            ember::hdr_to_rgba8(rgba_staging_, color_hdr_);
            runtime_->upload_rgba8(rgba_staging_.data(), color_hdr_.w, color_hdr_.h, color_hdr_.w * 4);
            runtime_->present();

            ++frames;
            title_accum += kFixedDt;
            if (title_accum >= 0.25f)
            {
                title_accum = 0.0f;
                const std::string title =
                    std::string("HelloEmissiveQuad")
                    + " | light=" + std::to_string(lights_.index())
                    + " | bg=" + std::to_string(backgrounds_.index())
                    + " | energy=" + std::to_string(clock_.energy_left)
                    + " | tris=" + std::to_string(stats.tri_raster)
                    + " | frame=" + std::to_string(frames);
                runtime_->set_title(title);
            }
        }
    }

private:
    ember::DemoConfig cfg_{};
    std::unique_ptr<ember::ThreadPoolJobSystem> jobs_{};
    std::unique_ptr<ember::SdlRuntime> runtime_{};

    ember::MeshData quad_{};
    ember::ShaderProgram program_{};
    ember::ShaderUniforms uniforms_{};
    ember::RasterizerConfig rast_cfg_{};

    ember::PresetCycle<glm::vec4> lights_ = ember::default_light_presets();
    ember::PresetCycle<glm::vec4> backgrounds_ = ember::default_background_presets();
    glm::vec4 base_tint_{1.0f};
    AgentClock clock_{};
    float time_ = 0.0f;
    bool paused_ = false;
    int debug_view_ = 0;

    ember::RT_ColorHDR color_hdr_{};
    ember::RT_DepthBuffer depth_{};
    std::vector<uint8_t> rgba_staging_{};
};
}

int main()
{
    try
    {
        const ember::DemoConfig cfg = ember::load_demo_config_from_env();
        HelloEmissiveQuadApp app(cfg);
        return app.run();
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
