#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: std140.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Uniform block-уудыг std140 байт дараалал руу талбар бүрээр нь бичиж,
            буцааж уншина. Caller талын buffer upload-той binary нийцтэй байхын тулд
            талбарын дараалал uniform_blocks.hpp-тэй яг ижил.
*/


#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/result.hpp"
#include "ember/shader/uniform_blocks.hpp"

namespace ember
{
    namespace std140
    {
        constexpr size_t k_camera_block_size = 128;
        constexpr size_t k_model_block_size = 64;
        constexpr size_t k_fragment_args_block_size = 16;
        constexpr size_t k_light_record_size = 48;
        constexpr size_t k_lights_block_size = k_light_record_size * EMBER_MAX_LIGHTS;
        constexpr size_t k_material_block_size = 32;

        class Writer
        {
        public:
            explicit Writer(size_t reserve_bytes) { bytes_.reserve(reserve_bytes); }

            void write_f32(float v) { append(&v, sizeof(v)); }
            void write_i32(int32_t v) { append(&v, sizeof(v)); }

            void write_vec4(const glm::vec4& v)
            {
                for (int i = 0; i < 4; ++i) write_f32(v[i]);
            }

            // mat4 = багана бүр нэг vec4 (column-major).
            void write_mat4(const glm::mat4& m)
            {
                for (int c = 0; c < 4; ++c) write_vec4(m[c]);
            }

            void pad_to(size_t alignment)
            {
                while (bytes_.size() % alignment != 0) bytes_.push_back(0u);
            }

            std::vector<uint8_t> take() { return std::move(bytes_); }

        private:
            void append(const void* src, size_t n)
            {
                const uint8_t* p = static_cast<const uint8_t*>(src);
                bytes_.insert(bytes_.end(), p, p + n);
            }

            std::vector<uint8_t> bytes_{};
        };

        class Reader
        {
        public:
            explicit Reader(const std::vector<uint8_t>& bytes) : bytes_(bytes) {}

            float read_f32() { float v = 0.0f; take(&v, sizeof(v)); return v; }
            int32_t read_i32() { int32_t v = 0; take(&v, sizeof(v)); return v; }

            glm::vec4 read_vec4()
            {
                glm::vec4 v{};
                for (int i = 0; i < 4; ++i) v[i] = read_f32();
                return v;
            }

            glm::mat4 read_mat4()
            {
                glm::mat4 m{};
                for (int c = 0; c < 4; ++c) m[c] = read_vec4();
                return m;
            }

        private:
            void take(void* dst, size_t n)
            {
                std::memcpy(dst, bytes_.data() + offset_, n);
                offset_ += n;
            }

            const std::vector<uint8_t>& bytes_;
            size_t offset_ = 0;
        };

        inline std::string size_error(const char* block, size_t expected, size_t got)
        {
            return std::string(block) + " expects " + std::to_string(expected) + " bytes, got " + std::to_string(got);
        }
    }

    inline std::vector<uint8_t> pack_std140(const CameraBlock& b)
    {
        std140::Writer w(std140::k_camera_block_size);
        w.write_mat4(b.projection);
        w.write_mat4(b.view);
        return w.take();
    }

    inline std::vector<uint8_t> pack_std140(const ModelBlock& b)
    {
        std140::Writer w(std140::k_model_block_size);
        w.write_mat4(b.model);
        return w.take();
    }

    inline std::vector<uint8_t> pack_std140(const FragmentArgsBlock& b)
    {
        std140::Writer w(std140::k_fragment_args_block_size);
        w.write_i32(b.light_count);
        w.pad_to(16);
        return w.take();
    }

    inline std::vector<uint8_t> pack_std140(const LightsBlock& b)
    {
        std140::Writer w(std140::k_lights_block_size);
        for (const LightRecord& l : b.lights)
        {
            w.write_vec4(l.propagation);
            w.write_vec4(l.center);
            w.write_vec4(l.color);
        }
        return w.take();
    }

    inline std::vector<uint8_t> pack_std140(const MaterialBlock& b)
    {
        std140::Writer w(std140::k_material_block_size);
        w.write_vec4(b.emissive);
        w.write_vec4(b.effect);
        return w.take();
    }

    inline Result<CameraBlock> unpack_camera_block_std140(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() != std140::k_camera_block_size)
        {
            return Result<CameraBlock>::failure(std140::size_error("CameraBlock", std140::k_camera_block_size, bytes.size()));
        }
        std140::Reader r(bytes);
        CameraBlock b{};
        b.projection = r.read_mat4();
        b.view = r.read_mat4();
        return Result<CameraBlock>::success(b);
    }

    inline Result<ModelBlock> unpack_model_block_std140(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() != std140::k_model_block_size)
        {
            return Result<ModelBlock>::failure(std140::size_error("ModelBlock", std140::k_model_block_size, bytes.size()));
        }
        std140::Reader r(bytes);
        ModelBlock b{};
        b.model = r.read_mat4();
        return Result<ModelBlock>::success(b);
    }

    inline Result<FragmentArgsBlock> unpack_fragment_args_block_std140(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() != std140::k_fragment_args_block_size)
        {
            return Result<FragmentArgsBlock>::failure(
                std140::size_error("FragmentArgsBlock", std140::k_fragment_args_block_size, bytes.size()));
        }
        std140::Reader r(bytes);
        FragmentArgsBlock b{};
        b.light_count = r.read_i32();
        return Result<FragmentArgsBlock>::success(b);
    }

    inline Result<LightsBlock> unpack_lights_block_std140(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() != std140::k_lights_block_size)
        {
            return Result<LightsBlock>::failure(std140::size_error("LightsBlock", std140::k_lights_block_size, bytes.size()));
        }
        std140::Reader r(bytes);
        LightsBlock b{};
        for (LightRecord& l : b.lights)
        {
            l.propagation = r.read_vec4();
            l.center = r.read_vec4();
            l.color = r.read_vec4();
        }
        return Result<LightsBlock>::success(b);
    }

    inline Result<MaterialBlock> unpack_material_block_std140(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() != std140::k_material_block_size)
        {
            return Result<MaterialBlock>::failure(std140::size_error("MaterialBlock", std140::k_material_block_size, bytes.size()));
        }
        std140::Reader r(bytes);
        MaterialBlock b{};
        b.emissive = r.read_vec4();
        b.effect = r.read_vec4();
        return Result<MaterialBlock>::success(b);
    }
}
