#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: color_space.hpp
    МОДУЛЬ: color
    ЗОРИЛГО: Emissive өнгө бэлтгэхэд хэрэглэгдэх HSL болон YPbPr (luma/chroma) хувиргалтууд.
            Бүх RGB утга [0,1] мужид.
*/


#include <algorithm>

#include <glm/glm.hpp>

namespace ember
{
    struct Hsl
    {
        float h = 0.0f;
        float s = 0.0f;
        float l = 0.0f;

        static Hsl from_rgb(const glm::vec3& c)
        {
            const float mx = std::max({c.r, c.g, c.b});
            const float mn = std::min({c.r, c.g, c.b});
            const float l = (mx + mn) * 0.5f;
            if (mx == mn) return Hsl{0.0f, 0.0f, l};

            const float d = mx - mn;
            const float s = (l > 0.5f) ? d / (2.0f - mx - mn) : d / (mx + mn);
            float h = 0.0f;
            if (mx == c.r) h = (c.g - c.b) / d + (c.g < c.b ? 6.0f : 0.0f);
            else if (mx == c.g) h = (c.b - c.r) / d + 2.0f;
            else h = (c.r - c.g) / d + 4.0f;
            return Hsl{h / 6.0f, s, l};
        }

        glm::vec3 to_rgb() const
        {
            if (s == 0.0f) return glm::vec3(l);

            const auto hue_to_rgb = [](float p, float q, float t) {
                if (t < 0.0f) t += 1.0f;
                if (t > 1.0f) t -= 1.0f;
                if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
                if (t < 0.5f) return q;
                if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
                return p;
            };
            const float q = (l < 0.5f) ? l * (1.0f + s) : l + s - l * s;
            const float p = 2.0f * l - q;
            return glm::vec3(
                hue_to_rgb(p, q, h + 1.0f / 3.0f),
                hue_to_rgb(p, q, h),
                hue_to_rgb(p, q, h - 1.0f / 3.0f));
        }

        glm::vec4 to_rgba() const { return glm::vec4(to_rgb(), 1.0f); }
    };

    // ITU-R BT.601. y нь [0,1], pb/pr нь [-0.5,0.5].
    struct YPbPr
    {
        float y = 0.0f;
        float pb = 0.0f;
        float pr = 0.0f;

        static YPbPr from_rgb(const glm::vec3& c)
        {
            return YPbPr{
                0.299f * c.r + 0.587f * c.g + 0.114f * c.b,
                -0.168736f * c.r - 0.331264f * c.g + 0.5f * c.b,
                0.5f * c.r - 0.418688f * c.g - 0.081312f * c.b
            };
        }

        glm::vec3 to_rgb() const
        {
            const glm::vec3 rgb(
                y + 1.402f * pr,
                y - 0.344136f * pb - 0.714136f * pr,
                y + 1.772f * pb);
            return glm::clamp(rgb, glm::vec3(0.0f), glm::vec3(1.0f));
        }

        glm::vec4 to_rgba() const { return glm::vec4(to_rgb(), 1.0f); }
    };
}
