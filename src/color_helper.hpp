// color_helper.hpp
#pragma once
#include <string>
#include <string_view>
#include <cstdint>
#include <cstdio>

#include "model.hpp"

namespace color
{
    // Scene palette
    inline constexpr const char* kHeaderBg   = "#F8F8F8";
    inline constexpr const char* kOverhead   = "#4CAF50";
    inline constexpr const char* kRulerLine  = "#EEEEEE";
    inline constexpr const char* kSparkline  = "#5B6B7A";
    inline constexpr const char* kViewWindow = "#1E88E5";

    /// @brief Hsl — hue in degrees, saturation/lightness in percent.
    struct Hsl
    {
        uint32_t hue = 0;
        uint32_t sat = 0;
        uint32_t light = 0;

        bool operator==(const Hsl& o) const noexcept
        {
            return hue == o.hue && sat == o.sat && light == o.light;
        }
    };

    // Knuth multiplicative mix, spreads neighbouring integers across the hue circle
    inline constexpr uint32_t kMixConstant = 2654435761u;

    inline Hsl fromInt(uint32_t x) noexcept
    {
        const uint32_t h = static_cast<uint32_t>((uint64_t(x) * kMixConstant) & 0xFFFFFFFFull);
        Hsl c;
        c.hue = h % 360;
        c.sat = 60 + (h >> 8) % 20;     // 60..79
        c.light = 45 + (h >> 16) % 10;  // 45..54
        return c;
    }

    // 64-bit FNV-1a over the raw bytes (UTF-8 for labels)
    inline uint64_t fnv1a64(std::string_view s) noexcept
    {
        uint64_t h = 14695981039346656037ull;
        for (unsigned char ch : s)
        {
            h ^= ch;
            h *= 1099511628211ull;
        }
        return h;
    }

    inline Hsl fromKey(std::string_view key) noexcept
    {
        return fromInt(static_cast<uint32_t>(fnv1a64(key) & 0xFFFFFFFFull));
    }

    inline std::string toCss(const Hsl& c)
    {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "hsl(%u %u%% %u%%)", c.hue, c.sat, c.light);
        return buf;
    }

    /**
     * - explicitColor : used when present
     * - fallback key : label, or sequence index when the label is empty
     */
    inline Hsl resolve(const Task& t)
    {
        if (t.explicitColor)
            return fromInt(*t.explicitColor);
        if (!t.label.empty())
            return fromKey(t.label);
        return fromKey(std::to_string(t.sequenceIndex));
    }

    inline std::string resolveCss(const Task& t)
    {
        return toCss(resolve(t));
    }

    /**
     * Color column of the input.
     * - "16711680"           decimal
     * - "#ff0000" / "#f00"   hex, 1..8 digits
     * - "0xff0000"           hex, 1..8 digits
     */
    static inline bool parseColorToken(std::string_view s, uint32_t& out)
    {
        if (s.empty()) return false;
        auto hex = [](char c)->int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
            };

        std::string_view digits;
        if (s[0] == '#')
            digits = s.substr(1);
        else if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
            digits = s.substr(2);

        if (!digits.empty() || s[0] == '#')
        {
            if (digits.empty() || digits.size() > 8) return false;
            uint32_t v = 0;
            for (char c : digits) {
                int d = hex(c); if (d < 0) return false;
                v = (v << 4) | uint32_t(d);
            }
            out = v;
            return true;
        }

        uint64_t v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
            v = v * 10 + uint64_t(c - '0');
            if (v > 0xFFFFFFFFull) return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    }
}
