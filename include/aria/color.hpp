#pragma once

#include <cstdint>

namespace aria
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // From hex (0xRRGGBB or 0xAARRGGBB)
    static constexpr Color from_hex(uint32_t hex)
    {
        if (hex > 0xFFFFFF)
        {
            return Color(((hex >> 16) & 0xFF) / 255.0f,
                         ((hex >> 8) & 0xFF) / 255.0f,
                         (hex & 0xFF) / 255.0f,
                         ((hex >> 24) & 0xFF) / 255.0f);
        }
        return Color(((hex >> 16) & 0xFF) / 255.0f,
                     ((hex >> 8) & 0xFF) / 255.0f,
                     (hex & 0xFF) / 255.0f,
                     1.0f);
    }

    // Packed as 0xAABBGGRR, the layout ImGui's IM_COL32 expects.
    uint32_t to_abgr32() const;

    constexpr Color with_alpha(float alpha) const { return Color(r, g, b, alpha); }

    constexpr Color lerp(const Color& other, float t) const
    {
        return Color(r + (other.r - r) * t,
                     g + (other.g - g) * t,
                     b + (other.b - b) * t,
                     a + (other.a - a) * t);
    }

    // sRGB relative luminance (BT.709), exact gamma.
    float luminance() const;

    // h: 0-360, s: 0-1, l: 0-1
    struct HSL
    {
        float h, s, l;
    };
    HSL          to_hsl() const;
    static Color from_hsl(float h, float s, float l, float a = 1.0f);

    constexpr bool operator==(const Color& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color transparent{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color player_dark_surface = Color::from_hex(0x121212);
inline constexpr Color placeholder_dark    = Color::from_hex(0x2A2A2A);
}   // namespace colors

// Subset of a Material color scheme the player reads.
struct ColorScheme
{
    Color primary;
    Color on_primary;
    Color primary_container;
    Color on_primary_container;
    Color surface;
    Color on_surface;
    Color surface_variant;
    Color on_surface_variant;
};

// Light and dark schemes extracted from one piece of artwork.
struct AdaptiveSchemes
{
    ColorScheme light;
    ColorScheme dark;
};

namespace schemes
{
ColorScheme default_dark();
ColorScheme default_light();
}   // namespace schemes

}   // namespace aria
