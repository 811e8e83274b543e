#include <algorithm>
#include <aria/color.hpp>
#include <cmath>

namespace aria
{

uint32_t Color::to_abgr32() const
{
    auto channel = [](float c) -> uint32_t
    { return static_cast<uint32_t>(std::clamp(c, 0.0f, 1.0f) * 255.0f + 0.5f); };
    return (channel(a) << 24) | (channel(b) << 16) | (channel(g) << 8) | channel(r);
}

float Color::luminance() const
{
    auto lin = [](float c) -> float
    { return (c <= 0.04045f) ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f); };
    return 0.2126f * lin(r) + 0.7152f * lin(g) + 0.0722f * lin(b);
}

Color::HSL Color::to_hsl() const
{
    float max_c = std::max({r, g, b});
    float min_c = std::min({r, g, b});
    float l     = (max_c + min_c) * 0.5f;
    if (max_c == min_c)
        return {0.0f, 0.0f, l};

    float d = max_c - min_c;
    float s = (l > 0.5f) ? d / (2.0f - max_c - min_c) : d / (max_c + min_c);
    float h = 0.0f;
    if (max_c == r)
        h = (g - b) / d + (g < b ? 6.0f : 0.0f);
    else if (max_c == g)
        h = (b - r) / d + 2.0f;
    else
        h = (r - g) / d + 4.0f;
    return {h * 60.0f, s, l};
}

Color Color::from_hsl(float h, float s, float l, float a)
{
    if (s == 0.0f)
        return Color(l, l, l, a);

    auto hue2rgb = [](float p, float q, float t) -> float
    {
        if (t < 0.0f)
            t += 1.0f;
        if (t > 1.0f)
            t -= 1.0f;
        if (t < 1.0f / 6.0f)
            return p + (q - p) * 6.0f * t;
        if (t < 1.0f / 2.0f)
            return q;
        if (t < 2.0f / 3.0f)
            return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
        return p;
    };
    float q  = (l < 0.5f) ? l * (1.0f + s) : l + s - l * s;
    float p  = 2.0f * l - q;
    float hn = h / 360.0f;
    return Color(hue2rgb(p, q, hn + 1.0f / 3.0f), hue2rgb(p, q, hn), hue2rgb(p, q, hn - 1.0f / 3.0f), a);
}

namespace schemes
{

ColorScheme default_dark()
{
    ColorScheme cs;
    cs.primary              = Color::from_hex(0xB4C5FF);
    cs.on_primary           = Color::from_hex(0x1A2D60);
    cs.primary_container    = Color::from_hex(0x324478);
    cs.on_primary_container = Color::from_hex(0xDBE1FF);
    cs.surface              = Color::from_hex(0x121318);
    cs.on_surface           = Color::from_hex(0xE3E2E9);
    cs.surface_variant      = Color::from_hex(0x44464F);
    cs.on_surface_variant   = Color::from_hex(0xC5C6D0);
    return cs;
}

ColorScheme default_light()
{
    ColorScheme cs;
    cs.primary              = Color::from_hex(0x4A5C92);
    cs.on_primary           = Color::from_hex(0xFFFFFF);
    cs.primary_container    = Color::from_hex(0xDBE1FF);
    cs.on_primary_container = Color::from_hex(0x00174B);
    cs.surface              = Color::from_hex(0xFAF8FF);
    cs.on_surface           = Color::from_hex(0x1A1B21);
    cs.surface_variant      = Color::from_hex(0xE1E2EC);
    cs.on_surface_variant   = Color::from_hex(0x44464F);
    return cs;
}

}   // namespace schemes

}   // namespace aria
