#pragma once

namespace aria
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float right() const { return x + w; }
    float bottom() const { return y + h; }
    bool  contains(float px, float py) const { return px >= x && px < x + w && py >= y && py < y + h; }
};

// Screen size and system insets in logical pixels.
struct ScreenMetrics
{
    float width        = 390.0f;
    float height       = 844.0f;
    float top_inset    = 0.0f;    // status bar
    float bottom_inset = 0.0f;    // gesture / home indicator area
    float nav_height   = 56.0f;   // bottom navigation bar

    float bottom_nav_space() const { return nav_height + bottom_inset; }
};

// Every layout property of the player surface at one expansion progress.
// The surface rect is in screen coordinates; everything else is relative to
// the surface's top-left corner.
struct ExpansionGeometry
{
    float t = 0.0f;

    // Surface
    Rect  surface;
    float surface_bottom = 0.0f;   // distance from the screen bottom
    float corner_radius  = 0.0f;
    float elevation      = 0.0f;

    // Artwork
    Rect  artwork;
    float artwork_corner       = 0.0f;
    float artwork_shadow_alpha = 0.0f;
    float glyph_size           = 0.0f;

    // Text
    float title_font      = 0.0f;
    float title_left      = 0.0f;
    float title_top       = 0.0f;
    float title_width     = 0.0f;
    float artist_font     = 0.0f;
    float artist_top      = 0.0f;
    float secondary_alpha = 0.0f;
    float album_top       = 0.0f;
    float tertiary_top    = 0.0f;   // collapsed target-name line

    // Controls
    float controls_top      = 0.0f;
    float controls_center_x = 0.0f;
    float skip_size         = 0.0f;
    float play_size         = 0.0f;
    float play_container    = 0.0f;
    float control_spacing   = 0.0f;
    float progress_top      = 0.0f;
    float volume_top        = 0.0f;
    float content_padding   = 0.0f;

    // Fades
    float album_opacity          = 0.0f;   // ramp over [0.3, 1]
    float header_opacity         = 0.0f;   // ramp over [0.3, 1]
    float expanded_opacity       = 0.0f;   // eased ramp over [0.5, 1]
    float collapsed_name_opacity = 0.0f;   // fades out over [0, 0.3]
};

}   // namespace aria
