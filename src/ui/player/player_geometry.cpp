#include "player_geometry.hpp"

#include <algorithm>
#include <aria/easing.hpp>

#include "ui/theme/design_tokens.hpp"

namespace aria
{

namespace tokens = ui::tokens;

float expanded_artwork_size(float screen_width)
{
    float max_art = screen_width - tokens::EXPANDED_ART_INSET;
    return std::clamp(max_art * tokens::EXPANDED_ART_SCALE,
                      tokens::EXPANDED_ART_MIN,
                      tokens::EXPANDED_ART_MAX);
}

ExpansionGeometry compute_expansion_geometry(float t, const ScreenMetrics& screen)
{
    t = std::clamp(t, 0.0f, 1.0f);

    ExpansionGeometry g;
    g.t = t;

    const float W = screen.width;
    const float H = screen.height;

    // ─── Surface ────────────────────────────────────────────────────────
    const float nav_space        = screen.bottom_nav_space();
    const float collapsed_bottom = nav_space + tokens::MINI_MARGIN;
    const float expanded_height  = std::max(H - nav_space, tokens::MINI_HEIGHT);

    const float margin = lerp(tokens::MINI_MARGIN, 0.0f, t);
    g.surface.w        = W - 2.0f * margin;
    g.surface.h        = lerp(tokens::MINI_HEIGHT, expanded_height, t);
    g.surface_bottom   = lerp(collapsed_bottom, nav_space, t);
    g.surface.x        = margin;
    g.surface.y        = H - g.surface_bottom - g.surface.h;
    g.corner_radius    = lerp(tokens::RADIUS_XL, 0.0f, t);
    g.elevation        = lerp(tokens::MINI_ELEVATION, 0.0f, t);

    // ─── Artwork ────────────────────────────────────────────────────────
    const float padding      = tokens::SPACE_8;
    const float exp_art      = expanded_artwork_size(W);
    const float exp_art_left = (W - exp_art) * 0.5f;
    const float exp_art_top  = screen.top_inset + tokens::SPACE_12 + tokens::SPACE_4;

    const float art = lerp(tokens::MINI_ART_SIZE, exp_art, t);
    g.artwork       = {lerp(0.0f, exp_art_left, t), lerp(0.0f, exp_art_top, t), art, art};
    g.artwork_corner       = lerp(0.0f, tokens::RADIUS_LG, t);
    g.artwork_shadow_alpha = tokens::OPACITY_SUBTLE * ramp(t, tokens::FADE_EARLY_START, 1.0f);
    g.glyph_size           = lerp(tokens::GLYPH_MINI, tokens::GLYPH_EXPANDED, t);

    // ─── Text ───────────────────────────────────────────────────────────
    const float exp_title_top  = exp_art_top + exp_art + tokens::SPACE_7;
    const float exp_artist_top = exp_title_top + tokens::LINE_TITLE_EXPANDED + tokens::SPACE_2;
    const float exp_album_top  = exp_artist_top + 24.0f;

    g.title_font      = lerp(tokens::FONT_LG, tokens::FONT_2XL, t);
    g.title_left      = lerp(tokens::MINI_TITLE_LEFT, padding, t);
    g.title_top       = lerp(tokens::MINI_TITLE_TOP, exp_title_top, t);
    g.title_width     = lerp(W - tokens::MINI_ART_SIZE - 150.0f, W - 2.0f * padding, t);
    g.artist_font     = lerp(tokens::FONT_BASE, tokens::FONT_LG, t);
    g.artist_top      = lerp(tokens::MINI_ARTIST_TOP, exp_artist_top, t);
    g.secondary_alpha = lerp(tokens::OPACITY_SECONDARY, tokens::OPACITY_STRONG, t);
    g.album_top       = lerp(g.artist_top + 24.0f, exp_album_top, t);
    g.tertiary_top    = 46.0f;

    // ─── Controls ───────────────────────────────────────────────────────
    const float exp_progress_top  = exp_album_top + 36.0f;
    const float exp_controls_top  = exp_progress_top + 64.0f;
    const float mini_controls_top = (tokens::MINI_HEIGHT - tokens::PLAY_CONTAINER_MINI) * 0.5f - 6.0f;

    g.skip_size       = lerp(tokens::SKIP_BUTTON_MINI, tokens::SKIP_BUTTON_EXPANDED, t);
    g.play_size       = lerp(tokens::PLAY_BUTTON_MINI, tokens::PLAY_BUTTON_EXPANDED, t);
    g.play_container  = lerp(tokens::PLAY_CONTAINER_MINI, tokens::PLAY_CONTAINER_LARGE, t);
    g.control_spacing = lerp(0.0f, tokens::CONTROL_SPACING_LARGE, t);
    g.controls_top    = lerp(mini_controls_top, exp_controls_top, t);
    g.progress_top    = exp_progress_top;
    g.volume_top      = exp_controls_top + 88.0f;
    g.content_padding = padding;

    // Collapsed row hugs the trailing edge, expanded row is centered
    const float mini_row    = 2.0f * tokens::SKIP_BUTTON_MINI + tokens::PLAY_CONTAINER_MINI;
    const float mini_center = (W - 2.0f * tokens::MINI_MARGIN) - tokens::MINI_MARGIN - mini_row * 0.5f;
    g.controls_center_x     = lerp(mini_center, W * 0.5f, t);

    // ─── Fades ──────────────────────────────────────────────────────────
    g.album_opacity          = ramp(t, tokens::FADE_EARLY_START, 1.0f);
    g.header_opacity         = ramp(t, tokens::FADE_EARLY_START, 1.0f);
    g.expanded_opacity       = ease::standard_ease_in(ramp(t, tokens::FADE_LATE_START, 1.0f));
    g.collapsed_name_opacity = 1.0f - ramp(t, 0.0f, tokens::FADE_NAME_END);

    return g;
}

}   // namespace aria
