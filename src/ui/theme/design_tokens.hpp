#pragma once

namespace aria::ui::tokens
{

// Spacing Scale (base: 4px)
constexpr float SPACE_1  = 4.0f;    // Tight
constexpr float SPACE_2  = 8.0f;    // Compact
constexpr float SPACE_3  = 12.0f;   // Default
constexpr float SPACE_4  = 16.0f;   // Comfortable
constexpr float SPACE_5  = 20.0f;   // Spacious
constexpr float SPACE_7  = 28.0f;   // Artwork to title
constexpr float SPACE_8  = 32.0f;   // Expanded side padding
constexpr float SPACE_12 = 48.0f;   // Expanded header

// Radius Scale
constexpr float RADIUS_LG = 12.0f;   // Expanded artwork
constexpr float RADIUS_XL = 16.0f;   // Mini player surface

// Font Scale
constexpr float FONT_BASE = 14.0f;   // Mini secondary line
constexpr float FONT_LG   = 16.0f;   // Mini title, expanded artist
constexpr float FONT_2XL  = 24.0f;   // Expanded title
constexpr float LINE_TITLE_EXPANDED = 32.0f;

// Mini player (collapsed) layout
constexpr float MINI_HEIGHT          = 72.0f;
constexpr float MINI_MARGIN          = 8.0f;
constexpr float MINI_ELEVATION       = 4.0f;
constexpr float MINI_ART_SIZE        = 72.0f;
constexpr float MINI_TITLE_LEFT      = 82.0f;
constexpr float MINI_TITLE_TOP       = 7.0f;
constexpr float MINI_ARTIST_TOP      = 27.0f;
constexpr float MINI_PROGRESS_HEIGHT = 4.0f;

// Expanded layout
constexpr float EXPANDED_ART_MIN   = 280.0f;
constexpr float EXPANDED_ART_MAX   = 400.0f;
constexpr float EXPANDED_ART_SCALE = 0.92f;
constexpr float EXPANDED_ART_INSET = 64.0f;   // horizontal padding subtracted before scaling

// Transport controls
constexpr float SKIP_BUTTON_MINI      = 28.0f;
constexpr float SKIP_BUTTON_EXPANDED  = 36.0f;
constexpr float PLAY_BUTTON_MINI      = 34.0f;
constexpr float PLAY_BUTTON_EXPANDED  = 44.0f;
constexpr float PLAY_CONTAINER_MINI   = 34.0f;
constexpr float PLAY_CONTAINER_LARGE  = 72.0f;
constexpr float CONTROL_SPACING_LARGE = 20.0f;

// Placeholder glyph
constexpr float GLYPH_MINI     = 24.0f;
constexpr float GLYPH_EXPANDED = 120.0f;

// Artwork sizes requested from the artwork service (pixels)
constexpr int ARTWORK_PX_MINI     = 128;
constexpr int ARTWORK_PX_EXPANDED = 512;

// Animation duration (in seconds)
constexpr float DURATION_EXPAND = 0.3f;

// Opacity Values
constexpr float OPACITY_SUBTLE    = 0.3f;
constexpr float OPACITY_MID       = 0.5f;
constexpr float OPACITY_SECONDARY = 0.6f;
constexpr float OPACITY_STRONG    = 0.7f;

// Gesture-gated fade windows (expansion progress)
constexpr float FADE_EARLY_START = 0.3f;
constexpr float FADE_LATE_START  = 0.5f;
constexpr float FADE_NAME_END    = 0.3f;

}   // namespace aria::ui::tokens
