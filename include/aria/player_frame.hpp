#pragma once

#include <aria/color.hpp>
#include <aria/geometry.hpp>
#include <aria/playback.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aria
{

// Colors of the player surface at one expansion progress.
struct PlayerColors
{
    Color background;
    Color text;
    Color primary;
    Color collapsed_background;
    Color expanded_background;
};

// Colors for a bottom navigation bar drawn under the player.
struct NavBarTint
{
    Color background;
    Color selected;
    Color unselected;
    float shadow_alpha = 0.0f;
};

enum class DeviceGlyph
{
    Speaker,
    Phone,
    Group,
    Tv,
    Cast,
};

// Glyph shown in place of artwork for a target with nothing to show.
DeviceGlyph device_glyph_for(std::string_view target_name);
const char* device_glyph_name(DeviceGlyph glyph);

// Text and artwork shown in the mini player for one target. Built for the
// selected target and, during a swipe, for the peek target.
struct MiniContent
{
    std::string                target_id;
    std::string                target_name;
    std::string                primary;             // track title or target name
    std::optional<std::string> secondary;           // artist or swipe hint
    bool                       secondary_is_hint = false;
    std::optional<std::string> tertiary;            // target name under a track
    std::optional<std::string> artwork_url;
    DeviceGlyph                glyph      = DeviceGlyph::Speaker;
    bool                       has_track  = false;
    bool                       is_playing = false;
    float                      progress   = 0.0f;   // playback fraction in [0,1]
};

enum class GestureAction
{
    Expand,
    Collapse,
    PlayPause,
    SkipNext,
    SkipPrevious,
    ToggleShuffle,
    CycleRepeat,
    ToggleQueue,
    Seek,
    Volume,
    ShowTargetSelector,
    DismissTargetSelector,
    SkipHint,
};

const char* gesture_action_name(GestureAction action);

// Tappable screen area. Regions are listed bottom-most first.
struct GestureRegion
{
    Rect          rect;
    GestureAction action;
};

struct PeekLayer
{
    bool        visible = false;
    float       x       = 0.0f;   // screen x of the peek surface
    MiniContent content;
};

struct ExpandedDetails
{
    std::optional<Track> track;
    std::string          target_name;
    float                position_sec = 0.0f;
    std::optional<float> duration_sec;
    std::string          position_text;
    std::string          duration_text;
    bool                 has_queue  = false;
    bool                 shuffle    = false;
    RepeatMode           repeat     = RepeatMode::Off;
    int                  volume     = 0;
    bool                 is_playing = false;
};

struct QueueLayer
{
    bool                       visible  = false;
    float                      progress = 0.0f;
    float                      x        = 0.0f;   // left edge in surface coordinates
    float                      opacity  = 0.0f;
    std::optional<PlayerQueue> queue;
};

struct WelcomeLayer
{
    bool        visible          = false;
    float       backdrop_opacity = 0.0f;
    float       content_opacity  = 0.0f;
    Color       backdrop         = Color::from_hex(0x1A1A1A);
    std::string title;
    std::string body;
    std::string skip_label;
};

struct TargetSelectorLayer
{
    bool                        visible     = false;
    float                       reveal      = 0.0f;   // 0 hidden, 1 fully up
    float                       drag_offset = 0.0f;   // px pulled down by the user
    std::vector<PlaybackTarget> targets;
    std::string                 selected_id;
};

// Everything needed to paint the player once.
struct PlayerFrame
{
    uint64_t number  = 0;
    bool     visible = false;   // false while disconnected or with no target

    float expansion      = 0.0f;
    float queue_progress = 0.0f;
    float swipe_offset   = 0.0f;
    float bounce_offset  = 0.0f;
    float hide_offset    = 0.0f;

    ExpansionGeometry geometry;   // surface rect includes bounce and hide offsets
    PlayerColors      colors;

    MiniContent current;
    float       current_x = 0.0f;   // screen x of the current mini content
    PeekLayer   peek;

    ExpandedDetails     details;
    QueueLayer          queue;
    WelcomeLayer        welcome;
    TargetSelectorLayer selector;

    std::optional<std::string> notification;

    std::vector<GestureRegion> regions;
};

}   // namespace aria
