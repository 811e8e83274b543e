#pragma once

#include <aria/color.hpp>
#include <cstdint>
#include <string>

namespace aria
{

struct QueuePanelConfig
{
    float duration         = 0.3f;
    float refresh_interval = 5.0f;     // seconds between queue refreshes while open
    float fling_velocity   = 300.0f;   // px/s
    float edge_dead_zone   = 40.0f;    // px from the trailing edge
};

struct SwipeConfig
{
    float    commit_threshold      = 0.3f;     // |offset| beyond which a release commits
    float    velocity_threshold    = 500.0f;   // px/s beyond which a release commits
    float    edge_dead_zone        = 40.0f;    // px from either screen edge
    float    commit_duration       = 0.15f;
    float    cancel_duration       = 0.3f;
    uint32_t settle_frames_known   = 1;        // peek track was cached
    uint32_t settle_frames_unknown = 2;        // peek target had nothing cached
};

struct HintConfig
{
    float single_amplitude = 10.0f;   // px
    float single_duration  = 0.4f;
    float hint_amplitude   = 20.0f;   // px
    float hint_duration    = 0.6f;
    float hint_interval    = 2.0f;    // seconds between hint bounces
    float backdrop_hold    = 2.0f;    // seconds at full opacity
    float backdrop_fade    = 1.0f;
    float backdrop_floor   = 0.5f;    // opacity after the fade
    float welcome_fade     = 0.8f;
};

// Device selector sheet that slides up over the mini player.
struct SelectorConfig
{
    float reveal_duration  = 0.2f;
    float dismiss_duration = 0.15f;
    float dismiss_distance = 100.0f;   // px of downward drag that dismisses
    float dismiss_velocity = 500.0f;   // px/s downward that dismisses
    float bounce_below     = 0.3f;     // reveal at which the closing sheet lands on the mini player
};

// User-visible text. Hosts replace these with localized strings.
struct PlayerStrings
{
    std::string swipe_hint     = "Swipe to switch device";
    std::string welcome_title  = "Welcome";
    std::string welcome_body   = "Swipe the mini player to switch devices";
    std::string skip_hint      = "Skip";
    std::string nothing_played = "Nothing playing";
    std::string command_failed = "Command failed";
};

struct OverlayConfig
{
    float expansion_duration = 0.3f;
    float readout_interval   = 1.0f;    // seconds between position readout refreshes
    float hide_duration      = 0.25f;
    float notification_time  = 3.0f;    // seconds a transient notification stays up

    QueuePanelConfig queue;
    SwipeConfig      swipe;
    HintConfig       hint;
    SelectorConfig   selector;

    ColorScheme dark_scheme  = schemes::default_dark();
    ColorScheme light_scheme = schemes::default_light();
    bool        dark_mode    = true;

    PlayerStrings strings;
};

}   // namespace aria
