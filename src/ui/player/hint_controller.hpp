#pragma once

#include <aria/playback.hpp>
#include <aria/player_config.hpp>
#include <aria/timeline.hpp>

#include "anim/frame_scheduler.hpp"

namespace aria
{

// Vertical bounce channel for the mini player plus the first-run welcome
// sequence. Two bounce animations share one output: a manual single bounce
// (queue toggle, target selector closing) and the periodic hint bounce that
// runs while hint mode is active. Manual bounces always win.
//
// Hint mode is entered at most once per instance, when preferences are
// loaded, onboarding is incomplete, and the source is connected with a
// selected target.
class HintController
{
   public:
    HintController(FrameScheduler& scheduler, PreferenceStore* prefs, HintConfig config = {});
    ~HintController();

    HintController(const HintController&)            = delete;
    HintController& operator=(const HintController&) = delete;

    // Read the persisted flags. Hint mode cannot start before this.
    void load_preferences();

    // Called whenever connection or selection changes; may enter hint mode.
    void on_connection_changed(bool connected, bool has_selected_target);

    // Manual single bounce. Cancels an in-flight hint bounce.
    void trigger_bounce();

    // The user performed the discovery gesture. Stops the hint loop; an
    // in-flight bounce finishes naturally.
    void mark_learned();

    // Explicit skip: stops everything and zeroes the offset immediately.
    void skip();

    void update(float dt);

    float bounce_offset() const;
    bool  is_active() const { return active_; }
    bool  was_triggered() const { return triggered_; }
    bool  is_single_bouncing() const { return single_.is_animating(); }
    bool  is_hint_bouncing() const { return hint_.is_animating(); }

    bool preferences_loaded() const { return loaded_; }
    bool has_completed_onboarding() const { return onboarding_completed_; }
    bool hints_enabled() const { return hints_enabled_; }
    void set_hints_enabled(bool enabled);

    // Welcome overlay: visible while hint mode is active.
    bool  is_welcome_visible() const { return active_; }
    float backdrop_opacity() const;
    float welcome_opacity() const { return welcome_.value(); }

    const HintConfig& config() const { return config_; }

   private:
    void enter_hint_mode();
    void end_hint_mode();
    void start_hint_bounce();
    void persist_onboarding_completed();

    FrameScheduler&  scheduler_;
    PreferenceStore* prefs_;
    HintConfig       config_;

    Timeline single_;
    Timeline hint_;
    Timeline welcome_;

    FrameScheduler::TimerId hint_timer_ = FrameScheduler::INVALID_TIMER;

    bool  loaded_               = false;
    bool  onboarding_completed_ = false;
    bool  hints_enabled_        = true;
    bool  triggered_            = false;
    bool  active_               = false;
    float active_elapsed_       = 0.0f;
};

}   // namespace aria
