#include "hint_controller.hpp"

#include <aria/logger.hpp>
#include <exception>

namespace aria
{

namespace
{

// Up to the peak at the eased midpoint, then back down.
float bounce_shape(float s, float amplitude)
{
    float t = ease::ease_out(s);
    return t < 0.5f ? amplitude * (t * 2.0f) : amplitude * ((1.0f - t) * 2.0f);
}

}   // namespace

HintController::HintController(FrameScheduler& scheduler, PreferenceStore* prefs, HintConfig config)
    : scheduler_(scheduler),
      prefs_(prefs),
      config_(config),
      single_(config.single_duration, ease::linear),
      hint_(config.hint_duration, ease::linear),
      welcome_(config.welcome_fade, ease::ease_out)
{
}

HintController::~HintController()
{
    scheduler_.cancel(hint_timer_);
}

void HintController::load_preferences()
{
    if (!prefs_)
    {
        loaded_ = true;
        return;
    }
    try
    {
        onboarding_completed_ = prefs_->read_onboarding_completed();
        hints_enabled_        = prefs_->read_hints_enabled();
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("hint", "Reading hint preferences failed: {}", e.what());
    }
    loaded_ = true;
}

void HintController::set_hints_enabled(bool enabled)
{
    hints_enabled_ = enabled;
    if (!prefs_)
        return;
    try
    {
        prefs_->persist_hints_enabled(enabled);
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("hint", "Persisting hints flag failed: {}", e.what());
    }
}

// ─── Hint mode ──────────────────────────────────────────────────────────────

void HintController::on_connection_changed(bool connected, bool has_selected_target)
{
    if (triggered_ || !loaded_ || onboarding_completed_)
        return;
    if (!connected || !has_selected_target)
        return;
    enter_hint_mode();
}

void HintController::enter_hint_mode()
{
    triggered_      = true;
    active_         = true;
    active_elapsed_ = 0.0f;
    welcome_.forward();

    ARIA_LOG_INFO("hint", "Entering hint mode");

    // A manual bounce in flight owns the channel; the loop picks up later
    if (!single_.is_animating())
        start_hint_bounce();

    scheduler_.cancel(hint_timer_);
    hint_timer_ = scheduler_.schedule_periodic(config_.hint_interval,
                                               [this]()
                                               {
                                                   if (active_ && !single_.is_animating())
                                                       start_hint_bounce();
                                               });
}

void HintController::end_hint_mode()
{
    scheduler_.cancel(hint_timer_);
    hint_timer_ = FrameScheduler::INVALID_TIMER;
    active_     = false;
    welcome_.set_value(0.0f);
}

void HintController::start_hint_bounce()
{
    hint_.set_value(0.0f);
    hint_.animate_to(1.0f, config_.hint_duration, ease::linear);
}

void HintController::mark_learned()
{
    if (!active_)
        return;
    ARIA_LOG_INFO("hint", "Discovery gesture performed, leaving hint mode");
    end_hint_mode();
    persist_onboarding_completed();
}

void HintController::skip()
{
    if (!active_)
        return;
    ARIA_LOG_INFO("hint", "Hint mode skipped");
    end_hint_mode();
    hint_.set_value(0.0f);
    single_.set_value(0.0f);
    persist_onboarding_completed();
}

void HintController::persist_onboarding_completed()
{
    onboarding_completed_ = true;
    if (!prefs_)
        return;
    try
    {
        prefs_->persist_onboarding_completed(true);
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("hint", "Persisting onboarding flag failed: {}", e.what());
    }
}

// ─── Bounce ─────────────────────────────────────────────────────────────────

void HintController::trigger_bounce()
{
    hint_.set_value(0.0f);
    single_.set_value(0.0f);
    single_.animate_to(1.0f, config_.single_duration, ease::linear);
}

void HintController::update(float dt)
{
    single_.update(dt);
    hint_.update(dt);
    welcome_.update(dt);
    if (active_)
        active_elapsed_ += dt;
}

float HintController::bounce_offset() const
{
    if (single_.is_animating())
        return bounce_shape(single_.value(), config_.single_amplitude);
    if (hint_.is_animating())
        return bounce_shape(hint_.value(), config_.hint_amplitude);
    return 0.0f;
}

float HintController::backdrop_opacity() const
{
    if (!active_)
        return 0.0f;
    float fade = ramp(active_elapsed_, config_.backdrop_hold, config_.backdrop_hold + config_.backdrop_fade);
    return lerp(1.0f, config_.backdrop_floor, ease::ease_out(fade));
}

}   // namespace aria
