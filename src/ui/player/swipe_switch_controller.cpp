#include "swipe_switch_controller.hpp"

#include <algorithm>
#include <aria/logger.hpp>
#include <cmath>
#include <exception>
#include <iterator>

namespace aria
{

const char* swipe_phase_name(SwipePhase phase)
{
    switch (phase)
    {
        case SwipePhase::Idle:
            return "Idle";
        case SwipePhase::Dragging:
            return "Dragging";
        case SwipePhase::Committing:
            return "Committing";
        case SwipePhase::Settling:
            return "Settling";
        case SwipePhase::Cancelling:
            return "Cancelling";
    }
    return "Unknown";
}

SwipeSwitchController::SwipeSwitchController(const PlaybackSource& source, SwipeConfig config)
    : source_(source), config_(config), timeline_(config.commit_duration, ease::ease_out, nullptr, -1.0f, 1.0f)
{
}

bool SwipeSwitchController::is_animating() const
{
    return phase_ == SwipePhase::Committing || phase_ == SwipePhase::Settling
           || phase_ == SwipePhase::Cancelling;
}

SwipeState SwipeSwitchController::state() const
{
    SwipeState s;
    s.offset       = offset();
    s.peek_target  = peek_target_;
    s.peek_track   = peek_track_;
    s.is_dragging  = is_dragging();
    s.is_animating = is_animating();
    return s;
}

// ─── Gesture input ──────────────────────────────────────────────────────────

bool SwipeSwitchController::drag_start(float x, float screen_width)
{
    if (is_animating())
    {
        ARIA_LOG_DEBUG("swipe", "Drag ignored during {}", swipe_phase_name(phase_));
        return false;
    }

    // A drag that never ended is abandoned
    if (phase_ == SwipePhase::Dragging)
        reset();

    // Edge zones belong to the system back gesture
    if (x < config_.edge_dead_zone || x > screen_width - config_.edge_dead_zone)
        return false;

    if (!adjacent_target(SwipeDirection::Next) && !adjacent_target(SwipeDirection::Previous))
    {
        ARIA_LOG_DEBUG("swipe", "Drag declined: no alternate target");
        return false;
    }

    phase_ = SwipePhase::Dragging;
    timeline_.set_value(0.0f);
    clear_peek();
    return true;
}

void SwipeSwitchController::drag_update(float dx, float container_width)
{
    if (phase_ != SwipePhase::Dragging || container_width <= 0.0f)
        return;

    float prev = timeline_.value();
    float next = std::clamp(prev + dx / container_width, -1.0f, 1.0f);
    if (next == prev)
        return;

    timeline_.set_value(next);
    refresh_peek(next < 0.0f ? SwipeDirection::Next : SwipeDirection::Previous);
}

void SwipeSwitchController::drag_end(float velocity)
{
    if (phase_ != SwipePhase::Dragging)
    {
        ARIA_LOG_DEBUG("swipe", "Drag end without an active drag ignored");
        return;
    }

    float off           = timeline_.value();
    bool  should_commit = std::fabs(off) > config_.commit_threshold
                         || std::fabs(velocity) > config_.velocity_threshold;

    SwipeDirection dir = SwipeDirection::None;
    if (off != 0.0f)
        dir = off < 0.0f ? SwipeDirection::Next : SwipeDirection::Previous;
    else if (velocity != 0.0f)
        dir = velocity < 0.0f ? SwipeDirection::Next : SwipeDirection::Previous;

    if (should_commit && dir != SwipeDirection::None)
    {
        if (dir != peek_direction_)
            refresh_peek(dir);
        if (peek_target_)
        {
            begin_commit(dir);
            return;
        }
    }
    begin_cancel();
}

// ─── Resolution ─────────────────────────────────────────────────────────────

void SwipeSwitchController::begin_commit(SwipeDirection dir)
{
    phase_       = SwipePhase::Committing;
    float target = dir == SwipeDirection::Next ? -1.0f : 1.0f;
    ARIA_LOG_DEBUG("swipe", "Committing to '{}'", peek_target_->name);
    timeline_.animate_to(target, config_.commit_duration, ease::ease_out, [this]() { finish_commit(); });
}

void SwipeSwitchController::begin_cancel()
{
    // Nothing to spring back from
    if (timeline_.value() == 0.0f)
    {
        clear_peek();
        finish(false);
        return;
    }

    phase_ = SwipePhase::Cancelling;
    timeline_.animate_to(0.0f,
                         config_.cancel_duration,
                         ease::ease_out_back,
                         [this]()
                         {
                             clear_peek();
                             finish(false);
                         });
}

void SwipeSwitchController::finish_commit()
{
    phase_         = SwipePhase::Settling;
    settle_frames_ = peek_track_ ? config_.settle_frames_known : config_.settle_frames_unknown;

    if (on_commit_ && peek_target_)
    {
        // Copy: the callback may trigger a refresh that touches peek state
        PlaybackTarget target = *peek_target_;
        on_commit_(target);
    }
}

void SwipeSwitchController::finish(bool committed)
{
    phase_ = SwipePhase::Idle;
    if (on_resolved_)
        on_resolved_(committed);
}

void SwipeSwitchController::update(float dt)
{
    // The settle countdown runs on the frames after the commit landed
    if (phase_ == SwipePhase::Settling)
    {
        if (settle_frames_ > 0)
            --settle_frames_;
        if (settle_frames_ == 0)
        {
            timeline_.set_value(0.0f);
            clear_peek();
            finish(true);
        }
        return;
    }

    timeline_.update(dt);
}

void SwipeSwitchController::reset()
{
    timeline_.set_value(0.0f);
    clear_peek();
    phase_         = SwipePhase::Idle;
    settle_frames_ = 0;
}

// ─── Peek ───────────────────────────────────────────────────────────────────

std::optional<PlaybackTarget> SwipeSwitchController::adjacent_target(SwipeDirection dir) const
{
    if (dir == SwipeDirection::None)
        return std::nullopt;

    auto selected = source_.selected_target();
    if (!selected)
        return std::nullopt;

    std::vector<PlaybackTarget> targets = source_.available_targets();
    std::erase_if(targets, [](const PlaybackTarget& t) { return !t.available; });

    auto it = std::find_if(targets.begin(),
                           targets.end(),
                           [&](const PlaybackTarget& t) { return t.id == selected->id; });
    if (it == targets.end())
        return std::nullopt;

    if (dir == SwipeDirection::Next)
    {
        auto next = std::next(it);
        if (next == targets.end())
            return std::nullopt;
        return *next;
    }
    if (it == targets.begin())
        return std::nullopt;
    return *std::prev(it);
}

void SwipeSwitchController::refresh_peek(SwipeDirection dir)
{
    peek_direction_ = dir;
    auto candidate  = adjacent_target(dir);
    if (!candidate)
    {
        clear_peek();
        peek_direction_ = dir;
        return;
    }

    if (peek_target_ && peek_target_->id == candidate->id)
    {
        peek_target_ = std::move(candidate);
        return;
    }

    peek_target_ = std::move(candidate);
    peek_track_.reset();
    try
    {
        peek_track_ = source_.cached_track_for(peek_target_->id);
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("swipe", "Cached track lookup for '{}' failed: {}", peek_target_->id, e.what());
    }
}

void SwipeSwitchController::clear_peek()
{
    peek_target_.reset();
    peek_track_.reset();
    peek_direction_ = SwipeDirection::None;
}

}   // namespace aria
