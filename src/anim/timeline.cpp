#include <algorithm>
#include <aria/timeline.hpp>
#include <cmath>

namespace aria
{

Timeline::Timeline(float      duration,
                   EasingFunc curve,
                   EasingFunc reverse_curve,
                   float      lower,
                   float      upper)
    : duration_(duration > 0.0f ? duration : 0.0f),
      curve_(curve ? std::move(curve) : EasingFunc(ease::linear)),
      reverse_curve_(std::move(reverse_curve)),
      lower_(lower),
      upper_(upper > lower ? upper : lower)
{
    value_  = std::clamp(0.0f, lower_, upper_);
    status_ = value_ >= upper_ ? TimelineStatus::Completed : TimelineStatus::Dismissed;
}

// ─── Runs ────────────────────────────────────────────────────────────────────

void Timeline::forward()
{
    if (animating_ && to_ == upper_)
        return;
    if (!animating_ && value_ >= upper_)
        return;

    float span      = upper_ - lower_;
    float remaining = span > 0.0f ? (upper_ - value_) / span : 0.0f;
    start_run(upper_, duration_ * std::clamp(remaining, 0.0f, 1.0f), curve_, nullptr);
}

void Timeline::reverse()
{
    if (animating_ && to_ == lower_)
        return;
    if (!animating_ && value_ <= lower_)
        return;

    float span      = upper_ - lower_;
    float remaining = span > 0.0f ? (value_ - lower_) / span : 0.0f;
    start_run(lower_,
              duration_ * std::clamp(remaining, 0.0f, 1.0f),
              reverse_curve_ ? reverse_curve_ : curve_,
              nullptr);
}

void Timeline::animate_to(float target, float duration, EasingFunc curve, DoneCallback on_done)
{
    start_run(std::clamp(target, lower_, upper_),
              duration,
              curve ? std::move(curve) : curve_,
              std::move(on_done));
}

void Timeline::start_run(float target, float duration, EasingFunc curve, DoneCallback on_done)
{
    from_         = value_;
    to_           = target;
    elapsed_      = 0.0f;
    run_duration_ = duration;
    run_curve_    = std::move(curve);
    on_done_      = std::move(on_done);
    animating_    = true;

    TimelineStatus heading = to_ >= from_ ? TimelineStatus::Forward : TimelineStatus::Reverse;
    if (to_ == from_)
        heading = status_ == TimelineStatus::Reverse ? TimelineStatus::Reverse : TimelineStatus::Forward;

    if (run_duration_ <= 0.0f)
    {
        // Degenerate run: land immediately, still through the normal exit path
        update(0.0f);
        return;
    }
    set_status(heading);
}

void Timeline::set_value(float v)
{
    animating_ = false;
    on_done_   = nullptr;
    run_curve_ = nullptr;

    float prev = value_;
    value_     = std::clamp(v, lower_, upper_);
    settle_status(value_ >= prev ? TimelineStatus::Forward : TimelineStatus::Reverse);
}

void Timeline::stop()
{
    animating_ = false;
    on_done_   = nullptr;
    run_curve_ = nullptr;
}

// ─── Update ──────────────────────────────────────────────────────────────────

void Timeline::update(float dt)
{
    if (!animating_)
        return;

    elapsed_ += dt;
    float s = run_duration_ > 0.0f ? std::clamp(elapsed_ / run_duration_, 0.0f, 1.0f) : 1.0f;
    if (s < 1.0f)
    {
        float eased = run_curve_ ? run_curve_(s) : s;
        value_      = from_ + (to_ - from_) * eased;
        return;
    }

    // Snap to exact target
    value_     = to_;
    animating_ = false;
    run_curve_ = nullptr;

    // The callback may start another run on this timeline
    DoneCallback done = std::move(on_done_);
    on_done_          = nullptr;

    settle_status(to_ >= from_ ? TimelineStatus::Forward : TimelineStatus::Reverse);
    if (done)
        done();
}

// ─── Status ──────────────────────────────────────────────────────────────────

void Timeline::settle_status(TimelineStatus heading)
{
    if (value_ >= upper_)
        set_status(TimelineStatus::Completed);
    else if (value_ <= lower_)
        set_status(TimelineStatus::Dismissed);
    else
        set_status(heading);
}

void Timeline::set_status(TimelineStatus s)
{
    if (s == status_)
        return;
    status_ = s;

    // Listeners may add or remove listeners
    auto snapshot = listeners_;
    for (const auto& l : snapshot)
    {
        if (l.cb)
            l.cb(s);
    }
}

Timeline::ListenerId Timeline::add_status_listener(StatusCallback cb)
{
    ListenerId id = next_listener_id_++;
    listeners_.push_back({id, std::move(cb)});
    return id;
}

void Timeline::remove_status_listener(ListenerId id)
{
    std::erase_if(listeners_, [id](const Listener& l) { return l.id == id; });
}

}   // namespace aria
