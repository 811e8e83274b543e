#pragma once

#include <aria/easing.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace aria
{

enum class TimelineStatus
{
    Dismissed,   // Resting at the lower bound
    Forward,     // Heading toward the upper bound
    Reverse,     // Heading toward the lower bound
    Completed,   // Resting at the upper bound
};

// A single animated scalar. Either runs toward a target over a duration with
// an easing curve, or is written directly by gesture input via set_value().
// Advanced only by update(dt); owns no clock of its own.
//
// The eased position is stored directly in value(): starting a run mid-way
// interpolates from the current value, so switching direction never jumps.
class Timeline
{
   public:
    using StatusCallback = std::function<void(TimelineStatus)>;
    using DoneCallback   = std::function<void()>;
    using ListenerId     = uint32_t;

    explicit Timeline(float      duration,
                      EasingFunc curve         = ease::ease_out,
                      EasingFunc reverse_curve = nullptr,
                      float      lower         = 0.0f,
                      float      upper         = 1.0f);

    Timeline(const Timeline&)            = delete;
    Timeline& operator=(const Timeline&) = delete;

    float          value() const { return value_; }
    float          lower() const { return lower_; }
    float          upper() const { return upper_; }
    TimelineStatus status() const { return status_; }
    bool           is_animating() const { return animating_; }
    float          target() const { return animating_ ? to_ : value_; }

    void  set_duration(float seconds) { duration_ = seconds > 0.0f ? seconds : 0.0f; }
    float duration() const { return duration_; }

    // Run to the upper bound with the forward curve. The duration is scaled
    // by the remaining distance. No-op when already there or heading there.
    void forward();

    // Run to the lower bound with the reverse curve (forward curve if unset).
    void reverse();

    // Run from the current value to `target` over exactly `duration` seconds.
    // on_done fires once, after the value lands on target.
    void animate_to(float target, float duration, EasingFunc curve, DoneCallback on_done = nullptr);

    // Jump to v (clamped to bounds). Stops a running animation without
    // firing its completion callback.
    void set_value(float v);

    // Freeze at the current value. The pending completion callback is dropped.
    void stop();

    void update(float dt);

    ListenerId add_status_listener(StatusCallback cb);
    void       remove_status_listener(ListenerId id);

   private:
    struct Listener
    {
        ListenerId     id;
        StatusCallback cb;
    };

    void start_run(float target, float duration, EasingFunc curve, DoneCallback on_done);
    void settle_status(TimelineStatus heading);
    void set_status(TimelineStatus s);

    float      duration_;
    EasingFunc curve_;
    EasingFunc reverse_curve_;
    float      lower_;
    float      upper_;

    float          value_  = 0.0f;
    TimelineStatus status_ = TimelineStatus::Dismissed;

    // Active run
    bool         animating_    = false;
    float        from_         = 0.0f;
    float        to_           = 0.0f;
    float        elapsed_      = 0.0f;
    float        run_duration_ = 0.0f;
    EasingFunc   run_curve_;
    DoneCallback on_done_;

    ListenerId            next_listener_id_ = 1;
    std::vector<Listener> listeners_;
};

}   // namespace aria
