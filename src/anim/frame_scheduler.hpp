#pragma once

#include <aria/frame.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace aria
{

// Cooperative frame clock. Owns the frame counter and every delayed or
// periodic continuation in the player; nothing here sleeps or spawns threads.
// advance() is the only way time moves, so tests step it explicitly.
class FrameScheduler
{
   public:
    using TimerId  = uint32_t;
    using Callback = std::function<void()>;

    static constexpr TimerId INVALID_TIMER = 0;

    FrameScheduler() = default;

    FrameScheduler(const FrameScheduler&)            = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    // Fire once after `delay_sec` of frame time.
    TimerId schedule_once(float delay_sec, Callback cb);

    // Fire every `interval_sec` until cancelled. The first firing is one
    // interval from now.
    TimerId schedule_periodic(float interval_sec, Callback cb);

    void cancel(TimerId id);
    void cancel_all();
    bool is_scheduled(TimerId id) const;

    // Advance the clock by dt seconds and run everything that came due.
    // Timers scheduled from inside a callback wait for the next advance().
    void advance(float dt);

    const Frame& current_frame() const { return frame_; }
    float        elapsed_seconds() const { return frame_.elapsed_sec; }
    uint64_t     frame_number() const { return frame_.number; }
    size_t       pending_count() const;

   private:
    struct Timer
    {
        TimerId  id;
        Callback cb;
        float    due_sec      = 0.0f;
        float    interval_sec = 0.0f;   // > 0 for periodic timers
        bool     cancelled    = false;
    };

    TimerId next_id_ = 1;
    Frame   frame_;

    std::vector<Timer> timers_;

    void gc();
};

}   // namespace aria
