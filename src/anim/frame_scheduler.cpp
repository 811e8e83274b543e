#include "frame_scheduler.hpp"

#include <algorithm>
#include <aria/logger.hpp>

namespace aria
{

// ─── Scheduling ─────────────────────────────────────────────────────────────

FrameScheduler::TimerId FrameScheduler::schedule_once(float delay_sec, Callback cb)
{
    Timer t;
    t.id      = next_id_++;
    t.cb      = std::move(cb);
    t.due_sec = frame_.elapsed_sec + std::max(delay_sec, 0.0f);
    timers_.push_back(std::move(t));
    return timers_.back().id;
}

FrameScheduler::TimerId FrameScheduler::schedule_periodic(float interval_sec, Callback cb)
{
    if (interval_sec <= 0.0f)
    {
        ARIA_LOG_WARN("scheduler", "Rejected periodic timer with interval {}", interval_sec);
        return INVALID_TIMER;
    }

    Timer t;
    t.id           = next_id_++;
    t.cb           = std::move(cb);
    t.interval_sec = interval_sec;
    t.due_sec      = frame_.elapsed_sec + interval_sec;
    timers_.push_back(std::move(t));
    return timers_.back().id;
}

// ─── Cancel ─────────────────────────────────────────────────────────────────

void FrameScheduler::cancel(TimerId id)
{
    for (auto& t : timers_)
    {
        if (t.id == id)
            t.cancelled = true;
    }
}

void FrameScheduler::cancel_all()
{
    for (auto& t : timers_)
        t.cancelled = true;
}

bool FrameScheduler::is_scheduled(TimerId id) const
{
    if (id == INVALID_TIMER)
        return false;
    for (const auto& t : timers_)
    {
        if (t.id == id && !t.cancelled)
            return true;
    }
    return false;
}

size_t FrameScheduler::pending_count() const
{
    return static_cast<size_t>(
        std::count_if(timers_.begin(), timers_.end(), [](const Timer& t) { return !t.cancelled; }));
}

// ─── Advance ────────────────────────────────────────────────────────────────

void FrameScheduler::advance(float dt)
{
    frame_.dt = std::max(dt, 0.0f);
    frame_.elapsed_sec += frame_.dt;
    ++frame_.number;

    // Callbacks may schedule or cancel; only timers that existed before this
    // frame are considered, and each is looked up by index every time.
    const size_t count = timers_.size();
    for (size_t i = 0; i < count; ++i)
    {
        if (timers_[i].cancelled)
            continue;

        if (frame_.elapsed_sec < timers_[i].due_sec)
            continue;

        Callback cb = timers_[i].cb;
        if (timers_[i].interval_sec > 0.0f)
        {
            // Missed intervals are dropped rather than replayed
            timers_[i].due_sec += timers_[i].interval_sec;
            if (timers_[i].due_sec <= frame_.elapsed_sec)
                timers_[i].due_sec = frame_.elapsed_sec + timers_[i].interval_sec;
        }
        else
        {
            timers_[i].cancelled = true;
        }

        if (cb)
            cb();
    }

    gc();
}

void FrameScheduler::gc()
{
    std::erase_if(timers_, [](const Timer& t) { return t.cancelled; });
}

}   // namespace aria
