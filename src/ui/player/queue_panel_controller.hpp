#pragma once

#include <aria/player_config.hpp>
#include <aria/timeline.hpp>
#include <functional>

#include "anim/frame_scheduler.hpp"

namespace aria
{

// Slide-in queue panel nested inside the expanded player. Its timeline is
// independent of the expansion timeline; the overlay only renders it while
// the player is visually expanded.
//
// While the panel is fully open and the host is fully expanded, the refresh
// callback runs periodically on the frame scheduler.
class QueuePanelController
{
   public:
    using RefreshCallback = std::function<void()>;

    QueuePanelController(FrameScheduler& scheduler, QueuePanelConfig config = {});
    ~QueuePanelController();

    QueuePanelController(const QueuePanelController&)            = delete;
    QueuePanelController& operator=(const QueuePanelController&) = delete;

    // Open when closed, close otherwise. Returns false (and does nothing)
    // while the panel is animating.
    bool toggle();

    // Hard reset to closed: no slide-out frames, refresh stopped.
    void force_close();

    // Horizontal fling in the expanded player. Negative velocity opens,
    // positive closes. Returns true when the fling toggled the panel.
    bool handle_fling(float start_x, float velocity, float screen_width);

    // The host reports whether it is fully expanded; refresh needs both.
    void set_host_expanded(bool fully_expanded);

    void update(float dt);

    float progress() const { return timeline_.value(); }
    bool  is_open() const { return timeline_.value() > 0.5f; }
    bool  is_animating() const { return timeline_.is_animating(); }
    bool  is_refreshing() const { return scheduler_.is_scheduled(refresh_timer_); }

    // Where the panel is heading, even mid-animation.
    bool is_target_open() const;

    void set_on_refresh(RefreshCallback cb) { on_refresh_ = std::move(cb); }

    const QueuePanelConfig& config() const { return config_; }

   private:
    void sync_refresh_timer();
    void stop_refresh_timer();

    FrameScheduler&  scheduler_;
    QueuePanelConfig config_;
    Timeline         timeline_;

    Timeline::ListenerId    listener_      = 0;
    FrameScheduler::TimerId refresh_timer_ = FrameScheduler::INVALID_TIMER;
    bool                    host_expanded_ = false;

    RefreshCallback on_refresh_;
};

}   // namespace aria
