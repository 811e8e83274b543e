#include "queue_panel_controller.hpp"

#include <aria/logger.hpp>

namespace aria
{

QueuePanelController::QueuePanelController(FrameScheduler& scheduler, QueuePanelConfig config)
    : scheduler_(scheduler),
      config_(config),
      timeline_(config.duration, ease::ease_out_cubic, ease::ease_in_cubic)
{
    listener_ = timeline_.add_status_listener(
        [this](TimelineStatus s)
        {
            if (s == TimelineStatus::Completed || s == TimelineStatus::Dismissed)
                sync_refresh_timer();
        });
}

QueuePanelController::~QueuePanelController()
{
    timeline_.remove_status_listener(listener_);
    stop_refresh_timer();
}

// ─── Transitions ────────────────────────────────────────────────────────────

bool QueuePanelController::toggle()
{
    if (timeline_.is_animating())
    {
        ARIA_LOG_DEBUG("queue", "Toggle ignored while animating");
        return false;
    }

    if (timeline_.value() <= 0.0f)
        timeline_.forward();
    else
        timeline_.reverse();
    return true;
}

void QueuePanelController::force_close()
{
    if (timeline_.value() > 0.0f || timeline_.is_animating())
        ARIA_LOG_DEBUG("queue", "Force-closing queue panel at {}", timeline_.value());
    timeline_.set_value(0.0f);
    stop_refresh_timer();
}

bool QueuePanelController::handle_fling(float start_x, float velocity, float screen_width)
{
    if (start_x > screen_width - config_.edge_dead_zone)
        return false;

    if (velocity < -config_.fling_velocity && !is_open())
        return toggle();
    if (velocity > config_.fling_velocity && is_open())
        return toggle();
    return false;
}

bool QueuePanelController::is_target_open() const
{
    if (timeline_.is_animating())
        return timeline_.target() >= timeline_.upper();
    return is_open();
}

void QueuePanelController::update(float dt)
{
    timeline_.update(dt);
}

// ─── Refresh ────────────────────────────────────────────────────────────────

void QueuePanelController::set_host_expanded(bool fully_expanded)
{
    if (host_expanded_ == fully_expanded)
        return;
    host_expanded_ = fully_expanded;
    sync_refresh_timer();
}

void QueuePanelController::sync_refresh_timer()
{
    bool want = host_expanded_ && timeline_.status() == TimelineStatus::Completed;
    if (!want)
    {
        stop_refresh_timer();
        return;
    }
    if (scheduler_.is_scheduled(refresh_timer_))
        return;

    refresh_timer_ = scheduler_.schedule_periodic(config_.refresh_interval,
                                                  [this]()
                                                  {
                                                      if (is_open() && on_refresh_)
                                                          on_refresh_();
                                                  });
    ARIA_LOG_DEBUG("queue", "Queue refresh started ({}s)", config_.refresh_interval);
}

void QueuePanelController::stop_refresh_timer()
{
    if (refresh_timer_ == FrameScheduler::INVALID_TIMER)
        return;
    scheduler_.cancel(refresh_timer_);
    refresh_timer_ = FrameScheduler::INVALID_TIMER;
}

}   // namespace aria
