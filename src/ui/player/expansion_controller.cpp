#include "expansion_controller.hpp"

#include <aria/logger.hpp>

#include "player_geometry.hpp"

namespace aria
{

ExpansionController::ExpansionController(float duration)
    : timeline_(duration, ease::ease_out_cubic, ease::ease_in_cubic)
{
    listener_ = timeline_.add_status_listener([this](TimelineStatus s) { on_status(s); });
}

ExpansionController::~ExpansionController()
{
    timeline_.remove_status_listener(listener_);
}

void ExpansionController::expand()
{
    // Resting at or already running to the upper bound
    if (timeline_.target() >= timeline_.upper())
        return;
    ARIA_LOG_DEBUG("player", "Expanding from {}", timeline_.value());
    timeline_.forward();
}

void ExpansionController::collapse()
{
    if (timeline_.target() <= timeline_.lower())
        return;
    ARIA_LOG_DEBUG("player", "Collapsing from {}", timeline_.value());
    timeline_.reverse();
}

void ExpansionController::toggle()
{
    if (is_expanded())
        collapse();
    else
        expand();
}

void ExpansionController::jump_to(float progress)
{
    timeline_.set_value(progress);
}

void ExpansionController::update(float dt)
{
    timeline_.update(dt);
}

ExpansionGeometry ExpansionController::geometry(const ScreenMetrics& screen) const
{
    return compute_expansion_geometry(timeline_.value(), screen);
}

void ExpansionController::on_status(TimelineStatus status)
{
    const Callback* cb = nullptr;
    switch (status)
    {
        case TimelineStatus::Forward:
            cb = &on_expand_start_;
            break;
        case TimelineStatus::Completed:
            cb = &on_expanded_;
            break;
        case TimelineStatus::Reverse:
            cb = &on_collapse_start_;
            break;
        case TimelineStatus::Dismissed:
            cb = &on_collapsed_;
            break;
    }
    if (cb && *cb)
        (*cb)();
}

}   // namespace aria
