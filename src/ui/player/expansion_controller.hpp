#pragma once

#include <aria/geometry.hpp>
#include <aria/timeline.hpp>
#include <functional>

#include "ui/theme/design_tokens.hpp"

namespace aria
{

// Drives the collapsed <-> expanded morph of the player surface. Owns one
// timeline (ease-out-cubic forward, ease-in-cubic reverse); all layout is
// derived from its value through compute_expansion_geometry().
//
// Phase callbacks are how the overlay wires cross-timeline effects:
//   on_expand_start   -> forward direction entered
//   on_expanded       -> reached progress 1
//   on_collapse_start -> reverse direction entered
//   on_collapsed      -> reached progress 0
class ExpansionController
{
   public:
    using Callback = std::function<void()>;

    explicit ExpansionController(float duration = ui::tokens::DURATION_EXPAND);
    ~ExpansionController();

    ExpansionController(const ExpansionController&)            = delete;
    ExpansionController& operator=(const ExpansionController&) = delete;

    // No-op when already expanded or expanding.
    void expand();
    // No-op when already collapsed or collapsing.
    void collapse();
    void toggle();

    // Jump without animation. Phase callbacks still fire for the new state.
    void jump_to(float progress);

    void update(float dt);

    float          progress() const { return timeline_.value(); }
    bool           is_expanded() const { return timeline_.value() > 0.5f; }
    bool           is_fully_expanded() const { return timeline_.value() >= 1.0f; }
    bool           is_fully_collapsed() const { return timeline_.value() <= 0.0f; }
    bool           is_animating() const { return timeline_.is_animating(); }
    TimelineStatus status() const { return timeline_.status(); }

    ExpansionGeometry geometry(const ScreenMetrics& screen) const;

    void set_on_expand_start(Callback cb) { on_expand_start_ = std::move(cb); }
    void set_on_expanded(Callback cb) { on_expanded_ = std::move(cb); }
    void set_on_collapse_start(Callback cb) { on_collapse_start_ = std::move(cb); }
    void set_on_collapsed(Callback cb) { on_collapsed_ = std::move(cb); }

   private:
    void on_status(TimelineStatus status);

    Timeline             timeline_;
    Timeline::ListenerId listener_ = 0;

    Callback on_expand_start_;
    Callback on_expanded_;
    Callback on_collapse_start_;
    Callback on_collapsed_;
};

}   // namespace aria
