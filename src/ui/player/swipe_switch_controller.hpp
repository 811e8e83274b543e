#pragma once

#include <aria/playback.hpp>
#include <aria/player_config.hpp>
#include <aria/timeline.hpp>
#include <cstdint>
#include <functional>
#include <optional>

namespace aria
{

enum class SwipePhase
{
    Idle,
    Dragging,
    Committing,
    Settling,
    Cancelling,
};

enum class SwipeDirection
{
    None,
    Next,       // negative offset, content slides in from the right
    Previous,   // positive offset, content slides in from the left
};

struct SwipeState
{
    float                         offset = 0.0f;
    std::optional<PlaybackTarget> peek_target;
    std::optional<Track>          peek_track;
    bool                          is_dragging  = false;
    bool                          is_animating = false;
};

const char* swipe_phase_name(SwipePhase phase);

// Horizontal swipe on the collapsed player that previews the adjacent
// playback target and either commits the switch or springs back.
//
//   Idle -> Dragging -> Committing -> Settling -> Idle
//                    -> Cancelling -> Idle
//
// Offset is in [-1, 1]. Commit runs to +-1 and then holds the peek for a
// counted number of frames so the new target's own content can take over
// without a gap. Only reset() interrupts a resolution.
class SwipeSwitchController
{
   public:
    using CommitCallback   = std::function<void(const PlaybackTarget&)>;
    using ResolvedCallback = std::function<void(bool committed)>;

    explicit SwipeSwitchController(const PlaybackSource& source, SwipeConfig config = {});
    ~SwipeSwitchController() = default;

    SwipeSwitchController(const SwipeSwitchController&)            = delete;
    SwipeSwitchController& operator=(const SwipeSwitchController&) = delete;

    // Returns true when the gesture was accepted. A rejected gesture stays
    // dead until the next drag_start().
    bool drag_start(float x, float screen_width);
    void drag_update(float dx, float container_width);
    void drag_end(float velocity);

    // Advances the resolution animation and the settle countdown.
    void update(float dt);

    // Unmount: stop everything and return to neutral without callbacks.
    void reset();

    float          offset() const { return timeline_.value(); }
    SwipePhase     phase() const { return phase_; }
    SwipeDirection peek_direction() const { return peek_direction_; }
    bool           is_dragging() const { return phase_ == SwipePhase::Dragging; }
    bool           is_animating() const;

    const std::optional<PlaybackTarget>& peek_target() const { return peek_target_; }
    const std::optional<Track>&          peek_track() const { return peek_track_; }
    SwipeState                           state() const;

    // Adjacent available target in the given direction, no wrap-around.
    std::optional<PlaybackTarget> adjacent_target(SwipeDirection dir) const;

    // Fired once the commit animation lands, before settling.
    void set_on_commit(CommitCallback cb) { on_commit_ = std::move(cb); }
    // Fired when the controller returns to Idle after a resolution.
    void set_on_resolved(ResolvedCallback cb) { on_resolved_ = std::move(cb); }

    const SwipeConfig& config() const { return config_; }

   private:
    void refresh_peek(SwipeDirection dir);
    void clear_peek();
    void begin_commit(SwipeDirection dir);
    void begin_cancel();
    void finish_commit();
    void finish(bool committed);

    const PlaybackSource& source_;
    SwipeConfig           config_;
    Timeline              timeline_;

    SwipePhase     phase_          = SwipePhase::Idle;
    SwipeDirection peek_direction_ = SwipeDirection::None;
    uint32_t       settle_frames_  = 0;

    std::optional<PlaybackTarget> peek_target_;
    std::optional<Track>          peek_track_;

    CommitCallback   on_commit_;
    ResolvedCallback on_resolved_;
};

}   // namespace aria
