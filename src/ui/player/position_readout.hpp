#pragma once

#include <aria/playback.hpp>
#include <optional>
#include <string>

namespace aria
{

// Playback position shown by the player. Follows the server-reported
// position, extrapolated on the frame clock while playing. A seek shows the
// requested position at once and keeps showing it until the command
// resolves; a failed seek is not rolled back.
class PositionReadout
{
   public:
    PositionReadout() = default;

    // Feed the latest upstream snapshot. A changed target, track or
    // server position rebases the extrapolation at `now`.
    void sync(const std::optional<PlaybackTarget>& target, const std::optional<Track>& track, float now);

    void begin_seek(float seconds);
    void update_seek(float seconds);

    // Ends the drag and returns the whole second to send to the server.
    // The preview stays until seek_resolved().
    int  commit_seek(float seconds, float now);
    void seek_resolved();

    bool is_seeking() const { return preview_.has_value(); }

    // Live position at `now`, clamped to [0, duration].
    float position(float now) const;

    // Position captured by the last sample(); what the expanded view shows.
    void  sample(float now) { displayed_ = position(now); }
    float displayed() const { return preview_ ? clamp(*preview_) : displayed_; }

    std::optional<float> duration() const { return duration_; }
    float                fraction(float now) const;

    // "m:ss"
    static std::string format(float seconds);

   private:
    float clamp(float seconds) const;

    std::string          target_id_;
    std::string          track_id_;
    std::optional<float> duration_;
    bool                 playing_    = false;
    float                server_pos_ = -1.0f;
    float                base_pos_   = 0.0f;
    float                base_time_  = 0.0f;
    float                displayed_  = 0.0f;
    std::optional<float> preview_;
};

}   // namespace aria
