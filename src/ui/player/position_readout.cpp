#include "position_readout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace aria
{

void PositionReadout::sync(const std::optional<PlaybackTarget>& target,
                           const std::optional<Track>&          track,
                           float                                now)
{
    std::string target_id = target ? target->id : std::string();
    std::string track_id  = track ? track->id : std::string();
    float       reported  = target ? target->elapsed_sec : 0.0f;
    bool        playing   = target && target->is_playing();

    bool rebase = target_id != target_id_ || track_id != track_id_ || reported != server_pos_;
    if (rebase)
    {
        base_pos_   = reported;
        base_time_  = now;
        server_pos_ = reported;
    }
    else if (playing != playing_)
    {
        // Keep the extrapolated position continuous across play/pause
        base_pos_  = position(now);
        base_time_ = now;
    }

    target_id_ = std::move(target_id);
    track_id_  = std::move(track_id);
    duration_  = track ? track->duration_sec : std::nullopt;
    playing_   = playing;

    if (rebase)
        displayed_ = position(now);
}

void PositionReadout::begin_seek(float seconds)
{
    preview_ = seconds;
}

void PositionReadout::update_seek(float seconds)
{
    preview_ = seconds;
}

int PositionReadout::commit_seek(float seconds, float now)
{
    preview_ = seconds;

    // Optimistic: continue from the requested position until the server
    // reports a new one
    base_pos_  = clamp(seconds);
    base_time_ = now;
    displayed_ = base_pos_;
    return static_cast<int>(std::lround(seconds));
}

void PositionReadout::seek_resolved()
{
    preview_.reset();
}

float PositionReadout::position(float now) const
{
    if (preview_)
        return clamp(*preview_);
    float pos = base_pos_;
    if (playing_)
        pos += std::max(now - base_time_, 0.0f);
    return clamp(pos);
}

float PositionReadout::fraction(float now) const
{
    if (!duration_ || *duration_ <= 0.0f)
        return 0.0f;
    return std::clamp(position(now) / *duration_, 0.0f, 1.0f);
}

float PositionReadout::clamp(float seconds) const
{
    float hi = duration_ && *duration_ > 0.0f ? *duration_ : std::max(seconds, 0.0f);
    return std::clamp(seconds, 0.0f, hi);
}

std::string PositionReadout::format(float seconds)
{
    int total = static_cast<int>(std::max(seconds, 0.0f));
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%d:%02d", total / 60, total % 60);
    return buf;
}

}   // namespace aria
