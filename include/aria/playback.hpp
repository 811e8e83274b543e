#pragma once

#include <aria/color.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace aria
{

enum class PlaybackState
{
    Idle,
    Playing,
    Paused,
};

enum class RepeatMode
{
    Off,
    All,
    One,
};

struct Track
{
    std::string                id;
    std::string                title;
    std::string                artist;
    std::optional<std::string> album;
    std::optional<float>       duration_sec;
};

struct PlaybackTarget
{
    std::string                id;
    std::string                name;
    bool                       available = true;
    bool                       powered   = true;
    PlaybackState              state     = PlaybackState::Idle;
    std::optional<std::string> current_item_id;
    float                      elapsed_sec = 0.0f;   // server-reported position
    int                        volume      = 0;      // 0-100

    bool is_playing() const { return state == PlaybackState::Playing; }
};

struct QueueItem
{
    std::string item_id;
    Track       track;
};

struct PlayerQueue
{
    std::string              target_id;
    std::vector<QueueItem>   items;
    std::optional<size_t>    current_index;
    bool                     shuffle = false;
    RepeatMode               repeat  = RepeatMode::Off;
};

struct CommandResult
{
    bool        ok = true;
    std::string error;

    static CommandResult success() { return {}; }
    static CommandResult failure(std::string message) { return {false, std::move(message)}; }
};

using CommandCallback = std::function<void(const CommandResult&)>;

// Read side and command side of the playback server, as seen by the player.
// Reads return snapshots and never block. Commands are fire-and-forget: the
// callback (if given) is invoked once when the server answers, possibly from
// inside the call itself. Implementations may also throw std::exception
// synchronously for requests they reject outright.
class PlaybackSource
{
   public:
    virtual ~PlaybackSource() = default;

    virtual bool                          is_connected() const = 0;
    virtual std::optional<PlaybackTarget> selected_target() const = 0;
    virtual std::optional<Track>          current_track() const = 0;

    // Stable order, e.g. by display name. Unavailable targets may be present.
    virtual std::vector<PlaybackTarget> available_targets() const = 0;

    // Last known track of a target from the local cache. Never a network call.
    virtual std::optional<Track> cached_track_for(const std::string& target_id) const = 0;

    virtual std::optional<PlayerQueue> queue_snapshot() const = 0;

    virtual void select_target(const PlaybackTarget& target, CommandCallback cb = nullptr) = 0;
    virtual void toggle_shuffle(const std::string& queue_id, bool current, CommandCallback cb = nullptr) = 0;
    virtual void cycle_repeat(const std::string& queue_id, RepeatMode current, CommandCallback cb = nullptr) = 0;
    virtual void seek(const std::string& target_id, int seconds, CommandCallback cb = nullptr) = 0;
    virtual void set_volume(const std::string& target_id, int volume, CommandCallback cb = nullptr) = 0;
    virtual void play_pause(const std::string& target_id, CommandCallback cb = nullptr) = 0;
    virtual void stop(const std::string& target_id, CommandCallback cb = nullptr) = 0;
    virtual void skip_next(const std::string& target_id, CommandCallback cb = nullptr) = 0;
    virtual void skip_previous(const std::string& target_id, CommandCallback cb = nullptr) = 0;
    virtual void refresh_queue(const std::string& target_id) = 0;
};

class ArtworkService
{
   public:
    using ColorsCallback = std::function<void(std::optional<AdaptiveSchemes>)>;

    virtual ~ArtworkService() = default;

    virtual std::optional<std::string> artwork_url(const Track& track, int size_px) const = 0;

    // Best-effort and asynchronous. The callback receives nullopt on failure.
    virtual void extract_adaptive_colors(const std::string& url, ColorsCallback cb) = 0;
};

class PreferenceStore
{
   public:
    virtual ~PreferenceStore() = default;

    virtual bool read_onboarding_completed() const        = 0;
    virtual void persist_onboarding_completed(bool value) = 0;
    virtual bool read_hints_enabled() const               = 0;
    virtual void persist_hints_enabled(bool value)        = 0;
};

}   // namespace aria
