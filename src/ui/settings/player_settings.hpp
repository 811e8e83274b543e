#pragma once

#include <aria/playback.hpp>
#include <functional>
#include <string>

namespace aria
{

// Persistent player preferences: hint and onboarding flags plus theme
// choices, saved as JSON. Implements PreferenceStore so the hint controller
// reads and writes through it.
//
// When a path is attached, every persisted change is written back to it
// immediately.
class PlayerSettings : public PreferenceStore
{
   public:
    PlayerSettings() = default;
    explicit PlayerSettings(std::string path) : path_(std::move(path)) {}
    ~PlayerSettings() override = default;

    PlayerSettings(const PlayerSettings&)            = delete;
    PlayerSettings& operator=(const PlayerSettings&) = delete;

    bool show_hints() const { return show_hints_; }
    void set_show_hints(bool v);

    bool onboarding_completed() const { return onboarding_completed_; }
    void set_onboarding_completed(bool v);

    bool adaptive_theme() const { return adaptive_theme_; }
    void set_adaptive_theme(bool v);

    bool dark_mode() const { return dark_mode_; }
    void set_dark_mode(bool v);

    // Restore every preference to its default.
    void reset_all();

    // PreferenceStore
    bool read_onboarding_completed() const override { return onboarding_completed_; }
    void persist_onboarding_completed(bool value) override { set_onboarding_completed(value); }
    bool read_hints_enabled() const override { return show_hints_; }
    void persist_hints_enabled(bool value) override { set_show_hints(value); }

    // Save to a JSON file. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success; on failure the
    // current values are left untouched.
    bool load(const std::string& path);

    // Attach a file for write-through and load it if it exists.
    bool attach(const std::string& path);
    const std::string& path() const { return path_; }

    // $XDG_CONFIG_HOME/aria/player.json, else ~/.config/aria/player.json.
    static std::string default_path();

    std::string serialize() const;
    bool        deserialize(const std::string& json);

    using ChangeCallback = std::function<void()>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    void notify_change();

    bool show_hints_           = true;
    bool onboarding_completed_ = false;
    bool adaptive_theme_       = true;
    bool dark_mode_            = true;

    std::string    path_;
    ChangeCallback on_change_;
};

}   // namespace aria
