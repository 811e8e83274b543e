#include "player_settings.hpp"

#include <aria/logger.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace aria
{

// ─── Setters ────────────────────────────────────────────────────────────────

void PlayerSettings::set_show_hints(bool v)
{
    if (show_hints_ == v)
        return;
    show_hints_ = v;
    notify_change();
}

void PlayerSettings::set_onboarding_completed(bool v)
{
    if (onboarding_completed_ == v)
        return;
    onboarding_completed_ = v;
    notify_change();
}

void PlayerSettings::set_adaptive_theme(bool v)
{
    if (adaptive_theme_ == v)
        return;
    adaptive_theme_ = v;
    notify_change();
}

void PlayerSettings::set_dark_mode(bool v)
{
    if (dark_mode_ == v)
        return;
    dark_mode_ = v;
    notify_change();
}

void PlayerSettings::reset_all()
{
    show_hints_           = true;
    onboarding_completed_ = false;
    adaptive_theme_       = true;
    dark_mode_            = true;
    notify_change();
}

// ─── JSON serialization ─────────────────────────────────────────────────────

std::string PlayerSettings::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": 1,\n";
    os << "  \"show_hints\": " << (show_hints_ ? "true" : "false") << ",\n";
    os << "  \"onboarding_completed\": " << (onboarding_completed_ ? "true" : "false") << ",\n";
    os << "  \"adaptive_theme\": " << (adaptive_theme_ ? "true" : "false") << ",\n";
    os << "  \"dark_mode\": " << (dark_mode_ ? "true" : "false") << "\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for our flat format
static bool read_json_bool(const std::string& json, const std::string& key, bool def)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return def;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return def;
    auto   rest  = json.substr(pos + 1, 10);
    size_t start = rest.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return def;
    if (rest.substr(start, 4) == "true")
        return true;
    if (rest.substr(start, 5) == "false")
        return false;
    return def;
}

bool PlayerSettings::deserialize(const std::string& json)
{
    if (json.empty() || json.find('{') == std::string::npos)
        return false;

    // Check version
    std::string search = "\"version\"";
    auto        vpos   = json.find(search);
    if (vpos != std::string::npos)
    {
        auto cpos = json.find(':', vpos + search.size());
        if (cpos != std::string::npos)
        {
            int ver = std::atoi(json.c_str() + cpos + 1);
            if (ver > 1)
            {
                ARIA_LOG_WARN("settings", "Ignoring settings with future version {}", ver);
                return false;
            }
        }
    }

    show_hints_           = read_json_bool(json, "show_hints", show_hints_);
    onboarding_completed_ = read_json_bool(json, "onboarding_completed", onboarding_completed_);
    adaptive_theme_       = read_json_bool(json, "adaptive_theme", adaptive_theme_);
    dark_mode_            = read_json_bool(json, "dark_mode", dark_mode_);
    return true;
}

// ─── File I/O ───────────────────────────────────────────────────────────────

bool PlayerSettings::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            ARIA_LOG_WARN("settings", "Cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        ARIA_LOG_WARN("settings", "Cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool PlayerSettings::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

bool PlayerSettings::attach(const std::string& path)
{
    path_ = path;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    bool ok = load(path);
    if (ok)
        ARIA_LOG_INFO("settings", "Loaded player settings from {}", path);
    return ok;
}

std::string PlayerSettings::default_path()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return (std::filesystem::path(xdg) / "aria" / "player.json").string();

    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "player.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "aria";
    return (dir / "player.json").string();
}

void PlayerSettings::notify_change()
{
    if (!path_.empty() && !save(path_))
        ARIA_LOG_WARN("settings", "Failed to persist settings to {}", path_);
    if (on_change_)
        on_change_();
}

}   // namespace aria
