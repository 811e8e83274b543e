#include "mini_content.hpp"

#include <algorithm>
#include <aria/logger.hpp>
#include <cctype>
#include <exception>
#include <initializer_list>

#include "ui/theme/design_tokens.hpp"

namespace aria
{

namespace
{

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(const std::string& haystack, std::initializer_list<std::string_view> needles)
{
    for (auto n : needles)
    {
        if (haystack.find(n) != std::string::npos)
            return true;
    }
    return false;
}

}   // namespace

DeviceGlyph device_glyph_for(std::string_view target_name)
{
    std::string name = to_lower(target_name);
    if (contains_any(name, {"phone", "ensemble", "mobile"}))
        return DeviceGlyph::Phone;
    if (contains_any(name, {"group", "sync", "all"}))
        return DeviceGlyph::Group;
    if (contains_any(name, {"tv", "television"}))
        return DeviceGlyph::Tv;
    if (contains_any(name, {"cast", "chromecast"}))
        return DeviceGlyph::Cast;
    return DeviceGlyph::Speaker;
}

const char* device_glyph_name(DeviceGlyph glyph)
{
    switch (glyph)
    {
        case DeviceGlyph::Speaker:
            return "speaker";
        case DeviceGlyph::Phone:
            return "phone";
        case DeviceGlyph::Group:
            return "group";
        case DeviceGlyph::Tv:
            return "tv";
        case DeviceGlyph::Cast:
            return "cast";
    }
    return "speaker";
}

MiniContent build_mini_content(const PlaybackTarget&       target,
                               const std::optional<Track>& track,
                               const ArtworkService*       artwork,
                               const MiniContentOptions&   options)
{
    MiniContent c;
    c.target_id   = target.id;
    c.target_name = target.name;
    c.glyph       = device_glyph_for(target.name);
    c.is_playing  = target.is_playing();

    if (!track)
    {
        c.primary = target.name;
        if (options.hints_enabled && options.available_targets > 1)
        {
            c.secondary         = options.swipe_hint;
            c.secondary_is_hint = true;
        }
        return c;
    }

    c.has_track = true;
    c.primary   = track->title;
    c.secondary = track->artist;
    c.tertiary  = target.name;

    if (artwork)
    {
        try
        {
            c.artwork_url = artwork->artwork_url(*track, ui::tokens::ARTWORK_PX_MINI);
        }
        catch (const std::exception& e)
        {
            ARIA_LOG_WARN("player", "Artwork lookup for '{}' failed: {}", track->id, e.what());
        }
    }

    if (options.position_sec && track->duration_sec && *track->duration_sec > 0.0f)
        c.progress = std::clamp(*options.position_sec / *track->duration_sec, 0.0f, 1.0f);

    return c;
}

}   // namespace aria
