#pragma once

#include <aria/playback.hpp>
#include <aria/player_frame.hpp>
#include <optional>
#include <string>

namespace aria
{

struct MiniContentOptions
{
    bool                 hints_enabled     = true;
    size_t               available_targets = 0;
    std::string          swipe_hint;
    std::optional<float> position_sec;   // for the progress fraction
};

// Mini player content for a target and whatever it is playing (if known).
// A target without a track shows its name and a device glyph; the swipe
// hint is added only when there is somewhere to swipe to.
MiniContent build_mini_content(const PlaybackTarget&       target,
                               const std::optional<Track>& track,
                               const ArtworkService*       artwork,
                               const MiniContentOptions&   options);

}   // namespace aria
