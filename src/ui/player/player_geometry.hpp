#pragma once

#include <aria/geometry.hpp>

namespace aria
{

// Player surface layout at expansion progress t (clamped to [0,1]).
// Pure function of t, the screen metrics and the layout tokens.
ExpansionGeometry compute_expansion_geometry(float t, const ScreenMetrics& screen);

// Expanded artwork edge length for a screen width.
float expanded_artwork_size(float screen_width);

// Queue panel left edge in surface coordinates: slides in from the trailing edge.
inline float queue_panel_x(float queue_progress, float surface_width)
{
    return surface_width * (1.0f - queue_progress);
}

}   // namespace aria
