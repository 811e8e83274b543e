#pragma once

#ifdef ARIA_USE_IMGUI

    #include <aria/player_frame.hpp>

struct ImDrawList;
struct ImFont;

namespace aria
{

class PlayerOverlay;

// Draws a PlayerFrame with ImGui draw lists and feeds ImGui mouse input
// back into the overlay. Holds no player state of its own beyond the
// in-progress pointer gesture.
class PlayerPainter
{
   public:
    PlayerPainter() = default;

    void set_fonts(ImFont* body, ImFont* heading);

    // Paint into the given list, or the background list when null.
    void paint(const PlayerFrame& frame, ImDrawList* dl = nullptr) const;

    // Translate this frame's mouse state into taps and drags.
    void route_input(PlayerOverlay& overlay);

   private:
    void paint_mini(ImDrawList* dl, const PlayerFrame& f, const MiniContent& c, float x) const;
    void paint_expanded(ImDrawList* dl, const PlayerFrame& f) const;
    void paint_queue(ImDrawList* dl, const PlayerFrame& f) const;
    void paint_welcome(ImDrawList* dl, const PlayerFrame& f) const;
    void paint_selector(ImDrawList* dl, const PlayerFrame& f) const;

    enum class Gesture
    {
        None,
        Pending,
        Horizontal,
        Vertical,
    };

    ImFont* font_body_    = nullptr;
    ImFont* font_heading_ = nullptr;

    Gesture gesture_   = Gesture::None;
    float   press_x_   = 0.0f;
    float   press_y_   = 0.0f;
    float   last_x_    = 0.0f;
    float   last_y_    = 0.0f;
    float   velocity_  = 0.0f;
};

}   // namespace aria

#endif   // ARIA_USE_IMGUI
