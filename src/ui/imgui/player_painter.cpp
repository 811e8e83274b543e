#ifdef ARIA_USE_IMGUI

    #include "player_painter.hpp"

    #include <algorithm>
    #include <aria/player_overlay.hpp>
    #include <cmath>
    #include <imgui.h>

    #include "ui/theme/design_tokens.hpp"

namespace aria
{

namespace tokens = ui::tokens;

namespace
{

// Pointer travel before a press becomes a drag
constexpr float DRAG_SLOP = 8.0f;

ImU32 to_u32(const Color& c, float alpha = 1.0f)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, c.a * alpha));
}

const char* glyph_label(DeviceGlyph glyph)
{
    switch (glyph)
    {
        case DeviceGlyph::Phone:
            return "[P]";
        case DeviceGlyph::Group:
            return "[G]";
        case DeviceGlyph::Tv:
            return "[T]";
        case DeviceGlyph::Cast:
            return "[C]";
        case DeviceGlyph::Speaker:
            break;
    }
    return "[S]";
}

void text(ImDrawList* dl, ImFont* font, float size, ImVec2 pos, ImU32 col, const std::string& s)
{
    if (s.empty())
        return;
    dl->AddText(font ? font : ImGui::GetFont(), size, pos, col, s.c_str());
}

}   // namespace

void PlayerPainter::set_fonts(ImFont* body, ImFont* heading)
{
    font_body_    = body;
    font_heading_ = heading;
}

// ─── Painting ───────────────────────────────────────────────────────────────

void PlayerPainter::paint(const PlayerFrame& f, ImDrawList* dl) const
{
    if (!dl)
        dl = ImGui::GetBackgroundDrawList();
    if (!f.visible)
        return;

    const auto& g = f.geometry;
    const Rect& s = g.surface;

    // Shadow, then the surface itself
    if (g.elevation > 0.0f)
    {
        dl->AddRectFilled(ImVec2(s.x, s.y + g.elevation),
                          ImVec2(s.right(), s.bottom() + g.elevation),
                          IM_COL32(0, 0, 0, 40),
                          g.corner_radius);
    }
    dl->AddRectFilled(ImVec2(s.x, s.y), ImVec2(s.right(), s.bottom()), to_u32(f.colors.background), g.corner_radius);

    dl->PushClipRect(ImVec2(s.x, s.y), ImVec2(s.right(), s.bottom()), true);
    if (f.expansion < tokens::FADE_LATE_START)
    {
        paint_mini(dl, f, f.current, f.current_x);
        if (f.peek.visible)
            paint_mini(dl, f, f.peek.content, f.peek.x);
    }
    else
    {
        paint_expanded(dl, f);
        paint_queue(dl, f);
    }
    dl->PopClipRect();

    if (f.selector.visible)
        paint_selector(dl, f);
    if (f.welcome.visible)
        paint_welcome(dl, f);

    if (f.notification)
    {
        ImVec2 size = ImGui::CalcTextSize(f.notification->c_str());
        float  x    = s.x + (s.w - size.x) * 0.5f;
        float  y    = s.y - size.y - tokens::SPACE_5;
        dl->AddRectFilled(ImVec2(x - tokens::SPACE_3, y - tokens::SPACE_2),
                          ImVec2(x + size.x + tokens::SPACE_3, y + size.y + tokens::SPACE_2),
                          IM_COL32(48, 48, 48, 230),
                          tokens::RADIUS_LG);
        text(dl, font_body_, tokens::FONT_BASE, ImVec2(x, y), IM_COL32_WHITE, *f.notification);
    }
}

void PlayerPainter::paint_mini(ImDrawList* dl, const PlayerFrame& f, const MiniContent& c, float x) const
{
    const auto& g   = f.geometry;
    const float top = g.surface.y;
    const ImU32 fg  = to_u32(f.colors.text);

    // Artwork placeholder with the device glyph
    Rect art = g.artwork;
    dl->AddRectFilled(ImVec2(x + art.x, top + art.y),
                      ImVec2(x + art.x + art.w, top + art.y + art.h),
                      to_u32(f.colors.primary, 0.15f),
                      g.artwork_corner);
    if (!c.has_track)
    {
        text(dl,
             font_body_,
             g.glyph_size * 0.5f,
             ImVec2(x + art.x + art.w * 0.3f, top + art.y + art.h * 0.35f),
             fg,
             glyph_label(c.glyph));
    }

    text(dl, font_heading_, g.title_font, ImVec2(x + g.title_left, top + g.title_top), fg, c.primary);
    if (c.secondary)
    {
        text(dl,
             font_body_,
             g.artist_font,
             ImVec2(x + g.title_left, top + g.artist_top),
             to_u32(f.colors.text, g.secondary_alpha),
             *c.secondary);
    }
    if (c.tertiary)
    {
        text(dl,
             font_body_,
             tokens::FONT_BASE * 0.85f,
             ImVec2(x + g.title_left, top + g.tertiary_top),
             to_u32(f.colors.text, g.collapsed_name_opacity * tokens::OPACITY_MID),
             *c.tertiary);
    }

    if (c.has_track && c.progress > 0.0f)
    {
        float bar_y = top + g.surface.h - tokens::MINI_PROGRESS_HEIGHT;
        dl->AddRectFilled(ImVec2(x, bar_y),
                          ImVec2(x + g.surface.w * c.progress, bar_y + tokens::MINI_PROGRESS_HEIGHT),
                          to_u32(f.colors.primary));
    }

    // Transport row
    float row_w = 2.0f * g.skip_size + g.play_container + 2.0f * g.control_spacing;
    float cx    = x + g.controls_center_x - row_w * 0.5f + g.skip_size + g.control_spacing
               + g.play_container * 0.5f;
    float cy = top + g.controls_top + g.play_container * 0.5f;
    dl->AddCircle(ImVec2(cx, cy), g.play_size * 0.5f, fg, 0, 1.5f);
    if (c.is_playing)
    {
        float w = g.play_size * 0.12f;
        dl->AddRectFilled(ImVec2(cx - 2.5f * w, cy - 3.0f * w), ImVec2(cx - w, cy + 3.0f * w), fg);
        dl->AddRectFilled(ImVec2(cx + w, cy - 3.0f * w), ImVec2(cx + 2.5f * w, cy + 3.0f * w), fg);
    }
    else
    {
        float r = g.play_size * 0.25f;
        dl->AddTriangleFilled(ImVec2(cx - r * 0.6f, cy - r), ImVec2(cx - r * 0.6f, cy + r), ImVec2(cx + r, cy), fg);
    }
}

void PlayerPainter::paint_expanded(ImDrawList* dl, const PlayerFrame& f) const
{
    const auto& g     = f.geometry;
    const auto& d     = f.details;
    const Rect& s     = g.surface;
    const float alpha = g.expanded_opacity;
    const ImU32 fg    = to_u32(f.colors.text, alpha);

    text(dl,
         font_body_,
         tokens::FONT_BASE,
         ImVec2(s.x + tokens::SPACE_12 + tokens::SPACE_2, s.y + tokens::SPACE_3),
         to_u32(f.colors.text, g.header_opacity),
         d.target_name);

    dl->AddRectFilled(ImVec2(s.x + g.artwork.x, s.y + g.artwork.y),
                      ImVec2(s.x + g.artwork.right(), s.y + g.artwork.bottom()),
                      to_u32(f.colors.primary, 0.15f),
                      g.artwork_corner);

    if (d.track)
    {
        text(dl, font_heading_, g.title_font, ImVec2(s.x + g.title_left, s.y + g.title_top), fg, d.track->title);
        text(dl,
             font_body_,
             g.artist_font,
             ImVec2(s.x + g.title_left, s.y + g.artist_top),
             to_u32(f.colors.text, g.secondary_alpha * alpha),
             d.track->artist);
        if (d.track->album)
        {
            text(dl,
                 font_body_,
                 tokens::FONT_BASE,
                 ImVec2(s.x + g.title_left, s.y + g.album_top),
                 to_u32(f.colors.text, g.album_opacity * tokens::OPACITY_MID),
                 *d.track->album);
        }
    }

    // Seek bar
    float pad   = g.content_padding;
    float bar_w = s.w - 2.0f * pad;
    float frac  = (d.duration_sec && *d.duration_sec > 0.0f)
                      ? std::clamp(d.position_sec / *d.duration_sec, 0.0f, 1.0f)
                      : 0.0f;
    float bar_y = s.y + g.progress_top + 10.0f;
    dl->AddRectFilled(ImVec2(s.x + pad, bar_y),
                      ImVec2(s.x + pad + bar_w, bar_y + 4.0f),
                      to_u32(f.colors.text, 0.2f * alpha),
                      2.0f);
    dl->AddRectFilled(ImVec2(s.x + pad, bar_y),
                      ImVec2(s.x + pad + bar_w * frac, bar_y + 4.0f),
                      to_u32(f.colors.primary, alpha),
                      2.0f);
    text(dl, font_body_, 12.0f, ImVec2(s.x + pad, bar_y + 10.0f), fg, d.position_text);
    ImVec2 dur = ImGui::CalcTextSize(d.duration_text.c_str());
    text(dl, font_body_, 12.0f, ImVec2(s.x + pad + bar_w - dur.x, bar_y + 10.0f), fg, d.duration_text);

    // Volume
    float vol_x = s.x + 48.0f;
    float vol_w = s.w - 96.0f;
    float vol_y = s.y + g.volume_top + 14.0f;
    dl->AddRectFilled(ImVec2(vol_x, vol_y), ImVec2(vol_x + vol_w, vol_y + 4.0f), to_u32(f.colors.text, 0.2f * alpha), 2.0f);
    dl->AddRectFilled(ImVec2(vol_x, vol_y),
                      ImVec2(vol_x + vol_w * static_cast<float>(d.volume) / 100.0f, vol_y + 4.0f),
                      fg,
                      2.0f);
}

void PlayerPainter::paint_queue(ImDrawList* dl, const PlayerFrame& f) const
{
    if (!f.queue.visible)
        return;

    const Rect& s  = f.geometry.surface;
    float       x0 = s.x + f.queue.x;
    dl->AddRectFilled(ImVec2(x0, s.y), ImVec2(s.right(), s.bottom()), to_u32(f.colors.background, f.queue.opacity));

    if (!f.queue.queue || f.queue.queue->items.empty())
    {
        text(dl,
             font_body_,
             tokens::FONT_BASE,
             ImVec2(x0 + tokens::SPACE_4, s.y + tokens::SPACE_12 + tokens::SPACE_4),
             to_u32(f.colors.text, tokens::OPACITY_SECONDARY * f.queue.opacity),
             "Queue is empty");
        return;
    }

    const auto& q   = *f.queue.queue;
    float       y   = s.y + tokens::SPACE_12 + tokens::SPACE_4;
    const float row = 48.0f;
    for (size_t i = 0; i < q.items.size() && y < s.bottom(); ++i, y += row)
    {
        bool  current = q.current_index && *q.current_index == i;
        ImU32 col     = current ? to_u32(f.colors.primary, f.queue.opacity)
                                : to_u32(f.colors.text, f.queue.opacity);
        text(dl, font_body_, tokens::FONT_LG, ImVec2(x0 + tokens::SPACE_4, y), col, q.items[i].track.title);
        text(dl,
             font_body_,
             tokens::FONT_BASE,
             ImVec2(x0 + tokens::SPACE_4, y + 20.0f),
             to_u32(f.colors.text, tokens::OPACITY_SECONDARY * f.queue.opacity),
             q.items[i].track.artist);
    }
}

void PlayerPainter::paint_welcome(ImDrawList* dl, const PlayerFrame& f) const
{
    const auto& w  = f.welcome;
    ImVec2      sz = ImGui::GetIO().DisplaySize;
    dl->AddRectFilled(ImVec2(0, 0), sz, to_u32(w.backdrop, w.backdrop_opacity));

    ImU32 fg = IM_COL32(255, 255, 255, static_cast<int>(255.0f * w.content_opacity));
    float cy = sz.y * 0.35f;
    ImVec2 title = ImGui::CalcTextSize(w.title.c_str());
    text(dl, font_heading_, tokens::FONT_2XL, ImVec2((sz.x - title.x) * 0.5f, cy), fg, w.title);
    ImVec2 body = ImGui::CalcTextSize(w.body.c_str());
    text(dl, font_body_, tokens::FONT_LG, ImVec2((sz.x - body.x) * 0.5f, cy + 40.0f), fg, w.body);

    for (const auto& r : f.regions)
    {
        if (r.action != GestureAction::SkipHint)
            continue;
        dl->AddRect(ImVec2(r.rect.x, r.rect.y), ImVec2(r.rect.right(), r.rect.bottom()), fg, tokens::RADIUS_XL);
        ImVec2 label = ImGui::CalcTextSize(w.skip_label.c_str());
        text(dl,
             font_body_,
             tokens::FONT_BASE,
             ImVec2(r.rect.x + (r.rect.w - label.x) * 0.5f, r.rect.y + (r.rect.h - label.y) * 0.5f),
             fg,
             w.skip_label);
    }
}

void PlayerPainter::paint_selector(ImDrawList* dl, const PlayerFrame& f) const
{
    ImVec2      sz     = ImGui::GetIO().DisplaySize;
    const float reveal = f.selector.reveal;
    dl->AddRectFilled(ImVec2(0, 0), sz, IM_COL32(0, 0, 0, static_cast<int>(140.0f * reveal)));

    // Slides up from below the screen edge, follows a downward pull
    const float row    = 52.0f;
    const float height = row * static_cast<float>(f.selector.targets.size()) + tokens::SPACE_4 * 2.0f;
    float       y      = sz.y - height * reveal + f.selector.drag_offset;
    dl->AddRectFilled(ImVec2(0, y), ImVec2(sz.x, sz.y), to_u32(f.colors.expanded_background), tokens::RADIUS_XL);

    y += tokens::SPACE_4;
    for (const auto& target : f.selector.targets)
    {
        bool  selected = target.id == f.selector.selected_id;
        ImU32 col      = selected ? to_u32(f.colors.primary) : IM_COL32_WHITE;
        text(dl, font_body_, tokens::FONT_BASE, ImVec2(tokens::SPACE_4, y + 16.0f), col, glyph_label(device_glyph_for(target.name)));
        text(dl, font_body_, tokens::FONT_LG, ImVec2(tokens::SPACE_12, y + 14.0f), col, target.name);
        y += row;
    }
}

// ─── Input ──────────────────────────────────────────────────────────────────

void PlayerPainter::route_input(PlayerOverlay& overlay)
{
    const ImGuiIO& io = ImGui::GetIO();
    const float    mx = io.MousePos.x;
    const float    my = io.MousePos.y;

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Left))
    {
        gesture_  = Gesture::Pending;
        press_x_  = last_x_ = mx;
        press_y_  = last_y_ = my;
        velocity_ = 0.0f;
        return;
    }

    if (gesture_ == Gesture::None)
        return;

    if (ImGui::IsMouseDown(ImGuiMouseButton_Left))
    {
        float dx = mx - last_x_;
        float dy = my - last_y_;
        if (gesture_ == Gesture::Pending)
        {
            float tx = mx - press_x_;
            float ty = my - press_y_;
            if (std::abs(tx) > DRAG_SLOP && std::abs(tx) >= std::abs(ty))
            {
                gesture_ = Gesture::Horizontal;
                overlay.horizontal_drag_start(press_x_, press_y_);
                dx = tx;
            }
            else if (std::abs(ty) > DRAG_SLOP)
            {
                gesture_ = Gesture::Vertical;
                dy       = ty;
            }
        }

        if (gesture_ == Gesture::Horizontal && dx != 0.0f)
            overlay.horizontal_drag_update(dx);
        else if (gesture_ == Gesture::Vertical && dy != 0.0f)
        {
            if (overlay.is_target_selector_visible())
                overlay.selector_drag(dy);
            else
                overlay.vertical_drag(dy);
        }

        if (io.DeltaTime > 0.0f)
            velocity_ = (gesture_ == Gesture::Vertical ? dy : dx) / io.DeltaTime;
        last_x_ = mx;
        last_y_ = my;
        return;
    }

    // Released
    if (gesture_ == Gesture::Pending)
        overlay.tap(press_x_, press_y_);
    else if (gesture_ == Gesture::Horizontal)
        overlay.horizontal_drag_end(velocity_);
    else if (gesture_ == Gesture::Vertical && overlay.is_target_selector_visible())
        overlay.selector_drag_end(velocity_);
    gesture_ = Gesture::None;
}

}   // namespace aria

#endif   // ARIA_USE_IMGUI
