#include "adaptive_palette.hpp"

#include <algorithm>
#include <aria/logger.hpp>
#include <exception>

namespace aria
{

// ─── NavColorMemo ───────────────────────────────────────────────────────────

Color NavColorMemo::adjust_for_contrast(const Color& source, bool dark)
{
    if (dark && source.luminance() < 0.2f)
    {
        auto hsl = source.to_hsl();
        return Color::from_hsl(hsl.h, hsl.s, std::clamp(hsl.l + 0.3f, 0.0f, 0.8f), source.a);
    }
    if (!dark && source.luminance() > 0.8f)
    {
        auto hsl = source.to_hsl();
        return Color::from_hsl(hsl.h, hsl.s, std::clamp(hsl.l - 0.3f, 0.2f, 1.0f), source.a);
    }
    return source;
}

Color NavColorMemo::adjusted(const Color& source, bool dark)
{
    if (source_ && *source_ == source && dark_ == dark)
        return adjusted_;

    adjusted_ = adjust_for_contrast(source, dark);
    source_   = source;
    dark_     = dark;
    return adjusted_;
}

// ─── AdaptivePalette ────────────────────────────────────────────────────────

AdaptivePalette::AdaptivePalette(ArtworkService* artwork, ColorScheme dark_scheme, ColorScheme light_scheme)
    : artwork_(artwork),
      dark_scheme_(dark_scheme),
      light_scheme_(light_scheme),
      self_(std::make_shared<AdaptivePalette*>(this))
{
}

void AdaptivePalette::request(const std::string& url)
{
    if (!artwork_ || url.empty())
        return;
    if (url_ && *url_ == url)
        return;
    url_ = url;

    std::weak_ptr<AdaptivePalette*> weak = self_;
    try
    {
        artwork_->extract_adaptive_colors(
            url,
            [weak, url](std::optional<AdaptiveSchemes> result)
            {
                auto self = weak.lock();
                if (!self)
                    return;
                AdaptivePalette* palette = *self;
                if (!palette->url_ || *palette->url_ != url)
                {
                    ARIA_LOG_DEBUG("palette", "Dropping stale colors for {}", url);
                    return;
                }
                if (!result)
                {
                    ARIA_LOG_WARN("palette", "Color extraction failed for {}", url);
                    return;
                }
                palette->schemes_ = std::move(result);
            });
    }
    catch (const std::exception& e)
    {
        ARIA_LOG_WARN("palette", "Color extraction failed for {}: {}", url, e.what());
    }
}

std::optional<ColorScheme> AdaptivePalette::adaptive_scheme() const
{
    if (!adaptive_enabled_ || !schemes_)
        return std::nullopt;
    return dark_ ? schemes_->dark : schemes_->light;
}

PlayerColors AdaptivePalette::resolve(float t)
{
    t = std::clamp(t, 0.0f, 1.0f);

    const ColorScheme&         base     = default_scheme();
    std::optional<ColorScheme> adaptive = adaptive_scheme();

    PlayerColors c;
    c.collapsed_background = adaptive ? adaptive->primary_container : base.primary_container;
    c.expanded_background  = adaptive ? adaptive->surface : colors::player_dark_surface;

    // Only adaptive colors replace the cached value; the fallback seeds it once
    if (adaptive || !cached_expanded_bg_)
        cached_expanded_bg_ = c.expanded_background;

    Color collapsed_text = adaptive ? adaptive->on_primary_container : base.on_primary_container;
    Color expanded_text  = adaptive ? adaptive->on_surface : colors::white;

    c.background = c.collapsed_background.lerp(c.expanded_background, t);
    c.text       = collapsed_text.lerp(expanded_text, t);
    c.primary    = adaptive ? adaptive->primary : colors::white;
    return c;
}

NavBarTint AdaptivePalette::nav_tint(float progress,
                                     std::optional<Color> player_bg,
                                     std::optional<Color> player_primary)
{
    progress = std::clamp(progress, 0.0f, 1.0f);

    const ColorScheme&         base         = default_scheme();
    std::optional<ColorScheme> adaptive     = adaptive_scheme();
    bool                       use_adaptive = adaptive_enabled_ && progress > 0.0f;

    NavBarTint tint;
    if (progress > 0.0f && player_bg)
        tint.background = base.surface.lerp(*player_bg, progress);
    else
        tint.background = base.surface;

    Color source = (use_adaptive && adaptive) ? adaptive->primary : base.primary;
    if (adaptive_enabled_ && progress > 0.0f && player_primary)
        source = source.lerp(*player_primary, progress);

    tint.selected     = nav_memo_.adjusted(source, dark_);
    tint.unselected   = base.on_surface.with_alpha(0.54f);
    tint.shadow_alpha = progress < 0.5f ? 0.1f : 0.0f;
    return tint;
}

}   // namespace aria
