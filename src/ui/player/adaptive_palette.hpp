#pragma once

#include <aria/color.hpp>
#include <aria/playback.hpp>
#include <aria/player_frame.hpp>
#include <memory>
#include <optional>
#include <string>

namespace aria
{

// Caches the last adjusted color; recomputes only when the inputs change.
class NavColorMemo
{
   public:
    Color adjusted(const Color& source, bool dark);

    static Color adjust_for_contrast(const Color& source, bool dark);

   private:
    std::optional<Color> source_;
    bool                 dark_ = false;
    Color                adjusted_;
};

// Resolves the player's colors from the default scheme and, when adaptive
// theming is on, from the light/dark schemes extracted from the current
// artwork. Extraction is requested once per distinct URL; results for a URL
// that is no longer current are dropped.
class AdaptivePalette
{
   public:
    AdaptivePalette(ArtworkService* artwork, ColorScheme dark_scheme, ColorScheme light_scheme);
    ~AdaptivePalette() = default;

    AdaptivePalette(const AdaptivePalette&)            = delete;
    AdaptivePalette& operator=(const AdaptivePalette&) = delete;

    void set_dark_mode(bool dark) { dark_ = dark; }
    bool dark_mode() const { return dark_; }

    void set_adaptive_enabled(bool enabled) { adaptive_enabled_ = enabled; }
    bool adaptive_enabled() const { return adaptive_enabled_; }

    // Ask for the schemes of this artwork URL. No-op for the current URL.
    void request(const std::string& url);

    const std::optional<std::string>& current_url() const { return url_; }
    bool                              has_adaptive() const { return schemes_.has_value(); }

    const ColorScheme&         default_scheme() const { return dark_ ? dark_scheme_ : light_scheme_; }
    std::optional<ColorScheme> adaptive_scheme() const;

    // Blend for progress t. Also updates the cached expanded background.
    PlayerColors resolve(float t);

    std::optional<Color> expanded_background() const { return cached_expanded_bg_; }

    NavBarTint nav_tint(float progress, std::optional<Color> player_bg, std::optional<Color> player_primary);

   private:
    ArtworkService* artwork_;
    ColorScheme     dark_scheme_;
    ColorScheme     light_scheme_;
    bool            dark_             = true;
    bool            adaptive_enabled_ = true;

    std::optional<std::string>     url_;
    std::optional<AdaptiveSchemes> schemes_;
    std::optional<Color>           cached_expanded_bg_;
    NavColorMemo                   nav_memo_;

    // Outstanding extraction callbacks hold a weak reference to this
    std::shared_ptr<AdaptivePalette*> self_;
};

}   // namespace aria
