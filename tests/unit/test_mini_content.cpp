#include <gtest/gtest.h>
#include <stdexcept>

#include "../util/fake_playback.hpp"
#include "ui/player/mini_content.hpp"

using namespace aria;
using namespace aria::test;

namespace
{

class ThrowingArtwork : public ArtworkService
{
   public:
    std::optional<std::string> artwork_url(const Track&, int) const override
    {
        throw std::runtime_error("artwork index unavailable");
    }
    void extract_adaptive_colors(const std::string&, ColorsCallback cb) override { cb(std::nullopt); }
};

MiniContentOptions options_with_targets(size_t n)
{
    MiniContentOptions o;
    o.available_targets = n;
    o.swipe_hint        = "Swipe to switch";
    return o;
}

}   // namespace

// ─── Without a track ────────────────────────────────────────────────────────

TEST(MiniContent, TargetWithoutTrackShowsNameAndHint)
{
    auto c = build_mini_content(make_target("a", "Kitchen"), std::nullopt, nullptr, options_with_targets(3));
    EXPECT_FALSE(c.has_track);
    EXPECT_EQ(c.primary, "Kitchen");
    ASSERT_TRUE(c.secondary.has_value());
    EXPECT_EQ(*c.secondary, "Swipe to switch");
    EXPECT_TRUE(c.secondary_is_hint);
    EXPECT_FALSE(c.artwork_url.has_value());
}

TEST(MiniContent, NoHintWithSingleTarget)
{
    auto c = build_mini_content(make_target("a", "Kitchen"), std::nullopt, nullptr, options_with_targets(1));
    EXPECT_FALSE(c.secondary.has_value());
    EXPECT_FALSE(c.secondary_is_hint);
}

TEST(MiniContent, NoHintWhenHintsDisabled)
{
    auto opts          = options_with_targets(4);
    opts.hints_enabled = false;
    auto c             = build_mini_content(make_target("a", "Kitchen"), std::nullopt, nullptr, opts);
    EXPECT_FALSE(c.secondary.has_value());
}

// ─── With a track ───────────────────────────────────────────────────────────

TEST(MiniContent, TrackShowsTitleArtistAndTarget)
{
    FakeArtworkService art;
    auto               opts = options_with_targets(3);
    opts.position_sec       = 50.0f;

    auto c = build_mini_content(make_target("a", "Kitchen"), make_track("t1", "Song", "Band"), &art, opts);
    EXPECT_TRUE(c.has_track);
    EXPECT_EQ(c.primary, "Song");
    EXPECT_EQ(c.secondary.value_or(""), "Band");
    EXPECT_FALSE(c.secondary_is_hint);
    EXPECT_EQ(c.tertiary.value_or(""), "Kitchen");
    EXPECT_EQ(c.artwork_url.value_or(""), "art://t1/128");
    EXPECT_FLOAT_EQ(c.progress, 0.25f);
}

TEST(MiniContent, ProgressClampedToTrackLength)
{
    auto opts         = options_with_targets(1);
    opts.position_sec = 900.0f;
    auto c = build_mini_content(make_target("a", "Kitchen"), make_track("t1", "Song", "Band"), nullptr, opts);
    EXPECT_FLOAT_EQ(c.progress, 1.0f);
}

TEST(MiniContent, UnknownDurationLeavesProgressZero)
{
    Track t           = make_track("t1", "Stream", "Radio");
    t.duration_sec    = std::nullopt;
    auto opts         = options_with_targets(1);
    opts.position_sec = 30.0f;
    auto c            = build_mini_content(make_target("a", "Kitchen"), t, nullptr, opts);
    EXPECT_FLOAT_EQ(c.progress, 0.0f);
}

TEST(MiniContent, ArtworkFailureFallsBackToGlyph)
{
    ThrowingArtwork art;
    MiniContent     c;
    EXPECT_NO_THROW(c = build_mini_content(make_target("a", "Living Room TV"),
                                           make_track("t1", "Song", "Band"),
                                           &art,
                                           options_with_targets(1)));
    EXPECT_FALSE(c.artwork_url.has_value());
    EXPECT_EQ(c.glyph, DeviceGlyph::Tv);
}

TEST(MiniContent, PlayingStateFollowsTarget)
{
    auto t  = make_target("a", "Kitchen");
    t.state = PlaybackState::Playing;
    EXPECT_TRUE(build_mini_content(t, std::nullopt, nullptr, {}).is_playing);
}

// ─── Device glyphs ──────────────────────────────────────────────────────────

TEST(DeviceGlyph, KeywordsPickGlyph)
{
    EXPECT_EQ(device_glyph_for("My Phone"), DeviceGlyph::Phone);
    EXPECT_EQ(device_glyph_for("Ensemble 2"), DeviceGlyph::Phone);
    EXPECT_EQ(device_glyph_for("Upstairs Group"), DeviceGlyph::Group);
    EXPECT_EQ(device_glyph_for("Sync Zone"), DeviceGlyph::Group);
    EXPECT_EQ(device_glyph_for("Bedroom TV"), DeviceGlyph::Tv);
    EXPECT_EQ(device_glyph_for("Chromecast Audio"), DeviceGlyph::Cast);
    EXPECT_EQ(device_glyph_for("Kitchen"), DeviceGlyph::Speaker);
}

TEST(DeviceGlyph, MatchIsCaseInsensitive)
{
    EXPECT_EQ(device_glyph_for("TELEVISION"), DeviceGlyph::Tv);
    EXPECT_STREQ(device_glyph_name(DeviceGlyph::Cast), "cast");
}
