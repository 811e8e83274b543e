#include <algorithm>
#include <aria/player_overlay.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "../util/fake_playback.hpp"
#include "ui/player/expansion_controller.hpp"
#include "ui/player/hint_controller.hpp"
#include "ui/player/position_readout.hpp"
#include "ui/player/queue_panel_controller.hpp"
#include "ui/player/swipe_switch_controller.hpp"

using namespace aria;
using namespace aria::test;

namespace
{

constexpr float DT = 1.0f / 60.0f;

class PlayerOverlayTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        populate_three_targets(src);
        src.find("a")->state = PlaybackState::Playing;
        prefs.onboarding_completed = true;
        overlay = std::make_unique<PlayerOverlay>(src, &art, &prefs);
    }

    void step(float seconds)
    {
        for (float t = 0.0f; t < seconds; t += DT)
            overlay->tick(DT);
    }

    void expand_fully()
    {
        overlay->expand();
        step(0.4f);
        ASSERT_TRUE(overlay->expansion().is_fully_expanded());
    }

    const GestureRegion* region(GestureAction action) const
    {
        const auto& rs = overlay->frame().regions;
        auto it = std::find_if(rs.rbegin(), rs.rend(), [&](const GestureRegion& r) { return r.action == action; });
        return it == rs.rend() ? nullptr : &*it;
    }

    bool tap_at(GestureAction action, float fx = 0.5f, float fy = 0.5f)
    {
        const GestureRegion* r = region(action);
        if (!r)
            return false;
        return overlay->tap(r->rect.x + fx * r->rect.w, r->rect.y + fy * r->rect.h);
    }

    bool has_command(const std::string& c) const
    {
        return std::find(src.commands.begin(), src.commands.end(), c) != src.commands.end();
    }

    FakePlaybackSource             src;
    FakeArtworkService             art;
    MemoryPreferenceStore          prefs;
    std::unique_ptr<PlayerOverlay> overlay;
};

}   // namespace

// ─── Initial state ──────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, ShowsSelectedTargetTrack)
{
    const auto& f = overlay->frame();
    EXPECT_TRUE(f.visible);
    EXPECT_FLOAT_EQ(f.expansion, 0.0f);
    EXPECT_EQ(f.current.primary, "Song One");
    EXPECT_EQ(f.current.tertiary.value_or(""), "Kitchen");
    EXPECT_TRUE(f.current.is_playing);
    EXPECT_FALSE(f.peek.visible);
    EXPECT_EQ(f.selector.targets.size(), 3u);
}

TEST_F(PlayerOverlayTest, HiddenWhileDisconnected)
{
    src.connected = false;
    overlay->refresh();
    EXPECT_FALSE(overlay->frame().visible);
    EXPECT_TRUE(overlay->frame().regions.empty());

    overlay->expand();
    EXPECT_FALSE(overlay->expansion().is_animating());
    EXPECT_FALSE(overlay->tap(195.0f, 700.0f));
}

TEST_F(PlayerOverlayTest, FailedReadKeepsPreviousSnapshot)
{
    src.selected_id         = "b";
    src.throw_on_track_read = true;
    overlay->refresh();

    ASSERT_TRUE(overlay->selected_target().has_value());
    EXPECT_EQ(overlay->selected_target()->id, "a");
    ASSERT_TRUE(overlay->current_track().has_value());
    EXPECT_EQ(overlay->current_track()->title, "Song One");
    EXPECT_EQ(overlay->frame().current.primary, "Song One");

    src.throw_on_track_read = false;
    overlay->refresh();
    EXPECT_EQ(overlay->selected_target()->id, "b");
    EXPECT_FALSE(overlay->current_track().has_value());
}

// ─── Expansion ──────────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, TapOnSurfaceExpands)
{
    const GestureRegion* s = region(GestureAction::Expand);
    ASSERT_NE(s, nullptr);
    EXPECT_TRUE(overlay->tap(s->rect.x + 20.0f, s->rect.y + s->rect.h * 0.5f));
    step(0.4f);
    EXPECT_TRUE(overlay->is_expanded());
    EXPECT_FLOAT_EQ(overlay->expansion_progress(), 1.0f);
    EXPECT_GE(src.queue_refreshes, 1);
}

TEST_F(PlayerOverlayTest, ExpandWhenExpandedIsNoop)
{
    expand_fully();
    uint64_t before = overlay->frame().number;
    overlay->expand();
    EXPECT_FALSE(overlay->expansion().is_animating());
    overlay->tick(DT);
    EXPECT_FLOAT_EQ(overlay->frame().expansion, 1.0f);
    EXPECT_GT(overlay->frame().number, before);
}

TEST_F(PlayerOverlayTest, VerticalDragExpandsAndCollapses)
{
    overlay->vertical_drag(-5.0f);
    EXPECT_FALSE(overlay->expansion().is_animating());

    overlay->vertical_drag(-30.0f);
    step(0.4f);
    EXPECT_TRUE(overlay->is_expanded());

    overlay->vertical_drag(30.0f);
    step(0.4f);
    EXPECT_FALSE(overlay->is_expanded());
}

TEST_F(PlayerOverlayTest, NotifierFollowsProgress)
{
    std::vector<ExpansionSnapshot> seen;
    overlay->expansion_notifier().subscribe([&](const ExpansionSnapshot& s) { seen.push_back(s); });
    ASSERT_EQ(seen.size(), 1u);

    overlay->expand();
    step(0.4f);

    ASSERT_GT(seen.size(), 2u);
    for (size_t i = 1; i < seen.size(); ++i)
        EXPECT_GE(seen[i].progress, seen[i - 1].progress);
    EXPECT_FLOAT_EQ(seen.back().progress, 1.0f);
    EXPECT_TRUE(seen.back().background.has_value());

    // Settled frames publish nothing new
    size_t count = seen.size();
    step(0.2f);
    EXPECT_EQ(seen.size(), count);
}

TEST_F(PlayerOverlayTest, AdaptiveColorsReachNotifier)
{
    ASSERT_FALSE(art.requests.empty());
    EXPECT_EQ(art.requests.back().url, "art://t1/512");

    Color surface = Color::from_hex(0x203040);
    art.answer(art.requests.size() - 1, make_schemes(Color::from_hex(0xFFAA00), surface));
    overlay->tick(DT);

    ASSERT_TRUE(overlay->expanded_background_color().has_value());
    EXPECT_EQ(*overlay->expanded_background_color(), surface);
    EXPECT_TRUE(overlay->expansion_notifier().value().primary.has_value());

    overlay->set_adaptive_theme(false);
    EXPECT_FALSE(overlay->expansion_notifier().value().primary.has_value());
}

// ─── Queue panel ────────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, QueueToggleNeedsExpandedPlayer)
{
    EXPECT_FALSE(overlay->toggle_queue());
    expand_fully();
    EXPECT_TRUE(overlay->toggle_queue());
    step(0.4f);
    EXPECT_TRUE(overlay->queue_panel().is_open());
    EXPECT_TRUE(overlay->frame().queue.visible);
}

TEST_F(PlayerOverlayTest, CollapseForceClosesOpenQueue)
{
    expand_fully();
    ASSERT_TRUE(overlay->toggle_queue());
    step(0.4f);
    ASSERT_FLOAT_EQ(overlay->queue_panel().progress(), 1.0f);

    overlay->collapse();
    EXPECT_FLOAT_EQ(overlay->queue_panel().progress(), 0.0f);

    // No slide-out frames while the surface collapses
    for (float t = 0.0f; t < 0.4f; t += DT)
    {
        overlay->tick(DT);
        EXPECT_FLOAT_EQ(overlay->frame().queue_progress, 0.0f);
    }
    EXPECT_FLOAT_EQ(overlay->expansion_progress(), 0.0f);
    EXPECT_FALSE(overlay->queue_panel().is_refreshing());
}

TEST_F(PlayerOverlayTest, VerticalDragDoesNotCollapseOverQueue)
{
    expand_fully();
    overlay->toggle_queue();
    step(0.4f);
    overlay->vertical_drag(40.0f);
    step(0.4f);
    EXPECT_TRUE(overlay->is_expanded());
}

TEST_F(PlayerOverlayTest, HorizontalFlingWhenExpandedOpensQueue)
{
    expand_fully();
    overlay->horizontal_drag_start(200.0f, 400.0f);
    overlay->horizontal_drag_update(-120.0f);
    EXPECT_FLOAT_EQ(overlay->swipe().offset(), 0.0f);
    overlay->horizontal_drag_end(-450.0f);
    step(0.4f);
    EXPECT_TRUE(overlay->queue_panel().is_open());
}

TEST_F(PlayerOverlayTest, QueueRefreshesWhileOpen)
{
    expand_fully();
    overlay->toggle_queue();
    step(0.4f);
    int before = src.queue_refreshes;
    step(5.1f);
    EXPECT_EQ(src.queue_refreshes - before, 1);
}

// ─── Swipe switch ───────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, SwipeLeftSwitchesToNextTarget)
{
    const float W = overlay->frame().geometry.surface.w;
    overlay->horizontal_drag_start(200.0f, 700.0f);
    overlay->horizontal_drag_update(-0.5f * W);

    const auto& peek = overlay->frame().peek;
    ASSERT_TRUE(peek.visible);
    EXPECT_EQ(peek.content.target_name, "Living Room");
    EXPECT_NEAR(peek.x, overlay->frame().current_x + W, 1e-3f);

    overlay->horizontal_drag_end(0.0f);
    while (overlay->swipe().phase() == SwipePhase::Committing)
        overlay->tick(DT);

    // The landing frame: B selected, shown by name with a device glyph
    ASSERT_EQ(overlay->swipe().phase(), SwipePhase::Settling);
    EXPECT_TRUE(has_command("select_target:b"));
    EXPECT_EQ(src.selected_id, "b");
    ASSERT_TRUE(overlay->selected_target().has_value());
    EXPECT_EQ(overlay->selected_target()->id, "b");

    const auto& landed = overlay->frame();
    EXPECT_FLOAT_EQ(landed.swipe_offset, -1.0f);
    EXPECT_EQ(landed.current.primary, "Living Room");
    EXPECT_FALSE(landed.current.has_track);
    EXPECT_EQ(landed.current.glyph, DeviceGlyph::Speaker);
    ASSERT_TRUE(landed.peek.visible);
    EXPECT_EQ(landed.peek.content.primary, "Living Room");
    EXPECT_NEAR(landed.peek.x, landed.geometry.surface.x, 1e-3f);

    overlay->tick(DT);
    EXPECT_FLOAT_EQ(overlay->frame().swipe_offset, -1.0f);
    overlay->tick(DT);
    EXPECT_FLOAT_EQ(overlay->frame().swipe_offset, 0.0f);
    EXPECT_FALSE(overlay->frame().peek.visible);
    EXPECT_EQ(overlay->frame().current.primary, "Living Room");
}

TEST_F(PlayerOverlayTest, SwipeIgnoredWhileExpandedOrSelectorOpen)
{
    overlay->show_target_selector();
    overlay->horizontal_drag_start(200.0f, 700.0f);
    overlay->horizontal_drag_update(-200.0f);
    EXPECT_FLOAT_EQ(overlay->swipe().offset(), 0.0f);
    overlay->horizontal_drag_end(-1000.0f);
    EXPECT_EQ(overlay->swipe().phase(), SwipePhase::Idle);
}

TEST_F(PlayerOverlayTest, DisconnectMidDragResetsSwipe)
{
    overlay->horizontal_drag_start(200.0f, 700.0f);
    overlay->horizontal_drag_update(-80.0f);
    ASSERT_EQ(overlay->swipe().phase(), SwipePhase::Dragging);

    overlay->set_connected(false);
    EXPECT_EQ(overlay->swipe().phase(), SwipePhase::Idle);
    EXPECT_FLOAT_EQ(overlay->frame().swipe_offset, 0.0f);
    EXPECT_FALSE(overlay->frame().visible);
}

TEST(PlayerOverlay, SwipeCommitEndsOnboarding)
{
    FakePlaybackSource    src;
    MemoryPreferenceStore prefs;
    populate_three_targets(src);
    PlayerOverlay overlay(src, nullptr, &prefs);
    ASSERT_TRUE(overlay.hints().is_active());
    EXPECT_TRUE(overlay.frame().welcome.visible);

    overlay.horizontal_drag_start(200.0f, 700.0f);
    overlay.horizontal_drag_update(-300.0f);
    overlay.horizontal_drag_end(-900.0f);
    for (int i = 0; i < 30; ++i)
        overlay.tick(DT);

    EXPECT_EQ(src.selected_id, "b");
    EXPECT_FALSE(overlay.hints().is_active());
    EXPECT_TRUE(prefs.onboarding_completed);
}

// ─── Commands ───────────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, CollapsedTransportButtons)
{
    EXPECT_TRUE(tap_at(GestureAction::PlayPause));
    EXPECT_TRUE(tap_at(GestureAction::SkipNext));
    EXPECT_TRUE(tap_at(GestureAction::SkipPrevious));
    EXPECT_EQ(src.commands,
              (std::vector<std::string>{"play_pause:a", "skip_next:a", "skip_previous:a"}));
    EXPECT_FALSE(overlay->expansion().is_animating());
}

TEST_F(PlayerOverlayTest, FailedCommandShowsTransientNotification)
{
    src.fail_next = true;
    overlay->play_pause();
    ASSERT_TRUE(overlay->notification().has_value());
    EXPECT_EQ(*overlay->notification(), "Command failed: offline");

    overlay->tick(DT);
    EXPECT_EQ(overlay->frame().notification.value_or(""), "Command failed: offline");

    step(3.1f);
    EXPECT_FALSE(overlay->notification().has_value());
    EXPECT_FALSE(overlay->frame().notification.has_value());
}

TEST_F(PlayerOverlayTest, ThrowingCommandIsReportedNotPropagated)
{
    src.throw_next = true;
    EXPECT_NO_THROW(overlay->skip_next());
    EXPECT_TRUE(overlay->notification().has_value());
}

TEST_F(PlayerOverlayTest, LateAnswerAfterDestructionDropped)
{
    src.defer = true;
    overlay->play_pause();
    overlay.reset();
    EXPECT_NO_THROW(src.resolve_pending(false));
}

TEST_F(PlayerOverlayTest, ShuffleNeedsQueue)
{
    overlay->toggle_shuffle();
    overlay->cycle_repeat();
    EXPECT_TRUE(src.commands.empty());

    PlayerQueue q;
    q.target_id = "a";
    src.set_queue(q);
    overlay->refresh();

    overlay->toggle_shuffle();
    EXPECT_TRUE(has_command("toggle_shuffle:a"));
    ASSERT_TRUE(overlay->queue().has_value());
    EXPECT_TRUE(overlay->queue()->shuffle);

    overlay->cycle_repeat();
    EXPECT_EQ(overlay->queue()->repeat, RepeatMode::All);
}

TEST_F(PlayerOverlayTest, SeekBarTapSeeksToFraction)
{
    expand_fully();
    ASSERT_TRUE(tap_at(GestureAction::Seek, 0.5f));
    EXPECT_EQ(src.last_seek, 100);
    EXPECT_FALSE(overlay->readout().is_seeking());
}

TEST_F(PlayerOverlayTest, SeekPreviewHeldUntilServerAnswers)
{
    src.defer = true;
    overlay->begin_seek(30.0f);
    overlay->update_seek(42.0f);
    overlay->commit_seek(42.0f);
    overlay->tick(DT);
    EXPECT_TRUE(overlay->readout().is_seeking());
    EXPECT_FLOAT_EQ(overlay->frame().details.position_sec, 42.0f);
    EXPECT_EQ(overlay->frame().details.position_text, "0:42");

    src.resolve_pending(true);
    EXPECT_FALSE(overlay->readout().is_seeking());
}

TEST_F(PlayerOverlayTest, VolumeBarTapSetsVolume)
{
    expand_fully();
    ASSERT_TRUE(tap_at(GestureAction::Volume, 0.75f));
    EXPECT_EQ(src.find("a")->volume, 75);

    overlay->set_volume(250);
    EXPECT_EQ(src.find("a")->volume, 100);
}

TEST_F(PlayerOverlayTest, QueueOpenHidesTransportRegions)
{
    expand_fully();
    EXPECT_NE(region(GestureAction::Seek), nullptr);
    overlay->toggle_queue();
    step(0.4f);
    EXPECT_EQ(region(GestureAction::Seek), nullptr);
    EXPECT_EQ(region(GestureAction::Volume), nullptr);
    EXPECT_NE(region(GestureAction::ToggleQueue), nullptr);
}

// ─── Target selector ────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, SelectorSwitchesTarget)
{
    expand_fully();
    ASSERT_TRUE(tap_at(GestureAction::ShowTargetSelector));
    EXPECT_TRUE(overlay->is_target_selector_visible());
    EXPECT_TRUE(overlay->frame().selector.visible);
    step(0.4f);
    EXPECT_FALSE(overlay->is_expanded());

    overlay->select_target("c");
    EXPECT_TRUE(has_command("select_target:c"));
    EXPECT_FALSE(overlay->is_target_selector_visible());
    ASSERT_TRUE(overlay->selected_target().has_value());
    EXPECT_EQ(overlay->selected_target()->id, "c");
    EXPECT_EQ(overlay->frame().current.primary, "Office");
}

TEST_F(PlayerOverlayTest, UnavailableTargetNotSelectable)
{
    src.find("c")->available = false;
    overlay->refresh();
    EXPECT_EQ(overlay->frame().selector.targets.size(), 2u);

    overlay->select_target("c");
    overlay->select_target("zzz");
    EXPECT_TRUE(src.commands.empty());
}

TEST_F(PlayerOverlayTest, TapOutsideDismissesSelector)
{
    overlay->show_target_selector();
    overlay->tick(DT);
    EXPECT_TRUE(overlay->tap(5.0f, 5.0f));
    EXPECT_FALSE(overlay->is_target_selector_visible());
    EXPECT_TRUE(overlay->hints().is_single_bouncing());
}

TEST_F(PlayerOverlayTest, SelectorRevealsOverTime)
{
    overlay->show_target_selector();
    EXPECT_FLOAT_EQ(overlay->selector_reveal(), 0.0f);
    overlay->tick(DT);
    const float early = overlay->selector_reveal();
    EXPECT_GT(early, 0.0f);
    EXPECT_LT(early, 1.0f);
    EXPECT_TRUE(overlay->frame().selector.visible);

    step(0.3f);
    EXPECT_FLOAT_EQ(overlay->selector_reveal(), 1.0f);
    EXPECT_FLOAT_EQ(overlay->frame().selector.reveal, 1.0f);
}

TEST_F(PlayerOverlayTest, ClosingSelectorBouncesMiniPlayerOnce)
{
    overlay->show_target_selector();
    step(0.3f);

    overlay->dismiss_target_selector();
    overlay->tick(DT);
    EXPECT_FALSE(overlay->is_target_selector_visible());
    EXPECT_TRUE(overlay->frame().selector.visible);
    EXPECT_FALSE(overlay->hints().is_single_bouncing());

    int frames = 0;
    while (overlay->selector_reveal() >= 0.3f && frames++ < 60)
    {
        EXPECT_FALSE(overlay->hints().is_single_bouncing());
        overlay->tick(DT);
    }
    EXPECT_TRUE(overlay->hints().is_single_bouncing());

    step(0.2f);
    EXPECT_FLOAT_EQ(overlay->selector_reveal(), 0.0f);
    EXPECT_FALSE(overlay->frame().selector.visible);
}

TEST_F(PlayerOverlayTest, SelectorPulledPastDistanceDismisses)
{
    overlay->show_target_selector();
    step(0.3f);

    overlay->selector_drag(60.0f);
    overlay->selector_drag(50.0f);
    EXPECT_FLOAT_EQ(overlay->frame().selector.drag_offset, 110.0f);
    overlay->selector_drag_end(0.0f);

    EXPECT_FALSE(overlay->is_target_selector_visible());
    EXPECT_FLOAT_EQ(overlay->frame().selector.drag_offset, 0.0f);
    step(0.3f);
    EXPECT_FLOAT_EQ(overlay->selector_reveal(), 0.0f);
    EXPECT_TRUE(overlay->hints().is_single_bouncing());
}

TEST_F(PlayerOverlayTest, SelectorFlingDismisses)
{
    overlay->show_target_selector();
    step(0.3f);
    overlay->selector_drag(20.0f);
    overlay->selector_drag_end(800.0f);
    EXPECT_FALSE(overlay->is_target_selector_visible());
}

TEST_F(PlayerOverlayTest, ShortSlowPullSpringsBack)
{
    overlay->show_target_selector();
    step(0.3f);
    overlay->selector_drag(60.0f);
    overlay->selector_drag_end(200.0f);

    EXPECT_TRUE(overlay->is_target_selector_visible());
    EXPECT_FLOAT_EQ(overlay->frame().selector.drag_offset, 0.0f);
    step(0.3f);
    EXPECT_FLOAT_EQ(overlay->selector_reveal(), 1.0f);
    EXPECT_FALSE(overlay->hints().is_single_bouncing());
}

TEST_F(PlayerOverlayTest, UpwardPullOnSelectorIgnored)
{
    overlay->show_target_selector();
    step(0.3f);
    overlay->selector_drag(-150.0f);
    overlay->selector_drag_end(900.0f);
    EXPECT_TRUE(overlay->is_target_selector_visible());

    // No drag without an open selector
    overlay->dismiss_target_selector();
    overlay->selector_drag(150.0f);
    EXPECT_FLOAT_EQ(overlay->frame().selector.drag_offset, 0.0f);
}

// ─── Back ───────────────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, BackClosesInnermostFirst)
{
    EXPECT_FALSE(overlay->back());

    expand_fully();
    overlay->toggle_queue();
    step(0.4f);

    EXPECT_TRUE(overlay->back());
    step(0.4f);
    EXPECT_FALSE(overlay->queue_panel().is_open());
    EXPECT_TRUE(overlay->is_expanded());

    EXPECT_TRUE(overlay->back());
    step(0.4f);
    EXPECT_FALSE(overlay->is_expanded());

    overlay->show_target_selector();
    EXPECT_TRUE(overlay->back());
    EXPECT_FALSE(overlay->is_target_selector_visible());
}

TEST(PlayerOverlay, BackSkipsActiveHints)
{
    FakePlaybackSource    src;
    MemoryPreferenceStore prefs;
    populate_three_targets(src);
    PlayerOverlay overlay(src, nullptr, &prefs);
    ASSERT_TRUE(overlay.hints().is_active());
    EXPECT_TRUE(overlay.back());
    EXPECT_FALSE(overlay.hints().is_active());
    EXPECT_TRUE(prefs.onboarding_completed);
}

// ─── Hide ───────────────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, HideSlidesSurfaceOffScreen)
{
    float rest_y = overlay->frame().geometry.surface.y;
    overlay->hide_player();
    step(0.3f);

    const auto& f = overlay->frame();
    EXPECT_GT(f.hide_offset, f.geometry.surface_bottom + f.geometry.surface.h);
    EXPECT_FLOAT_EQ(f.geometry.surface.y, rest_y + f.hide_offset);

    overlay->show_player();
    step(0.3f);
    EXPECT_FLOAT_EQ(overlay->frame().hide_offset, 0.0f);
    EXPECT_FLOAT_EQ(overlay->frame().geometry.surface.y, rest_y);
}

// ─── Nav tint ───────────────────────────────────────────────────────────────

TEST_F(PlayerOverlayTest, NavTintShadowOnlyWhileCollapsed)
{
    EXPECT_FLOAT_EQ(overlay->nav_tint().shadow_alpha, 0.1f);
    expand_fully();
    EXPECT_FLOAT_EQ(overlay->nav_tint().shadow_alpha, 0.0f);
}
