#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "ui/player/expansion_controller.hpp"

using namespace aria;

namespace
{

struct Recorder
{
    std::vector<std::string> events;

    void attach(ExpansionController& c)
    {
        c.set_on_expand_start([this]() { events.push_back("expand_start"); });
        c.set_on_expanded([this]() { events.push_back("expanded"); });
        c.set_on_collapse_start([this]() { events.push_back("collapse_start"); });
        c.set_on_collapsed([this]() { events.push_back("collapsed"); });
    }
};

void run(ExpansionController& c, float seconds, float dt = 1.0f / 60.0f)
{
    for (float t = 0.0f; t < seconds; t += dt)
        c.update(dt);
}

}   // namespace

TEST(ExpansionController, StartsCollapsed)
{
    ExpansionController c;
    EXPECT_TRUE(c.is_fully_collapsed());
    EXPECT_FALSE(c.is_expanded());
    EXPECT_FLOAT_EQ(c.progress(), 0.0f);
}

TEST(ExpansionController, ExpandReachesOneWithLifecycle)
{
    ExpansionController c(0.3f);
    Recorder            r;
    r.attach(c);

    c.expand();
    EXPECT_TRUE(c.is_animating());
    run(c, 0.4f);

    EXPECT_TRUE(c.is_fully_expanded());
    EXPECT_EQ(r.events, (std::vector<std::string>{"expand_start", "expanded"}));
}

TEST(ExpansionController, ExpandIsIdempotent)
{
    ExpansionController c(0.3f);
    Recorder            r;
    r.attach(c);

    c.expand();
    c.update(0.1f);
    float mid = c.progress();
    c.expand();
    EXPECT_FLOAT_EQ(c.progress(), mid);
    run(c, 0.4f);
    c.expand();
    EXPECT_FALSE(c.is_animating());
    EXPECT_EQ(r.events, (std::vector<std::string>{"expand_start", "expanded"}));
}

TEST(ExpansionController, CollapseWhenCollapsedIsNoop)
{
    ExpansionController c;
    Recorder            r;
    r.attach(c);
    c.collapse();
    EXPECT_FALSE(c.is_animating());
    EXPECT_TRUE(r.events.empty());
}

TEST(ExpansionController, ReverseMidFlightFromCurrentValue)
{
    ExpansionController c(0.3f);
    Recorder            r;
    r.attach(c);

    c.expand();
    c.update(0.1f);
    float mid = c.progress();
    ASSERT_GT(mid, 0.0f);
    ASSERT_LT(mid, 1.0f);

    c.collapse();
    c.update(0.0f);
    EXPECT_NEAR(c.progress(), mid, 1e-5f);
    EXPECT_EQ(c.status(), TimelineStatus::Reverse);

    run(c, 0.4f);
    EXPECT_TRUE(c.is_fully_collapsed());
    EXPECT_EQ(r.events,
              (std::vector<std::string>{"expand_start", "collapse_start", "collapsed"}));
}

TEST(ExpansionController, ProgressStaysInUnitRange)
{
    ExpansionController c(0.3f);
    c.expand();
    for (int i = 0; i < 40; ++i)
    {
        c.update(1.0f / 60.0f);
        EXPECT_GE(c.progress(), 0.0f);
        EXPECT_LE(c.progress(), 1.0f);
    }
    c.collapse();
    for (int i = 0; i < 40; ++i)
    {
        c.update(1.0f / 60.0f);
        EXPECT_GE(c.progress(), 0.0f);
        EXPECT_LE(c.progress(), 1.0f);
    }
}

TEST(ExpansionController, ToggleFollowsHalfwayThreshold)
{
    ExpansionController c(0.3f);
    c.toggle();
    run(c, 0.4f);
    EXPECT_TRUE(c.is_expanded());
    c.toggle();
    run(c, 0.4f);
    EXPECT_FALSE(c.is_expanded());
}

TEST(ExpansionController, JumpToSettlesStatus)
{
    ExpansionController c;
    Recorder            r;
    r.attach(c);
    c.jump_to(1.0f);
    EXPECT_TRUE(c.is_fully_expanded());
    EXPECT_EQ(r.events, (std::vector<std::string>{"expanded"}));
}

TEST(ExpansionController, ExpandResumesFromIntermediateJump)
{
    ExpansionController c(0.3f);
    c.jump_to(0.4f);
    EXPECT_FALSE(c.is_animating());
    c.expand();
    EXPECT_TRUE(c.is_animating());
    run(c, 1.0f);
    EXPECT_TRUE(c.is_fully_expanded());
}

TEST(ExpansionController, CollapseResumesFromIntermediateJump)
{
    ExpansionController c(0.3f);
    Recorder            r;
    r.attach(c);
    c.jump_to(1.0f);
    c.jump_to(0.7f);
    c.collapse();
    run(c, 1.0f);
    EXPECT_TRUE(c.is_fully_collapsed());
    EXPECT_EQ(r.events.back(), "collapsed");
}

TEST(ExpansionController, GeometryFollowsProgress)
{
    ExpansionController c;
    ScreenMetrics       s;
    c.jump_to(1.0f);
    EXPECT_FLOAT_EQ(c.geometry(s).t, 1.0f);
    EXPECT_FLOAT_EQ(c.geometry(s).surface.w, s.width);
}
