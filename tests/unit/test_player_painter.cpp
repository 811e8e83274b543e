#ifdef ARIA_USE_IMGUI

    #include <aria/player_overlay.hpp>
    #include <gtest/gtest.h>
    #include <imgui.h>
    #include <memory>

    #include "../util/fake_playback.hpp"
    #include "ui/imgui/player_painter.hpp"
    #include "ui/player/expansion_controller.hpp"

using namespace aria;
using namespace aria::test;

namespace
{

class PlayerPainterTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        ImGui::CreateContext();
        ImGuiIO& io    = ImGui::GetIO();
        io.DisplaySize = ImVec2(390.0f, 844.0f);
        io.DeltaTime   = 1.0f / 60.0f;
        unsigned char* pixels = nullptr;
        int            w = 0, h = 0;
        io.Fonts->GetTexDataAsRGBA32(&pixels, &w, &h);

        populate_three_targets(src);
        prefs.onboarding_completed = true;
        overlay = std::make_unique<PlayerOverlay>(src, nullptr, &prefs);
    }

    void TearDown() override
    {
        overlay.reset();
        ImGui::DestroyContext();
    }

    size_t painted_vertices()
    {
        ImGui::NewFrame();
        ImDrawList* dl = ImGui::GetBackgroundDrawList();
        painter.paint(overlay->frame(), dl);
        size_t n = static_cast<size_t>(dl->VtxBuffer.Size);
        ImGui::EndFrame();
        return n;
    }

    FakePlaybackSource             src;
    MemoryPreferenceStore          prefs;
    std::unique_ptr<PlayerOverlay> overlay;
    PlayerPainter                  painter;
};

}   // namespace

TEST_F(PlayerPainterTest, PaintsMiniPlayer)
{
    EXPECT_GT(painted_vertices(), 0u);
}

TEST_F(PlayerPainterTest, PaintsExpandedPlayer)
{
    overlay->expand();
    for (int i = 0; i < 30; ++i)
        overlay->tick(1.0f / 60.0f);
    EXPECT_GT(painted_vertices(), 0u);
}

TEST_F(PlayerPainterTest, NothingPaintedWhenHidden)
{
    src.connected = false;
    overlay->refresh();
    EXPECT_EQ(painted_vertices(), 0u);
}

TEST_F(PlayerPainterTest, ClickBecomesTap)
{
    const Rect& s = overlay->frame().geometry.surface;
    ImGuiIO&    io = ImGui::GetIO();

    io.AddMousePosEvent(s.x + 20.0f, s.y + s.h * 0.5f);
    io.AddMouseButtonEvent(0, true);
    ImGui::NewFrame();
    painter.route_input(*overlay);
    ImGui::EndFrame();

    io.AddMouseButtonEvent(0, false);
    ImGui::NewFrame();
    painter.route_input(*overlay);
    ImGui::EndFrame();

    EXPECT_TRUE(overlay->expansion().is_animating());
}

#endif   // ARIA_USE_IMGUI
