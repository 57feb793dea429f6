#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <stdexcept>
#include <vector>

#include "overlay_error.h"
#include "overlay_session.h"

using namespace fm;
using namespace std::chrono_literals;

namespace {

using Clock = OverlaySession::Clock;

const Clock::time_point kStart = Clock::time_point{} + 500s;

Clock::time_point at(double seconds) {
    return kStart + std::chrono::round<Clock::duration>(std::chrono::duration<double>(seconds));
}

struct PresentedFrame {
    Point origin;
    int width = 0;
    int height = 0;
    bool transparent = false;
};

// Records every frame; scripted answers are consumed first, then it accepts.
class RecordingPresenter : public SurfacePresenter {
public:
    bool present(Point origin, RenderedFrame&& frame) override {
        frames.push_back(PresentedFrame{origin, frame.width, frame.height, frame.fully_transparent()});
        if (answers.empty()) return true;
        const bool ok = answers.front();
        answers.pop_front();
        return ok;
    }

    std::vector<PresentedFrame> frames;
    std::deque<bool> answers;
};

std::vector<ScreenGeometry> one_screen() {
    ScreenGeometry s;
    s.name = "main";
    s.bounds = Rect{0, 0, 400, 300};
    s.primary = true;
    return {s};
}

class OverlaySessionTest : public ::testing::Test {
protected:
    OverlaySession make_highlight() {
        return OverlaySession(plan_highlight(Rect{100, 100, 50, 40}, one_screen()), font, presenter, RenderStyle{},
                              SessionConfig{}, kStart);
    }

    ui::BitmapFontMeasurer font;
    RecordingPresenter presenter;
};

} // namespace

TEST(OverlayPlanTest, HighlightCoversResolvedScreen) {
    const OverlayPlan plan = plan_highlight(Rect{100, 100, 50, 40}, one_screen());
    EXPECT_EQ(plan.placement, (Rect{0, 0, 400, 300}));
    ASSERT_TRUE(std::holds_alternative<HighlightAnnotation>(plan.annotation));
    EXPECT_EQ(std::get<HighlightAnnotation>(plan.annotation).rect, (Rect{100, 100, 50, 40}));
    EXPECT_DOUBLE_EQ(plan.profile.startup_delay_s, 0.15);
}

TEST(OverlayPlanTest, PopupIsSizedAndPlacedAboveTarget) {
    ui::BitmapFontMeasurer font;
    ScreenGeometry s;
    s.bounds = Rect{0, 0, 1920, 1080};
    const OverlayPlan plan = plan_popup("Hello", Rect{100, 100, 50, 50}, s, font);
    // "Hello" measures 56.25 px -> 117 px wide; centered gives x = 100 + (50 - 117) / 2.
    EXPECT_EQ(plan.placement, (Rect{67, 42, 117, 50}));
    ASSERT_TRUE(std::holds_alternative<PopupAnnotation>(plan.annotation));
    EXPECT_EQ(std::get<PopupAnnotation>(plan.annotation).text, "Hello");
    EXPECT_FLOAT_EQ(plan.profile.peak, 0.98f);
}

TEST(OverlayPlanTest, HighlightWithoutScreensFails) {
    try {
        plan_highlight(Rect{0, 0, 10, 10}, std::vector<ScreenGeometry>{});
        FAIL() << "expected OverlayError";
    } catch (const OverlayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoScreenFound);
    }
}

TEST_F(OverlaySessionTest, WaitsForStartupDelay) {
    OverlaySession session = make_highlight();
    EXPECT_EQ(session.tick(kStart), SessionStatus::Waiting);
    EXPECT_EQ(session.tick(at(0.1)), SessionStatus::Waiting);
    EXPECT_TRUE(presenter.frames.empty());
    EXPECT_FALSE(session.phase().has_value());

    EXPECT_EQ(session.tick(at(0.15)), SessionStatus::Running);
    ASSERT_EQ(presenter.frames.size(), 1u);
    EXPECT_EQ(session.phase(), FadePhase::FadingIn);
    // First painted frame sits at the very start of the fade-in.
    EXPECT_TRUE(presenter.frames[0].transparent);
}

TEST_F(OverlaySessionTest, PresentsAtPlacementOrigin) {
    OverlaySession session = make_highlight();
    session.tick(at(0.5));
    ASSERT_EQ(presenter.frames.size(), 1u);
    EXPECT_EQ(presenter.frames[0].origin, (Point{0, 0}));
    EXPECT_EQ(presenter.frames[0].width, 400);
    EXPECT_EQ(presenter.frames[0].height, 300);
    EXPECT_FALSE(presenter.frames[0].transparent);
}

TEST_F(OverlaySessionTest, FinishesOnceWithTransparentFrame) {
    OverlaySession session = make_highlight();
    session.tick(at(0.15));
    session.tick(at(1.0));
    EXPECT_EQ(session.phase(), FadePhase::Holding);

    EXPECT_EQ(session.tick(at(0.15 + 3.4 + 0.01)), SessionStatus::Finished);
    const std::size_t count = presenter.frames.size();
    EXPECT_TRUE(presenter.frames.back().transparent);

    EXPECT_EQ(session.tick(at(10.0)), SessionStatus::Finished);
    EXPECT_EQ(presenter.frames.size(), count);
}

TEST_F(OverlaySessionTest, RetriesOnceThenFails) {
    OverlaySession session = make_highlight();
    presenter.answers = {false, false};
    EXPECT_EQ(session.tick(at(0.2)), SessionStatus::Running);
    EXPECT_EQ(session.tick(at(0.3)), SessionStatus::Failed);

    const std::size_t count = presenter.frames.size();
    EXPECT_EQ(session.tick(at(0.4)), SessionStatus::Failed);
    EXPECT_EQ(presenter.frames.size(), count);
}

TEST_F(OverlaySessionTest, AcceptedFrameResetsRetryBudget) {
    OverlaySession session = make_highlight();
    presenter.answers = {false, true, false, true};
    EXPECT_EQ(session.tick(at(0.2)), SessionStatus::Running);
    EXPECT_EQ(session.tick(at(0.3)), SessionStatus::Running);
    EXPECT_EQ(session.tick(at(0.4)), SessionStatus::Running);
    EXPECT_EQ(session.tick(at(0.5)), SessionStatus::Running);
}

TEST_F(OverlaySessionTest, RejectedFinalFrameIsRetried) {
    OverlaySession session = make_highlight();
    session.tick(at(0.2));
    presenter.answers = {false};
    EXPECT_EQ(session.tick(at(5.0)), SessionStatus::Running);
    EXPECT_EQ(session.tick(at(5.01)), SessionStatus::Finished);
    EXPECT_TRUE(presenter.frames.back().transparent);
}

TEST_F(OverlaySessionTest, RunReturnsZeroWhenFadeCompletes) {
    OverlayPlan plan = plan_highlight(Rect{10, 10, 20, 20}, one_screen(), FadeProfile{0.0, 0.0, 0.0, 0.2f, 0.0});
    SessionConfig config;
    config.tick_interval = 1ms;
    OverlaySession session(std::move(plan), font, presenter, RenderStyle{}, config);

    int pumps = 0;
    EXPECT_EQ(session.run([&pumps] { ++pumps; return true; }), 0);
    EXPECT_GE(pumps, 1);
    EXPECT_EQ(session.status(), SessionStatus::Finished);
    EXPECT_TRUE(presenter.frames.back().transparent);
}

TEST_F(OverlaySessionTest, RunFailsWhenWindowCloses) {
    OverlaySession session(plan_highlight(Rect{10, 10, 20, 20}, one_screen()), font, presenter);
    EXPECT_EQ(session.run([] { return false; }), 1);
    EXPECT_TRUE(presenter.frames.empty());
}

TEST_F(OverlaySessionTest, RunFailsAfterRepeatedRejections) {
    OverlayPlan plan = plan_highlight(Rect{10, 10, 20, 20}, one_screen(), FadeProfile{0.5, 0.5, 0.5, 0.2f, 0.0});
    SessionConfig config;
    config.tick_interval = 1ms;
    OverlaySession session(std::move(plan), font, presenter, RenderStyle{}, config);
    presenter.answers = {false, false};
    EXPECT_EQ(session.run([] { return true; }), 1);
    EXPECT_EQ(session.status(), SessionStatus::Failed);
}

TEST_F(OverlaySessionTest, RunRequiresPump) {
    OverlaySession session = make_highlight();
    EXPECT_THROW(session.run(OverlaySession::Pump{}), std::runtime_error);
}

TEST_F(OverlaySessionTest, FactoriesBuildPlannedSessions) {
    const std::vector<ScreenGeometry> screens = one_screen();
    auto highlight = make_highlight_session(Rect{100, 100, 50, 40}, screens, font, presenter);
    ASSERT_NE(highlight, nullptr);
    EXPECT_EQ(highlight->plan().placement, (Rect{0, 0, 400, 300}));
    EXPECT_EQ(highlight->status(), SessionStatus::Waiting);

    auto popup = make_popup_session("Hello", Rect{100, 100, 50, 50}, screens[0], font, presenter);
    ASSERT_NE(popup, nullptr);
    EXPECT_EQ(popup->plan().placement, (Rect{67, 42, 117, 50}));
    EXPECT_DOUBLE_EQ(popup->plan().profile.startup_delay_s, 0.05);
}

TEST(SessionStatusTest, Names) {
    EXPECT_STREQ(to_string(SessionStatus::Waiting), "Waiting");
    EXPECT_STREQ(to_string(SessionStatus::Failed), "Failed");
}
