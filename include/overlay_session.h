#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "annotation.h"
#include "fade_sequencer.h"
#include "fm_types.h"
#include "surface_presenter.h"
#include "surface_renderer.h"

namespace fm {

enum class SessionStatus { Waiting, Running, Finished, Failed };

const char* to_string(SessionStatus status);

struct SessionConfig {
    std::chrono::milliseconds tick_interval{10};
    bool log_transitions = false;
};

// What to draw, where its render surface sits on the desktop and how it fades.
struct OverlayPlan {
    Annotation annotation;
    Rect placement{};
    FadeProfile profile{};
};

// The highlight surface covers the whole screen hosting the target.
OverlayPlan plan_highlight(const Rect& target, std::span<const ScreenGeometry> screens,
                           const FadeProfile& profile = FadeProfile::highlight());

// Sized with the same bitmap font the renderer draws with, so the text fits the placement.
OverlayPlan plan_popup(std::string message, const Rect& target, const ScreenGeometry& screen,
                       const ui::BitmapFontMeasurer& font, const FadeProfile& profile = FadeProfile::popup());

// Drives one annotation from startup delay to its final transparent frame.
class OverlaySession {
public:
    using Clock = FadeSequencer::Clock;
    using Pump = std::function<bool()>;

    OverlaySession(OverlayPlan plan, const ui::BitmapFontMeasurer& font, SurfacePresenter& presenter,
                   RenderStyle style = {}, SessionConfig config = {}, Clock::time_point start = Clock::now());

    SessionStatus tick(Clock::time_point now);

    // Blocks until the fade completes. pump returns false once the host window is gone.
    int run(const Pump& pump);

    SessionStatus status() const { return status_; }
    const OverlayPlan& plan() const { return plan_; }
    std::optional<FadePhase> phase() const;

private:
    bool present_frame(RenderedFrame&& frame);

    OverlayPlan plan_;
    SurfaceRenderer renderer_;
    SurfacePresenter& presenter_;
    SessionConfig config_;
    Clock::time_point start_;
    std::optional<FadeSequencer> sequencer_;
    SessionStatus status_ = SessionStatus::Waiting;
    std::optional<FadePhase> logged_phase_;
    int consecutive_rejections_ = 0;
};

std::unique_ptr<OverlaySession> make_highlight_session(const Rect& target, std::span<const ScreenGeometry> screens,
                                                       const ui::BitmapFontMeasurer& font, SurfacePresenter& presenter,
                                                       RenderStyle style = {}, SessionConfig config = {});

std::unique_ptr<OverlaySession> make_popup_session(std::string message, const Rect& target_rect,
                                                   const ScreenGeometry& target_screen,
                                                   const ui::BitmapFontMeasurer& font, SurfacePresenter& presenter,
                                                   RenderStyle style = {}, SessionConfig config = {});

} // namespace fm
