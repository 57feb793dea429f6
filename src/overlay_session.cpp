#include "overlay_session.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "geometry_resolver.h"
#include "overlay_error.h"

namespace fm {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Waiting: return "Waiting";
        case SessionStatus::Running: return "Running";
        case SessionStatus::Finished: return "Finished";
        case SessionStatus::Failed: return "Failed";
    }
    return "Unknown";
}

OverlayPlan plan_highlight(const Rect& target, std::span<const ScreenGeometry> screens, const FadeProfile& profile) {
    const ScreenGeometry& screen = resolve_screen(target, screens);
    return OverlayPlan{HighlightAnnotation{target}, screen.bounds, profile};
}

OverlayPlan plan_popup(std::string message, const Rect& target, const ScreenGeometry& screen,
                       const ui::BitmapFontMeasurer& font, const FadeProfile& profile) {
    const PopupSize size = popup_size(message, font);
    const Rect placement = place_popup(target, screen, size.width, size.height);
    return OverlayPlan{PopupAnnotation{std::move(message), target}, placement, profile};
}

OverlaySession::OverlaySession(OverlayPlan plan, const ui::BitmapFontMeasurer& font, SurfacePresenter& presenter,
                               RenderStyle style, SessionConfig config, Clock::time_point start)
    : plan_(std::move(plan)), renderer_(font, style), presenter_(presenter), config_(config), start_(start) {}

std::optional<FadePhase> OverlaySession::phase() const {
    if (!sequencer_) return std::nullopt;
    return sequencer_->phase();
}

SessionStatus OverlaySession::tick(Clock::time_point now) {
    if (status_ == SessionStatus::Finished || status_ == SessionStatus::Failed) return status_;

    if (!sequencer_) {
        // Give the host surface time to settle before the first paint.
        const auto delay = std::chrono::round<Clock::duration>(
            std::chrono::duration<double>(std::max(0.0, plan_.profile.startup_delay_s)));
        if (now < start_ + delay) return SessionStatus::Waiting;
        sequencer_.emplace(plan_.profile, start_ + delay);
        status_ = SessionStatus::Running;
        if (config_.log_transitions) {
            const Rect& p = plan_.placement;
            std::cout << "[session] " << annotation_kind_name(plan_.annotation) << " surface " << p.w << "x" << p.h
                      << " at (" << p.x << "," << p.y << ")\n";
        }
    }

    const FadeSample sample = sequencer_->tick(now);
    if (config_.log_transitions && logged_phase_ != sample.phase) {
        std::cout << "[session] phase " << to_string(sample.phase) << " opacity=" << sample.opacity << "\n";
        logged_phase_ = sample.phase;
    }

    if (sample.phase == FadePhase::Done) {
        if (present_frame(renderer_.render(plan_.annotation, 0.0f, plan_.placement))) {
            status_ = SessionStatus::Finished;
        }
        return status_;
    }

    present_frame(renderer_.render(plan_.annotation, sample.opacity, plan_.placement));
    return status_;
}

bool OverlaySession::present_frame(RenderedFrame&& frame) {
    if (presenter_.present(plan_.placement.origin(), std::move(frame))) {
        consecutive_rejections_ = 0;
        return true;
    }
    ++consecutive_rejections_;
    if (consecutive_rejections_ >= 2) {
        std::cerr << "[session] presenter rejected " << consecutive_rejections_ << " consecutive frames; giving up\n";
        status_ = SessionStatus::Failed;
    } else {
        std::cerr << "[session] presenter rejected frame; retrying next tick\n";
    }
    return false;
}

int OverlaySession::run(const Pump& pump) {
    if (!pump) throw std::runtime_error("OverlaySession::run requires an event pump");

    auto deadline = Clock::now();
    for (;;) {
        if (!pump()) {
            std::cerr << "[session] overlay window closed before the fade completed\n";
            return exit_code(ErrorCode::RenderFailure);
        }
        const SessionStatus status = tick(Clock::now());
        if (status == SessionStatus::Finished) return 0;
        if (status == SessionStatus::Failed) return exit_code(ErrorCode::RenderFailure);

        deadline += config_.tick_interval;
        const auto now = Clock::now();
        if (deadline <= now) deadline = now + config_.tick_interval;
        std::this_thread::sleep_until(deadline);
    }
}

std::unique_ptr<OverlaySession> make_highlight_session(const Rect& target, std::span<const ScreenGeometry> screens,
                                                       const ui::BitmapFontMeasurer& font, SurfacePresenter& presenter,
                                                       RenderStyle style, SessionConfig config) {
    return std::make_unique<OverlaySession>(plan_highlight(target, screens), font, presenter, style, config);
}

std::unique_ptr<OverlaySession> make_popup_session(std::string message, const Rect& target_rect,
                                                   const ScreenGeometry& target_screen,
                                                   const ui::BitmapFontMeasurer& font, SurfacePresenter& presenter,
                                                   RenderStyle style, SessionConfig config) {
    return std::make_unique<OverlaySession>(plan_popup(std::move(message), target_rect, target_screen, font), font,
                                            presenter, style, config);
}

} // namespace fm
