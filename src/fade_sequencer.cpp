#include "fade_sequencer.h"

#include <algorithm>

namespace fm {

const char* to_string(FadePhase phase) {
    switch (phase) {
        case FadePhase::FadingIn: return "FadingIn";
        case FadePhase::Holding: return "Holding";
        case FadePhase::FadingOut: return "FadingOut";
        case FadePhase::Done: return "Done";
    }
    return "Unknown";
}

namespace {

FadePhase next_phase(FadePhase phase) {
    switch (phase) {
        case FadePhase::FadingIn: return FadePhase::Holding;
        case FadePhase::Holding: return FadePhase::FadingOut;
        default: return FadePhase::Done;
    }
}

} // namespace

FadeSequencer::FadeSequencer(const FadeProfile& profile, Clock::time_point start)
    : profile_(profile), phase_start_(start) {
    profile_.fade_in_s = std::max(0.0, profile_.fade_in_s);
    profile_.hold_s = std::max(0.0, profile_.hold_s);
    profile_.fade_out_s = std::max(0.0, profile_.fade_out_s);
    profile_.peak = std::clamp(profile_.peak, 0.0f, 1.0f);
}

FadeSample FadeSequencer::tick(Clock::time_point now) {
    double elapsed = std::max(0.0, std::chrono::duration<double>(now - phase_start_).count());

    // A late tick may cross several boundaries; each phase ends exactly where the next begins.
    while (phase_ != FadePhase::Done) {
        const double duration = phase_duration_s(phase_);
        if (elapsed < duration) break;
        phase_start_ += std::chrono::round<Clock::duration>(std::chrono::duration<double>(duration));
        elapsed = std::max(0.0, elapsed - duration);
        phase_ = next_phase(phase_);
    }

    opacity_ = opacity_at(elapsed);
    return FadeSample{phase_, opacity_};
}

double FadeSequencer::phase_duration_s(FadePhase phase) const {
    switch (phase) {
        case FadePhase::FadingIn: return profile_.fade_in_s;
        case FadePhase::Holding: return profile_.hold_s;
        case FadePhase::FadingOut: return profile_.fade_out_s;
        case FadePhase::Done: break;
    }
    return 0.0;
}

float FadeSequencer::opacity_at(double elapsed_s) const {
    switch (phase_) {
        case FadePhase::FadingIn:
            if (profile_.fade_in_s <= 0.0) return profile_.peak;
            return static_cast<float>(profile_.peak * std::min(elapsed_s, profile_.fade_in_s) / profile_.fade_in_s);
        case FadePhase::Holding:
            return profile_.peak;
        case FadePhase::FadingOut:
            if (profile_.fade_out_s <= 0.0) return 0.0f;
            return static_cast<float>(std::max(0.0, profile_.peak * (1.0 - elapsed_s / profile_.fade_out_s)));
        case FadePhase::Done:
            break;
    }
    return 0.0f;
}

} // namespace fm
