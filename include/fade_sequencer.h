#pragma once

#include <chrono>

namespace fm {

enum class FadePhase { FadingIn, Holding, FadingOut, Done };

const char* to_string(FadePhase phase);

struct FadeProfile {
    double fade_in_s = 0.3;
    double hold_s = 2.8;
    double fade_out_s = 0.3;
    float peak = 0.2f;
    double startup_delay_s = 0.15;

    static FadeProfile highlight() { return FadeProfile{0.3, 2.8, 0.3, 0.2f, 0.15}; }
    static FadeProfile popup() { return FadeProfile{0.25, 3.1, 0.3, 0.98f, 0.05}; }

    double total_s() const { return fade_in_s + hold_s + fade_out_s; }
};

struct FadeSample {
    FadePhase phase = FadePhase::FadingIn;
    float opacity = 0.0f;
};

// Linear fade-in / hold / fade-out envelope driven purely by injected timestamps.
class FadeSequencer {
public:
    using Clock = std::chrono::steady_clock;

    FadeSequencer(const FadeProfile& profile, Clock::time_point start);

    FadeSample tick(Clock::time_point now);

    FadePhase phase() const { return phase_; }
    float opacity() const { return opacity_; }
    const FadeProfile& profile() const { return profile_; }

private:
    double phase_duration_s(FadePhase phase) const;
    float opacity_at(double elapsed_s) const;

    FadeProfile profile_;
    FadePhase phase_ = FadePhase::FadingIn;
    Clock::time_point phase_start_;
    float opacity_ = 0.0f;
};

} // namespace fm
