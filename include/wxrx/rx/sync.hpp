#pragma once
#include <array>
#include <cstddef>
#include <optional>

#include "wxrx/config.hpp"
#include "wxrx/rx/sample_window.hpp"
#include "wxrx/rx/timing.hpp"
#include "wxrx/types.hpp"

namespace wxrx::rx {

// First ELV sync bit: a long high segment followed by a low one.
struct EnvelopeSync {
    bool found{false};
    float high{0.f};     // lead segment average
    float low{0.f};      // trail segment average
    float on_level{0.f}; // midpoint, valid when found
    bool clipped{false};
};

// Evaluates the full window as a candidate first sync 0 bit. Requires the
// lead average to exceed its own range, the trail range and the trail
// average (strictly).
EnvelopeSync detect_envelope_sync(const SampleWindow& win, const EnvelopeTiming& t);

// Collects the Mebus sync block (3 ON, 3 OFF pulses) and derives the pulse
// thresholds from it.
class PulseSyncCalibrator {
public:
    enum class Verdict { Pending, Locked, Failed };

    explicit PulseSyncCalibrator(double jitter = 20.0) : jitter_(jitter) {}

    // `limit` is the pulse limit in force before lock.
    Verdict on_pulse(size_t len, double limit);
    Verdict off_pulse(size_t len, double limit);

    void reset() { n_on_ = 0; n_off_ = 0; }
    size_t on_count() const { return n_on_; }
    size_t off_count() const { return n_off_; }

    // Valid after Verdict::Locked.
    double pulse_border() const { return border_; }
    double pulse_limit() const { return 2.0 * border_; }

private:
    Verdict verify();

    double jitter_;
    std::array<size_t, 3> on_{};
    std::array<size_t, 3> off_{};
    size_t n_on_{0};
    size_t n_off_{0};
    double border_{0.0};
};

// Samples a probe window needs: up to one segment past the third transition.
size_t probe_window_length(const PreambleProbe& probe);

// Amplitude self-calibration over a window whose index 0 is (close to) the
// first rising edge of a Mebus sync block. Returns the derived noise level
// when all three ON/OFF transitions show a clean step.
std::optional<double> calibrate_noise_level(const SampleWindow& win, const PreambleProbe& probe,
                                            bool* clipped = nullptr);

} // namespace wxrx::rx
