#pragma once
#include <cstddef>

namespace wxrx::rx {

// ELV envelope offsets in samples at the configured rate. Segment bounds are
// relative to the window start, or to the detected rising edge for the
// per-bit lead/mid/trail split.
struct EnvelopeTiming {
    size_t window{0};
    size_t sync_high_end{0};
    size_t sync_low_begin{0};
    size_t edge_search{0};
    size_t lead_begin{0};
    size_t lead_end{0};
    size_t mid_begin{0};
    size_t mid_end{0};
    size_t trail_begin{0};
};

EnvelopeTiming make_envelope_timing(int sample_rate_hz);

// True when every segment is non-empty and ordered inside the window for any
// edge position the search can report.
bool timing_is_consistent(const EnvelopeTiming& t);

// Mebus thresholds. noise_level binarizes samples; OFF pulses in
// (jitter, pulse_border) are 0 bits, in (pulse_border, pulse_limit) 1 bits.
struct PulseThresholds {
    double noise_level{500.0};
    double jitter{20.0};
    double pulse_border{0.0};
    double pulse_limit{10000.0};
};

} // namespace wxrx::rx
