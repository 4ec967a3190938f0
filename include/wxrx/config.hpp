#pragma once
#include <cstddef>
#include <cstdint>

#include "wxrx/constants.hpp"

namespace wxrx {

struct ElvParams {
    // Sample rate of the AM-demodulated input. Envelope offsets are scaled
    // from their 160 kHz reference values.
    int sample_rate_hz = 160000;
    // Segments holding a sample beyond +/- clip_level count as clipped.
    int clip_level = SAMPLE_CLIP_LEVEL;
    // Minimum number of samples between two clipping warnings (0 = one per
    // second of input).
    size_t clip_warn_interval = 0;
    // Sync 0-bits required before a start bit is accepted.
    int min_sync_run = 7;
    // Upper bound on buffered data bits; longer frames are dropped.
    size_t max_frame_bits = 512;
};

// Amplitude probe used to derive the noise level from the sync block when
// auto_noise_level is set. Offsets are in samples from the first rising edge.
struct PreambleProbe {
    size_t on_len = 100;        // nominal sync ON pulse
    size_t short_off_len = 150; // nominal first two sync OFF pulses
    size_t segment_len = 16;
    size_t guard = 8;           // distance kept from each transition
};

struct MebusParams {
    // Binarization threshold. Ignored until calibrated when auto_noise_level.
    int noise_level = 500;
    // Timing tolerance in samples; pulses not longer than this are invalid.
    int jitter = 20;
    // Pulse limit used before the sync block calibrated the real one.
    double initial_pulse_limit = 10000.0;
    bool auto_noise_level = false;
    PreambleProbe probe{};
    size_t max_repeats = 16;
    size_t max_frame_bits = 256;
    // Samples beyond +/- clip_level count as clipped, one event per sample.
    int clip_level = SAMPLE_CLIP_LEVEL;
    // Minimum number of samples between two clipping warnings (0 =
    // MEBUS_CLIP_WARN_INTERVAL).
    size_t clip_warn_interval = MEBUS_CLIP_WARN_INTERVAL;
};

// Both throw std::invalid_argument describing the first offending field.
void validate(const ElvParams& params);
void validate(const MebusParams& params);

} // namespace wxrx
