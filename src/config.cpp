#include "wxrx/config.hpp"

#include <stdexcept>
#include <string>

#include "wxrx/rx/timing.hpp"

namespace wxrx {

void validate(const ElvParams& p) {
    if (p.sample_rate_hz <= 0)
        throw std::invalid_argument("sample_rate_hz must be positive");
    if (!rx::timing_is_consistent(rx::make_envelope_timing(p.sample_rate_hz)))
        throw std::invalid_argument("sample_rate_hz " + std::to_string(p.sample_rate_hz) +
                                    " too low to resolve the ELV bit segments");
    if (p.clip_level <= 0)
        throw std::invalid_argument("clip_level must be positive");
    if (p.min_sync_run < 1)
        throw std::invalid_argument("min_sync_run must be at least 1");
    if (p.max_frame_bits < ELV_MIN_FRAME_BITS)
        throw std::invalid_argument("max_frame_bits smaller than the shortest ELV frame");
}

void validate(const MebusParams& p) {
    if (p.noise_level <= 0)
        throw std::invalid_argument("noise_level must be a positive integer value");
    if (p.jitter < 0)
        throw std::invalid_argument("jitter must not be negative");
    if (!(p.initial_pulse_limit > p.jitter))
        throw std::invalid_argument("initial_pulse_limit must exceed jitter");
    if (p.clip_level <= 0)
        throw std::invalid_argument("clip_level must be positive");
    if (p.max_repeats == 0)
        throw std::invalid_argument("max_repeats must be positive");
    if (p.max_frame_bits < MEBUS_FRAME_BITS)
        throw std::invalid_argument("max_frame_bits smaller than a Mebus frame");
    if (p.auto_noise_level) {
        const auto& pr = p.probe;
        if (pr.segment_len == 0)
            throw std::invalid_argument("probe.segment_len must be positive");
        if (pr.guard + pr.segment_len > pr.on_len || pr.guard + pr.segment_len > pr.short_off_len)
            throw std::invalid_argument("probe segments do not fit inside the sync pulses");
    }
}

} // namespace wxrx
