#include "wxrx/rx/timing.hpp"

#include <cmath>

#include "wxrx/constants.hpp"

namespace wxrx::rx {

namespace {
size_t scale(size_t ref, int rate) {
    return static_cast<size_t>(std::lround(static_cast<double>(ref) * rate / ELV_REFERENCE_RATE_HZ));
}
} // namespace

EnvelopeTiming make_envelope_timing(int sample_rate_hz) {
    EnvelopeTiming t;
    if (sample_rate_hz <= 0) return t;
    t.window         = scale(ELV_WINDOW_REF, sample_rate_hz);
    t.sync_high_end  = scale(ELV_SYNC_HIGH_END_REF, sample_rate_hz);
    t.sync_low_begin = scale(ELV_SYNC_LOW_BEGIN_REF, sample_rate_hz);
    t.edge_search    = scale(ELV_EDGE_SEARCH_REF, sample_rate_hz);
    t.lead_begin     = scale(ELV_LEAD_BEGIN_REF, sample_rate_hz);
    t.lead_end       = scale(ELV_LEAD_END_REF, sample_rate_hz);
    t.mid_begin      = scale(ELV_MID_BEGIN_REF, sample_rate_hz);
    t.mid_end        = scale(ELV_MID_END_REF, sample_rate_hz);
    t.trail_begin    = scale(ELV_TRAIL_BEGIN_REF, sample_rate_hz);
    return t;
}

bool timing_is_consistent(const EnvelopeTiming& t) {
    if (t.window == 0 || t.edge_search == 0) return false;
    if (!(t.sync_high_end > 0 && t.sync_high_end <= t.sync_low_begin && t.sync_low_begin < t.window)) return false;
    if (!(t.lead_begin < t.lead_end && t.lead_end <= t.mid_begin && t.mid_begin < t.mid_end)) return false;
    if (!(t.mid_end <= t.trail_begin)) return false;
    // Worst case edge at edge_search - 1 must leave a non-empty trail segment.
    return t.trail_begin + t.edge_search - 1 < t.window;
}

} // namespace wxrx::rx
