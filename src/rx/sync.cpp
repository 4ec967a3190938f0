#include "wxrx/rx/sync.hpp"

#include <cmath>

#include "wxrx/debug.hpp"

namespace wxrx::rx {

EnvelopeSync detect_envelope_sync(const SampleWindow& win, const EnvelopeTiming& t) {
    EnvelopeSync r;
    auto sh = win.segment(0, t.sync_high_end);
    auto sl = win.segment(t.sync_low_begin, t.window);
    r.clipped = sh.clipped || sl.clipped;
    r.high = sh.average;
    r.low = sl.average;

    // average of the high part must stand out of both noise ranges
    if (!(sh.average > sh.range && sh.average > sl.range)) return r;
    if (!(sh.average > sl.average)) return r;

    r.found = true;
    r.on_level = (sh.average + sl.average) / 2.f;
    return r;
}

PulseSyncCalibrator::Verdict PulseSyncCalibrator::on_pulse(size_t len, double limit) {
    double l = static_cast<double>(len);
    if (!(l > jitter_ && l < limit)) {
        WXRX_DEBUGF("sync ON pulse %zu out of range", len);
        return Verdict::Failed;
    }
    if (n_on_ >= on_.size()) {
        WXRX_DEBUGF("more than %zu ON pulses in sync block", on_.size());
        return Verdict::Failed;
    }
    on_[n_on_++] = len;
    return Verdict::Pending;
}

PulseSyncCalibrator::Verdict PulseSyncCalibrator::off_pulse(size_t len, double limit) {
    double l = static_cast<double>(len);
    if (!(l > jitter_ && l < limit)) {
        WXRX_DEBUGF("sync OFF pulse %zu out of range", len);
        return Verdict::Failed;
    }
    if (n_off_ >= off_.size()) return Verdict::Failed;
    off_[n_off_++] = len;
    if (n_off_ < off_.size()) return Verdict::Pending;
    return verify();
}

PulseSyncCalibrator::Verdict PulseSyncCalibrator::verify() {
    if (n_on_ != on_.size()) {
        WXRX_WARNF("number of ON/OFF pulses in sync block != 3");
        return Verdict::Failed;
    }
    double onl = (on_[0] + on_[1] + on_[2]) / 3.0;
    double offl = (off_[0] + off_[1]) / 2.0;
    WXRX_DEBUGF("onl=%.1f offl=%.1f", onl, offl);

    for (size_t v : on_) {
        if (std::fabs(onl - static_cast<double>(v)) > jitter_) {
            WXRX_WARNF("high jitter in sync block (ON)");
            return Verdict::Failed;
        }
    }
    if (static_cast<double>(off_[2]) < 2.0 * offl) {
        WXRX_WARNF("last OFF in sync is too short");
        return Verdict::Failed;
    }
    border_ = 1.5 * static_cast<double>(off_[2]);
    return Verdict::Locked;
}

size_t probe_window_length(const PreambleProbe& p) {
    size_t t3 = 3 * p.on_len + 2 * p.short_off_len;
    return t3 + p.guard + p.segment_len;
}

std::optional<double> calibrate_noise_level(const SampleWindow& win, const PreambleProbe& p, bool* clipped) {
    if (win.capacity() < probe_window_length(p) || !win.full()) return std::nullopt;

    // ON->OFF transitions of the three sync pulses
    const std::array<size_t, 3> edges = {
        p.on_len,
        2 * p.on_len + p.short_off_len,
        3 * p.on_len + 2 * p.short_off_len,
    };

    double sum = 0.0;
    bool clip = false;
    bool ok = true;
    for (size_t t : edges) {
        auto hi = win.segment(t - p.guard - p.segment_len, t - p.guard);
        auto lo = win.segment(t + p.guard, t + p.guard + p.segment_len);
        clip = clip || hi.clipped || lo.clipped;
        if (!(hi.average > 2.f * lo.average && hi.average > hi.range && hi.average > lo.range)) {
            ok = false;
            break;
        }
        sum += hi.average + lo.average;
    }
    if (clipped) *clipped = clip;
    if (!ok) return std::nullopt;
    return sum / 6.0;
}

} // namespace wxrx::rx
