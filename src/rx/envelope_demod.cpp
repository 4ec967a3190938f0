#include "wxrx/rx/envelope_demod.hpp"

#include <cmath>

#include "wxrx/debug.hpp"
#include "wxrx/rx/sync.hpp"

namespace wxrx::rx {

EnvelopeBit evaluate_envelope_bit(const SampleWindow& win, const EnvelopeTiming& t, float on_level) {
    EnvelopeBit r;
    r.on_level = on_level;

    // the window starts while the carrier is off; find the off->on slope
    size_t skip = 0;
    while (skip < t.edge_search && !(win.at(skip) > on_level))
        ++skip;
    r.skip = skip;
    if (skip >= t.edge_search) return r;

    auto a = win.segment(skip + t.lead_begin, skip + t.lead_end);
    auto m = win.segment(skip + t.mid_begin, skip + t.mid_end);
    auto e = win.segment(skip + t.trail_begin, t.window);
    r.lead = a.average;
    r.mid = m.average;
    r.trail = e.average;
    r.clipped = a.clipped || m.clipped || e.clipped;

    r.kind = EnvelopeBit::Kind::Undecodable;
    if (a.average > a.range && a.average > e.average) {
        r.kind = EnvelopeBit::Kind::Bit;
        r.value = std::fabs(m.average - a.average) > std::fabs(m.average - e.average) ? 1 : 0;
    }
    // tracks drift even when the bit is rejected
    r.on_level = (a.average + e.average) / 2.f;
    return r;
}

EnvelopeDemodulator::EnvelopeDemodulator(const ElvParams& params)
    : timing_(make_envelope_timing(params.sample_rate_hz)),
      window_(timing_.window, params.clip_level),
      clip_(params.clip_warn_interval ? params.clip_warn_interval
                                      : static_cast<size_t>(params.sample_rate_hz)) {}

void EnvelopeDemodulator::process(Sample s, SymbolSink& sink) {
    window_.push(s);
    ++sample_index_;
    if (++pulse_len_ <= static_cast<long>(timing_.window)) return; // buffer not filled

    if (sink.state() == RxState::WAIT) {
        auto sy = detect_envelope_sync(window_, timing_);
        if (sy.clipped) note_clip();
        if (!sy.found) return;
        on_level_ = sy.on_level;
        pulse_len_ = 0;
        WXRX_INFOF("SYNC!");
        WXRX_DEBUGF("avh=%.1f avl=%.1f", sy.high, sy.low);
        sink.on_symbol(Symbol::acquire());
        return;
    }

    auto b = evaluate_envelope_bit(window_, timing_, on_level_);
    if (b.clipped) note_clip();
    pulse_len_ = -static_cast<long>(b.skip);
    WXRX_DEBUGF("skip=%zu", b.skip);
    switch (b.kind) {
    case EnvelopeBit::Kind::NoEdge:
        WXRX_DEBUGF("No starting slope off->on detected");
        sink.on_symbol(Symbol::end_of_frame());
        break;
    case EnvelopeBit::Kind::Undecodable:
        on_level_ = b.on_level;
        WXRX_WARNF("Failed to decode bitval");
        sink.on_symbol(Symbol::invalid(DecodeError::EdgeNotFound));
        break;
    case EnvelopeBit::Kind::Bit:
        on_level_ = b.on_level;
        WXRX_DEBUGF("bitval: a=%.1f m=%.1f e=%.1f val=%u", b.lead, b.mid, b.trail, unsigned(b.value));
        sink.on_symbol(Symbol::data(b.value));
        break;
    }
}

void EnvelopeDemodulator::resync() {
    on_level_ = 0.f;
}

void EnvelopeDemodulator::reset() {
    window_.reset();
    pulse_len_ = 0;
    on_level_ = 0.f;
    sample_index_ = 0;
    clip_.reset();
}

void EnvelopeDemodulator::note_clip() {
    if (clip_.note(sample_index_))
        WXRX_ERRORF("Clipped signal detected, you should reduce gain of receiver!");
}

} // namespace wxrx::rx
