#pragma once
#include <cstddef>
#include <cstdint>

#include "wxrx/config.hpp"
#include "wxrx/rx/sample_window.hpp"
#include "wxrx/rx/scheduler.hpp"
#include "wxrx/rx/timing.hpp"

namespace wxrx::rx {

// Outcome of one ELV bit evaluation.
struct EnvelopeBit {
    enum class Kind { Bit, NoEdge, Undecodable } kind = Kind::NoEdge;
    uint8_t value = 0;
    size_t skip = 0;         // offset of the rising edge in the window
    float lead = 0.f;
    float mid = 0.f;
    float trail = 0.f;
    float on_level = 0.f;    // re-derived level, updated unless NoEdge
    bool clipped = false;
};

// Decides the bit held in a full window given the current on-level.
EnvelopeBit evaluate_envelope_bit(const SampleWindow& win, const EnvelopeTiming& t, float on_level);

// ELV demodulator. Keeps a one-bit window and evaluates it once per bit
// period, re-aligned to the rising edge found in the previous bit.
class EnvelopeDemodulator {
public:
    explicit EnvelopeDemodulator(const ElvParams& params);

    void process(Sample s, SymbolSink& sink);

    // Called once the frame automaton fell back to WAIT.
    void resync();
    void reset();

    float on_level() const { return on_level_; }
    const EnvelopeTiming& timing() const { return timing_; }
    const ClipMonitor& clip_monitor() const { return clip_; }

private:
    void note_clip();

    EnvelopeTiming timing_;
    SampleWindow window_;
    ClipMonitor clip_;
    // Samples since the last evaluation point; negative after a bit so the
    // next window starts at the detected edge.
    long pulse_len_{0};
    float on_level_{0.f};
    uint64_t sample_index_{0};
};

} // namespace wxrx::rx
