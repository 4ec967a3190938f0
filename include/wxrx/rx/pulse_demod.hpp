#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "wxrx/config.hpp"
#include "wxrx/rx/sample_window.hpp"
#include "wxrx/rx/scheduler.hpp"
#include "wxrx/rx/sync.hpp"
#include "wxrx/rx/timing.hpp"

namespace wxrx::rx {

// OFF pulse duration -> bit, against the calibrated border/limit.
Symbol classify_off_pulse(size_t len, const PulseThresholds& th);

// Mebus demodulator: binarizes samples against the noise level and turns
// ON/OFF pulse durations into symbols. With auto_noise_level the noise level
// is derived from the amplitude of each sync block before any edge is
// tracked.
class PulseDemodulator {
public:
    explicit PulseDemodulator(const MebusParams& params);

    void process(Sample s, SymbolSink& sink);

    // Frame automaton fell back to WAIT: drop calibrated thresholds.
    void resync();
    void reset();

    const PulseThresholds& thresholds() const { return th_; }
    bool noise_locked() const { return locked_; }
    const ClipMonitor& clip_monitor() const { return clip_; }

private:
    void edge(bool on, SymbolSink& sink);
    void rise(SymbolSink& sink);
    void fall(SymbolSink& sink);
    void restart_edges();
    bool calibrate(SymbolSink& sink);

    MebusParams params_;
    PulseThresholds th_;
    PulseSyncCalibrator sync_;
    bool locked_{true};
    bool signal_on_{false};
    long pulse_len_{-1};
    bool frame_gap_sent_{false};
    bool packet_gap_sent_{false};
    std::unique_ptr<SampleWindow> probe_win_;
    std::vector<float> replay_;
    ClipMonitor clip_;
    uint64_t sample_index_{0};
};

} // namespace wxrx::rx
