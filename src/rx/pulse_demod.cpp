#include "wxrx/rx/pulse_demod.hpp"

#include <cstdlib>

#include "wxrx/debug.hpp"

namespace wxrx::rx {

Symbol classify_off_pulse(size_t len, const PulseThresholds& th) {
    double l = static_cast<double>(len);
    if (l > th.jitter && l < th.pulse_border) return Symbol::data(0);
    if (l > th.pulse_border && l < th.pulse_limit) return Symbol::data(1);
    WXRX_WARNF("off pulse of %zu samples fits no bit", len);
    return Symbol::invalid(DecodeError::InvalidPulse);
}

PulseDemodulator::PulseDemodulator(const MebusParams& params)
    : params_(params),
      sync_(params.jitter),
      clip_(params.clip_warn_interval ? params.clip_warn_interval : MEBUS_CLIP_WARN_INTERVAL) {
    th_.jitter = params.jitter;
    if (params_.auto_noise_level) {
        probe_win_ = std::make_unique<SampleWindow>(probe_window_length(params_.probe), params_.clip_level);
        replay_.reserve(probe_win_->capacity());
    }
    resync();
}

void PulseDemodulator::process(Sample s, SymbolSink& sink) {
    ++sample_index_;
    if (std::abs(static_cast<int>(s)) > params_.clip_level && clip_.note(sample_index_))
        WXRX_ERRORF("Clipped signal detected, you should reduce gain of receiver!");

    if (probe_win_) {
        probe_win_->push(s);
        if (!locked_) {
            calibrate(sink);
            return;
        }
    }
    edge(static_cast<double>(s) > th_.noise_level, sink);
}

bool PulseDemodulator::calibrate(SymbolSink& sink) {
    auto level = calibrate_noise_level(*probe_win_, params_.probe);
    if (!level) return false;

    th_.noise_level = *level;
    locked_ = true;
    WXRX_INFOF("noise level calibrated to %.1f", *level);

    // the window holds the sync block from just before its first rise
    restart_edges();
    auto v = probe_win_->view();
    replay_.assign(v.begin(), v.end());
    for (float x : replay_) {
        if (!locked_) break;
        edge(x > th_.noise_level, sink);
    }
    return true;
}

void PulseDemodulator::edge(bool on, SymbolSink& sink) {
    ++pulse_len_;
    if (!signal_on_) {
        if (on) {
            rise(sink);
        } else if (sink.state() != RxState::WAIT) {
            if (!frame_gap_sent_ && pulse_len_ > th_.pulse_limit) {
                frame_gap_sent_ = true;
                sink.on_symbol(Symbol::end_of_frame());
            }
            if (!packet_gap_sent_ && pulse_len_ > 2.0 * th_.pulse_limit) {
                packet_gap_sent_ = true;
                sink.on_symbol(Symbol::end_of_packet());
            }
        }
    } else if (!on) {
        fall(sink);
    }
    signal_on_ = on;
}

void PulseDemodulator::rise(SymbolSink& sink) {
    size_t len = pulse_len_ > 0 ? static_cast<size_t>(pulse_len_) : 0;
    pulse_len_ = 0;
    frame_gap_sent_ = packet_gap_sent_ = false;

    WXRX_DEBUGF("OFF: %zu", len);
    switch (sink.state()) {
    case RxState::WAIT:
        sync_.reset();
        sink.on_symbol(Symbol::acquire());
        break;
    case RxState::SYNC: {
        auto v = sync_.off_pulse(len, th_.pulse_limit);
        if (v == PulseSyncCalibrator::Verdict::Failed) {
            sink.on_symbol(Symbol::invalid(DecodeError::SyncFailure));
        } else if (v == PulseSyncCalibrator::Verdict::Locked) {
            th_.pulse_border = sync_.pulse_border();
            th_.pulse_limit = sync_.pulse_limit();
            WXRX_INFOF("SYNC! pulse_border=%.1f pulse_limit=%.1f", th_.pulse_border, th_.pulse_limit);
            sink.on_symbol(Symbol::locked());
        }
        break;
    }
    case RxState::START:
    case RxState::DATA:
    case RxState::REPEAT_2:
        sink.on_symbol(classify_off_pulse(len, th_));
        break;
    case RxState::REPEAT_1:
        break;
    }
}

void PulseDemodulator::fall(SymbolSink& sink) {
    size_t len = pulse_len_ > 0 ? static_cast<size_t>(pulse_len_) : 0;
    pulse_len_ = 0;
    frame_gap_sent_ = packet_gap_sent_ = false;

    WXRX_DEBUGF(" ON: %zu", len);
    RxState st = sink.state();
    if (st == RxState::WAIT) return;
    if (st == RxState::SYNC) {
        if (sync_.on_pulse(len, th_.pulse_limit) == PulseSyncCalibrator::Verdict::Failed)
            sink.on_symbol(Symbol::invalid(DecodeError::SyncFailure));
        return;
    }
    sink.on_symbol(Symbol::pulse());
}

void PulseDemodulator::restart_edges() {
    signal_on_ = false;
    pulse_len_ = -1;
    frame_gap_sent_ = packet_gap_sent_ = false;
}

void PulseDemodulator::resync() {
    sync_.reset();
    th_.pulse_border = 0.0;
    th_.pulse_limit = params_.initial_pulse_limit;
    if (params_.auto_noise_level) {
        locked_ = false;
    } else {
        th_.noise_level = params_.noise_level;
        locked_ = true;
    }
}

void PulseDemodulator::reset() {
    resync();
    restart_edges();
    if (probe_win_) probe_win_->reset();
    clip_.reset();
    sample_index_ = 0;
}

} // namespace wxrx::rx
