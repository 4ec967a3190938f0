#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "wxrx/config.hpp"
#include "wxrx/constants.hpp"
#include "wxrx/debug.hpp"
#include "wxrx/records.hpp"
#include "wxrx/rx/elv_frame.hpp"
#include "wxrx/rx/envelope_demod.hpp"
#include "wxrx/rx/mebus_frame.hpp"
#include "wxrx/rx/pulse_demod.hpp"
#include "wxrx/rx/scheduler.hpp"
#include "wxrx/types.hpp"

namespace wxrx::rx {

struct ElvProtocol {
    using Params = ElvParams;
    using Record = ElvRecord;
    using Demodulator = EnvelopeDemodulator;

    static ProtocolDescriptor descriptor(const Params& p) {
        ProtocolDescriptor d;
        d.name = "elv";
        d.sync_by_run = true;
        d.sync_bit = 0;
        d.min_sync_run = p.min_sync_run;
        d.start_bit = 1;
        d.repeats = false;
        d.min_frame_bits = ELV_MIN_FRAME_BITS;
        d.max_frame_bits = p.max_frame_bits;
        d.max_repeats = 0;
        return d;
    }

    static DecodeOutcome<Record> decode(EngineContext& ctx) { return decode_elv_frame(ctx.bits); }
};

struct MebusProtocol {
    using Params = MebusParams;
    using Record = MebusRecord;
    using Demodulator = PulseDemodulator;

    static ProtocolDescriptor descriptor(const Params& p) {
        ProtocolDescriptor d;
        d.name = "mebus";
        d.sync_by_run = false;
        d.start_bit = 1;
        d.repeats = true;
        d.repeat_bit = 0;
        d.min_frame_bits = MEBUS_FRAME_BITS;
        d.max_frame_bits = p.max_frame_bits;
        d.max_repeats = p.max_repeats;
        return d;
    }

    static DecodeOutcome<Record> decode(EngineContext& ctx) {
        return decode_mebus_packet(std::span<const utils::BitBuffer>(ctx.repeats));
    }
};

// Streaming decoder: demodulator + generic frame automaton + frame decoder
// for one protocol. Records are returned as soon as a frame validates.
template <typename Protocol>
class Decoder : private SymbolSink {
public:
    using Params = typename Protocol::Params;
    using Record = typename Protocol::Record;

    explicit Decoder(const Params& params = Params{})
        : params_(checked(params)),
          desc_(Protocol::descriptor(params_)),
          demod_(params_) {}

    // Process one sample; returns the record completed by it, if any.
    std::optional<Record> push(Sample s) {
        process(s);
        if (ready_.empty()) return std::nullopt;
        Record r = std::move(ready_.front());
        ready_.erase(ready_.begin());
        return r;
    }

    std::vector<Record> push_samples(std::span<const Sample> chunk) {
        for (Sample s : chunk) process(s);
        return std::exchange(ready_, {});
    }

    // End of stream: decode whatever frame is still in flight, then return
    // to WAIT. The demodulator keeps its window so a later push continues
    // the same stream.
    std::vector<Record> flush() {
        if (finish(ctx_, desc_, stats_) != Action::None) decode_pending();
        reset_engine();
        return std::exchange(ready_, {});
    }

    void reset() {
        rx::reset(ctx_);
        demod_.reset();
        stats_ = DecodeStats{};
        ready_.clear();
    }

    RxState state() const override { return ctx_.state; }
    const EngineContext& context() const { return ctx_; }
    const DecodeStats& stats() const { return stats_; }
    const typename Protocol::Demodulator& demodulator() const { return demod_; }
    const Params& params() const { return params_; }

private:
    static const Params& checked(const Params& p) {
        validate(p);
        return p;
    }

    void process(Sample s) {
        ++stats_.samples;
        demod_.process(s, *this);
        const auto& clip = demod_.clip_monitor();
        stats_.clipped_segments = clip.events();
        stats_.clip_warnings = clip.warnings();
    }

    void on_symbol(const Symbol& sym) override {
        RxState before = ctx_.state;
        if (step(ctx_, desc_, sym, stats_) != Action::None) {
            decode_pending();
            reset_engine();
        } else if (before != RxState::WAIT && ctx_.state == RxState::WAIT) {
            demod_.resync();
        }
    }

    // ctx_ holds a complete frame (or repeat set) for Protocol::decode.
    void decode_pending() {
        auto out = Protocol::decode(ctx_);
        if (!out.record) {
            stats_.note(out.error);
            return;
        }
        ++stats_.records;
        ready_.push_back(std::move(*out.record));
    }

    void reset_engine() {
        rx::reset(ctx_);
        demod_.resync();
    }

    Params params_;
    ProtocolDescriptor desc_;
    typename Protocol::Demodulator demod_;
    EngineContext ctx_;
    DecodeStats stats_;
    std::vector<Record> ready_;
};

using ElvDecoder = Decoder<ElvProtocol>;
using MebusDecoder = Decoder<MebusProtocol>;

} // namespace wxrx::rx
