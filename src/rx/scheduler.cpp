#include "wxrx/rx/scheduler.hpp"

#include "wxrx/debug.hpp"

namespace wxrx::rx {

void reset(EngineContext& ctx) {
    ctx.state = RxState::WAIT;
    ctx.sync_count = 0;
    ctx.bits.clear();
    ctx.repeats.clear();
}

bool is_reset(const EngineContext& ctx) {
    return ctx.state == RxState::WAIT && ctx.sync_count == 0 && ctx.bits.empty() && ctx.repeats.empty();
}

namespace {

void reject(EngineContext& ctx, DecodeStats& stats, DecodeError err) {
    WXRX_DEBUGF("reject in %s: %s", to_string(ctx.state), to_string(err));
    stats.note(err);
    reset(ctx);
}

void begin_data(EngineContext& ctx) {
    ctx.bits.clear();
    ctx.state = RxState::DATA;
    WXRX_INFOF("START");
}

Action end_frame(EngineContext& ctx, const ProtocolDescriptor& desc, DecodeStats& stats) {
    if (ctx.bits.size() < desc.min_frame_bits) {
        WXRX_DEBUGF("%s: short frame (%zu bits) dropped", desc.name, ctx.bits.size());
        reset(ctx);
        return Action::None;
    }
    ++stats.frames;
    if (!desc.repeats)
        return Action::DecodeFrame;
    if (ctx.repeats.size() >= desc.max_repeats) {
        reject(ctx, stats, DecodeError::FrameOverflow);
        return Action::None;
    }
    WXRX_INFOF("DUMP Frame:%s", utils::format_bits(ctx.bits.bits()).c_str());
    ctx.repeats.push_back(ctx.bits);
    ctx.bits.clear();
    ctx.state = RxState::REPEAT_1;
    WXRX_INFOF("REPEATING...");
    return Action::None;
}

} // namespace

Action step(EngineContext& ctx, const ProtocolDescriptor& desc, const Symbol& sym, DecodeStats& stats) {
    using T = Symbol::Type;
    if (sym.type == T::None) return Action::None;
    if (sym.type == T::Invalid) {
        if (ctx.state != RxState::WAIT) reject(ctx, stats, sym.error);
        return Action::None;
    }

    switch (ctx.state) {
    case RxState::WAIT:
        if (sym.type == T::Acquire) {
            reset(ctx);
            ctx.state = RxState::SYNC;
            ++stats.syncs;
            WXRX_INFOF("SYNCING...");
        }
        break;

    case RxState::SYNC:
        if (sym.type == T::Locked && !desc.sync_by_run) {
            ctx.state = RxState::START;
        } else if (sym.type == T::Bit && desc.sync_by_run) {
            if (sym.bit == desc.sync_bit)
                ++ctx.sync_count;
            else if (ctx.sync_count >= desc.min_sync_run && sym.bit == desc.start_bit)
                begin_data(ctx);
        } else if (sym.type == T::EndOfFrame || sym.type == T::EndOfPacket) {
            reject(ctx, stats, DecodeError::SyncFailure);
        }
        break;

    case RxState::START:
        if (sym.type == T::Bit) {
            if (sym.bit == desc.start_bit) {
                begin_data(ctx);
            } else {
                WXRX_WARNF("Start bit is not %u", unsigned(desc.start_bit));
                reject(ctx, stats, DecodeError::FramingError);
            }
        } else if (sym.type == T::EndOfFrame || sym.type == T::EndOfPacket) {
            reject(ctx, stats, DecodeError::SyncFailure);
        }
        break;

    case RxState::DATA:
        if (sym.type == T::Bit) {
            if (ctx.bits.size() >= desc.max_frame_bits) {
                reject(ctx, stats, DecodeError::FrameOverflow);
                break;
            }
            ctx.bits.push(sym.bit);
        } else if (sym.type == T::EndOfFrame || sym.type == T::EndOfPacket) {
            return end_frame(ctx, desc, stats);
        }
        break;

    case RxState::REPEAT_1:
        if (sym.type == T::Pulse) {
            ctx.state = RxState::REPEAT_2;
        } else if (sym.type == T::EndOfPacket && !ctx.repeats.empty()) {
            // silence after the last frame, no separator pulse
            return Action::DecodePacket;
        }
        break;

    case RxState::REPEAT_2:
        if (sym.type == T::Bit) {
            if (sym.bit == desc.repeat_bit) {
                ctx.bits.clear();
                ctx.state = RxState::START;
                WXRX_INFOF("REPEAT");
            } else {
                WXRX_WARNF("Repeat bit is not %u", unsigned(desc.repeat_bit));
                reject(ctx, stats, DecodeError::FramingError);
            }
        } else if (sym.type == T::EndOfPacket) {
            return Action::DecodePacket;
        }
        break;
    }
    return Action::None;
}

Action finish(EngineContext& ctx, const ProtocolDescriptor& desc, DecodeStats& stats) {
    switch (ctx.state) {
    case RxState::DATA:
        if (desc.repeats) {
            if (ctx.bits.size() >= desc.min_frame_bits && ctx.repeats.size() < desc.max_repeats) {
                ++stats.frames;
                ctx.repeats.push_back(ctx.bits);
                ctx.bits.clear();
            }
            if (!ctx.repeats.empty()) return Action::DecodePacket;
        } else if (ctx.bits.size() >= desc.min_frame_bits) {
            ++stats.frames;
            return Action::DecodeFrame;
        }
        break;
    case RxState::REPEAT_1:
    case RxState::REPEAT_2:
    case RxState::START:
        if (desc.repeats && !ctx.repeats.empty()) return Action::DecodePacket;
        break;
    default:
        break;
    }
    reset(ctx);
    return Action::None;
}

} // namespace wxrx::rx
