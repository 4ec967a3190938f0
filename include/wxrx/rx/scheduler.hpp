#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "wxrx/types.hpp"
#include "wxrx/utils/bit_buffer.hpp"

namespace wxrx::rx {

// Demodulator output for one sample. Most samples produce Type::None.
struct Symbol {
    enum class Type {
        None,
        Acquire,     // preamble candidate found (WAIT -> SYNC)
        Locked,      // thresholds calibrated from the sync block (SYNC -> START)
        Bit,         // demodulated bit in `bit`
        Pulse,       // carrier pulse that carries no bit (repeat separator)
        EndOfFrame,  // gap/edge loss ending the bit stream
        EndOfPacket, // long gap after the last repeated frame
        Invalid,     // timing inconsistent with the encoding; `error` says why
    } type = Type::None;
    uint8_t bit = 0;
    DecodeError error = DecodeError::None;

    static Symbol none() { return {}; }
    static Symbol acquire() { return {Type::Acquire}; }
    static Symbol locked() { return {Type::Locked}; }
    static Symbol data(uint8_t b) { return {Type::Bit, static_cast<uint8_t>(b & 1u)}; }
    static Symbol pulse() { return {Type::Pulse}; }
    static Symbol end_of_frame() { return {Type::EndOfFrame}; }
    static Symbol end_of_packet() { return {Type::EndOfPacket}; }
    static Symbol invalid(DecodeError e) { return {Type::Invalid, 0, e}; }
};

// Receives demodulator output. state() lets a demodulator pick the per-state
// interpretation of a pulse; it must reflect every symbol delivered so far.
class SymbolSink {
public:
    virtual ~SymbolSink() = default;
    virtual void on_symbol(const Symbol& sym) = 0;
    virtual RxState state() const = 0;
};

// Transition predicates and bounds that distinguish one protocol's frame
// automaton from another's.
struct ProtocolDescriptor {
    const char* name = "";
    // SYNC is left after a run of `sync_bit` bits of at least `min_sync_run`
    // followed by `start_bit`. Otherwise SYNC waits for a Locked symbol and
    // START expects `start_bit`.
    bool sync_by_run = false;
    uint8_t sync_bit = 0;
    int min_sync_run = 0;
    uint8_t start_bit = 1;
    // Completed frames are collected into the repeat set and decoded together
    // at end-of-packet. Repeats are separated by a Pulse and `repeat_bit`.
    bool repeats = false;
    uint8_t repeat_bit = 0;
    size_t min_frame_bits = 0;
    size_t max_frame_bits = 512;
    size_t max_repeats = 16;
};

enum class Action { None, DecodeFrame, DecodePacket };

// Everything the frame automaton owns. Reset to a default-constructed value
// on every return to WAIT.
struct EngineContext {
    RxState state = RxState::WAIT;
    int sync_count = 0;
    utils::BitBuffer bits;
    std::vector<utils::BitBuffer> repeats;
};

void reset(EngineContext& ctx);
bool is_reset(const EngineContext& ctx);

// Advance the automaton by one demodulated symbol. A returned Decode* action
// leaves the context untouched so the caller can decode `bits` or `repeats`
// and then reset.
Action step(EngineContext& ctx, const ProtocolDescriptor& desc, const Symbol& sym, DecodeStats& stats);

// End-of-stream: decide whether the in-flight frame/packet is decodable.
// Non-decodable state is discarded.
Action finish(EngineContext& ctx, const ProtocolDescriptor& desc, DecodeStats& stats);

} // namespace wxrx::rx
