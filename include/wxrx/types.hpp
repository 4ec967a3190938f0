#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace wxrx {

using Sample = int16_t;

enum class RxState { WAIT, SYNC, START, DATA, REPEAT_1, REPEAT_2 };

enum class DecodeError {
    None,
    SyncFailure,      // preamble unrecognized or too jittery
    InvalidPulse,     // pulse duration outside every bit class
    EdgeNotFound,     // envelope bit could not be decided
    FramingError,     // bad start/repeat bit or end-of-nibble marker
    FrameIncomplete,  // fewer bits than the layout needs
    FrameOverflow,    // bit buffer or repeat set bound exceeded
    ChecksumMismatch,
    SumMismatch,
    RepeatMismatch,
};

inline constexpr size_t DECODE_ERROR_COUNT = 10;

const char* to_string(RxState st);
const char* to_string(DecodeError err);

// Decoder output for one completed frame or packet.
template <typename Record>
struct DecodeOutcome {
    std::optional<Record> record;
    DecodeError error = DecodeError::None;

    static DecodeOutcome fail(DecodeError e) { return DecodeOutcome{std::nullopt, e}; }
    static DecodeOutcome ok(Record r) { return DecodeOutcome{std::move(r), DecodeError::None}; }
};

struct DecodeStats {
    uint64_t samples = 0;
    uint64_t syncs = 0;             // WAIT -> SYNC transitions
    uint64_t frames = 0;            // frames handed to a frame decoder
    uint64_t records = 0;
    uint64_t clipped_segments = 0;  // ELV: clipped window segments, Mebus: clipped samples
    uint64_t clip_warnings = 0;
    std::array<uint64_t, DECODE_ERROR_COUNT> errors{};
    DecodeError last_error = DecodeError::None;

    uint64_t count(DecodeError e) const { return errors[static_cast<size_t>(e)]; }
    void note(DecodeError e) {
        if (e == DecodeError::None) return;
        ++errors[static_cast<size_t>(e)];
        last_error = e;
    }
};

} // namespace wxrx
