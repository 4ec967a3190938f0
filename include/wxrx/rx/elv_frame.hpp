#pragma once
#include <array>
#include <cstdint>

#include "wxrx/records.hpp"
#include "wxrx/types.hpp"
#include "wxrx/utils/bit_buffer.hpp"

namespace wxrx::rx {

// Nibbles of one ELV frame after framing and integrity checks; n[0] is the
// first payload nibble (not the type).
struct ElvNibbles {
    uint8_t sensor_type = 0;
    std::array<uint8_t, 14> n{};
    uint8_t count = 0;
};

// Reads type, payload nibbles and sum from `bits` (LSB-first, each nibble but
// the sum followed by an end-of-nibble 1) and validates XOR and sum.
// Consumes from the buffer's cursor.
DecodeOutcome<ElvNibbles> read_elv_nibbles(utils::BitBuffer& bits);

// Maps validated nibbles to the sensor fields of their type.
ElvRecord elv_record_from_nibbles(const ElvNibbles& nb);

// read_elv_nibbles + elv_record_from_nibbles, starting from the first bit.
DecodeOutcome<ElvRecord> decode_elv_frame(utils::BitBuffer& bits);

} // namespace wxrx::rx
