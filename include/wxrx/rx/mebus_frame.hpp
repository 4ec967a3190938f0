#pragma once
#include <span>

#include "wxrx/records.hpp"
#include "wxrx/types.hpp"
#include "wxrx/utils/bit_buffer.hpp"

namespace wxrx::rx {

// Validates that every repeat is bit-identical to the first and decodes the
// payload (MSB-first: id 11, setkey 1, channel 2, temperature 12, humidity 8).
DecodeOutcome<MebusRecord> decode_mebus_packet(std::span<const utils::BitBuffer> repeats);

} // namespace wxrx::rx
