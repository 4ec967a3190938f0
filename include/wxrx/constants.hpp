#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace wxrx {

// Rate at which all ELV envelope offsets below are specified. One ELV bit is
// 1220 us, i.e. 195.2 samples at 160 kHz.
inline constexpr double ELV_REFERENCE_RATE_HZ = 160000.0;

// Window holding a whole bit, rounded down so the next bit stays outside.
inline constexpr size_t ELV_WINDOW_REF       = 190;
// First sync bit: high for 134..137 samples, low for 58..61.
inline constexpr size_t ELV_SYNC_HIGH_END_REF = 133;
inline constexpr size_t ELV_SYNC_LOW_BEGIN_REF = 138;
// Rising edge must appear within this many samples at the window start.
inline constexpr size_t ELV_EDGE_SEARCH_REF  = 20;
// Lead segment (always high, 366 us) with 2 samples of jitter allowance.
inline constexpr size_t ELV_LEAD_BEGIN_REF   = 2;
inline constexpr size_t ELV_LEAD_END_REF     = 56;
// Mid segment (488 us), high for a 0 bit and low for a 1 bit.
inline constexpr size_t ELV_MID_BEGIN_REF    = 60;
inline constexpr size_t ELV_MID_END_REF      = 133;
// Trail segment (always low) runs to the window end.
inline constexpr size_t ELV_TRAIL_BEGIN_REF  = 138;

inline constexpr int ELV_SUM_CONSTANT = 5;
inline constexpr size_t ELV_SENSOR_TYPES = 8;

// Payload nibbles following the type nibble, per sensor type.
inline constexpr std::array<uint8_t, ELV_SENSOR_TYPES> ELV_SENSOR_NIBBLES = {5, 8, 5, 8, 12, 6, 6, 14};

inline constexpr std::array<const char*, ELV_SENSOR_TYPES> ELV_SENSOR_NAMES = {
    "Thermo", "Thermo/Hygro", "Rain(?)", "Wind(?)",
    "Thermo/Hygro/Baro", "Luminance(?)", "Pyrano(?)", "Kombi"};

// Smallest complete frame: type + 5 nibbles (each with end-of-nibble bit) + sum.
inline constexpr size_t ELV_MIN_FRAME_BITS = 5 + 5 * 5 + 4;

// Mebus payload: id(11) setkey(1) channel(2) temperature(12) humidity(8).
inline constexpr size_t MEBUS_FRAME_BITS = 11 + 1 + 2 + 12 + 8;

inline constexpr int SAMPLE_CLIP_LEVEL = 32500;

// Mebus has no sample rate setting; one second of input at the usual 160 kHz.
inline constexpr size_t MEBUS_CLIP_WARN_INTERVAL = 160000;

} // namespace wxrx
