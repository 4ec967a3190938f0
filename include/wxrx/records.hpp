#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace wxrx {

// Decoded ELV sensor frame. Optional fields are present only for the sensor
// types that carry them.
struct ElvRecord {
    uint8_t sensor_type = 0;          // 0..7
    std::string sensor_type_name;
    uint8_t address = 0;              // 0..7
    double temperature = 0.0;         // degC
    std::optional<double> humidity;   // %RH, types 1, 4 and 7
    std::optional<double> wind;       // km/h, type 7
    std::optional<uint32_t> rain_sum; // counter ticks, type 7
    std::optional<bool> rain_detect;  // type 7
    std::optional<int> pressure;      // hPa, type 4
};

struct MebusRecord {
    uint16_t id = 0;                  // 11 bit
    uint8_t setkey = 0;
    uint8_t channel = 0;              // raw 0..3, rendered 1-based
    double temperature = 0.0;         // degC
    uint8_t humidity = 0;             // %RH
};

std::string format_record(const ElvRecord& rec);
std::string format_record(const MebusRecord& rec);

} // namespace wxrx
