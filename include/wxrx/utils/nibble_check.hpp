#pragma once
#include <cstdint>

#include "wxrx/constants.hpp"

namespace wxrx::utils {

// Integrity accumulator of the ELV frame: every nibble (type included) is
// XORed and summed. A valid frame XORs to zero and its trailing sum nibble
// equals (sum + 5) & 0xF.
struct NibbleCheck {
    uint8_t xor_acc = 0;
    uint32_t sum = 0;
    int sum_constant = ELV_SUM_CONSTANT;

    void add(uint8_t nibble) {
        xor_acc ^= nibble & 0x0F;
        sum += nibble & 0x0F;
    }
    bool xor_ok() const { return xor_acc == 0; }
    uint8_t expected_sum() const { return static_cast<uint8_t>((sum + sum_constant) & 0x0F); }
    bool sum_ok(uint8_t received) const { return expected_sum() == (received & 0x0F); }
};

} // namespace wxrx::utils
