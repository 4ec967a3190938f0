#include "wxrx/utils/bit_buffer.hpp"

#include <string>

namespace wxrx::utils {

std::optional<uint32_t> BitBuffer::pop_lsb(size_t n) {
    if (n > 32 || remaining() < n) return std::nullopt;
    uint32_t v = 0;
    for (size_t i = 0; i < n; ++i)
        v |= static_cast<uint32_t>(bits_[cursor_ + i]) << i;
    cursor_ += n;
    return v;
}

std::optional<uint32_t> BitBuffer::pop_msb(size_t n) {
    if (n > 32 || remaining() < n) return std::nullopt;
    uint32_t v = 0;
    for (size_t i = 0; i < n; ++i)
        v = (v << 1) | bits_[cursor_ + i];
    cursor_ += n;
    return v;
}

std::string format_bits(std::span<const uint8_t> bits) {
    std::string s;
    s.reserve(bits.size() + bits.size() / 4 + 1);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (i % 4 == 0) s += ' ';
        s += bits[i] ? '1' : '0';
    }
    return s;
}

} // namespace wxrx::utils
