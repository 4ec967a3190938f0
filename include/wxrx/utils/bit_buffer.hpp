// Append-only bit storage consumed through a read cursor.
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace wxrx::utils {

class BitBuffer {
public:
    BitBuffer() = default;
    explicit BitBuffer(std::vector<uint8_t> bits) : bits_(std::move(bits)) {}

    void push(uint8_t bit) { bits_.push_back(bit & 1u); }
    void clear() { bits_.clear(); cursor_ = 0; }
    void rewind() { cursor_ = 0; }

    size_t size() const { return bits_.size(); }
    bool empty() const { return bits_.empty(); }
    size_t cursor() const { return cursor_; }
    size_t remaining() const { return bits_.size() - cursor_; }
    std::span<const uint8_t> bits() const { return bits_; }

    // Consume `n` bits (n <= 32). LSB-first: the first bit read is bit 0.
    // Returns nullopt and leaves the cursor untouched when fewer remain.
    std::optional<uint32_t> pop_lsb(size_t n);
    // MSB-first: the first bit read is the most significant.
    std::optional<uint32_t> pop_msb(size_t n);

    bool operator==(const BitBuffer& o) const { return bits_ == o.bits_; }

private:
    std::vector<uint8_t> bits_;
    size_t cursor_{0};
};

// Groups of four bits separated by spaces, e.g. " 0101 1100 01".
std::string format_bits(std::span<const uint8_t> bits);

} // namespace wxrx::utils
