#pragma once

#include "wxrx/types.hpp"

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace wxrx::io {

// Reads raw signed 16-bit samples in host byte order, as written by
// `rtl_fm -M`, from a file or stdin ("-").
class SampleReader {
public:
    static constexpr std::size_t kBlockBytes = 512;

    // Throws std::runtime_error when the file cannot be opened.
    explicit SampleReader(const std::filesystem::path &path);
    ~SampleReader();

    SampleReader(const SampleReader &) = delete;
    SampleReader &operator=(const SampleReader &) = delete;

    // Next block of up to 256 samples; empty at end of input. A trailing odd
    // byte is dropped. Throws std::runtime_error on read errors.
    std::span<const Sample> next_block();

    std::size_t samples_read() const { return total_; }

private:
    std::FILE *file_ = nullptr;
    bool owns_file_ = false;
    std::vector<Sample> block_;
    std::size_t total_ = 0;
};

} // namespace wxrx::io
