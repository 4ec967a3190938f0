#include "wxrx/io/sample_reader.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace wxrx::io {

SampleReader::SampleReader(const std::filesystem::path &path)
    : block_(kBlockBytes / sizeof(Sample)) {
    if (path == "-") {
        file_ = stdin;
        return;
    }
    file_ = std::fopen(path.string().c_str(), "rb");
    if (!file_) {
        throw std::runtime_error("Failed to open sample file: " + path.string() + ": " + std::strerror(errno));
    }
    owns_file_ = true;
}

SampleReader::~SampleReader() {
    if (owns_file_ && file_) std::fclose(file_);
}

std::span<const Sample> SampleReader::next_block() {
    // fread may return short counts on pipes; keep reading until the block
    // is full or the stream ends.
    std::size_t got = 0;
    auto *dst = reinterpret_cast<unsigned char *>(block_.data());
    while (got < kBlockBytes) {
        std::size_t n = std::fread(dst + got, 1, kBlockBytes - got, file_);
        if (n == 0) break;
        got += n;
    }
    if (std::ferror(file_)) {
        throw std::runtime_error("Failed to read samples");
    }
    const std::size_t count = got / sizeof(Sample);
    total_ += count;
    return {block_.data(), count};
}

} // namespace wxrx::io
