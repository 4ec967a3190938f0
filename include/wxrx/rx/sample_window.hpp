#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <liquid/liquid.h>

#include "wxrx/types.hpp"

namespace wxrx::rx {

struct SegmentStats {
    float average{0.f};
    float range{0.f};    // max - min
    bool clipped{false}; // a sample reached the clip level
};

// Fixed-capacity window over the most recent samples, backed by a liquid
// windowf. Index 0 is the oldest sample; the window starts zero-filled.
class SampleWindow {
public:
    explicit SampleWindow(size_t capacity, int clip_level = 32500);
    ~SampleWindow();

    SampleWindow(const SampleWindow&) = delete;
    SampleWindow& operator=(const SampleWindow&) = delete;

    void push(Sample s);
    void reset();

    size_t capacity() const { return capacity_; }
    // Number of samples pushed since construction/reset, saturating at capacity.
    size_t filled() const { return filled_; }
    bool full() const { return filled_ >= capacity_; }

    float at(size_t i) const;
    std::span<const float> view() const;

    // Mean and range over [begin, end). Requires begin < end <= capacity.
    SegmentStats segment(size_t begin, size_t end) const;

private:
    size_t capacity_;
    size_t filled_{0};
    int clip_level_;
    windowf win_{nullptr};
};

// Rate limiter for the clipping diagnostic: at most one warning per interval.
class ClipMonitor {
public:
    explicit ClipMonitor(size_t interval) : interval_(interval) {}

    // Record a clipped segment seen at stream position `sample_index`;
    // returns true when a warning should be emitted now.
    bool note(uint64_t sample_index);

    void reset() { events_ = 0; warnings_ = 0; warned_ = false; last_warning_ = 0; }

    uint64_t events() const { return events_; }
    uint64_t warnings() const { return warnings_; }

private:
    size_t interval_;
    uint64_t events_{0};
    uint64_t warnings_{0};
    bool warned_{false};
    uint64_t last_warning_{0};
};

} // namespace wxrx::rx
