#include "wxrx/rx/sample_window.hpp"

#include <algorithm>
#include <stdexcept>

namespace wxrx::rx {

SampleWindow::SampleWindow(size_t capacity, int clip_level)
    : capacity_(capacity), clip_level_(clip_level) {
    if (capacity_ == 0)
        throw std::invalid_argument("SampleWindow capacity must be positive");
    win_ = windowf_create(static_cast<unsigned int>(capacity_));
    if (!win_)
        throw std::runtime_error("windowf_create failed");
}

SampleWindow::~SampleWindow() {
    if (win_)
        windowf_destroy(win_);
}

void SampleWindow::push(Sample s) {
    windowf_push(win_, static_cast<float>(s));
    if (filled_ < capacity_) ++filled_;
}

void SampleWindow::reset() {
    windowf_reset(win_);
    filled_ = 0;
}

std::span<const float> SampleWindow::view() const {
    float* r = nullptr;
    windowf_read(win_, &r);
    return {r, capacity_};
}

float SampleWindow::at(size_t i) const {
    return view()[i];
}

SegmentStats SampleWindow::segment(size_t begin, size_t end) const {
    SegmentStats st;
    if (begin >= end || end > capacity_) return st;
    auto v = view();
    float sum = 0.f;
    float mn = v[begin];
    float mx = v[begin];
    for (size_t i = begin; i < end; ++i) {
        sum += v[i];
        mn = std::min(mn, v[i]);
        mx = std::max(mx, v[i]);
    }
    st.average = sum / static_cast<float>(end - begin);
    st.range = mx - mn;
    st.clipped = mx > static_cast<float>(clip_level_) || mn < -static_cast<float>(clip_level_);
    return st;
}

bool ClipMonitor::note(uint64_t sample_index) {
    ++events_;
    if (warned_ && sample_index - last_warning_ < interval_) return false;
    warned_ = true;
    last_warning_ = sample_index;
    ++warnings_;
    return true;
}

} // namespace wxrx::rx
