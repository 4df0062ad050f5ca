#include <tilewrap/frame_meter.h>

#include <cmath>

namespace tilewrap {

FrameMeter::FrameMeter(size_t window)
    : window_(window > 0 ? window : 1)
{}

void FrameMeter::tick(double timestamp_ms) {
    if (has_prev_) {
        double dt = timestamp_ms - prev_ms_;
        if (dt >= 0.0) {
            intervals_.push_back(dt);
            sum_ += dt;
            if (intervals_.size() > window_) {
                sum_ -= intervals_.front();
                intervals_.pop_front();
            }
        }
    }
    prev_ms_  = timestamp_ms;
    has_prev_ = true;
}

double FrameMeter::mean_interval_ms() const {
    if (intervals_.empty()) return 0.0;
    return sum_ / static_cast<double>(intervals_.size());
}

int FrameMeter::frames_per_second() const {
    double mean = mean_interval_ms();
    if (mean <= 0.0) return 0;
    return static_cast<int>(std::floor(1000.0 / mean));
}

void FrameMeter::reset() {
    intervals_.clear();
    sum_      = 0.0;
    prev_ms_  = 0.0;
    has_prev_ = false;
}

} // namespace tilewrap
