#pragma once

#include <cstddef>
#include <deque>

namespace tilewrap {

// Rolling-average frame rate over the last `window` frame intervals.
class FrameMeter {
public:
    explicit FrameMeter(size_t window = 60);

    // Record a frame at timestamp_ms (non-decreasing). Intervals that run
    // backwards are dropped.
    void tick(double timestamp_ms);

    double mean_interval_ms() const;

    // floor(1000 / mean interval); 0 until two frames have been seen.
    int frames_per_second() const;

    size_t samples() const { return intervals_.size(); }

    void reset();

private:
    size_t             window_;
    std::deque<double> intervals_;
    double             sum_{0.0};
    double             prev_ms_{0.0};
    bool               has_prev_{false};
};

} // namespace tilewrap
