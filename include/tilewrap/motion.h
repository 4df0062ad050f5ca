#pragma once

#include "geometry.h"

#include <optional>

namespace tilewrap {

class Viewport;

struct PointerPair {
    Point previous;
    Point current;
};

// Drag-to-pan with momentum. While pressed, each move pans the viewport by
// the pointer delta and records it as velocity; after a drag release the
// velocity decays by kDecay per frame until both components drop below
// kRestThreshold.
class MotionModel {
public:
    static constexpr double kTapSlopPx      = 10.0;
    static constexpr double kDecay          = 0.9;
    static constexpr double kRestThreshold  = 0.1;

    void on_press(bool pressed, std::optional<Point> at = std::nullopt);
    void on_move(Point at, Viewport& vp);

    // True when x is within the tap slop of the last press start.
    bool is_tap(double x) const;

    // Advance inertia by one frame. No-op while pressed or at rest.
    void animate(Viewport& vp);

    bool  pressed()     const { return pressed_; }
    Point velocity()    const { return velocity_; }
    Point press_start() const { return press_start_; }
    const std::optional<PointerPair>& pointer() const { return pointer_; }

private:
    std::optional<PointerPair> pointer_;
    Point press_start_;
    Point velocity_;
    bool  pressed_{false};
};

} // namespace tilewrap
