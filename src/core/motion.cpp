#include <tilewrap/motion.h>
#include <tilewrap/viewport.h>

#include <cmath>

namespace tilewrap {

void MotionModel::on_press(bool pressed, std::optional<Point> at) {
    pressed_ = pressed;

    if (pressed) {
        velocity_ = Point{};
        if (at) press_start_ = *at;
    } else if (at) {
        // Releasing close to where the press began is a tap: no fling.
        if (std::abs(press_start_.x - at->x) < kTapSlopPx)
            velocity_ = Point{};
    }
}

void MotionModel::on_move(Point at, Viewport& vp) {
    if (!pointer_)
        pointer_ = PointerPair{at, at};
    else
        pointer_ = PointerPair{pointer_->current, at};

    if (pressed_) {
        velocity_ = Point{pointer_->previous.x - pointer_->current.x,
                          pointer_->previous.y - pointer_->current.y};
        vp.pan(velocity_.x, velocity_.y);
    }
}

bool MotionModel::is_tap(double x) const {
    return std::abs(press_start_.x - x) <= kTapSlopPx;
}

void MotionModel::animate(Viewport& vp) {
    if (pressed_) return;
    if (velocity_.x == 0.0 && velocity_.y == 0.0) return;

    if (std::abs(velocity_.x) < kRestThreshold &&
        std::abs(velocity_.y) < kRestThreshold)
    {
        velocity_ = Point{};
        return;
    }

    vp.pan(velocity_.x, velocity_.y);
    velocity_.x *= kDecay;
    velocity_.y *= kDecay;
}

} // namespace tilewrap
