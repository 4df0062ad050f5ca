#include <tilewrap/viewport.h>

#include <algorithm>

namespace tilewrap {

Viewport::Viewport(Grid grid, double width_px, double height_px)
    : grid_(grid)
{
    resize(width_px, height_px);
}

void Viewport::resize(double width_px, double height_px) {
    update_box(width_px, height_px);

    double cw = std::max(width_px / 4.0, height_px / 4.0);
    cell_ = CellSize{cw, cw / 4.0 * 5.0};

    canvas_ = make_box(0.0, 0.0, cell_.width * grid_.cols, cell_.height * grid_.rows);
}

double Viewport::wrap_axis(double cam, double delta, double extent) {
    if (-cam < 0.0)    return -extent;
    if (-cam > extent) return 0.0;
    return cam - delta;
}

void Viewport::pan(double dx, double dy) {
    camera_.x = wrap_axis(camera_.x, dx / camera_.scale, canvas_.width);
    camera_.y = wrap_axis(camera_.y, dy / camera_.scale, canvas_.height);
    update_box(box_.width, box_.height);
}

void Viewport::update_box(double width_px, double height_px) {
    box_ = make_box(-camera_.x, -camera_.y, width_px, height_px);
}

Point Viewport::screen_to_canvas(Point screen) const {
    return Point{screen.x / camera_.scale - camera_.x,
                 screen.y / camera_.scale - camera_.y};
}

CellAddress Viewport::cell_from_point(Point screen) const {
    return cell_at_world(screen_to_canvas(screen), cell_, grid_);
}

} // namespace tilewrap
