#pragma once

namespace tilewrap {

struct Point {
    double x{0.0};
    double y{0.0};
};

// World translation is stored negated: x/y say how far the world has been
// pushed under the viewport. scale must stay > 0.
struct Camera {
    double x{0.0};
    double y{0.0};
    double scale{1.0};
};

struct Box {
    double min_x{0.0}, min_y{0.0};
    double max_x{0.0}, max_y{0.0};
    double width{0.0}, height{0.0};
};

struct CellSize {
    double width{0.0};
    double height{0.0};
};

inline Box make_box(double min_x, double min_y, double width, double height) {
    return Box{min_x, min_y, min_x + width, min_y + height, width, height};
}

} // namespace tilewrap
