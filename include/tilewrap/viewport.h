#pragma once

#include "geometry.h"
#include "grid.h"

namespace tilewrap {

// Camera over an infinitely tiling grid. Every camera mutation recomputes the
// visible world box in the same call, so box() is never stale.
class Viewport {
public:
    Viewport(Grid grid, double width_px, double height_px);

    // Recompute viewport box, cell size and canvas extent. Idempotent.
    // width_px and height_px must be positive.
    void resize(double width_px, double height_px);

    // Move the world under the viewport by (dx, dy) screen pixels, snapping
    // to the opposite edge once the camera leaves [0, canvas extent].
    void pan(double dx, double dy);

    Point screen_to_canvas(Point screen) const;

    CellAddress cell_from_point(Point screen) const;

    const Camera&   camera() const { return camera_; }
    const Box&      box()    const { return box_; }
    const Box&      canvas() const { return canvas_; }
    const CellSize& cell()   const { return cell_; }
    const Grid&     grid()   const { return grid_; }

    double width_px()  const { return box_.width; }
    double height_px() const { return box_.height; }

private:
    static double wrap_axis(double cam, double delta, double extent);
    void update_box(double width_px, double height_px);

    Grid     grid_;
    Camera   camera_;
    Box      box_;
    Box      canvas_;
    CellSize cell_;
};

} // namespace tilewrap
