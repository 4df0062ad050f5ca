#include <tilewrap/cell_iterator.h>

#include <cmath>

namespace tilewrap {

namespace {

// Offset, in whole canvas extents, that moves a cell starting at `min`
// (screen space) so its left edge lands in [-size, extent - size). Once the
// camera overshoots the edge it can be several extents away.
double wrap_shift(double min, double size, double extent) {
    return -extent * std::floor((min + size) / extent);
}

bool edge_visible(double max, double span, double size) {
    return max >= 0.0 && max < span + size;
}

} // namespace

void for_each_visible_cell(const Viewport& vp, size_t count,
                           const std::function<void(const VisibleCell&)>& fn)
{
    const Camera&   cam    = vp.camera();
    const CellSize& cell   = vp.cell();
    const Box&      canvas = vp.canvas();
    const Box&      box    = vp.box();
    const int       cols   = vp.grid().cols;

    for (size_t i = 0; i < count; ++i) {
        int col = static_cast<int>(i % static_cast<size_t>(cols));
        int row = static_cast<int>(i / static_cast<size_t>(cols));

        double min_x = cam.x + col * cell.width;
        double min_y = cam.y + row * cell.height;

        double shift_x = wrap_shift(min_x, cell.width,  canvas.width);
        double shift_y = wrap_shift(min_y, cell.height, canvas.height);

        min_x += shift_x;
        min_y += shift_y;

        if (!edge_visible(min_x + cell.width,  box.width,  cell.width) ||
            !edge_visible(min_y + cell.height, box.height, cell.height))
            continue;

        VisibleCell vc;
        vc.index  = static_cast<int>(i);
        vc.col    = col;
        vc.row    = row;
        vc.origin = Point{col * cell.width + shift_x, row * cell.height + shift_y};
        vc.screen = make_box(min_x, min_y, cell.width, cell.height);
        fn(vc);
    }
}

std::vector<VisibleCell> visible_cells(const Viewport& vp, size_t count) {
    std::vector<VisibleCell> out;
    for_each_visible_cell(vp, count, [&](const VisibleCell& c) { out.push_back(c); });
    return out;
}

} // namespace tilewrap
