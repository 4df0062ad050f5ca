#pragma once

#include "geometry.h"
#include "viewport.h"

#include <cstddef>
#include <functional>
#include <vector>

namespace tilewrap {

struct VisibleCell {
    int   index;
    int   col;     // x-axis position in the grid (index % cols)
    int   row;     // y-axis position in the grid (index / cols)
    Point origin;  // top-left in camera-translated space, wrap shift applied
    Box   screen;  // on-screen rectangle
};

// Walk cells [0, count) and report the ones that intersect the viewport,
// each at the wrapped copy nearest the viewport. Grids of at least
// kMinGridSide cells per axis keep the canvas wider than the viewport plus
// one cell, so no more than one copy of a cell is ever on screen.
void for_each_visible_cell(const Viewport& vp, size_t count,
                           const std::function<void(const VisibleCell&)>& fn);

std::vector<VisibleCell> visible_cells(const Viewport& vp, size_t count);

} // namespace tilewrap
