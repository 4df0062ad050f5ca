#pragma once

#include "geometry.h"

namespace tilewrap {

// Smallest grid side that keeps the canvas at least one cell wider than the
// viewport (a cell is never narrower than a quarter of the viewport).
constexpr int kMinGridSide = 5;

struct Grid {
    int cols{10};
    int rows{10};

    int cell_count() const { return cols * rows; }
};

// Checked constructor. Throws std::invalid_argument if either side is below
// kMinGridSide or cols * rows does not fit in an int.
Grid make_grid(int cols, int rows);

struct CellAddress {
    int index{0};
    int col{0};
    int row{0};

    bool operator==(const CellAddress&) const = default;
};

// Mathematical modulo of an integral-valued double: result in [0, n).
// Safe for magnitudes far beyond the range of int.
int wrap_index(double value, int n);

// Wrapped cell under a world-space point. col/row are always in range,
// including for points left of or above the world origin.
CellAddress cell_at_world(Point world, CellSize cell, Grid grid);

} // namespace tilewrap
