#include <tilewrap/grid.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace tilewrap {

Grid make_grid(int cols, int rows) {
    if (cols < kMinGridSide || rows < kMinGridSide)
        throw std::invalid_argument("grid must be at least " + std::to_string(kMinGridSide) +
                                    "x" + std::to_string(kMinGridSide) + ", got " +
                                    std::to_string(cols) + "x" + std::to_string(rows));
    if (static_cast<long long>(cols) * rows > std::numeric_limits<int>::max())
        throw std::invalid_argument("grid of " + std::to_string(cols) + "x" +
                                    std::to_string(rows) + " cells is too large");
    return Grid{cols, rows};
}

int wrap_index(double value, int n) {
    double r = std::fmod(value, static_cast<double>(n));
    if (r < 0.0) r += n;
    // fmod of an integral value is exact, but guard the upper edge anyway
    if (r >= n) r = 0.0;
    return static_cast<int>(r);
}

CellAddress cell_at_world(Point world, CellSize cell, Grid grid) {
    int col = wrap_index(std::floor(world.x / cell.width),  grid.cols);
    int row = wrap_index(std::floor(world.y / cell.height), grid.rows);
    return CellAddress{col + row * grid.cols, col, row};
}

} // namespace tilewrap
