#include <doctest/doctest.h>

#include <tilewrap/viewport.h>

#include <cmath>

using namespace tilewrap;

namespace {

// 400x500 viewport: cell = max(100, 125) = 125 wide, 156.25 tall.
Viewport make_viewport() {
    return Viewport(Grid{10, 10}, 400.0, 500.0);
}

void check_same_state(const Viewport& a, const Viewport& b) {
    CHECK(a.camera().x == b.camera().x);
    CHECK(a.camera().y == b.camera().y);
    CHECK(a.box().min_x == b.box().min_x);
    CHECK(a.box().min_y == b.box().min_y);
    CHECK(a.box().max_x == b.box().max_x);
    CHECK(a.box().max_y == b.box().max_y);
    CHECK(a.cell().width == b.cell().width);
    CHECK(a.cell().height == b.cell().height);
    CHECK(a.canvas().width == b.canvas().width);
    CHECK(a.canvas().height == b.canvas().height);
}

} // namespace

TEST_CASE("Viewport: initial geometry") {
    auto vp = make_viewport();

    CHECK(vp.camera().x == 0.0);
    CHECK(vp.camera().y == 0.0);
    CHECK(vp.camera().scale == 1.0);

    CHECK(vp.box().min_x == 0.0);
    CHECK(vp.box().min_y == 0.0);
    CHECK(vp.box().max_x == 400.0);
    CHECK(vp.box().max_y == 500.0);

    CHECK(vp.cell().width == 125.0);
    CHECK(vp.cell().height == 156.25);

    CHECK(vp.canvas().min_x == 0.0);
    CHECK(vp.canvas().max_x == 1250.0);
    CHECK(vp.canvas().width == 1250.0);
    CHECK(vp.canvas().height == 1562.5);
}

TEST_CASE("Viewport: cell width follows the larger viewport side") {
    Viewport wide(Grid{10, 10}, 800.0, 600.0);
    CHECK(wide.cell().width == 200.0);
    CHECK(wide.cell().height == 250.0);

    Viewport tall(Grid{4, 6}, 300.0, 1000.0);
    CHECK(tall.cell().width == 250.0);
    CHECK(tall.cell().height == 312.5);
    CHECK(tall.canvas().width == 1000.0);
    CHECK(tall.canvas().height == 1875.0);
}

TEST_CASE("Viewport: pan moves camera and box together") {
    auto vp = make_viewport();
    vp.pan(10.0, 20.0);

    CHECK(vp.camera().x == -10.0);
    CHECK(vp.camera().y == -20.0);
    CHECK(vp.box().min_x == 10.0);
    CHECK(vp.box().min_y == 20.0);
    CHECK(vp.box().max_x == 410.0);
    CHECK(vp.box().max_y == 520.0);
    CHECK(vp.box().width == 400.0);
    CHECK(vp.box().height == 500.0);
}

TEST_CASE("Viewport: leaving the near edge snaps to the far edge") {
    auto vp = make_viewport();

    vp.pan(-5.0, 0.0);
    CHECK(vp.camera().x == 5.0);
    CHECK(vp.box().min_x == -5.0);

    // The step that finds the camera out of range snaps instead of moving.
    vp.pan(1.0, 0.0);
    CHECK(vp.camera().x == -1250.0);
    CHECK(vp.box().min_x == 1250.0);
}

TEST_CASE("Viewport: leaving the far edge snaps to the origin") {
    auto vp = make_viewport();

    vp.pan(1250.0, 0.0);
    CHECK(vp.camera().x == -1250.0);

    vp.pan(10.0, 0.0);
    CHECK(vp.camera().x == -1260.0);

    vp.pan(1.0, 0.0);
    CHECK(vp.camera().x == 0.0);
    CHECK(vp.box().min_x == 0.0);
}

TEST_CASE("Viewport: vertical wrap uses the canvas height") {
    auto vp = make_viewport();

    vp.pan(0.0, -3.0);
    vp.pan(0.0, 1.0);
    CHECK(vp.camera().y == -1562.5);
    CHECK(vp.box().min_y == 1562.5);
    CHECK(vp.camera().x == 0.0);
}

TEST_CASE("Viewport: one canvas width of panning returns to the same tile position") {
    auto vp = make_viewport();
    vp.pan(30.0, 40.0);
    const Box before = vp.box();

    for (int i = 0; i < 10; ++i)
        vp.pan(125.0, 0.0);

    CHECK(std::fmod(vp.box().min_x - before.min_x, vp.canvas().width) == 0.0);
    CHECK(vp.box().min_y == before.min_y);
    CHECK(vp.box().width == before.width);
}

TEST_CASE("Viewport: screen_to_canvas applies the camera") {
    auto vp = make_viewport();
    auto p = vp.screen_to_canvas(Point{30.0, 40.0});
    CHECK(p.x == 30.0);
    CHECK(p.y == 40.0);

    vp.pan(10.0, 20.0);
    p = vp.screen_to_canvas(Point{30.0, 40.0});
    CHECK(p.x == 40.0);
    CHECK(p.y == 60.0);
}

TEST_CASE("Viewport: cell_from_point uses world coordinates") {
    auto vp = make_viewport();
    CHECK(vp.cell_from_point(Point{130.0, 160.0}) == CellAddress{11, 1, 1});

    vp.pan(-10.0, -10.0);
    // Screen (5, 5) is world (-5, -5): the last cell of the grid.
    CHECK(vp.cell_from_point(Point{5.0, 5.0}) == CellAddress{99, 9, 9});
}

TEST_CASE("Viewport: resize is idempotent") {
    auto a = make_viewport();
    a.pan(77.0, 33.0);
    auto b = a;

    a.resize(800.0, 600.0);
    b.resize(800.0, 600.0);
    b.resize(800.0, 600.0);
    check_same_state(a, b);

    CHECK(a.cell().width == 200.0);
    CHECK(a.canvas().width == 2000.0);
}

TEST_CASE("Viewport: resize keeps the camera") {
    auto vp = make_viewport();
    vp.pan(50.0, 60.0);
    vp.resize(640.0, 480.0);

    CHECK(vp.camera().x == -50.0);
    CHECK(vp.camera().y == -60.0);
    CHECK(vp.box().min_x == 50.0);
    CHECK(vp.box().max_x == 690.0);
    CHECK(vp.box().max_y == 540.0);
}
