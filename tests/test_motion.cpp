#include <doctest/doctest.h>

#include <tilewrap/motion.h>
#include <tilewrap/viewport.h>

using namespace tilewrap;

namespace {

Viewport make_viewport() {
    return Viewport(Grid{10, 10}, 400.0, 500.0);
}

// Press at `from`, drag to `to` in one step, release at `to`.
void fling(MotionModel& m, Viewport& vp, Point from, Point to) {
    m.on_press(true, from);
    m.on_move(from, vp);
    m.on_move(to, vp);
    m.on_press(false, to);
}

} // namespace

TEST_CASE("MotionModel: pointer is unset until the first move") {
    MotionModel m;
    CHECK_FALSE(m.pointer().has_value());
    CHECK_FALSE(m.pressed());
    CHECK(m.velocity().x == 0.0);
    CHECK(m.velocity().y == 0.0);

    auto vp = make_viewport();
    m.on_move(Point{12.0, 34.0}, vp);
    REQUIRE(m.pointer().has_value());
    CHECK(m.pointer()->previous.x == 12.0);
    CHECK(m.pointer()->current.y == 34.0);
}

TEST_CASE("MotionModel: moving without a press does not pan") {
    MotionModel m;
    auto vp = make_viewport();
    m.on_move(Point{10.0, 10.0}, vp);
    m.on_move(Point{200.0, 150.0}, vp);

    CHECK(vp.camera().x == 0.0);
    CHECK(vp.camera().y == 0.0);
    CHECK(m.velocity().x == 0.0);
    CHECK(m.pointer()->previous.x == 10.0);
    CHECK(m.pointer()->current.x == 200.0);
}

TEST_CASE("MotionModel: dragging pans by the pointer delta") {
    MotionModel m;
    auto vp = make_viewport();

    m.on_press(true, Point{100.0, 100.0});
    m.on_move(Point{100.0, 100.0}, vp);
    m.on_move(Point{80.0, 90.0}, vp);

    CHECK(m.velocity().x == 20.0);
    CHECK(m.velocity().y == 10.0);
    CHECK(vp.camera().x == -20.0);
    CHECK(vp.camera().y == -10.0);

    m.on_move(Point{50.0, 90.0}, vp);
    CHECK(m.velocity().x == 30.0);
    CHECK(m.velocity().y == 0.0);
    CHECK(vp.camera().x == -50.0);
    CHECK(vp.camera().y == -10.0);
}

TEST_CASE("MotionModel: releasing a drag keeps momentum") {
    MotionModel m;
    auto vp = make_viewport();

    m.on_press(true, Point{100.0, 100.0});
    m.on_move(Point{100.0, 100.0}, vp);
    m.on_move(Point{80.0, 90.0}, vp);
    m.on_move(Point{50.0, 90.0}, vp);
    m.on_press(false, Point{50.0, 90.0});

    CHECK_FALSE(m.pressed());
    CHECK(m.velocity().x == 30.0);

    m.animate(vp);
    CHECK(vp.camera().x == -80.0);
    CHECK(vp.camera().y == -10.0);
    CHECK(m.velocity().x == doctest::Approx(27.0));
}

TEST_CASE("MotionModel: press resets velocity and records the start") {
    MotionModel m;
    auto vp = make_viewport();
    fling(m, vp, Point{200.0, 0.0}, Point{100.0, 0.0});
    REQUIRE(m.velocity().x == 100.0);

    m.on_press(true, Point{5.0, 6.0});
    CHECK(m.pressed());
    CHECK(m.velocity().x == 0.0);
    CHECK(m.velocity().y == 0.0);
    CHECK(m.press_start().x == 5.0);
    CHECK(m.press_start().y == 6.0);
}

TEST_CASE("MotionModel: a short release is a tap with no fling") {
    MotionModel m;
    auto vp = make_viewport();
    fling(m, vp, Point{100.0, 100.0}, Point{105.0, 100.0});

    CHECK(m.velocity().x == 0.0);
    CHECK(m.velocity().y == 0.0);
    CHECK(m.is_tap(105.0));
}

TEST_CASE("MotionModel: release exactly at the slop keeps velocity but still clicks") {
    MotionModel m;
    auto vp = make_viewport();
    fling(m, vp, Point{100.0, 100.0}, Point{110.0, 100.0});

    CHECK(m.velocity().x == -10.0);
    CHECK(m.is_tap(110.0));
    CHECK_FALSE(m.is_tap(110.5));
}

TEST_CASE("MotionModel: tap detection looks at horizontal distance only") {
    MotionModel m;
    auto vp = make_viewport();
    fling(m, vp, Point{100.0, 100.0}, Point{103.0, 200.0});

    CHECK(m.velocity().x == 0.0);
    CHECK(m.velocity().y == 0.0);
    CHECK(m.is_tap(103.0));
}

TEST_CASE("MotionModel: release without a position keeps velocity") {
    MotionModel m;
    auto vp = make_viewport();
    m.on_press(true, Point{100.0, 0.0});
    m.on_move(Point{100.0, 0.0}, vp);
    m.on_move(Point{98.0, 0.0}, vp);
    m.on_press(false);

    CHECK_FALSE(m.pressed());
    CHECK(m.velocity().x == 2.0);
}

TEST_CASE("MotionModel: animate does nothing while pressed") {
    MotionModel m;
    auto vp = make_viewport();
    m.on_press(true, Point{100.0, 100.0});
    m.on_move(Point{100.0, 100.0}, vp);
    m.on_move(Point{60.0, 100.0}, vp);

    Camera before = vp.camera();
    m.animate(vp);
    m.animate(vp);
    CHECK(vp.camera().x == before.x);
    CHECK(vp.camera().y == before.y);
    CHECK(m.velocity().x == 40.0);
}

TEST_CASE("MotionModel: animate does nothing at rest") {
    MotionModel m;
    auto vp = make_viewport();
    m.animate(vp);
    CHECK(vp.camera().x == 0.0);
    CHECK(vp.camera().y == 0.0);
}

TEST_CASE("MotionModel: inertia from 100 px/frame stops after 67 frames") {
    MotionModel m;
    auto vp = make_viewport();
    fling(m, vp, Point{200.0, 0.0}, Point{100.0, 0.0});
    REQUIRE(m.velocity().x == 100.0);

    int frames = 0;
    while (m.velocity().x != 0.0 || m.velocity().y != 0.0) {
        m.animate(vp);
        ++frames;
        REQUIRE(frames < 1000);
    }
    // 66 decaying steps, then one call that snaps the remainder to zero.
    CHECK(frames == 67);
}

TEST_CASE("MotionModel: inertia always comes to rest") {
    const Point starts[] = {
        {-37.5, 12.25}, {0.5, -250.0}, {999.0, 999.0}, {0.15, 0.0}, {-0.11, 0.09},
    };

    for (Point v : starts) {
        CAPTURE(v.x);
        CAPTURE(v.y);
        MotionModel m;
        auto vp = make_viewport();
        m.on_press(true, Point{500.0, 500.0});
        m.on_move(Point{500.0, 500.0}, vp);
        m.on_move(Point{500.0 - v.x, 500.0 - v.y}, vp);
        m.on_press(false);

        int frames = 0;
        while (m.velocity().x != 0.0 || m.velocity().y != 0.0) {
            m.animate(vp);
            ++frames;
            REQUIRE(frames < 1000);
        }
        CHECK(frames > 0);
    }
}

TEST_CASE("MotionModel: momentum keeps wrapping the camera") {
    MotionModel m;
    auto vp = make_viewport();
    fling(m, vp, Point{300.0, 300.0}, Point{100.0, 100.0});

    for (int i = 0; i < 200; ++i) {
        m.animate(vp);
        CHECK(-vp.camera().x >= -200.0);
        CHECK(-vp.camera().x <= vp.canvas().width + 200.0);
    }
}
