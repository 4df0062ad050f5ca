#pragma once

#include "cell_iterator.h"
#include "debug_overlay.h"
#include "frame_meter.h"
#include "grid.h"
#include "motion.h"
#include "surface.h"
#include "viewport.h"

#include <optional>
#include <string>
#include <vector>

namespace tilewrap {

struct GridConfig {
    int  cols{10};
    int  rows{10};
    bool show_debug{true};
};

// A pannable, wrapping grid of labeled cells drawn onto a DrawSurface.
// The host forwards pointer, wheel and resize events and calls render()
// once per animation frame. Not thread-safe; one instance per surface.
class GridView {
public:
    // Throws std::invalid_argument for grids make_grid() rejects.
    // Labels beyond cols * rows are dropped.
    GridView(DrawSurface& surface, double width_px, double height_px,
             std::vector<std::string> labels, GridConfig config = {});

    GridView(const GridView&) = delete;
    GridView& operator=(const GridView&) = delete;

    // timestamp_ms must not decrease between calls.
    void render(double timestamp_ms);

    void on_move(double x, double y);
    void on_press(bool pressed, std::optional<Point> at = std::nullopt);
    void on_click(double x, double y);
    void on_wheel(double dx, double dy);
    void on_resize(double width_px, double height_px);

    void set_debug_visible(bool show) { overlay_.set_visible(show); }
    bool debug_visible() const { return overlay_.visible(); }

    DebugSnapshot snapshot() const;

    const Viewport&                 viewport()     const { return viewport_; }
    const MotionModel&              motion()       const { return motion_; }
    const CellAddress&              active_cell()  const { return active_; }
    const CellAddress&              hovered_cell() const { return hovered_; }
    const std::vector<std::string>& labels()       const { return labels_; }
    const FrameMeter&               frame_meter()  const { return meter_; }

private:
    void draw_cell(const VisibleCell& cell);

    DrawSurface&             surface_;
    Viewport                 viewport_;
    MotionModel              motion_;
    std::vector<std::string> labels_;
    CellAddress              active_;
    CellAddress              hovered_;
    FrameMeter               meter_;
    DebugOverlay             overlay_;

    static constexpr float kIndexFontPx = 13.0f;
    static constexpr float kLabelFontPx = 40.0f;
};

} // namespace tilewrap
