#include <tilewrap/grid_view.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace tilewrap {

namespace {

constexpr Color kCellFill   {0x1A, 0x1A, 0x1A, 255};
constexpr Color kCellStroke {0x3A, 0x3A, 0x3A, 255};
constexpr Color kCellText   {255, 255, 255, 255};

} // namespace

GridView::GridView(DrawSurface& surface, double width_px, double height_px,
                   std::vector<std::string> labels, GridConfig config)
    : surface_(surface),
      viewport_(make_grid(config.cols, config.rows), width_px, height_px),
      labels_(std::move(labels)),
      overlay_(DebugOverlayConfig{config.show_debug})
{
    size_t cap = static_cast<size_t>(viewport_.grid().cell_count());
    if (labels_.size() > cap)
        labels_.resize(cap);
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void GridView::on_move(double x, double y) {
    motion_.on_move(Point{x, y}, viewport_);
    hovered_ = viewport_.cell_from_point(Point{x, y});
}

void GridView::on_press(bool pressed, std::optional<Point> at) {
    motion_.on_press(pressed, at);
}

void GridView::on_click(double x, double y) {
    if (!motion_.is_tap(x)) return;
    active_ = viewport_.cell_from_point(Point{x, y});
}

void GridView::on_wheel(double dx, double dy) {
    viewport_.pan(-dx, -dy);
}

void GridView::on_resize(double width_px, double height_px) {
    viewport_.resize(width_px, height_px);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

void GridView::render(double timestamp_ms) {
    motion_.animate(viewport_);
    meter_.tick(timestamp_ms);

    surface_.clear_rect(RectF{0.0f, 0.0f,
                              static_cast<float>(viewport_.width_px()),
                              static_cast<float>(viewport_.height_px())});

    const Camera& cam = viewport_.camera();
    surface_.save();
    surface_.translate(cam.x, cam.y);

    for_each_visible_cell(viewport_, labels_.size(),
                          [this](const VisibleCell& c) { draw_cell(c); });

    surface_.restore();

    overlay_.draw(surface_, snapshot());
}

void GridView::draw_cell(const VisibleCell& cell) {
    const CellSize& size = viewport_.cell();
    const double    vw   = viewport_.width_px();

    RectF r{static_cast<float>(cell.origin.x), static_cast<float>(cell.origin.y),
            static_cast<float>(size.width),    static_cast<float>(size.height)};
    surface_.fill_rect(r, kCellFill);
    surface_.stroke_rect(r, kCellStroke);

    TextStyle index_style;
    index_style.size_px = kIndexFontPx;
    index_style.color   = kCellText;
    index_style.align   = TextAlign::Center;
    surface_.draw_text(std::to_string(cell.index),
                       Point{cell.origin.x + vw / 55.0, cell.origin.y + vw / 50.0},
                       index_style);

    TextStyle label_style;
    label_style.size_px  = kLabelFontPx;
    label_style.color    = kCellText;
    label_style.align    = TextAlign::Center;
    label_style.baseline = TextBaseline::Middle;
    surface_.draw_text(labels_[static_cast<size_t>(cell.index)],
                       Point{cell.origin.x + size.width / 2.0,
                             cell.origin.y + size.height / 2.0},
                       label_style);
}

DebugSnapshot GridView::snapshot() const {
    DebugSnapshot s;
    s.backend   = surface_.name();
    s.framerate = meter_.frames_per_second();
    s.camera    = viewport_.camera();
    s.viewport  = viewport_.box();
    if (motion_.pointer())
        s.mouse = motion_.pointer()->current;
    s.velocity  = motion_.velocity();
    s.pressed   = motion_.pressed();
    s.active    = active_;
    s.hovered   = hovered_;
    return s;
}

} // namespace tilewrap
