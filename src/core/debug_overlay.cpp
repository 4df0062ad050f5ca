#include <tilewrap/debug_overlay.h>

#include <cstdio>
#include <iterator>

namespace tilewrap {

namespace {

constexpr Color kPanelFill   {0, 0, 0, 153};
constexpr Color kPanelStroke {255, 255, 255, 38};
constexpr Color kText        {0xEF, 0xEF, 0xEF, 255};

// Vertical position of each line, in units of the font size.
constexpr float kLineSlots[] = {1.0f, 2.5f, 4.0f, 5.5f, 7.0f, 8.5f, 10.0f, 11.5f, 13.0f};

std::string format_viewport(const Box& b) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Viewport: %.1f, %.1f, %.1f, %.1f",
                  b.min_x, b.min_y, b.max_x, b.max_y);
    return buf;
}

std::string format_cell(const char* label, const CellAddress& c) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s: %d, %d, %d", label, c.index, c.col, c.row);
    return buf;
}

} // namespace

DebugOverlay::DebugOverlay(DebugOverlayConfig config)
    : config_(config)
{}

std::vector<std::string> DebugOverlay::lines(const DebugSnapshot& snap) {
    std::vector<std::string> out;
    char buf[128];

    out.push_back("Backend: " + snap.backend);

    std::snprintf(buf, sizeof(buf), "Framerate: %d", snap.framerate);
    out.emplace_back(buf);

    std::snprintf(buf, sizeof(buf), "Camera: %.2f, %.2f", snap.camera.x, snap.camera.y);
    out.emplace_back(buf);

    out.push_back(format_viewport(snap.viewport));

    if (snap.mouse) {
        std::snprintf(buf, sizeof(buf), "Mouse: %.2f, %.2f", snap.mouse->x, snap.mouse->y);
        out.emplace_back(buf);
    } else {
        out.emplace_back("Mouse: no mouse position yet");
    }

    std::snprintf(buf, sizeof(buf), "Velocity: %.2f, %.2f", snap.velocity.x, snap.velocity.y);
    out.emplace_back(buf);

    out.push_back(std::string("Is pressed: ") + (snap.pressed ? "true" : "false"));
    out.push_back(format_cell("Active Cell", snap.active));
    out.push_back(format_cell("Hovered Cell", snap.hovered));
    return out;
}

void DebugOverlay::draw(DrawSurface& surface, const DebugSnapshot& snap) const {
    if (!config_.show) return;

    const float offset = config_.offset;
    const float fs     = config_.font_size;

    // Panel width follows the viewport line, the widest one in practice.
    float w = surface.measure_text(format_viewport(snap.viewport), fs);

    surface.save();

    RectF panel{offset, offset, w + offset + fs * 1.25f, config_.panel_height};
    surface.fill_rect(panel, kPanelFill);
    surface.stroke_rect(panel, kPanelStroke);

    TextStyle style;
    style.size_px  = fs;
    style.color    = kText;
    style.baseline = TextBaseline::Middle;

    const double x = offset + fs;
    auto text = lines(snap);
    for (size_t i = 0; i < text.size() && i < std::size(kLineSlots); ++i) {
        double y = offset * 1.625 + fs * kLineSlots[i];
        surface.draw_text(text[i], Point{x, y}, style);
    }

    surface.restore();
}

} // namespace tilewrap
