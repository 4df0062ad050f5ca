#pragma once

#include "geometry.h"
#include "grid.h"
#include "surface.h"

#include <optional>
#include <string>
#include <vector>

namespace tilewrap {

// Everything the overlay shows. Filled by GridView once per frame.
struct DebugSnapshot {
    std::string          backend;
    int                  framerate{0};
    Camera               camera;
    Box                  viewport;
    std::optional<Point> mouse;
    Point                velocity;
    bool                 pressed{false};
    CellAddress          active;
    CellAddress          hovered;
};

struct DebugOverlayConfig {
    bool  show{true};
    float offset{12.0f};
    float font_size{16.0f};
    float panel_height{240.0f};
};

class DebugOverlay {
public:
    explicit DebugOverlay(DebugOverlayConfig config = {});

    void draw(DrawSurface& surface, const DebugSnapshot& snap) const;

    // Text lines in display order.
    static std::vector<std::string> lines(const DebugSnapshot& snap);

    bool visible() const { return config_.show; }
    void set_visible(bool show) { config_.show = show; }

    const DebugOverlayConfig& config() const { return config_; }

private:
    DebugOverlayConfig config_;
};

} // namespace tilewrap
