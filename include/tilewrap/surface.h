#pragma once

#include "color.h"
#include "geometry.h"

#include <string>
#include <string_view>

namespace tilewrap {

enum class TextAlign    { Left, Center, Right };
enum class TextBaseline { Alphabetic, Middle, Top };

struct TextStyle {
    float        size_px{16.0f};
    Color        color{255, 255, 255, 255};
    TextAlign    align{TextAlign::Left};
    TextBaseline baseline{TextBaseline::Alphabetic};
};

// 2-D drawing capability the grid view renders through. Coordinates are
// logical pixels, offset by the current translation; save()/restore() push
// and pop that translation.
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual void clear_rect(RectF r) = 0;
    virtual void fill_rect(RectF r, Color c) = 0;
    virtual void stroke_rect(RectF r, Color c) = 0;

    virtual void  draw_text(std::string_view utf8, Point at, const TextStyle& style) = 0;
    virtual float measure_text(std::string_view utf8, float size_px) = 0;

    virtual void save() = 0;
    virtual void restore() = 0;
    virtual void translate(double dx, double dy) = 0;

    // Short description of the backend, shown in the debug overlay.
    virtual std::string name() const = 0;
};

} // namespace tilewrap
