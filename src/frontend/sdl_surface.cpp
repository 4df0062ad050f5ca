#include "sdl_surface.h"

#include <cmath>
#include <utility>

namespace tilewrap {

// Large sizes hold few glyphs per row; give them a bigger sheet.
SdlSurface::TextStack::TextStack(Renderer& r, const FontLibrary& library,
                                 int phys_px, float dpi_scale)
    : fonts(library.open(phys_px)),
      atlas(r, *fonts, phys_px >= 48 ? 2048 : 1024),
      layout(atlas, *fonts, dpi_scale),
      runs(256)
{}

SdlSurface::SdlSurface(Renderer& renderer, std::filesystem::path primary_font,
                       std::vector<std::filesystem::path> fallback_fonts,
                       float dpi_scale)
    : renderer_(renderer),
      fonts_(std::move(primary_font), fallback_fonts),
      dpi_scale_(dpi_scale)
{}

SdlSurface::~SdlSurface() = default;

void SdlSurface::set_dpi_scale(float scale) {
    if (scale == dpi_scale_) return;
    dpi_scale_ = scale;
    stacks_.clear();
}

SdlSurface::TextStack& SdlSurface::stack_for(float size_px) {
    int key = static_cast<int>(std::lround(size_px));
    auto it = stacks_.find(key);
    if (it != stacks_.end())
        return *it->second;

    int phys = static_cast<int>(key * dpi_scale_ + 0.5f);
    auto stack = std::make_unique<TextStack>(renderer_, fonts_, phys, dpi_scale_);
    return *(stacks_[key] = std::move(stack));
}

const GlyphRun& SdlSurface::shaped(TextStack& stack, std::string_view utf8) {
    if (const GlyphRun* hit = stack.runs.get(utf8))
        return *hit;
    return stack.runs.put(utf8, stack.layout.shape_line(utf8));
}

RectF SdlSurface::offset(RectF r) const {
    return RectF{r.x + static_cast<float>(origin_.x),
                 r.y + static_cast<float>(origin_.y), r.w, r.h};
}

// ---------------------------------------------------------------------------
// Shapes
// ---------------------------------------------------------------------------

void SdlSurface::clear_rect(RectF r) {
    renderer_.clear_rect(offset(r), background_);
}

void SdlSurface::fill_rect(RectF r, Color c) {
    renderer_.fill_rect(offset(r), c);
}

void SdlSurface::stroke_rect(RectF r, Color c) {
    renderer_.stroke_rect(offset(r), c);
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

void SdlSurface::draw_text(std::string_view utf8, Point at, const TextStyle& style) {
    TextStack& stack = stack_for(style.size_px);
    const GlyphRun& run = shaped(stack, utf8);

    float x = static_cast<float>(at.x + origin_.x);
    float y = static_cast<float>(at.y + origin_.y);

    float w = stack.layout.width_of(run);
    switch (style.align) {
    case TextAlign::Left:   break;
    case TextAlign::Center: x -= w / 2.0f; break;
    case TextAlign::Right:  x -= w;        break;
    }

    switch (style.baseline) {
    case TextBaseline::Alphabetic: y -= static_cast<float>(stack.layout.ascent()); break;
    case TextBaseline::Middle:     y -= stack.layout.line_height() / 2.0f;         break;
    case TextBaseline::Top:        break;
    }

    stack.layout.draw_run(renderer_, run, x, y, style.color);

    // Glyphs that did not fit are drawn from a fresh atlas next frame.
    if (stack.atlas.full())
        stack.atlas.clear();
}

float SdlSurface::measure_text(std::string_view utf8, float size_px) {
    TextStack& stack = stack_for(size_px);
    return stack.layout.width_of(shaped(stack, utf8));
}

// ---------------------------------------------------------------------------
// Transform state
// ---------------------------------------------------------------------------

void SdlSurface::save() {
    saved_.push_back(origin_);
}

void SdlSurface::restore() {
    if (saved_.empty()) return;
    origin_ = saved_.back();
    saved_.pop_back();
}

void SdlSurface::translate(double dx, double dy) {
    origin_.x += dx;
    origin_.y += dy;
}

std::string SdlSurface::name() const {
    return renderer_.name();
}

} // namespace tilewrap
