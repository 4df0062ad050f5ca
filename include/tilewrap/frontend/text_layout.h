#pragma once

#include "renderer.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tilewrap {

class GlyphAtlas;
class FontChain;

struct GlyphEntry {
    uint32_t glyph_id;
    uint8_t  font_index{0};
    int x;         // x position relative to run origin (physical pixels)
    int y_offset;  // vertical offset from HarfBuzz (pixels, positive = up)
};

struct GlyphRun {
    std::vector<GlyphEntry> glyphs;
    int total_width{0};    // total advance width in physical pixels
};

// Shapes and draws single-line labels at one font size.
class TextLayout {
public:
    TextLayout(GlyphAtlas& atlas, FontChain& fonts, float dpi_scale = 1.0f);

    // Shape a UTF-8 label using HarfBuzz + ICU BiDi. Line breaks are dropped.
    GlyphRun shape_line(std::string_view utf8) const;

    // Blit all glyphs in the run with its top-left corner at (x, y).
    void draw_run(Renderer& r, const GlyphRun& run, float x, float y, Color tint);

    // Logical width of a shaped run.
    float width_of(const GlyphRun& run) const;

    int line_height() const { return line_height_; }
    int ascent()      const { return ascent_; }

private:
    GlyphAtlas& atlas_;
    FontChain&  fonts_;
    float dpi_scale_{1.0f};
    int line_height_;
    int ascent_;
};

} // namespace tilewrap
