#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace tilewrap {

// A rasterized glyph. Metrics are in physical pixels.
struct GlyphBitmap {
    int width{0};
    int height{0};
    int bearing_x{0};   // left edge relative to the pen position
    int bearing_y{0};   // top edge above the baseline
    bool color{false};  // pixels are RGBA when set, 8-bit coverage otherwise
    std::vector<uint8_t> pixels;

    bool empty() const { return width == 0 || height == 0 || pixels.empty(); }
};

// One font file opened at a fixed pixel size, with its HarfBuzz font.
// Bitmap-only faces (color emoji) are rasterized at their native strike and
// scaled down to the requested size.
class FontFace {
public:
    FontFace(FT_Library lib, const std::filesystem::path& path, int size_px);
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    GlyphBitmap rasterize(uint32_t glyph_id);

    // 0 when the face has no glyph for the codepoint.
    uint32_t glyph_index(uint32_t codepoint) const;

    hb_font_t* hb_font() const { return hb_font_; }

    int line_height() const { return line_height_; }
    int ascent()      const { return ascent_; }

    // Factor from HarfBuzz positions to requested pixels. 1 for outline fonts.
    double bitmap_scale() const { return bitmap_scale_; }

private:
    FT_Face    face_{};
    hb_font_t* hb_font_{};
    int        line_height_{};
    int        ascent_{};
    double     bitmap_scale_{1.0};
};

// First sans-serif font found in the usual system locations, or empty.
std::filesystem::path find_system_sans_font();

// Installed fallback fonts, emoji first, then CJK and symbols.
std::vector<std::filesystem::path> find_fallback_fonts();

} // namespace tilewrap
