#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H

#include <cstdint>
#include <vector>

namespace tilewrap {

// Conversions from FreeType's rendered bitmaps to tightly packed,
// top-down pixel rows. Negative pitches (bottom-up bitmaps) are honoured.

// 8-bit coverage, width * rows bytes. GRAY is copied, MONO expands each bit
// to 0 or 255. Other modes yield all zeros.
std::vector<uint8_t> coverage_from_bitmap(const FT_Bitmap& bm);

// RGBA, still premultiplied, from an FT_PIXEL_MODE_BGRA bitmap.
std::vector<uint8_t> premultiplied_rgba(const FT_Bitmap& bm);

// Divides colour by alpha in place so the pixels suit straight-alpha blending.
// Fully transparent pixels become 0,0,0,0.
void unpremultiply(std::vector<uint8_t>& rgba);

} // namespace tilewrap
