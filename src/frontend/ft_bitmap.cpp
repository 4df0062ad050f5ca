#include "ft_bitmap.h"

#include <algorithm>
#include <cstddef>

namespace tilewrap {

namespace {

// Row y counted from the top of the image.
const unsigned char* top_down_row(const FT_Bitmap& bm, unsigned y) {
    if (bm.pitch >= 0)
        return bm.buffer + static_cast<ptrdiff_t>(y) * bm.pitch;
    return bm.buffer + static_cast<ptrdiff_t>(bm.rows - 1 - y) * -bm.pitch;
}

} // namespace

std::vector<uint8_t> coverage_from_bitmap(const FT_Bitmap& bm) {
    std::vector<uint8_t> out(static_cast<size_t>(bm.width) * bm.rows);
    if (bm.pixel_mode != FT_PIXEL_MODE_GRAY && bm.pixel_mode != FT_PIXEL_MODE_MONO)
        return out;

    for (unsigned y = 0; y < bm.rows; ++y) {
        const unsigned char* row = top_down_row(bm, y);
        uint8_t* dst = out.data() + static_cast<size_t>(y) * bm.width;
        if (bm.pixel_mode == FT_PIXEL_MODE_GRAY) {
            std::copy(row, row + bm.width, dst);
            continue;
        }
        for (unsigned x = 0; x < bm.width; ++x)
            dst[x] = (row[x >> 3] & (0x80 >> (x & 7))) ? 255 : 0;
    }
    return out;
}

std::vector<uint8_t> premultiplied_rgba(const FT_Bitmap& bm) {
    std::vector<uint8_t> out(static_cast<size_t>(bm.width) * bm.rows * 4);
    if (bm.pixel_mode != FT_PIXEL_MODE_BGRA)
        return out;

    uint8_t* d = out.data();
    for (unsigned y = 0; y < bm.rows; ++y) {
        const unsigned char* s = top_down_row(bm, y);
        for (unsigned x = 0; x < bm.width; ++x, s += 4, d += 4) {
            d[0] = s[2];
            d[1] = s[1];
            d[2] = s[0];
            d[3] = s[3];
        }
    }
    return out;
}

void unpremultiply(std::vector<uint8_t>& rgba) {
    for (size_t i = 0; i + 3 < rgba.size(); i += 4) {
        unsigned a = rgba[i + 3];
        if (a == 255)
            continue;
        for (size_t c = 0; c < 3; ++c) {
            unsigned v = a == 0 ? 0 : (rgba[i + c] * 255u + a / 2) / a;
            rgba[i + c] = static_cast<uint8_t>(std::min(v, 255u));
        }
    }
}

} // namespace tilewrap
