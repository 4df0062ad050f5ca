#include "font_face.h"
#include "ft_bitmap.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace tilewrap {

namespace {

const std::initializer_list<const char*> kSansCandidates = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
    "/usr/share/fonts/noto/NotoSans-Regular.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/System/Library/Fonts/Helvetica.ttc",
    "C:\\Windows\\Fonts\\segoeui.ttf",
};

const std::initializer_list<const char*> kFallbackCandidates = {
    "/usr/share/fonts/truetype/noto/NotoColorEmoji.ttf",
    "/usr/share/fonts/noto/NotoColorEmoji.ttf",
    "/usr/share/fonts/google-noto-emoji/NotoColorEmoji.ttf",
    "/System/Library/Fonts/Apple Color Emoji.ttc",
    "C:\\Windows\\Fonts\\seguiemj.ttf",
    "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
    "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
    "/usr/share/fonts/truetype/ancient-scripts/Symbola_hint.ttf",
    "/usr/share/fonts/TTF/Symbola.ttf",
};

// Bilinear resample of a premultiplied RGBA image to dst_w x dst_h.
std::vector<uint8_t> resample_rgba(const std::vector<uint8_t>& src, int src_w, int src_h,
                                   int dst_w, int dst_h)
{
    std::vector<uint8_t> dst(static_cast<size_t>(dst_w) * dst_h * 4);
    const double sx_step = static_cast<double>(src_w) / dst_w;
    const double sy_step = static_cast<double>(src_h) / dst_h;

    auto at = [&](int x, int y, int c) -> double {
        x = std::clamp(x, 0, src_w - 1);
        y = std::clamp(y, 0, src_h - 1);
        return src[(static_cast<size_t>(y) * src_w + x) * 4 + c];
    };

    for (int y = 0; y < dst_h; ++y) {
        double fy = (y + 0.5) * sy_step - 0.5;
        int    y0 = static_cast<int>(std::floor(fy));
        double ty = fy - y0;
        for (int x = 0; x < dst_w; ++x) {
            double fx = (x + 0.5) * sx_step - 0.5;
            int    x0 = static_cast<int>(std::floor(fx));
            double tx = fx - x0;
            uint8_t* out = &dst[(static_cast<size_t>(y) * dst_w + x) * 4];
            for (int c = 0; c < 4; ++c) {
                double top = at(x0, y0, c)     + (at(x0 + 1, y0, c)     - at(x0, y0, c))     * tx;
                double bot = at(x0, y0 + 1, c) + (at(x0 + 1, y0 + 1, c) - at(x0, y0 + 1, c)) * tx;
                out[c] = static_cast<uint8_t>(std::clamp(top + (bot - top) * ty + 0.5, 0.0, 255.0));
            }
        }
    }
    return dst;
}

std::filesystem::path first_existing(std::initializer_list<const char*> candidates) {
    for (const char* p : candidates)
        if (std::filesystem::exists(p)) return p;
    return {};
}

} // namespace

std::filesystem::path find_system_sans_font() {
    return first_existing(kSansCandidates);
}

std::vector<std::filesystem::path> find_fallback_fonts() {
    std::vector<std::filesystem::path> found;
    for (const char* p : kFallbackCandidates)
        if (std::filesystem::exists(p)) found.emplace_back(p);
    return found;
}

FontFace::FontFace(FT_Library lib, const std::filesystem::path& path, int size_px) {
    if (FT_New_Face(lib, path.c_str(), 0, &face_))
        throw std::runtime_error("Failed to load font: " + path.string());

    if (FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(size_px)) != 0) {
        // Bitmap-only face: pick the first strike and scale it on output.
        if (!FT_HAS_FIXED_SIZES(face_) || face_->num_fixed_sizes <= 0) {
            FT_Done_Face(face_);
            throw std::runtime_error("Font has no usable size: " + path.string());
        }
        FT_Select_Size(face_, 0);
        if (int strike = face_->available_sizes[0].height; strike > 0)
            bitmap_scale_ = static_cast<double>(size_px) / strike;
    }

    const FT_Size_Metrics& m = face_->size->metrics;
    line_height_ = static_cast<int>(std::lround((m.height   >> 6) * bitmap_scale_));
    ascent_      = static_cast<int>(std::lround((m.ascender >> 6) * bitmap_scale_));

    hb_font_ = hb_ft_font_create_referenced(face_);
}

FontFace::~FontFace() {
    if (hb_font_) hb_font_destroy(hb_font_);
    if (face_)    FT_Done_Face(face_);
}

GlyphBitmap FontFace::rasterize(uint32_t glyph_id) {
    GlyphBitmap out;
    if (FT_Load_Glyph(face_, glyph_id, FT_LOAD_DEFAULT | FT_LOAD_COLOR) ||
        FT_Render_Glyph(face_->glyph, FT_RENDER_MODE_NORMAL))
        return out;

    const FT_GlyphSlot slot = face_->glyph;
    const FT_Bitmap&   bm   = slot->bitmap;
    out.width     = static_cast<int>(bm.width);
    out.height    = static_cast<int>(bm.rows);
    out.bearing_x = slot->bitmap_left;
    out.bearing_y = slot->bitmap_top;
    if (out.width == 0 || out.height == 0)
        return out;

    if (bm.pixel_mode != FT_PIXEL_MODE_BGRA) {
        out.pixels = coverage_from_bitmap(bm);
        return out;
    }

    out.color  = true;
    out.pixels = premultiplied_rgba(bm);
    if (bitmap_scale_ < 1.0) {
        int w = std::max(1, static_cast<int>(std::lround(out.width  * bitmap_scale_)));
        int h = std::max(1, static_cast<int>(std::lround(out.height * bitmap_scale_)));
        out.pixels    = resample_rgba(out.pixels, out.width, out.height, w, h);
        out.width     = w;
        out.height    = h;
        out.bearing_x = static_cast<int>(std::lround(out.bearing_x * bitmap_scale_));
        out.bearing_y = static_cast<int>(std::lround(out.bearing_y * bitmap_scale_));
    }
    unpremultiply(out.pixels);
    return out;
}

uint32_t FontFace::glyph_index(uint32_t codepoint) const {
    return FT_Get_Char_Index(face_, codepoint);
}

} // namespace tilewrap
