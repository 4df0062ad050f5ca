#include <tilewrap/frontend/text_layout.h>
#include "font_chain.h"
#include "glyph_atlas.h"

#include <hb.h>
#include <unicode/ubidi.h>
#include <unicode/ustring.h>

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace tilewrap {

namespace {

// Decode the UTF-8 codepoint starting at byte offset pos (0xFFFD if invalid).
uint32_t decode_at(std::string_view utf8, size_t pos) {
    if (pos >= utf8.size()) return 0;
    auto b = static_cast<uint8_t>(utf8[pos]);

    uint32_t cp;
    int extra;
    if      (b < 0x80)           { cp = b;        extra = 0; }
    else if ((b & 0xE0) == 0xC0) { cp = b & 0x1F; extra = 1; }
    else if ((b & 0xF0) == 0xE0) { cp = b & 0x0F; extra = 2; }
    else if ((b & 0xF8) == 0xF0) { cp = b & 0x07; extra = 3; }
    else return 0xFFFD;

    for (int i = 1; i <= extra; ++i) {
        if (pos + i >= utf8.size()) return 0xFFFD;
        auto cont = static_cast<uint8_t>(utf8[pos + i]);
        if ((cont & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (cont & 0x3F);
    }
    return cp;
}

// Fast check for bytes that may start an RTL or complex-script sequence
// (U+0590 and above).
bool might_need_bidi(std::string_view utf8) {
    for (char c : utf8) {
        auto b = static_cast<uint8_t>(c);
        if (b >= 0xD6 && b != 0xFF)
            return true;
    }
    return false;
}

struct BufferDeleter {
    void operator()(hb_buffer_t* b) const { hb_buffer_destroy(b); }
};
using HbBuffer = std::unique_ptr<hb_buffer_t, BufferDeleter>;

HbBuffer shape_with(hb_font_t* font, std::string_view utf8,
                    int start, int length, hb_direction_t direction)
{
    HbBuffer buf(hb_buffer_create());
    hb_buffer_add_utf8(buf.get(), utf8.data(), static_cast<int>(utf8.size()),
                       start, length);
    hb_buffer_set_direction(buf.get(), direction);
    hb_buffer_guess_segment_properties(buf.get());
    hb_shape(font, buf.get(), nullptr, 0);
    return buf;
}

// Shape one directional run and append its glyphs to out. Clusters the
// primary face cannot render are re-shaped with the first fallback face
// that has their leading codepoint.
void shape_run(FontChain& fonts, std::string_view utf8,
               int run_start, int run_length, hb_direction_t direction,
               int& x_accum, std::vector<GlyphEntry>& out)
{
    HbBuffer buf = shape_with(fonts.primary().hb_font(), utf8,
                              run_start, run_length, direction);

    unsigned count = 0;
    hb_glyph_info_t*     infos = hb_buffer_get_glyph_infos(buf.get(), &count);
    hb_glyph_position_t* pos   = hb_buffer_get_glyph_positions(buf.get(), &count);

    for (unsigned i = 0; i < count; ++i) {
        if (infos[i].codepoint == 0) {
            int cluster = static_cast<int>(infos[i].cluster);
            auto [fi, fallback_gid] = fonts.resolve(decode_at(utf8, cluster));
            if (fallback_gid != 0 && fi != 0) {
                // Cluster ends where the next higher cluster starts, in
                // either direction.
                int next = run_start + run_length;
                for (unsigned j = 0; j < count; ++j) {
                    int c = static_cast<int>(infos[j].cluster);
                    if (c > cluster && c < next) next = c;
                }
                int len = next - cluster;

                FontFace& face = fonts.font(fi);
                HbBuffer fb = shape_with(face.hb_font(), utf8, cluster, len, direction);

                unsigned fb_count = 0;
                hb_glyph_info_t*     fb_infos = hb_buffer_get_glyph_infos(fb.get(), &fb_count);
                hb_glyph_position_t* fb_pos   = hb_buffer_get_glyph_positions(fb.get(), &fb_count);

                double scale = face.bitmap_scale();
                for (unsigned j = 0; j < fb_count; ++j) {
                    GlyphEntry ge;
                    ge.glyph_id   = fb_infos[j].codepoint;
                    ge.font_index = fi;
                    ge.x          = x_accum + static_cast<int>((fb_pos[j].x_offset >> 6) * scale);
                    ge.y_offset   = static_cast<int>((fb_pos[j].y_offset >> 6) * scale);
                    out.push_back(ge);
                    x_accum += static_cast<int>((fb_pos[j].x_advance >> 6) * scale);
                }

                // Skip the remaining primary glyphs of this cluster.
                while (i + 1 < count && static_cast<int>(infos[i + 1].cluster) == cluster)
                    ++i;
                continue;
            }
        }

        GlyphEntry ge;
        ge.glyph_id   = infos[i].codepoint;
        ge.font_index = 0;
        ge.x          = x_accum + (pos[i].x_offset >> 6);
        ge.y_offset   = pos[i].y_offset >> 6;
        out.push_back(ge);
        x_accum += pos[i].x_advance >> 6;
    }
}

// UTF-16 index → UTF-8 byte offset for every position in utf8 (plus end).
std::vector<int32_t> utf16_to_utf8_map(std::string_view utf8, int32_t u16_len) {
    std::vector<int32_t> map(static_cast<size_t>(u16_len) + 1, static_cast<int32_t>(utf8.size()));
    int32_t u8i = 0, u16i = 0;
    while (u8i < static_cast<int32_t>(utf8.size()) && u16i <= u16_len) {
        auto b = static_cast<uint8_t>(utf8[u8i]);
        int u8_len, u16_units;
        if      (b < 0x80) { u8_len = 1; u16_units = 1; }
        else if (b < 0xE0) { u8_len = 2; u16_units = 1; }
        else if (b < 0xF0) { u8_len = 3; u16_units = 1; }
        else               { u8_len = 4; u16_units = 2; } // surrogate pair
        for (int k = 0; k < u16_units && u16i + k <= u16_len; ++k)
            map[u16i + k] = u8i;
        u8i  += u8_len;
        u16i += u16_units;
    }
    return map;
}

} // namespace

TextLayout::TextLayout(GlyphAtlas& atlas, FontChain& fonts, float dpi_scale)
    : atlas_(atlas), fonts_(fonts), dpi_scale_(dpi_scale),
      line_height_(static_cast<int>(fonts.line_height() / dpi_scale + 0.5f)),
      ascent_(static_cast<int>(fonts.ascent() / dpi_scale + 0.5f))
{}

GlyphRun TextLayout::shape_line(std::string_view utf8) const {
    GlyphRun run;

    // Labels are single-line: cut at the first line break.
    size_t nl = utf8.find_first_of("\r\n");
    if (nl != std::string_view::npos)
        utf8 = utf8.substr(0, nl);
    if (utf8.empty()) return run;

    int x_accum = 0;

    if (!might_need_bidi(utf8)) {
        shape_run(fonts_, utf8, 0, static_cast<int>(utf8.size()),
                  HB_DIRECTION_LTR, x_accum, run.glyphs);
        run.total_width = x_accum;
        return run;
    }

    // ICU BiDi path; UTF-8 → UTF-16 for ICU
    int32_t u16_len = 0;
    UErrorCode err = U_ZERO_ERROR;
    u_strFromUTF8(nullptr, 0, &u16_len,
                  utf8.data(), static_cast<int32_t>(utf8.size()), &err);
    err = U_ZERO_ERROR; // reset buffer overflow error

    std::vector<UChar> u16(static_cast<size_t>(u16_len) + 1);
    u_strFromUTF8(u16.data(), u16_len + 1, &u16_len,
                  utf8.data(), static_cast<int32_t>(utf8.size()), &err);

    UBiDi* bidi = U_SUCCESS(err) ? ubidi_open() : nullptr;
    if (bidi)
        ubidi_setPara(bidi, u16.data(), u16_len, UBIDI_DEFAULT_LTR, nullptr, &err);

    if (!bidi || U_FAILURE(err)) {
        // Fall back to a single LTR run
        if (bidi) ubidi_close(bidi);
        shape_run(fonts_, utf8, 0, static_cast<int>(utf8.size()),
                  HB_DIRECTION_LTR, x_accum, run.glyphs);
        run.total_width = x_accum;
        return run;
    }

    std::vector<int32_t> u16_to_u8 = utf16_to_utf8_map(utf8, u16_len);

    int32_t run_count = ubidi_countRuns(bidi, &err);
    for (int32_t i = 0; U_SUCCESS(err) && i < run_count; ++i) {
        int32_t logical_start = 0, length = 0;
        UBiDiDirection dir = ubidi_getVisualRun(bidi, i, &logical_start, &length);

        int32_t u8_start = u16_to_u8[logical_start];
        int32_t u8_end   = u16_to_u8[logical_start + length];

        shape_run(fonts_, utf8, u8_start, u8_end - u8_start,
                  dir == UBIDI_RTL ? HB_DIRECTION_RTL : HB_DIRECTION_LTR,
                  x_accum, run.glyphs);
    }

    ubidi_close(bidi);
    run.total_width = x_accum;
    return run;
}

void TextLayout::draw_run(Renderer& r, const GlyphRun& run, float x, float y,
                          Color tint)
{
    float baseline_y = y + static_cast<float>(ascent_);
    float inv = 1.0f / dpi_scale_;

    for (const GlyphEntry& ge : run.glyphs) {
        const AtlasGlyph* ag = atlas_.glyph(ge.font_index, ge.glyph_id);
        if (!ag || ag->rect.w == 0 || ag->rect.h == 0)
            continue;

        SDL_FRect dst;
        dst.x = x + (ge.x + ag->bearing_x) * inv;
        dst.y = baseline_y - (ag->bearing_y + ge.y_offset) * inv;
        dst.w = ag->rect.w * inv;
        dst.h = ag->rect.h * inv;

        r.blit(atlas_.texture(), ag->rect, dst, tint);
    }
}

float TextLayout::width_of(const GlyphRun& run) const {
    return static_cast<float>(run.total_width) / dpi_scale_;
}

} // namespace tilewrap
