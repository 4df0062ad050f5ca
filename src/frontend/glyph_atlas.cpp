#include "glyph_atlas.h"

#include <stdexcept>
#include <string>

namespace tilewrap {

namespace {

constexpr int kPadding = 1;

uint64_t glyph_key(uint8_t font_index, uint32_t glyph_id) {
    return (static_cast<uint64_t>(font_index) << 32) | glyph_id;
}

} // namespace

GlyphAtlas::GlyphAtlas(Renderer& renderer, FontChain& fonts, int size)
    : renderer_(renderer), fonts_(fonts), size_(size)
{
    texture_ = renderer_.create_texture(size_, size_);
    if (!texture_)
        throw std::runtime_error(std::string("Failed to create glyph atlas texture: ")
                                 + SDL_GetError());
    clear();
}

GlyphAtlas::~GlyphAtlas() {
    if (texture_) SDL_DestroyTexture(texture_);
}

void GlyphAtlas::clear() {
    glyphs_.clear();
    shelves_.clear();
    full_ = false;

    std::vector<uint8_t> transparent(static_cast<size_t>(size_) * size_ * 4, 0);
    renderer_.update_texture(texture_, nullptr, transparent.data(), size_ * 4);
}

bool GlyphAtlas::allocate(int w, int h, SDL_Point& at) {
    Shelf* best = nullptr;
    for (Shelf& s : shelves_) {
        if (s.height < h || s.next_x + w > size_) continue;
        if (!best || s.height < best->height) best = &s;
    }

    if (!best) {
        int top = shelves_.empty() ? kPadding
                                   : shelves_.back().y + shelves_.back().height;
        if (top + h > size_ || kPadding + w > size_)
            return false;
        shelves_.push_back(Shelf{top, h, kPadding});
        best = &shelves_.back();
    }

    at = SDL_Point{best->next_x, best->y};
    best->next_x += w;
    return true;
}

const AtlasGlyph* GlyphAtlas::glyph(uint8_t font_index, uint32_t glyph_id) {
    const uint64_t key = glyph_key(font_index, glyph_id);
    if (auto it = glyphs_.find(key); it != glyphs_.end())
        return &it->second;

    GlyphBitmap bm = fonts_.font(font_index).rasterize(glyph_id);

    AtlasGlyph g;
    g.bearing_x = bm.bearing_x;
    g.bearing_y = bm.bearing_y;

    if (!bm.empty()) {
        SDL_Point at{};
        if (!allocate(bm.width + kPadding, bm.height + kPadding, at)) {
            full_ = true;
            return nullptr;
        }
        g.rect = SDL_Rect{at.x, at.y, bm.width, bm.height};
        upload(g.rect, bm);
    }

    return &glyphs_.emplace(key, g).first->second;
}

void GlyphAtlas::upload(const SDL_Rect& dst, const GlyphBitmap& bm) {
    if (bm.color) {
        renderer_.update_texture(texture_, &dst, bm.pixels.data(), dst.w * 4);
        return;
    }

    // Coverage becomes alpha over white so the blit tint sets the colour.
    std::vector<uint8_t> rgba(bm.pixels.size() * 4);
    for (size_t i = 0; i < bm.pixels.size(); ++i) {
        rgba[i * 4 + 0] = 255;
        rgba[i * 4 + 1] = 255;
        rgba[i * 4 + 2] = 255;
        rgba[i * 4 + 3] = bm.pixels[i];
    }
    renderer_.update_texture(texture_, &dst, rgba.data(), dst.w * 4);
}

} // namespace tilewrap
