#pragma once

#include "font_chain.h"
#include <tilewrap/frontend/renderer.h>

#include <SDL2/SDL.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tilewrap {

struct AtlasGlyph {
    SDL_Rect rect{};     // texture region; empty for blank glyphs
    int      bearing_x{0};
    int      bearing_y{0};
};

// RGBA texture caching the rasterized glyphs of one FontChain. Glyphs are
// packed onto shelves; each goes on the shortest shelf that still has room
// for it, and a new shelf is opened below when none does.
class GlyphAtlas {
public:
    GlyphAtlas(Renderer& renderer, FontChain& fonts, int size);
    ~GlyphAtlas();

    GlyphAtlas(const GlyphAtlas&) = delete;
    GlyphAtlas& operator=(const GlyphAtlas&) = delete;

    // nullptr when the glyph did not fit; full() is set from then on.
    const AtlasGlyph* glyph(uint8_t font_index, uint32_t glyph_id);

    // Forget every glyph and start packing from the top again.
    void clear();

    bool full() const { return full_; }

    SDL_Texture* texture() const { return texture_; }

private:
    struct Shelf {
        int y;
        int height;
        int next_x;
    };

    // Top-left of a free w x h region, or false when none is left.
    bool allocate(int w, int h, SDL_Point& at);
    void upload(const SDL_Rect& dst, const GlyphBitmap& bm);

    Renderer&    renderer_;
    FontChain&   fonts_;
    SDL_Texture* texture_{};
    int          size_;
    bool         full_{false};

    std::vector<Shelf> shelves_;
    std::unordered_map<uint64_t, AtlasGlyph> glyphs_;
};

} // namespace tilewrap
