#pragma once

#include <tilewrap/color.h>

#include <SDL2/SDL.h>
#include <string>

namespace tilewrap {

using TextureHandle = SDL_Texture*;

// Thin wrapper over SDL_Renderer. All rectangles are in logical pixels;
// the HiDPI scale is applied by SDL_RenderSetScale.
class Renderer {
public:
    explicit Renderer(SDL_Renderer* r);

    void begin_frame(Color bg);

    // Overwrite a region with bg, ignoring blending.
    void clear_rect(RectF rect, Color bg);

    void fill_rect(RectF rect, Color c);
    void stroke_rect(RectF rect, Color c);

    // Creates an RGBA streaming texture for the glyph atlas.
    TextureHandle create_texture(int w, int h);

    // Upload row-major RGBA bytes to region (whole texture when null).
    void update_texture(TextureHandle tex, const SDL_Rect* region,
                        const void* pixels, int pitch);

    // Blit a sub-rect of a texture to a destination rect with a color tint.
    void blit(TextureHandle tex, SDL_Rect src, SDL_FRect dst, Color tint);

    // Resets per-frame renderer state.
    void end_frame();

    std::string name() const;

    SDL_Renderer* raw() const { return r_; }

private:
    void set_color(Color c, SDL_BlendMode mode);

    SDL_Renderer* r_;
};

} // namespace tilewrap
