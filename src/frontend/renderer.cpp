#include <tilewrap/frontend/renderer.h>

#include <stdexcept>

namespace tilewrap {

Renderer::Renderer(SDL_Renderer* r) : r_(r) {
    if (!r_)
        throw std::runtime_error("Renderer: null SDL_Renderer");
}

void Renderer::set_color(Color c, SDL_BlendMode mode) {
    SDL_SetRenderDrawBlendMode(r_, mode);
    SDL_SetRenderDrawColor(r_, c.r, c.g, c.b, c.a);
}

void Renderer::begin_frame(Color bg) {
    set_color(bg, SDL_BLENDMODE_NONE);
    SDL_RenderClear(r_);
}

void Renderer::clear_rect(RectF rect, Color bg) {
    set_color(bg, SDL_BLENDMODE_NONE);
    SDL_FRect fr{rect.x, rect.y, rect.w, rect.h};
    SDL_RenderFillRectF(r_, &fr);
}

void Renderer::fill_rect(RectF rect, Color c) {
    set_color(c, SDL_BLENDMODE_BLEND);
    SDL_FRect fr{rect.x, rect.y, rect.w, rect.h};
    SDL_RenderFillRectF(r_, &fr);
}

void Renderer::stroke_rect(RectF rect, Color c) {
    set_color(c, SDL_BLENDMODE_BLEND);
    SDL_FRect fr{rect.x, rect.y, rect.w, rect.h};
    SDL_RenderDrawRectF(r_, &fr);
}

TextureHandle Renderer::create_texture(int w, int h) {
    SDL_Texture* tex = SDL_CreateTexture(r_, SDL_PIXELFORMAT_RGBA32,
                                         SDL_TEXTUREACCESS_STREAMING, w, h);
    if (tex)
        SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
    return tex;
}

void Renderer::update_texture(TextureHandle tex, const SDL_Rect* region,
                              const void* pixels, int pitch) {
    SDL_UpdateTexture(tex, region, pixels, pitch);
}

void Renderer::blit(TextureHandle tex, SDL_Rect src, SDL_FRect dst, Color tint) {
    SDL_SetTextureColorMod(tex, tint.r, tint.g, tint.b);
    SDL_SetTextureAlphaMod(tex, tint.a);
    SDL_RenderCopyF(r_, tex, &src, &dst);
}

void Renderer::end_frame() {
    SDL_RenderSetClipRect(r_, nullptr);
}

std::string Renderer::name() const {
    SDL_RendererInfo info{};
    if (SDL_GetRendererInfo(r_, &info) != 0 || !info.name)
        return "SDL2";
    return std::string("SDL2 ") + info.name;
}

} // namespace tilewrap
