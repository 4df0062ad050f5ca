#pragma once

#include "font_chain.h"
#include "glyph_atlas.h"
#include <tilewrap/frontend/renderer.h>
#include <tilewrap/frontend/run_cache.h>
#include <tilewrap/frontend/text_layout.h>
#include <tilewrap/surface.h>

#include <filesystem>
#include <memory>
#include <unordered_map>
#include <vector>

namespace tilewrap {

// DrawSurface on an SDL renderer. Text is shaped and rasterized per pixel
// size; each size gets its own font chain, atlas and run cache on first use.
class SdlSurface : public DrawSurface {
public:
    // Throws std::runtime_error if the primary font cannot be used.
    SdlSurface(Renderer& renderer, std::filesystem::path primary_font,
               std::vector<std::filesystem::path> fallback_fonts,
               float dpi_scale);
    ~SdlSurface() override;

    SdlSurface(const SdlSurface&) = delete;
    SdlSurface& operator=(const SdlSurface&) = delete;

    void clear_rect(RectF r) override;
    void fill_rect(RectF r, Color c) override;
    void stroke_rect(RectF r, Color c) override;

    void  draw_text(std::string_view utf8, Point at, const TextStyle& style) override;
    float measure_text(std::string_view utf8, float size_px) override;

    void save() override;
    void restore() override;
    void translate(double dx, double dy) override;

    std::string name() const override;

    // Drops all text stacks; they are rebuilt at the new scale on demand.
    void set_dpi_scale(float scale);

    void set_background(Color bg) { background_ = bg; }

private:
    struct TextStack {
        TextStack(Renderer& r, const FontLibrary& library, int phys_px, float dpi_scale);

        std::unique_ptr<FontChain> fonts;
        GlyphAtlas atlas;
        TextLayout layout;
        RunCache   runs;
    };

    TextStack&      stack_for(float size_px);
    const GlyphRun& shaped(TextStack& stack, std::string_view utf8);
    RectF           offset(RectF r) const;

    Renderer&   renderer_;
    FontLibrary fonts_;
    float       dpi_scale_;
    Color       background_{0, 0, 0, 255};

    Point              origin_;
    std::vector<Point> saved_;

    std::unordered_map<int, std::unique_ptr<TextStack>> stacks_;
};

} // namespace tilewrap
