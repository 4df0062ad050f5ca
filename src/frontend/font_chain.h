#pragma once

#include "font_face.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tilewrap {

class FontChain;

// Owns the FreeType library and the list of font files. Text is drawn at
// several pixel sizes; each size opens its own chain from here.
class FontLibrary {
public:
    // Throws std::runtime_error if FreeType cannot start or the primary
    // font does not exist. Missing fallbacks are dropped silently.
    FontLibrary(std::filesystem::path primary,
                const std::vector<std::filesystem::path>& fallbacks);
    ~FontLibrary();

    FontLibrary(const FontLibrary&) = delete;
    FontLibrary& operator=(const FontLibrary&) = delete;

    std::unique_ptr<FontChain> open(int size_px) const;

    const std::vector<std::filesystem::path>& paths() const { return paths_; }

private:
    FT_Library library_{};
    std::vector<std::filesystem::path> paths_;   // primary first
};

// The library's fonts opened at one pixel size, in lookup order.
class FontChain {
public:
    FontChain(FT_Library lib, const std::vector<std::filesystem::path>& paths, int size_px);

    FontChain(const FontChain&) = delete;
    FontChain& operator=(const FontChain&) = delete;

    FontFace& primary()           { return *faces_.front(); }
    FontFace& font(uint8_t index) { return *faces_.at(index); }
    uint8_t   count() const       { return static_cast<uint8_t>(faces_.size()); }

    // First face that has the codepoint, as {face index, glyph id}.
    // {0, 0} when none does.
    std::pair<uint8_t, uint32_t> resolve(uint32_t codepoint);

    int size_px()     const { return size_px_; }
    int line_height() const { return faces_.front()->line_height(); }
    int ascent()      const { return faces_.front()->ascent(); }

private:
    std::vector<std::unique_ptr<FontFace>> faces_;
    std::unordered_map<uint32_t, std::pair<uint8_t, uint32_t>> resolved_;
    int size_px_;
};

} // namespace tilewrap
