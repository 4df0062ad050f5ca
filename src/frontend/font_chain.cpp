#include "font_chain.h"

#include <cstdio>
#include <limits>
#include <stdexcept>
#include <utility>

namespace tilewrap {

FontLibrary::FontLibrary(std::filesystem::path primary,
                         const std::vector<std::filesystem::path>& fallbacks)
{
    if (!std::filesystem::exists(primary))
        throw std::runtime_error("Font not found: " + primary.string());
    if (FT_Init_FreeType(&library_))
        throw std::runtime_error("FreeType init failed");

    paths_.push_back(std::move(primary));
    for (const auto& p : fallbacks) {
        if (paths_.size() > std::numeric_limits<uint8_t>::max()) break;
        if (std::filesystem::exists(p)) paths_.push_back(p);
    }
}

FontLibrary::~FontLibrary() {
    FT_Done_FreeType(library_);
}

std::unique_ptr<FontChain> FontLibrary::open(int size_px) const {
    return std::make_unique<FontChain>(library_, paths_, size_px);
}

FontChain::FontChain(FT_Library lib, const std::vector<std::filesystem::path>& paths,
                     int size_px)
    : size_px_(size_px)
{
    if (paths.empty())
        throw std::runtime_error("FontChain: no fonts");

    // The primary face must load; a broken fallback only costs coverage.
    faces_.push_back(std::make_unique<FontFace>(lib, paths.front(), size_px));
    for (size_t i = 1; i < paths.size(); ++i) {
        try {
            faces_.push_back(std::make_unique<FontFace>(lib, paths[i], size_px));
        } catch (const std::exception& e) {
            std::fprintf(stderr, "tilewrap: skipping fallback font at %dpx: %s\n",
                         size_px, e.what());
        }
    }
}

std::pair<uint8_t, uint32_t> FontChain::resolve(uint32_t codepoint) {
    if (auto it = resolved_.find(codepoint); it != resolved_.end())
        return it->second;

    std::pair<uint8_t, uint32_t> hit{0, 0};
    for (size_t i = 0; i < faces_.size(); ++i) {
        if (uint32_t gid = faces_[i]->glyph_index(codepoint); gid != 0) {
            hit = {static_cast<uint8_t>(i), gid};
            break;
        }
    }
    resolved_.emplace(codepoint, hit);
    return hit;
}

} // namespace tilewrap
