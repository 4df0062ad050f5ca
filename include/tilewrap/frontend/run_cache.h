#pragma once

#include "text_layout.h"

#include <cstddef>
#include <cstdint>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tilewrap {

// LRU cache of shaped runs for one font size, keyed by label text.
class RunCache {
public:
    explicit RunCache(size_t capacity = 512);

    // Returns the cached run for text, or nullptr on miss.
    const GlyphRun* get(std::string_view text);

    const GlyphRun& put(std::string_view text, GlyphRun run);

    void clear();

    size_t size() const { return lru_.size(); }

private:
    struct Entry {
        uint64_t    hash;
        std::string text;
        GlyphRun    run;
    };

    void evict_if_full();

    size_t capacity_;
    std::list<Entry>                                      lru_;
    std::unordered_map<uint64_t, std::list<Entry>::iterator> index_;
};

} // namespace tilewrap
