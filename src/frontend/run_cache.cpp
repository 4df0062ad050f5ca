#include <tilewrap/frontend/run_cache.h>

#include <utility>

namespace tilewrap {

namespace {

// FNV-1a 64-bit hash
uint64_t fnv1a(std::string_view s) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace

RunCache::RunCache(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

const GlyphRun* RunCache::get(std::string_view text) {
    auto it = index_.find(fnv1a(text));
    if (it == index_.end()) return nullptr;

    auto list_it = it->second;
    if (list_it->text != text) return nullptr;

    // Move to front (most recently used)
    lru_.splice(lru_.begin(), lru_, list_it);
    return &list_it->run;
}

const GlyphRun& RunCache::put(std::string_view text, GlyphRun run) {
    uint64_t h = fnv1a(text);
    auto it = index_.find(h);
    if (it != index_.end()) {
        // Replace the entry; also covers a hash collision with other text
        auto list_it = it->second;
        list_it->text = std::string(text);
        list_it->run  = std::move(run);
        lru_.splice(lru_.begin(), lru_, list_it);
        return list_it->run;
    }

    evict_if_full();

    lru_.push_front(Entry{h, std::string(text), std::move(run)});
    index_[h] = lru_.begin();
    return lru_.front().run;
}

void RunCache::clear() {
    lru_.clear();
    index_.clear();
}

void RunCache::evict_if_full() {
    while (lru_.size() >= capacity_) {
        index_.erase(lru_.back().hash);
        lru_.pop_back();
    }
}

} // namespace tilewrap
