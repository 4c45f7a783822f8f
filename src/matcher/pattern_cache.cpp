#include <ope/pattern_cache.hpp>
#include <ope/log.hpp>
#include <system_error>

namespace ope {

size_t PatternKeyHash::operator()(const PatternKey& key) const {
    size_t h = std::hash<std::string>{}(key.text);
    size_t d = (static_cast<unsigned char>(key.delims.start) << 8) |
               static_cast<unsigned char>(key.delims.end);
    return h ^ (d + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

PatternCache::PatternCache(Passkey, size_t capacity)
    : capacity_(capacity), lru_(capacity) {}

Result<std::unique_ptr<PatternCache>> PatternCache::create(size_t capacity) {
    if (capacity == 0) {
        return OpeError{OpeError::InvalidCacheSize,
            "invalid cache size " + std::to_string(capacity),
            "cache capacity must be at least 1"};
    }
    return Result<std::unique_ptr<PatternCache>>::ok(
        std::make_unique<PatternCache>(Passkey{}, capacity));
}

Result<std::unique_lock<std::mutex>> PatternCache::acquire() const {
    try {
        return Result<std::unique_lock<std::mutex>>::ok(std::unique_lock<std::mutex>(mutex_));
    } catch (const std::system_error& e) {
        return OpeError{OpeError::Lock,
            std::string("lock error: ") + e.what()};
    }
}

Result<CompiledPattern> PatternCache::get(const PatternKey& key) {
    auto lock = acquire();
    OPE_TRY(lock);

    const CompiledPattern* found = lru_.get(key);
    if (!found) {
        ++stats_.misses;
        return Result<CompiledPattern>::ok(nullptr);
    }
    ++stats_.hits;
    return Result<CompiledPattern>::ok(*found);
}

Status PatternCache::put(const PatternKey& key, CompiledPattern pattern) {
    auto lock = acquire();
    OPE_TRY(lock);

    if (lru_.size() >= capacity_ && !lru_.contains(key)) {
        log::trace("pattern cache: evicting '%s'", lru_.lru_key().text.c_str());
    }
    if (lru_.put(key, std::move(pattern))) {
        ++stats_.evictions;
    }
    ++stats_.insertions;
    return ok_status();
}

Status PatternCache::clear() {
    auto lock = acquire();
    OPE_TRY(lock);
    lru_.clear();
    return ok_status();
}

Result<size_t> PatternCache::size() const {
    auto lock = acquire();
    OPE_TRY(lock);
    return Result<size_t>::ok(lru_.size());
}

Result<PatternCacheStats> PatternCache::stats() const {
    auto lock = acquire();
    OPE_TRY(lock);
    return Result<PatternCacheStats>::ok(stats_);
}

} // namespace ope
