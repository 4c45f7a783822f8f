#pragma once

#include <ope/delimiter.hpp>
#include <ope/lru_cache.hpp>
#include <ope/result.hpp>
#include <ope/template_compiler.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ope {

// Cache key: the template text together with the delimiters it was
// compiled under, so one cache can serve several delimiter pairs.
struct PatternKey {
    std::string text;
    Delimiters delims;

    bool operator==(const PatternKey& other) const {
        return text == other.text && delims == other.delims;
    }
};

struct PatternKeyHash {
    size_t operator()(const PatternKey& key) const;
};

struct PatternCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;
};

// Bounded LRU cache of compiled templates, shared by every caller of one
// matcher. All access to the underlying LruCache happens under a single
// mutex; patterns are handed out by shared ownership and evaluated after
// the lock is released.
class PatternCache {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    // Use create(); the passkey keeps construction behind the capacity check.
    PatternCache(Passkey, size_t capacity);

    // Fails with InvalidCacheSize when capacity is zero.
    static Result<std::unique_ptr<PatternCache>> create(size_t capacity);

    PatternCache(const PatternCache&) = delete;
    PatternCache& operator=(const PatternCache&) = delete;

    // Lookup and mark as most recently used. Ok(nullptr) on a miss.
    Result<CompiledPattern> get(const PatternKey& key);

    // Insert or overwrite, evicting the least recently used entry at capacity.
    Status put(const PatternKey& key, CompiledPattern pattern);

    Status clear();

    Result<size_t> size() const;
    size_t capacity() const { return capacity_; }
    Result<PatternCacheStats> stats() const;

private:
    Result<std::unique_lock<std::mutex>> acquire() const;

    const size_t capacity_;
    mutable std::mutex mutex_;
    LruCache<PatternKey, CompiledPattern, PatternKeyHash> lru_;
    PatternCacheStats stats_;
};

} // namespace ope
