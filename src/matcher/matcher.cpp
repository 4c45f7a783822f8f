#include <ope/matcher.hpp>
#include <ope/config.hpp>
#include <ope/log.hpp>

namespace ope {

RegexMatcher::RegexMatcher(Passkey, std::unique_ptr<PatternCache> cache,
                           PatternCompiler compiler)
    : cache_(std::move(cache)), compiler_(std::move(compiler)) {}

Result<std::unique_ptr<RegexMatcher>> RegexMatcher::create(size_t cache_size,
                                                           PatternCompiler compiler) {
    auto cache = PatternCache::create(cache_size);
    OPE_TRY(cache);
    if (!compiler) {
        return OpeError{OpeError::InvalidArg, "pattern compiler is empty"};
    }
    return Result<std::unique_ptr<RegexMatcher>>::ok(std::make_unique<RegexMatcher>(
        Passkey{}, std::move(cache).value(), std::move(compiler)));
}

Result<std::unique_ptr<RegexMatcher>> RegexMatcher::from_config(const MatcherConfig& cfg) {
    return create(cfg.cache_size);
}

Result<CompiledPattern> RegexMatcher::lookup_or_compile(const std::string& tpl,
                                                        const Delimiters& delims) const {
    PatternKey key{tpl, delims};

    auto cached = cache_->get(key);
    OPE_TRY(cached);
    if (cached.value()) return cached;

    // Compiled outside the cache lock; a concurrent miss on the same
    // template compiles an equivalent pattern and the later put wins.
    log::debug("compiling template '%s'", tpl.c_str());
    auto compiled = compiler_(tpl, delims);
    OPE_TRY(compiled);
    if (!compiled.value()) {
        return OpeError{OpeError::CompileRegex,
            "compiler returned no pattern for '" + tpl + "'"};
    }

    OPE_TRY(cache_->put(key, compiled.value()));
    return compiled;
}

Result<bool> RegexMatcher::matches(char delimiter_start, char delimiter_end,
                                   const std::vector<std::string>& haystack,
                                   const std::string& needle) const {
    Delimiters delims{delimiter_start, delimiter_end};

    for (const auto& tpl : haystack) {
        if (tpl.find(delims.start) == std::string::npos) {
            if (tpl == needle) return Result<bool>::ok(true);
            continue;
        }

        auto pattern = lookup_or_compile(tpl, delims);
        OPE_TRY(pattern);
        if (pattern_matches(pattern.value(), needle)) {
            return Result<bool>::ok(true);
        }
    }
    return Result<bool>::ok(false);
}

} // namespace ope
