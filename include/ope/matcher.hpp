#pragma once

#include <ope/delimiter.hpp>
#include <ope/pattern_cache.hpp>
#include <ope/result.hpp>
#include <ope/template_compiler.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ope {

struct MatcherConfig;

// Decides whether a needle satisfies at least one template in a haystack.
class Matcher {
public:
    virtual ~Matcher() = default;

    // Templates are tried in order; the first match returns true and later
    // entries are never looked at. The first error aborts the whole call.
    virtual Result<bool> matches(char delimiter_start, char delimiter_end,
                                 const std::vector<std::string>& haystack,
                                 const std::string& needle) const = 0;

    Result<bool> matches(const Delimiters& delims,
                         const std::vector<std::string>& haystack,
                         const std::string& needle) const {
        return matches(delims.start, delims.end, haystack, needle);
    }
};

// Turns a template into a compiled pattern. Defaults to compile_template;
// replaceable so callers can observe or wrap compilation.
using PatternCompiler =
    std::function<Result<CompiledPattern>(const std::string&, const Delimiters&)>;

// Matcher backed by RE2 and a bounded LRU cache of compiled templates.
// Safe to share between threads.
class RegexMatcher : public Matcher {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    RegexMatcher(Passkey, std::unique_ptr<PatternCache> cache, PatternCompiler compiler);

    static Result<std::unique_ptr<RegexMatcher>> create(size_t cache_size,
                                                        PatternCompiler compiler = compile_template);

    static Result<std::unique_ptr<RegexMatcher>> from_config(const MatcherConfig& cfg);

    using Matcher::matches;
    Result<bool> matches(char delimiter_start, char delimiter_end,
                         const std::vector<std::string>& haystack,
                         const std::string& needle) const override;

    PatternCache& cache() const { return *cache_; }

private:
    // Cached pattern for `tpl`, compiling and inserting it on a miss.
    Result<CompiledPattern> lookup_or_compile(const std::string& tpl,
                                              const Delimiters& delims) const;

    std::unique_ptr<PatternCache> cache_;
    PatternCompiler compiler_;
};

} // namespace ope
