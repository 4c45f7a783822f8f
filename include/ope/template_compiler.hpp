#pragma once

#include <ope/delimiter.hpp>
#include <ope/result.hpp>
#include <memory>
#include <string>

namespace re2 {
class RE2;
}

namespace ope {

// A compiled, anchored template. Immutable once built, so it may be shared
// and evaluated from any number of threads without locking.
using CompiledPattern = std::shared_ptr<const re2::RE2>;

// Build the composite regex source for a template:
//
//     "foo<a|b>bar"  ->  "^foo(a|b)bar$"
//
// Literal text is quoted, region content is inserted verbatim inside a
// capturing group. Each region is first compiled on its own as "^region$"
// so a malformed region is reported before the composite is assembled.
Result<std::string> build_pattern(const std::string& tpl, const Delimiters& delims);

// build_pattern() followed by compilation of the composite.
Result<CompiledPattern> compile_template(const std::string& tpl, const Delimiters& delims);

// Compile a regex source string, mapping engine errors to CompileRegex.
Result<CompiledPattern> compile_regex(const std::string& source);

// True if `needle` satisfies the pattern.
bool pattern_matches(const CompiledPattern& pattern, const std::string& needle);

} // namespace ope
