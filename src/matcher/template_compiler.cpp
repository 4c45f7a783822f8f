#include <ope/template_compiler.hpp>
#include <re2/re2.h>

namespace ope {

static OpeError not_index(const std::string& what, const std::string& tpl) {
    return OpeError{OpeError::NotIndex,
        what + " in '" + tpl + "'",
        "delimiter boundaries disagree with the template (internal error)"};
}

Result<CompiledPattern> compile_regex(const std::string& source) {
    auto re = std::make_shared<const re2::RE2>(source, re2::RE2::Quiet);
    if (!re->ok()) {
        return OpeError{OpeError::CompileRegex,
            "invalid regex '" + source + "': " + re->error()};
    }
    return Result<CompiledPattern>::ok(std::move(re));
}

Result<std::string> build_pattern(const std::string& tpl, const Delimiters& delims) {
    auto idx = delimiter_indices(tpl, delims);
    OPE_TRY(idx);
    const auto& bounds = idx.value();

    if (bounds.size() % 2 != 0) {
        return not_index("odd boundary count " + std::to_string(bounds.size()), tpl);
    }

    std::string buffer = "^";
    size_t end = 0;
    for (size_t i = 0; i < bounds.size(); i += 2) {
        size_t open = bounds[i];
        size_t close = bounds[i + 1];
        if (open < end || close > tpl.size() || close < open + 2) {
            return not_index("bad region [" + std::to_string(open) + ", " +
                             std::to_string(close) + ")", tpl);
        }

        std::string raw = tpl.substr(end, open - end);
        std::string region = tpl.substr(open + 1, close - open - 2);
        end = close;

        // Validated standalone; the compiled result is discarded.
        auto check = compile_regex("^" + region + "$");
        OPE_TRY(check);

        buffer += re2::RE2::QuoteMeta(raw);
        buffer += "(";
        buffer += region;
        buffer += ")";
    }

    buffer += re2::RE2::QuoteMeta(tpl.substr(end));
    buffer += "$";
    return Result<std::string>::ok(std::move(buffer));
}

Result<CompiledPattern> compile_template(const std::string& tpl, const Delimiters& delims) {
    auto source = build_pattern(tpl, delims);
    OPE_TRY(source);
    return compile_regex(source.value());
}

bool pattern_matches(const CompiledPattern& pattern, const std::string& needle) {
    return re2::RE2::PartialMatch(needle, *pattern);
}

} // namespace ope
