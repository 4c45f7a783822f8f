#include <ope/delimiter.hpp>

namespace ope {

static OpeError unbalanced(const std::string& tpl, const Delimiters& delims) {
    return OpeError{OpeError::UnbalancedDelimiters,
        "unbalanced delimiters in '" + tpl + "'",
        std::string("every '") + delims.start + "' needs a matching '" + delims.end + "'"};
}

Result<std::vector<size_t>> delimiter_indices(const std::string& tpl,
                                              const Delimiters& delims) {
    std::vector<size_t> idxs;
    long depth = 0;
    size_t open = 0;

    for (size_t i = 0; i < tpl.size(); ++i) {
        char c = tpl[i];
        if (c == delims.start) {
            if (++depth == 1) open = i;
        } else if (c == delims.end) {
            --depth;
            if (depth < 0) return unbalanced(tpl, delims);
            if (depth == 0) {
                idxs.push_back(open);
                idxs.push_back(i + 1);
            }
        }
    }

    if (depth != 0) return unbalanced(tpl, delims);
    return Result<std::vector<size_t>>::ok(std::move(idxs));
}

} // namespace ope
