#pragma once

#include <ope/result.hpp>
#include <string>
#include <vector>

namespace ope {

// Characters that open and close an embedded regex region in a template.
struct Delimiters {
    char start = '<';
    char end = '>';

    bool operator==(const Delimiters& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const Delimiters& other) const { return !(*this == other); }
};

// Scan `tpl` and return the boundaries of its top-level delimited regions as
// a flat list: [open0, close0, open1, close1, ...]. Each `open` is the index
// of the start delimiter, each `close` is one past the matching end delimiter.
// Delimiters nested inside a region are left in the region's content.
// Fails with UnbalancedDelimiters when a region closes before it opens or
// is never closed.
Result<std::vector<size_t>> delimiter_indices(const std::string& tpl,
                                              const Delimiters& delims);

} // namespace ope
