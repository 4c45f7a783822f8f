#include <ope/error.hpp>

namespace ope {

const char* OpeError::code_name(Code c) {
    switch (c) {
        case InvalidCacheSize:     return "InvalidCacheSize";
        case UnbalancedDelimiters: return "UnbalancedDelimiters";
        case CompileRegex:         return "CompileRegex";
        case Lock:                 return "Lock";
        case NotIndex:             return "NotIndex";
        case Config:               return "Config";
        case IO:                   return "IO";
        case InvalidArg:           return "InvalidArg";
    }
    return "Unknown";
}

std::string OpeError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace ope
