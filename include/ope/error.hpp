#pragma once

#include <string>

namespace ope {

struct OpeError {
    enum Code {
        InvalidCacheSize,
        UnbalancedDelimiters,
        CompileRegex,
        Lock,
        NotIndex,
        Config,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    OpeError() = default;
    OpeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    OpeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ope
