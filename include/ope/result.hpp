#pragma once

#include <ope/error.hpp>
#include <variant>

namespace ope {

template<typename T>
class Result {
    std::variant<T, OpeError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from OpeError so OPE_TRY can return errors across Result<T> types
    Result(OpeError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(OpeError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<OpeError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    OpeError& error() & { return std::get<OpeError>(data_); }
    const OpeError& error() const& { return std::get<OpeError>(data_); }
    OpeError&& error() && { return std::get<OpeError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Binds by reference so move-only results (locks, unique_ptr) work too.
#define OPE_TRY(expr) \
    do { \
        auto&& _ope_result = (expr); \
        if (_ope_result.is_err()) return std::move(_ope_result).error(); \
    } while(0)

} // namespace ope
