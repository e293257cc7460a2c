#pragma once

#include <chv/error.hpp>
#include <string>
#include <utility>
#include <variant>

namespace chv {

template<typename T>
class Result {
    std::variant<T, ChvError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ChvError so CHV_TRY can return errors across Result<T> types
    Result(ChvError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ChvError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ChvError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ChvError& error() & { return std::get<ChvError>(data_); }
    const ChvError& error() const& { return std::get<ChvError>(data_); }
    ChvError&& error() && { return std::get<ChvError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Re-tag an error under a domain code, keeping the original message as
    // context. Ok values pass through untouched.
    Result rewrap(ChvError::Code c, const std::string& what) && {
        if (is_ok()) return std::move(*this);
        ChvError inner = std::move(error());
        ChvError outer{c, what + ": " + inner.message, std::move(inner.hint)};
        return Result(std::move(outer));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CHV_TRY(expr) \
    do { \
        auto _chv_result = (expr); \
        if (_chv_result.is_err()) return std::move(_chv_result).error(); \
    } while(0)

} // namespace chv
