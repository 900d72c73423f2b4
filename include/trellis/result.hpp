#pragma once

#include <trellis/error.hpp>
#include <variant>
#include <functional>

namespace trellis {

template<typename T>
class Result {
    std::variant<T, TrellisError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TrellisError so TRELLIS_TRY can return errors across Result<T> types
    Result(TrellisError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TrellisError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TrellisError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TrellisError& error() & { return std::get<TrellisError>(data_); }
    const TrellisError& error() const& { return std::get<TrellisError>(data_); }
    TrellisError&& error() && { return std::get<TrellisError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // True when this holds an error with the given code
    bool has_code(TrellisError::Code c) const {
        return is_err() && std::get<TrellisError>(data_).code == c;
    }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TRELLIS_TRY(expr) \
    do { \
        auto&& _trellis_result = (expr); \
        if (_trellis_result.is_err()) return std::move(_trellis_result).error(); \
    } while(0)

} // namespace trellis
