#pragma once

#include <uuidkit/error.hpp>
#include <variant>
#include <functional>
#include <utility>

namespace uuidkit {

template<typename T>
class Result {
    std::variant<T, UuidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UuidError so UUIDKIT_TRY can return errors across Result<T> types
    Result(UuidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UuidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    UuidError& error() & { return std::get<UuidError>(data_); }
    const UuidError& error() const& { return std::get<UuidError>(data_); }
    UuidError&& error() && { return std::get<UuidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Value on success, `fallback` on failure. The error is discarded.
    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
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

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define UUIDKIT_TRY(expr) \
    do { \
        auto _uuidkit_result = (expr); \
        if (_uuidkit_result.is_err()) return std::move(_uuidkit_result).error(); \
    } while(0)

// Evaluate a Result-returning expression, bind its value to `decl` on success,
// return the error from the enclosing function otherwise.
#define UUIDKIT_TRY_ASSIGN(decl, expr) \
    UUIDKIT_TRY_ASSIGN_IMPL(UUIDKIT_CONCAT(_uuidkit_r_, __LINE__), decl, expr)

#define UUIDKIT_TRY_ASSIGN_IMPL(tmp, decl, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    decl = std::move(tmp).value()

#define UUIDKIT_CONCAT_INNER(a, b) a##b
#define UUIDKIT_CONCAT(a, b) UUIDKIT_CONCAT_INNER(a, b)

} // namespace uuidkit
