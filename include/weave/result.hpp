#pragma once

#include <weave/error.hpp>
#include <variant>
#include <functional>

namespace weave {

template<typename T>
class Result {
    std::variant<T, WeaveError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from WeaveError so WEAVE_TRY can return errors across Result<T> types
    Result(WeaveError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(WeaveError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<WeaveError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    WeaveError& error() & { return std::get<WeaveError>(data_); }
    const WeaveError& error() const& { return std::get<WeaveError>(data_); }
    WeaveError&& error() && { return std::get<WeaveError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Value or a fallback when this holds an error
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
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

#define WEAVE_TRY(expr) \
    do { \
        auto _weave_result = (expr); \
        if (_weave_result.is_err()) return std::move(_weave_result).error(); \
    } while(0)

} // namespace weave
