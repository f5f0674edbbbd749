#pragma once

#include <envinject/error.hpp>
#include <utility>
#include <variant>

namespace envinject {

template<typename T>
class Result {
    std::variant<T, InjectError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from InjectError so ENVINJECT_TRY can forward errors across Result<T> types
    Result(InjectError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(InjectError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<InjectError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    InjectError& error() & { return std::get<InjectError>(data_); }
    const InjectError& error() const& { return std::get<InjectError>(data_); }
    InjectError&& error() && { return std::get<InjectError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
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

#define ENVINJECT_TRY(expr) \
    do { \
        auto _envinject_result = (expr); \
        if (_envinject_result.is_err()) return std::move(_envinject_result).error(); \
    } while(0)

} // namespace envinject
