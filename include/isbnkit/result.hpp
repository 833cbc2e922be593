#pragma once

#include <isbnkit/error.hpp>
#include <utility>
#include <variant>

namespace isbnkit {

template<typename T>
class Result {
    std::variant<T, IsbnkitError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from IsbnkitError so ISBNKIT_TRY can return errors across Result<T> types
    Result(IsbnkitError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(IsbnkitError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<IsbnkitError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    IsbnkitError& error() & { return std::get<IsbnkitError>(data_); }
    const IsbnkitError& error() const& { return std::get<IsbnkitError>(data_); }
    IsbnkitError&& error() && { return std::get<IsbnkitError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Applies f to the value of an Ok result; an Err passes through unchanged
    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ISBNKIT_TRY(expr) \
    do { \
        auto _isbnkit_result = (expr); \
        if (_isbnkit_result.is_err()) return std::move(_isbnkit_result).error(); \
    } while(0)

} // namespace isbnkit
