#pragma once

#include <sift/error.hpp>
#include <variant>
#include <utility>

namespace sift {

template<typename T>
class Result {
    std::variant<T, SiftError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SiftError so SIFT_TRY can forward errors between Result types
    Result(SiftError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SiftError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SiftError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SiftError& error() & { return std::get<SiftError>(data_); }
    const SiftError& error() const& { return std::get<SiftError>(data_); }
    SiftError&& error() && { return std::get<SiftError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SIFT_TRY(expr) \
    do { \
        auto _sift_result = (expr); \
        if (_sift_result.is_err()) return std::move(_sift_result).error(); \
    } while(0)

} // namespace sift
