#pragma once

#include <versa/error.hpp>
#include <variant>
#include <utility>

namespace versa {

template<typename T>
class Result {
    std::variant<T, VersaError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from VersaError so VERSA_TRY can return errors across Result<T> types
    Result(VersaError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(VersaError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<VersaError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    VersaError& error() & { return std::get<VersaError>(data_); }
    const VersaError& error() const& { return std::get<VersaError>(data_); }
    VersaError&& error() && { return std::get<VersaError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define VERSA_TRY(expr) \
    do { \
        auto _versa_result = (expr); \
        if (_versa_result.is_err()) return std::move(_versa_result).error(); \
    } while(0)

} // namespace versa
