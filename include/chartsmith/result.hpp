#pragma once

#include <chartsmith/error.hpp>
#include <utility>
#include <variant>

namespace chartsmith {

template<typename T>
class Result {
    std::variant<T, ChartError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ChartError so CHARTSMITH_TRY can return errors across Result<T> types
    Result(ChartError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ChartError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ChartError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ChartError& error() & { return std::get<ChartError>(data_); }
    const ChartError& error() const& { return std::get<ChartError>(data_); }
    ChartError&& error() && { return std::get<ChartError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CHARTSMITH_TRY(expr) \
    do { \
        auto _chartsmith_result = (expr); \
        if (_chartsmith_result.is_err()) return std::move(_chartsmith_result).error(); \
    } while(0)

} // namespace chartsmith
