#pragma once

#include <projmetrics/error.hpp>
#include <variant>
#include <utility>

namespace projmetrics {

// Value-or-error return used across the scan pipeline. Per-file problems
// (binary input, read failures) travel as Unreadable errors and are
// counted by the scanner; only root, config and usage errors reach main.
template<typename T>
class Result {
    std::variant<T, MetricsError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from MetricsError so PROJMETRICS_TRY can return errors across Result<T> types
    Result(MetricsError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(MetricsError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<MetricsError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    MetricsError& error() & { return std::get<MetricsError>(data_); }
    const MetricsError& error() const& { return std::get<MetricsError>(data_); }
    MetricsError&& error() && { return std::get<MetricsError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

// For operations with nothing to return, e.g. Walker::walk
using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return early with the error of a failed Result or Status
#define PROJMETRICS_TRY(expr) \
    do { \
        auto _pm_result = (expr); \
        if (_pm_result.is_err()) return std::move(_pm_result).error(); \
    } while(0)

} // namespace projmetrics
