#pragma once
#include <variant>
#include <string>
#include <utility>

#include "devmux/core/error.h"

namespace devmux {
namespace utils {

// Generic Result<T> template
// Holds either a value of type T or a core::Error

template <typename T>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error constructor
    Result(const core::Error& error) : data_(error) {}
    Result(core::Error&& error) : data_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<core::Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const core::Error& error() const { return std::get<core::Error>(data_); }

private:
    std::variant<T, core::Error> data_;
};

// Specialization for void

template <>
class Result<void> {
public:
    // Success constructor
    Result() : success_(true) {}
    // Error constructor
    Result(const core::Error& error) : success_(false), error_(error) {}
    Result(core::Error&& error) : success_(false), error_(std::move(error)) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    explicit operator bool() const { return success_; }
    const core::Error& error() const { return error_; }

private:
    bool success_ = false;
    core::Error error_;
};

} // namespace utils
} // namespace devmux

// For convenience, provide a top-level alias
namespace devmux {
using utils::Result;
}
