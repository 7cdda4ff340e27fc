#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error propagation across the library.

#include <string>
#include <utility>
#include <variant>

namespace csa {

/// Minimal error payload for code that has no richer error type.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Value-or-error return type.
///
/// Every public operation that can fail returns Result<T, E>; nothing in
/// the public API throws for expected failures such as a bad password or
/// an expired token.
///
/// Example:
/// @code
///   auto result = authority.verify(bearer);
///   if (!result) {
///       return reject(result.error());
///   }
///   use(result.value());
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }

    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    // Indexed rather than type-addressed so that T == E stays well-formed.
    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace csa
