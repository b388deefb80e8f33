#pragma once

#include <string>
#include <utility>
#include <variant>

namespace parsediag {

/// Success-or-error value returned by the fallible decoding steps.
/// The error side defaults to a human-readable message.
template <typename T, typename E = std::string>
class Result {
public:
    /// Construct a success result.
    [[nodiscard]] static Result ok(T value) { return Result(std::move(value)); }

    /// Construct an error result.
    [[nodiscard]] static Result err(E error) { return Result(InError{std::move(error)}); }

    /// Re-wrap the error of another result, whatever its success type.
    template <typename U>
    [[nodiscard]] static Result forward_err(const Result<U, E>& other) {
        return err(other.error());
    }

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_err() const { return std::holds_alternative<InError>(data_); }

    /// Get the success value. Undefined behavior if is_err().
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get the error value. Undefined behavior if is_ok().
    [[nodiscard]] const E& error() const& { return std::get<InError>(data_).err; }

    [[nodiscard]] explicit operator bool() const { return is_ok(); }

private:
    // Wrap E so T and E can be the same type
    struct InError {
        E err;
    };

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(InError error) : data_(std::move(error)) {}

    std::variant<T, InError> data_;
};

} // namespace parsediag
