#pragma once

#include "common/source_location.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace parsediag {

/// Kinds of fatal diagnostics. Closed set.
enum class DiagnosticKind : uint8_t {
    CompileError,      // generic compile-time failure
    TokenMissingError, // input ended before a construct was complete
    SyntaxError,       // malformed token sequence
};

/// Returns the exception name of a diagnostic kind.
[[nodiscard]] std::string_view diagnostic_kind_to_string(DiagnosticKind kind);

/// A fatal compile-time diagnostic. Line 0 means "no specific line".
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::CompileError;
    std::string message;
    std::string file;
    uint32_t line = 0;

    [[nodiscard]] bool operator==(const Diagnostic&) const = default;
};

/// Format a diagnostic for display: `file[:line]: Kind: message`.
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diag);

/// Base of the exceptions thrown for fatal diagnostics.
/// origin() is the call site that asked for the diagnostic; the raising
/// helpers themselves never appear there.
class DiagnosticError : public std::runtime_error {
public:
    DiagnosticError(Diagnostic diag, std::source_location origin);

    [[nodiscard]] const Diagnostic& diagnostic() const noexcept { return diag_; }
    [[nodiscard]] DiagnosticKind kind() const noexcept { return diag_.kind; }
    [[nodiscard]] const std::source_location& origin() const noexcept { return origin_; }

private:
    Diagnostic diag_;
    std::source_location origin_;
};

class CompileError final : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

class TokenMissingError final : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

class SyntaxError final : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

/// Throw the exception matching `kind`. A missing line becomes 0.
/// Nothing is written to any stream.
[[noreturn]] void raise_diagnostic(std::optional<uint32_t> line, std::string_view file,
                                   DiagnosticKind kind, std::string message,
                                   std::source_location origin = std::source_location::current());

/// Raise a CompileError at the location resolved from `meta`.
[[noreturn]] void compile_error(const LocationMeta& meta, std::string_view file,
                                std::string_view message,
                                std::source_location origin = std::source_location::current());

/// A compile-time checked format string that also records where it was written.
template <typename... Args>
struct LocatedFormat {
    template <typename S>
    consteval LocatedFormat(const S& str,
                            std::source_location where = std::source_location::current())
        : format(str), origin(where) {}

    fmt::format_string<Args...> format;
    std::source_location origin;
};

namespace detail {

[[noreturn]] void raise_compile_error(const LocationMeta& meta, std::string_view file,
                                      std::string message, std::source_location origin);

} // namespace detail

/// Raise a CompileError whose message is rendered from a format string.
template <typename... Args>
[[noreturn]] void compile_error(const LocationMeta& meta, std::string_view file,
                                std::type_identity_t<LocatedFormat<Args...>> format,
                                Args&&... args) {
    detail::raise_compile_error(meta, file,
                                fmt::format(format.format, std::forward<Args>(args)...),
                                format.origin);
}

} // namespace parsediag
