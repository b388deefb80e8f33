#include "common/diagnostic.hpp"

#include <fmt/format.h>

namespace parsediag {

std::string_view diagnostic_kind_to_string(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::CompileError:      return "CompileError";
    case DiagnosticKind::TokenMissingError: return "TokenMissingError";
    case DiagnosticKind::SyntaxError:       return "SyntaxError";
    }
    return "Unknown";
}

std::string format_diagnostic(const Diagnostic& diag) {
    return fmt::format("{}: {}: {}", format_file_location(diag.line, diag.file),
                       diagnostic_kind_to_string(diag.kind), diag.message);
}

DiagnosticError::DiagnosticError(Diagnostic diag, std::source_location origin)
    : std::runtime_error(format_diagnostic(diag)), diag_(std::move(diag)), origin_(origin) {}

void raise_diagnostic(std::optional<uint32_t> line, std::string_view file,
                      DiagnosticKind kind, std::string message, std::source_location origin) {
    Diagnostic diag{kind, std::move(message), std::string(file), line.value_or(0)};
    switch (kind) {
    case DiagnosticKind::CompileError:
        throw CompileError(std::move(diag), origin);
    case DiagnosticKind::TokenMissingError:
        throw TokenMissingError(std::move(diag), origin);
    case DiagnosticKind::SyntaxError:
        throw SyntaxError(std::move(diag), origin);
    }
    throw DiagnosticError(std::move(diag), origin);
}

void compile_error(const LocationMeta& meta, std::string_view file, std::string_view message,
                   std::source_location origin) {
    detail::raise_compile_error(meta, file, std::string(message), origin);
}

namespace detail {

void raise_compile_error(const LocationMeta& meta, std::string_view file,
                         std::string message, std::source_location origin) {
    auto loc = resolve_location(meta, file);
    raise_diagnostic(loc.line, loc.file, DiagnosticKind::CompileError, std::move(message),
                     origin);
}

} // namespace detail

} // namespace parsediag
