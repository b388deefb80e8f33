#pragma once

#include "common/diagnostic.hpp"

#include <cstdint>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace parsediag {

/// The prefix the parser uses for "unexpected token" failures.
inline constexpr std::string_view kSyntaxErrorBefore = "syntax error before: ";

/// Error text produced by the parser: either a plain prefix that the
/// offending token is appended to, or a (prefix, suffix) pair that the
/// token is inserted between.
struct ErrorPrefix {
    std::string text;
    std::optional<std::string> suffix;

    [[nodiscard]] static ErrorPrefix plain(std::string text) {
        return ErrorPrefix{std::move(text), std::nullopt};
    }

    [[nodiscard]] static ErrorPrefix wrapping(std::string prefix, std::string suffix) {
        return ErrorPrefix{std::move(prefix), std::move(suffix)};
    }

    [[nodiscard]] bool is_pair() const { return suffix.has_value(); }

    /// True for a plain prefix equal to `s`.
    [[nodiscard]] bool is(std::string_view s) const { return !suffix && text == s; }
};

/// A raw failure reported by the lexer or parser.
struct RawErrorFragment {
    ErrorPrefix prefix;
    std::string token; // text following the point of failure, possibly empty
};

/// Kind and final text of a normalized failure.
struct NormalizedMessage {
    DiagnosticKind kind = DiagnosticKind::SyntaxError;
    std::string message;

    [[nodiscard]] bool operator==(const NormalizedMessage&) const = default;
};

/// One row of the normalization table.
struct NormalizationRule {
    std::string_view name;
    bool (*matches)(const RawErrorFragment& fragment);
    NormalizedMessage (*apply)(const RawErrorFragment& fragment);
};

/// The rules in the order they are tried. The last one matches everything.
[[nodiscard]] std::span<const NormalizationRule> normalization_rules();

/// The first rule that matches `fragment`.
[[nodiscard]] const NormalizationRule& matching_rule(const RawErrorFragment& fragment);

/// Rewrite a raw fragment into its final kind and message.
/// Throws TermDecodeError if a structured token cannot be decoded.
[[nodiscard]] NormalizedMessage normalize_message(const RawErrorFragment& fragment);

/// Build the diagnostic for a raw fragment. A missing line becomes 0.
[[nodiscard]] Diagnostic normalize(std::optional<uint32_t> line, std::string_view file,
                                   const RawErrorFragment& fragment);

/// Normalize a lexer/parser failure and raise it.
[[noreturn]] void parse_error(std::optional<uint32_t> line, std::string_view file,
                              const ErrorPrefix& prefix, std::string_view token,
                              std::source_location origin = std::source_location::current());

} // namespace parsediag
