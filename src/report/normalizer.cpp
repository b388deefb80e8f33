#include "report/normalizer.hpp"

#include "common/utf8.hpp"
#include "decode/structured_token.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>
#include <variant>

namespace parsediag {

namespace {

constexpr std::string_view kSigilMarker = "{sigil,";
constexpr std::string_view kAliasMarker = "['";
constexpr std::string_view kListMarker = "[";

StructuredToken decode_or_throw(std::string_view token) {
    auto decoded = decode_structured_token(token);
    if (!decoded) {
        throw TermDecodeError(decoded.error());
    }
    return std::move(decoded).value();
}

// ============================================================================
// Match conditions
// ============================================================================

bool is_incomplete_expression(const RawErrorFragment& f) {
    return f.token.empty() && f.prefix.is(kSyntaxErrorBefore);
}

bool is_missing_token(const RawErrorFragment& f) {
    return f.token.empty();
}

bool is_end_of_line(const RawErrorFragment& f) {
    return f.prefix.is(kSyntaxErrorBefore) && f.token == "eol";
}

bool is_dangling_end(const RawErrorFragment& f) {
    return f.prefix.is(kSyntaxErrorBefore) && f.token == "'end'";
}

bool is_sigil(const RawErrorFragment& f) {
    return f.prefix.is(kSyntaxErrorBefore) && f.token.starts_with(kSigilMarker);
}

bool is_quoted_alias(const RawErrorFragment& f) {
    return !f.prefix.is_pair() && f.token.starts_with(kAliasMarker);
}

bool is_wrapped_list(const RawErrorFragment& f) {
    return !f.prefix.is_pair() && f.token.starts_with(kListMarker);
}

bool is_prefix_suffix_pair(const RawErrorFragment& f) {
    return f.prefix.is_pair();
}

bool is_plain(const RawErrorFragment&) {
    return true;
}

// ============================================================================
// Transforms
// ============================================================================

NormalizedMessage incomplete_expression(const RawErrorFragment&) {
    return {DiagnosticKind::TokenMissingError, "syntax error: expression is incomplete"};
}

NormalizedMessage missing_token(const RawErrorFragment& f) {
    return {DiagnosticKind::TokenMissingError, f.prefix.text + f.prefix.suffix.value_or("")};
}

NormalizedMessage end_of_line(const RawErrorFragment&) {
    return {DiagnosticKind::SyntaxError,
            "unexpectedly reached end of line. The current expression is invalid or incomplete"};
}

NormalizedMessage dangling_end(const RawErrorFragment&) {
    return {DiagnosticKind::SyntaxError, "unexpected token: end"};
}

NormalizedMessage sigil(const RawErrorFragment& f) {
    auto decoded = decode_or_throw(f.token);
    const auto* token = std::get_if<SigilToken>(&decoded);
    if (!token) {
        throw TermDecodeError(fmt::format("expected a sigil token in '{}'", f.token));
    }
    std::string letter;
    append_utf8(letter, token->sigil);
    return {DiagnosticKind::SyntaxError,
            fmt::format("syntax error before: sigil ~{} starting with content '{}'", letter,
                        token->content.value_or(""))};
}

NormalizedMessage quoted_alias(const RawErrorFragment& f) {
    auto decoded = decode_or_throw(f.token);
    const auto* token = std::get_if<AliasToken>(&decoded);
    if (!token) {
        throw TermDecodeError(fmt::format("expected a single alias in '{}'", f.token));
    }
    return {DiagnosticKind::SyntaxError, f.prefix.text + token->name};
}

NormalizedMessage wrapped_list(const RawErrorFragment& f) {
    auto decoded = decode_or_throw(f.token);
    std::string quoted = "\"";
    if (const auto* list = std::get_if<ListToken>(&decoded)) {
        if (!list->elements.empty() && list->elements.front().is(ast::TermKind::Binary)) {
            quoted = fmt::format("\"{}\"", list->elements.front().text);
        }
    }
    return {DiagnosticKind::SyntaxError, f.prefix.text + quoted};
}

NormalizedMessage prefix_suffix_pair(const RawErrorFragment& f) {
    return {DiagnosticKind::SyntaxError, f.prefix.text + f.token + *f.prefix.suffix};
}

NormalizedMessage plain(const RawErrorFragment& f) {
    return {DiagnosticKind::SyntaxError, f.prefix.text + f.token};
}

// First match wins. The alias row must stay ahead of the generic list row.
// clang-format off
constexpr std::array<NormalizationRule, 9> kRules = {{
    {"incomplete-expression", is_incomplete_expression, incomplete_expression},
    {"missing-token",         is_missing_token,         missing_token},
    {"end-of-line",           is_end_of_line,           end_of_line},
    {"dangling-end",          is_dangling_end,          dangling_end},
    {"sigil",                 is_sigil,                 sigil},
    {"quoted-alias",          is_quoted_alias,          quoted_alias},
    {"wrapped-list",          is_wrapped_list,          wrapped_list},
    {"prefix-suffix",         is_prefix_suffix_pair,    prefix_suffix_pair},
    {"plain",                 is_plain,                 plain},
}};
// clang-format on

} // namespace

std::span<const NormalizationRule> normalization_rules() {
    return kRules;
}

const NormalizationRule& matching_rule(const RawErrorFragment& fragment) {
    for (const auto& rule : kRules) {
        if (rule.matches(fragment)) {
            return rule;
        }
    }
    return kRules.back();
}

NormalizedMessage normalize_message(const RawErrorFragment& fragment) {
    return matching_rule(fragment).apply(fragment);
}

Diagnostic normalize(std::optional<uint32_t> line, std::string_view file,
                     const RawErrorFragment& fragment) {
    auto normalized = normalize_message(fragment);
    return Diagnostic{normalized.kind, std::move(normalized.message), std::string(file),
                      line.value_or(0)};
}

void parse_error(std::optional<uint32_t> line, std::string_view file, const ErrorPrefix& prefix,
                 std::string_view token, std::source_location origin) {
    auto diag = normalize(line, file, RawErrorFragment{prefix, std::string(token)});
    raise_diagnostic(diag.line, diag.file, diag.kind, std::move(diag.message), origin);
}

} // namespace parsediag
