#pragma once

#include "common/result.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parsediag {

/// Lexer for the generic term notation that internal values are printed in.
/// Scanning stops at the first malformed token; the error is kept and
/// returned from tokenize_all().
class Lexer {
public:
    explicit Lexer(std::string_view source);

    /// Get the next token from the source.
    [[nodiscard]] Token next();

    /// Tokenize the entire source. The trailing Eof token is included.
    [[nodiscard]] Result<std::vector<Token>> tokenize_all();

    /// Check if we've reached the end of the source.
    [[nodiscard]] bool at_end() const;

    /// The first error met, if any.
    [[nodiscard]] const std::optional<std::string>& error() const { return error_; }

private:
    std::string_view source_;
    uint32_t offset_ = 0;
    std::optional<std::string> error_;

    [[nodiscard]] char peek() const;
    [[nodiscard]] char peek_next() const;
    char advance();
    bool match_char(char expected);
    void skip_whitespace();

    Token scan_token();
    Token make_token(TokenKind kind, uint32_t start) const;
    Token make_error(uint32_t start, std::string msg);
    Token scan_atom(uint32_t start);
    Token scan_var(uint32_t start);
    Token scan_quoted(uint32_t start, char quote);
    Token scan_number(uint32_t start);
    Token scan_char(uint32_t start);

    // Escape sequence parsing: appends the decoded character to `out`.
    bool scan_escape_sequence(std::string& out);

    [[nodiscard]] static bool is_lower(char c);
    [[nodiscard]] static bool is_upper(char c);
    [[nodiscard]] static bool is_digit(char c);
    [[nodiscard]] static bool is_name_char(char c);
    [[nodiscard]] static int digit_value(char c);
};

} // namespace parsediag
