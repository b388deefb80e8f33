#pragma once

#include "ast/term.hpp"
#include "common/result.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parsediag {

/// Recursive descent parser for a single term of the generic notation.
/// The token stream must end with a Dot terminator followed by Eof.
/// Parsing stops at the first error, including nesting deeper than 512 levels.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    /// Parse exactly one term followed by the terminator.
    [[nodiscard]] Result<ast::Term> parse_term();

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;
    std::optional<std::string> error_;

    // ---- Token navigation ----
    [[nodiscard]] const Token& peek() const { return tokens_[pos_]; }
    [[nodiscard]] bool at(TokenKind kind) const { return peek().kind == kind; }
    const Token& advance();
    bool expect(TokenKind kind);
    bool match(TokenKind kind);

    // ---- Error handling ----
    void error(std::string msg);
    void error_unexpected();
    [[nodiscard]] bool failed() const { return error_.has_value(); }

    // ---- Terms ----
    ast::Term parse_expr();
    ast::Term parse_primary();
    ast::Term parse_signed_number();
    ast::Term parse_tuple();
    ast::Term parse_list();
    ast::Term parse_string();
    ast::Term parse_binary();
    void parse_bin_segment(std::string& bytes);
};

/// Tokenize `text`, append the terminator and parse it as one term.
[[nodiscard]] Result<ast::Term> parse_term_text(std::string_view text);

} // namespace parsediag
