#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace parsediag {

/// Token kinds of the generic term notation.
enum class TokenKind : uint16_t {
    // Special tokens
    Invalid,
    Eof,

    // Literals
    Atom,          // foo, 'Foo'
    Var,           // Foo, _foo
    Integer,       // 42, 16#ff
    Float,         // 1.5e3
    Char,          // $a
    String,        // "abc"

    // Punctuation
    LBrace,        // {
    RBrace,        // }
    LBracket,      // [
    RBracket,      // ]
    BinOpen,       // <<
    BinClose,      // >>
    Comma,         // ,
    Pipe,          // |
    Slash,         // /
    Minus,         // -
    Plus,          // +
    Colon,         // :
    Dot,           // . (term terminator)
};

/// Returns the string representation of a token kind.
[[nodiscard]] std::string_view token_kind_to_string(TokenKind kind);

/// A single token from the term lexer.
/// `value` holds the decoded contents of atoms, strings and characters;
/// `integer` and `real` hold numeric values.
struct Token {
    TokenKind kind = TokenKind::Invalid;
    std::string_view text;
    uint32_t offset = 0;
    std::string value;
    int64_t integer = 0;
    double real = 0.0;

    [[nodiscard]] bool is(TokenKind k) const { return kind == k; }
    [[nodiscard]] bool is_not(TokenKind k) const { return kind != k; }
};

} // namespace parsediag
