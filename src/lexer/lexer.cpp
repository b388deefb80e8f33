#include "lexer/lexer.hpp"

#include "common/utf8.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

namespace parsediag {

// ============================================================================
// Token utility functions
// ============================================================================

std::string_view token_kind_to_string(TokenKind kind) {
    switch (kind) {
    case TokenKind::Invalid:  return "Invalid";
    case TokenKind::Eof:      return "EOF";
    case TokenKind::Atom:     return "Atom";
    case TokenKind::Var:      return "Var";
    case TokenKind::Integer:  return "Integer";
    case TokenKind::Float:    return "Float";
    case TokenKind::Char:     return "Char";
    case TokenKind::String:   return "String";
    case TokenKind::LBrace:   return "{";
    case TokenKind::RBrace:   return "}";
    case TokenKind::LBracket: return "[";
    case TokenKind::RBracket: return "]";
    case TokenKind::BinOpen:  return "<<";
    case TokenKind::BinClose: return ">>";
    case TokenKind::Comma:    return ",";
    case TokenKind::Pipe:     return "|";
    case TokenKind::Slash:    return "/";
    case TokenKind::Minus:    return "-";
    case TokenKind::Plus:     return "+";
    case TokenKind::Colon:    return ":";
    case TokenKind::Dot:      return ".";
    }
    return "Unknown";
}

// ============================================================================
// Character classification helpers
// ============================================================================

bool Lexer::is_lower(char c) {
    return c >= 'a' && c <= 'z';
}

bool Lexer::is_upper(char c) {
    return (c >= 'A' && c <= 'Z') || c == '_';
}

bool Lexer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool Lexer::is_name_char(char c) {
    return is_lower(c) || is_upper(c) || is_digit(c) || c == '@';
}

int Lexer::digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return 99;
}

// ============================================================================
// Lexer core
// ============================================================================

Lexer::Lexer(std::string_view source) : source_(source) {}

bool Lexer::at_end() const {
    return offset_ >= source_.size();
}

char Lexer::peek() const {
    if (at_end()) return '\0';
    return source_[offset_];
}

char Lexer::peek_next() const {
    if (offset_ + 1 >= source_.size()) return '\0';
    return source_[offset_ + 1];
}

char Lexer::advance() {
    return source_[offset_++];
}

bool Lexer::match_char(char expected) {
    if (at_end() || source_[offset_] != expected) return false;
    advance();
    return true;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const {
    Token tok;
    tok.kind = kind;
    tok.text = source_.substr(start, offset_ - start);
    tok.offset = start;
    return tok;
}

Token Lexer::make_error(uint32_t start, std::string msg) {
    if (!error_) {
        error_ = fmt::format("{}: {}", start + 1, msg);
    }
    return make_token(TokenKind::Invalid, start);
}

void Lexer::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '%') {
            // Comment runs to the end of the line
            while (!at_end() && peek() != '\n') {
                advance();
            }
        } else {
            break;
        }
    }
}

// ============================================================================
// Names
// ============================================================================

Token Lexer::scan_atom(uint32_t start) {
    while (!at_end() && is_name_char(peek())) {
        advance();
    }
    Token tok = make_token(TokenKind::Atom, start);
    tok.value = std::string(tok.text);
    return tok;
}

Token Lexer::scan_var(uint32_t start) {
    while (!at_end() && is_name_char(peek())) {
        advance();
    }
    Token tok = make_token(TokenKind::Var, start);
    tok.value = std::string(tok.text);
    return tok;
}

// ============================================================================
// Quoted atoms and strings
// ============================================================================

Token Lexer::scan_quoted(uint32_t start, char quote) {
    std::string value;
    while (!at_end() && peek() != quote) {
        char c = advance();
        if (c == '\\') {
            if (!scan_escape_sequence(value)) {
                return make_error(start, "unterminated escape sequence");
            }
        } else {
            value += c;
        }
    }
    if (at_end()) {
        return make_error(start, quote == '"' ? "unterminated string" : "unterminated atom");
    }
    advance(); // closing quote

    Token tok = make_token(quote == '"' ? TokenKind::String : TokenKind::Atom, start);
    tok.value = std::move(value);
    return tok;
}

// ============================================================================
// Numbers
//   decimal:  [0-9][0-9_]*
//   based:    Base#Digits, Base in 2..36
//   float:    digits '.' digits ([eE] [+-]? digits)?
// ============================================================================

Token Lexer::scan_number(uint32_t start) {
    auto read_digits = [this](std::string& digits) {
        while (!at_end() && (is_digit(peek()) || (peek() == '_' && is_digit(peek_next())))) {
            char c = advance();
            if (c != '_') digits += c;
        }
    };

    std::string digits(1, source_[start]);
    read_digits(digits);

    // Float
    if (peek() == '.' && is_digit(peek_next())) {
        digits += advance(); // '.'
        read_digits(digits);
        if (peek() == 'e' || peek() == 'E') {
            digits += advance();
            if (peek() == '+' || peek() == '-') {
                digits += advance();
            }
            if (!is_digit(peek())) {
                return make_error(start, "float exponent has no digits");
            }
            read_digits(digits);
        }
        double real = 0.0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), real);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return make_error(start, fmt::format("invalid float '{}'", digits));
        }
        Token tok = make_token(TokenKind::Float, start);
        tok.real = real;
        return tok;
    }

    int64_t base = 10;
    if (peek() == '#') {
        int64_t prefix = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), prefix);
        if (ec != std::errc{} || prefix < 2 || prefix > 36) {
            return make_error(start, fmt::format("illegal base '{}'", digits));
        }
        advance(); // '#'
        base = prefix;
        digits.clear();
        while (!at_end() && (digit_value(peek()) < base ||
                             (peek() == '_' && digit_value(peek_next()) < base))) {
            char c = advance();
            if (c != '_') digits += c;
        }
        if (digits.empty()) {
            return make_error(start, fmt::format("base {} integer has no digits", base));
        }
    }

    int64_t value = 0;
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    for (char c : digits) {
        int64_t d = digit_value(c);
        if (value > (max - d) / base) {
            return make_error(start, "integer literal out of range");
        }
        value = value * base + d;
    }

    Token tok = make_token(TokenKind::Integer, start);
    tok.integer = value;
    return tok;
}

// ============================================================================
// Character literals: $c, $\n, $\x{1F600}
// ============================================================================

Token Lexer::scan_char(uint32_t start) {
    if (at_end()) {
        return make_error(start, "unterminated character literal");
    }

    std::string value;
    char c = advance();
    if (c == '\\') {
        if (!scan_escape_sequence(value)) {
            return make_error(start, "unterminated escape sequence");
        }
    } else {
        value += c;
        // Pull in the continuation bytes of a multi-byte character
        while (!at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
            value += advance();
        }
    }

    Token tok = make_token(TokenKind::Char, start);
    auto codes = decode_utf8(value);
    tok.integer = codes.empty() ? 0 : codes.front();
    tok.value = std::move(value);
    return tok;
}

// ============================================================================
// Escape sequence parsing
// ============================================================================

bool Lexer::scan_escape_sequence(std::string& out) {
    if (at_end()) {
        return false;
    }

    char c = advance();
    switch (c) {
    case 'b': out += '\b'; return true;
    case 'd': out += '\x7f'; return true;
    case 'e': out += '\x1b'; return true;
    case 'f': out += '\f'; return true;
    case 'n': out += '\n'; return true;
    case 'r': out += '\r'; return true;
    case 's': out += ' '; return true;
    case 't': out += '\t'; return true;
    case 'v': out += '\v'; return true;
    case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        // Octal: up to three digits
        uint32_t cp = static_cast<uint32_t>(c - '0');
        for (int i = 0; i < 2 && !at_end() && peek() >= '0' && peek() <= '7'; ++i) {
            cp = cp * 8 + static_cast<uint32_t>(advance() - '0');
        }
        append_utf8(out, cp);
        return true;
    }
    case 'x': {
        uint32_t cp = 0;
        if (match_char('{')) {
            while (!at_end() && peek() != '}') {
                int d = digit_value(advance());
                if (d >= 16) return false;
                cp = cp * 16 + static_cast<uint32_t>(d);
            }
            if (!match_char('}')) return false;
        } else {
            for (int i = 0; i < 2; ++i) {
                if (at_end() || digit_value(peek()) >= 16) return false;
                cp = cp * 16 + static_cast<uint32_t>(digit_value(advance()));
            }
        }
        append_utf8(out, cp);
        return true;
    }
    case '^':
        // Control character: \^a is 1
        if (at_end()) return false;
        out += static_cast<char>(advance() & 0x1F);
        return true;
    default:
        // \\, \', \" and any other character stand for themselves
        out += c;
        return true;
    }
}

// ============================================================================
// Main scanning logic
// ============================================================================

Token Lexer::next() {
    if (error_) {
        return make_token(TokenKind::Invalid, offset_);
    }

    skip_whitespace();

    if (at_end()) {
        return make_token(TokenKind::Eof, offset_);
    }

    return scan_token();
}

Token Lexer::scan_token() {
    uint32_t start = offset_;
    char c = advance();

    if (is_lower(c)) {
        return scan_atom(start);
    }
    if (is_upper(c)) {
        return scan_var(start);
    }
    if (is_digit(c)) {
        return scan_number(start);
    }

    switch (c) {
    case '\'': return scan_quoted(start, '\'');
    case '"':  return scan_quoted(start, '"');
    case '$':  return scan_char(start);

    case '{':  return make_token(TokenKind::LBrace, start);
    case '}':  return make_token(TokenKind::RBrace, start);
    case '[':  return make_token(TokenKind::LBracket, start);
    case ']':  return make_token(TokenKind::RBracket, start);
    case ',':  return make_token(TokenKind::Comma, start);
    case '|':  return make_token(TokenKind::Pipe, start);
    case '/':  return make_token(TokenKind::Slash, start);
    case '-':  return make_token(TokenKind::Minus, start);
    case '+':  return make_token(TokenKind::Plus, start);
    case ':':  return make_token(TokenKind::Colon, start);
    case '.':  return make_token(TokenKind::Dot, start);

    case '<':
        if (match_char('<')) return make_token(TokenKind::BinOpen, start);
        break;
    case '>':
        if (match_char('>')) return make_token(TokenKind::BinClose, start);
        break;
    default:
        break;
    }

    return make_error(start, fmt::format("illegal character '{}'", c));
}

Result<std::vector<Token>> Lexer::tokenize_all() {
    std::vector<Token> tokens;
    while (true) {
        auto tok = next();
        if (tok.kind == TokenKind::Invalid) {
            return Result<std::vector<Token>>::err(error_.value_or("invalid token"));
        }
        bool done = tok.kind == TokenKind::Eof;
        tokens.push_back(std::move(tok));
        if (done) break;
    }
    return Result<std::vector<Token>>::ok(std::move(tokens));
}

} // namespace parsediag
