#include "parser/parser.hpp"

#include "common/utf8.hpp"
#include "lexer/lexer.hpp"

#include <fmt/format.h>

#include <utility>

namespace parsediag {

using namespace ast;

namespace {

constexpr size_t kMaxNesting = 512;

} // namespace

// ============================================================================
// Constructor & main entry point
// ============================================================================

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().is_not(TokenKind::Eof)) {
        Token eof;
        eof.kind = TokenKind::Eof;
        tokens_.push_back(eof);
    }
}

Result<Term> Parser::parse_term() {
    Term term = parse_expr();
    if (!failed()) {
        expect(TokenKind::Dot);
    }
    if (!failed() && !at(TokenKind::Eof)) {
        error_unexpected();
    }
    if (failed()) {
        return Result<Term>::err(*error_);
    }
    return Result<Term>::ok(std::move(term));
}

// ============================================================================
// Token navigation
// ============================================================================

const Token& Parser::advance() {
    const Token& tok = tokens_[pos_];
    if (tok.is_not(TokenKind::Eof)) {
        ++pos_;
    }
    return tok;
}

bool Parser::expect(TokenKind kind) {
    if (at(kind)) {
        advance();
        return true;
    }
    error(fmt::format("expected '{}', got '{}'", token_kind_to_string(kind),
                      token_kind_to_string(peek().kind)));
    return false;
}

bool Parser::match(TokenKind kind) {
    if (at(kind)) {
        advance();
        return true;
    }
    return false;
}

// ============================================================================
// Error handling
// ============================================================================

void Parser::error(std::string msg) {
    if (!error_) {
        error_ = fmt::format("{}: {}", peek().offset + 1, msg);
    }
}

void Parser::error_unexpected() {
    if (at(TokenKind::Eof)) {
        error("unexpected end of term");
    } else {
        error(fmt::format("syntax error before: {}", peek().text));
    }
}

// ============================================================================
// Terms
// ============================================================================

Term Parser::parse_expr() {
    if (depth_ >= kMaxNesting) {
        error("term nesting too deep");
        return Term{};
    }
    ++depth_;
    Term term = parse_primary();
    --depth_;
    return term;
}

Term Parser::parse_primary() {
    switch (peek().kind) {
        case TokenKind::Atom:
            return Term::make_atom(advance().value);
        case TokenKind::Integer:
        case TokenKind::Char:
            return Term::make_integer(advance().integer);
        case TokenKind::Float:
            return Term::make_float(advance().real);
        case TokenKind::String:
            return parse_string();
        case TokenKind::Minus:
        case TokenKind::Plus:
            return parse_signed_number();
        case TokenKind::LBrace:
            return parse_tuple();
        case TokenKind::LBracket:
            return parse_list();
        case TokenKind::BinOpen:
            return parse_binary();
        case TokenKind::Var:
            error(fmt::format("variable '{}' is not allowed in a term", peek().text));
            return Term{};
        default:
            error_unexpected();
            return Term{};
    }
}

Term Parser::parse_signed_number() {
    bool negate = advance().is(TokenKind::Minus);
    switch (peek().kind) {
        case TokenKind::Integer:
        case TokenKind::Char: {
            int64_t value = advance().integer;
            return Term::make_integer(negate ? -value : value);
        }
        case TokenKind::Float: {
            double value = advance().real;
            return Term::make_float(negate ? -value : value);
        }
        default:
            error_unexpected();
            return Term{};
    }
}

Term Parser::parse_tuple() {
    advance(); // {
    std::vector<Term> elements;
    if (match(TokenKind::RBrace)) {
        return Term::make_tuple(std::move(elements));
    }
    do {
        elements.push_back(parse_expr());
        if (failed()) return Term{};
    } while (match(TokenKind::Comma));
    expect(TokenKind::RBrace);
    return Term::make_tuple(std::move(elements));
}

Term Parser::parse_list() {
    advance(); // [
    std::vector<Term> elements;
    if (match(TokenKind::RBracket)) {
        return Term::make_list(std::move(elements));
    }
    do {
        elements.push_back(parse_expr());
        if (failed()) return Term{};
    } while (match(TokenKind::Comma));

    if (match(TokenKind::Pipe)) {
        // An improper tail is parsed and dropped; the head elements are kept
        Term tail = parse_expr();
        if (failed()) return Term{};
        if (tail.is(TermKind::List)) {
            for (auto& e : tail.elements) {
                elements.push_back(std::move(e));
            }
        }
    }
    expect(TokenKind::RBracket);
    return Term::make_list(std::move(elements));
}

Term Parser::parse_string() {
    // Adjacent string literals concatenate
    std::string text;
    while (at(TokenKind::String)) {
        text += advance().value;
    }
    std::vector<Term> codes;
    for (uint32_t cp : decode_utf8(text)) {
        codes.push_back(Term::make_integer(cp));
    }
    return Term::make_list(std::move(codes));
}

// ============================================================================
// Binaries: << >>, <<"text">>, <<"text"/utf8>>, <<1,2,3>>, <<$a, 955/utf8>>
// ============================================================================

Term Parser::parse_binary() {
    advance(); // <<
    std::string bytes;
    if (match(TokenKind::BinClose)) {
        return Term::make_binary(std::move(bytes));
    }
    do {
        parse_bin_segment(bytes);
        if (failed()) return Term{};
    } while (match(TokenKind::Comma));
    expect(TokenKind::BinClose);
    return Term::make_binary(std::move(bytes));
}

void Parser::parse_bin_segment(std::string& bytes) {
    std::string text;
    int64_t value = 0;
    bool is_text = false;

    if (at(TokenKind::String)) {
        while (at(TokenKind::String)) {
            text += advance().value;
        }
        is_text = true;
    } else if (at(TokenKind::Integer) || at(TokenKind::Char)) {
        value = advance().integer;
    } else if (at(TokenKind::Minus) && (tokens_[pos_ + 1].is(TokenKind::Integer))) {
        advance();
        value = -advance().integer;
    } else {
        error_unexpected();
        return;
    }

    if (at(TokenKind::Colon)) {
        error("sized binary segments are not supported");
        return;
    }

    bool utf8 = false;
    if (match(TokenKind::Slash)) {
        do {
            if (!at(TokenKind::Atom)) {
                error_unexpected();
                return;
            }
            const auto& type = advance().value;
            if (type == "utf8") {
                utf8 = true;
            } else if (type != "binary" && type != "integer") {
                error(fmt::format("unsupported binary segment type '{}'", type));
                return;
            }
        } while (match(TokenKind::Minus));
    }

    if (is_text) {
        // String segments keep their UTF-8 bytes with or without /utf8
        bytes += text;
    } else if (utf8) {
        if (value < 0 || value > 0x10FFFF) {
            error(fmt::format("invalid code point {}", value));
            return;
        }
        append_utf8(bytes, static_cast<uint32_t>(value));
    } else {
        bytes += static_cast<char>(value & 0xFF);
    }
}

// ============================================================================
// Text entry point
// ============================================================================

Result<Term> parse_term_text(std::string_view text) {
    Lexer lexer(text);
    auto tokens = lexer.tokenize_all();
    if (!tokens) {
        return Result<Term>::forward_err(tokens);
    }

    // Terminate the term, as a full stop would in source text
    auto stream = std::move(tokens).value();
    Token dot;
    dot.kind = TokenKind::Dot;
    dot.text = ".";
    dot.offset = static_cast<uint32_t>(text.size());
    stream.insert(stream.end() - 1, dot);

    Parser parser(std::move(stream));
    return parser.parse_term();
}

} // namespace parsediag
