#include "decode/structured_token.hpp"

#include "ast/term_printer.hpp"
#include "parser/parser.hpp"

#include <fmt/format.h>

#include <utility>

namespace parsediag {

using namespace ast;

namespace {

Result<StructuredToken> classify_sigil(const Term& term) {
    // {sigil, Meta, Char, [Content | _], Modifiers, Delimiter}
    const auto& e = term.elements;
    if (e.size() != 6 || !e[2].is(TermKind::Integer) || !e[3].is(TermKind::List) ||
        e[3].elements.empty()) {
        return Result<StructuredToken>::err(
            fmt::format("no match of sigil token {}", term_to_string(term)));
    }
    if (e[2].integer < 0 || e[2].integer > 0x10FFFF) {
        return Result<StructuredToken>::err(
            fmt::format("invalid sigil character {}", e[2].integer));
    }

    SigilToken sigil;
    sigil.sigil = static_cast<uint32_t>(e[2].integer);
    const auto& first = e[3].elements.front();
    if (first.is(TermKind::Binary)) {
        sigil.content = first.text;
    }
    return Result<StructuredToken>::ok(std::move(sigil));
}

} // namespace

Result<StructuredToken> decode_structured_token(std::string_view text) {
    auto parsed = parse_term_text(text);
    if (!parsed) {
        return Result<StructuredToken>::forward_err(parsed);
    }
    Term term = std::move(parsed).value();

    if (term.is(TermKind::Tuple)) {
        if (!term.elements.empty() && term.elements.front().is_atom("sigil")) {
            return classify_sigil(term);
        }
        return Result<StructuredToken>::err(
            fmt::format("unrecognized structured token {}", term_to_string(term)));
    }

    if (term.is(TermKind::List)) {
        if (term.elements.size() == 1 && term.elements.front().is(TermKind::Atom)) {
            return Result<StructuredToken>::ok(AliasToken{term.elements.front().text});
        }
        return Result<StructuredToken>::ok(ListToken{std::move(term.elements)});
    }

    return Result<StructuredToken>::err(
        fmt::format("unrecognized structured token {}", term_to_string(term)));
}

} // namespace parsediag
