#include "ast/term.hpp"

#include <utility>

namespace parsediag {
namespace ast {

Term Term::make_atom(std::string name) {
    Term t;
    t.kind = TermKind::Atom;
    t.text = std::move(name);
    return t;
}

Term Term::make_integer(int64_t value) {
    Term t;
    t.kind = TermKind::Integer;
    t.integer = value;
    return t;
}

Term Term::make_float(double value) {
    Term t;
    t.kind = TermKind::Float;
    t.real = value;
    return t;
}

Term Term::make_binary(std::string bytes) {
    Term t;
    t.kind = TermKind::Binary;
    t.text = std::move(bytes);
    return t;
}

Term Term::make_tuple(std::vector<Term> elements) {
    Term t;
    t.kind = TermKind::Tuple;
    t.elements = std::move(elements);
    return t;
}

Term Term::make_list(std::vector<Term> elements) {
    Term t;
    t.kind = TermKind::List;
    t.elements = std::move(elements);
    return t;
}

} // namespace ast
} // namespace parsediag
