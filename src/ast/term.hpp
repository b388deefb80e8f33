#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace parsediag {
namespace ast {

enum class TermKind : uint8_t {
    Atom,
    Integer,
    Float,
    Binary,
    Tuple,
    List,
};

/// A decoded value of the generic term notation.
/// Strings decode to lists of character codes, as in the notation itself.
struct Term {
    TermKind kind = TermKind::List;
    std::string text;              // Atom: name, Binary: raw bytes
    int64_t integer = 0;
    double real = 0.0;
    std::vector<Term> elements;    // Tuple and List

    [[nodiscard]] static Term make_atom(std::string name);
    [[nodiscard]] static Term make_integer(int64_t value);
    [[nodiscard]] static Term make_float(double value);
    [[nodiscard]] static Term make_binary(std::string bytes);
    [[nodiscard]] static Term make_tuple(std::vector<Term> elements);
    [[nodiscard]] static Term make_list(std::vector<Term> elements);

    [[nodiscard]] bool is(TermKind k) const { return kind == k; }
    [[nodiscard]] bool is_atom(std::string_view name) const {
        return kind == TermKind::Atom && text == name;
    }

    [[nodiscard]] bool operator==(const Term&) const = default;
};

} // namespace ast
} // namespace parsediag
