#pragma once

#include "ast/term.hpp"

#include <string>
#include <string_view>

namespace parsediag {
namespace ast {

/// Prints a term back in the generic term notation.
class TermPrinter {
public:
    [[nodiscard]] std::string print(const Term& term);

private:
    std::string output_;

    void print_term(const Term& term);
    void print_atom(std::string_view name);
    void print_float(double value);
    void print_binary(std::string_view bytes);
    void print_list(const Term& term);
    void print_elements(const Term& term);
    void print_quoted(std::string_view text, char quote);

    [[nodiscard]] static bool is_bare_atom(std::string_view name);
    [[nodiscard]] static bool is_printable_string(const Term& term);
    [[nodiscard]] static bool is_printable_bytes(std::string_view bytes);
};

/// Convenience wrapper around TermPrinter.
[[nodiscard]] std::string term_to_string(const Term& term);

} // namespace ast
} // namespace parsediag
