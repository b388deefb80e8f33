#include "ast/term_printer.hpp"

#include "common/utf8.hpp"

#include <fmt/format.h>

namespace parsediag {
namespace ast {

std::string TermPrinter::print(const Term& term) {
    output_.clear();
    print_term(term);
    return output_;
}

void TermPrinter::print_term(const Term& term) {
    switch (term.kind) {
        case TermKind::Atom:
            print_atom(term.text);
            break;
        case TermKind::Integer:
            output_ += fmt::format("{}", term.integer);
            break;
        case TermKind::Float:
            print_float(term.real);
            break;
        case TermKind::Binary:
            print_binary(term.text);
            break;
        case TermKind::Tuple:
            output_ += '{';
            print_elements(term);
            output_ += '}';
            break;
        case TermKind::List:
            print_list(term);
            break;
    }
}

void TermPrinter::print_atom(std::string_view name) {
    if (is_bare_atom(name)) {
        output_ += name;
    } else {
        print_quoted(name, '\'');
    }
}

void TermPrinter::print_float(double value) {
    auto text = fmt::format("{}", value);
    // Floats always carry a fractional part in the notation: 1.0, 1.0e20
    if (text.find_first_of(".ein") == std::string::npos) {
        text += ".0";
    } else if (text.find('.') == std::string::npos && text.find('e') != std::string::npos) {
        text.insert(text.find('e'), ".0");
    }
    output_ += text;
}

void TermPrinter::print_binary(std::string_view bytes) {
    output_ += "<<";
    if (!bytes.empty()) {
        if (is_printable_bytes(bytes)) {
            print_quoted(bytes, '"');
        } else {
            for (size_t i = 0; i < bytes.size(); ++i) {
                if (i > 0) output_ += ',';
                output_ += fmt::format("{}", static_cast<unsigned char>(bytes[i]));
            }
        }
    }
    output_ += ">>";
}

void TermPrinter::print_list(const Term& term) {
    if (is_printable_string(term)) {
        std::string text;
        for (const auto& e : term.elements) {
            append_utf8(text, static_cast<uint32_t>(e.integer));
        }
        print_quoted(text, '"');
        return;
    }
    output_ += '[';
    print_elements(term);
    output_ += ']';
}

void TermPrinter::print_elements(const Term& term) {
    for (size_t i = 0; i < term.elements.size(); ++i) {
        if (i > 0) output_ += ',';
        print_term(term.elements[i]);
    }
}

void TermPrinter::print_quoted(std::string_view text, char quote) {
    output_ += quote;
    for (char c : text) {
        switch (c) {
            case '\n': output_ += "\\n"; break;
            case '\t': output_ += "\\t"; break;
            case '\r': output_ += "\\r"; break;
            case '\\': output_ += "\\\\"; break;
            default:
                if (c == quote) {
                    output_ += '\\';
                }
                output_ += c;
        }
    }
    output_ += quote;
}

bool TermPrinter::is_bare_atom(std::string_view name) {
    if (name.empty() || name.front() < 'a' || name.front() > 'z') {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '@';
        if (!ok) return false;
    }
    return true;
}

bool TermPrinter::is_printable_string(const Term& term) {
    if (term.elements.empty()) {
        return false;
    }
    for (const auto& e : term.elements) {
        if (!e.is(TermKind::Integer)) return false;
        bool ok = (e.integer >= 32 && e.integer < 127) || e.integer == '\n' ||
                  e.integer == '\t' || e.integer == '\r' ||
                  (e.integer >= 160 && e.integer <= 0x10FFFF);
        if (!ok) return false;
    }
    return true;
}

bool TermPrinter::is_printable_bytes(std::string_view bytes) {
    for (uint32_t cp : decode_utf8(bytes)) {
        bool ok = (cp >= 32 && cp < 127) || cp == '\n' || cp == '\t' || cp == '\r' ||
                  (cp >= 160 && cp <= 0x10FFFF);
        if (!ok) return false;
    }
    return true;
}

std::string term_to_string(const Term& term) {
    TermPrinter printer;
    return printer.print(term);
}

} // namespace ast
} // namespace parsediag
