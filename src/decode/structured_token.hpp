#pragma once

#include "ast/term.hpp"
#include "common/result.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace parsediag {

/// A sigil token: `{sigil, Meta, Char, [Content | _], Modifiers, Delimiter}`.
struct SigilToken {
    uint32_t sigil = 0;                  // sigil letter as a code point
    std::optional<std::string> content;  // first part, when it is plain text
};

/// A quoted alias wrapped in a one-element list: `['Foo']`.
struct AliasToken {
    std::string name;
};

/// Any other list, such as a binary or interpolation wrapper: `[<<"foo">>]`.
struct ListToken {
    std::vector<ast::Term> elements;
};

using StructuredToken = std::variant<SigilToken, AliasToken, ListToken>;

/// Raised when an offending token that should hold a serialized value
/// cannot be decoded. Carries the decoder's message unchanged.
class TermDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Reparse an offending token that holds a serialized value and classify it.
[[nodiscard]] Result<StructuredToken> decode_structured_token(std::string_view text);

} // namespace parsediag
