#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace parsediag {

/// Append the UTF-8 encoding of `codepoint` to `out`.
void append_utf8(std::string& out, uint32_t codepoint);

/// Decode UTF-8 text into code points. Bytes that do not start a valid
/// sequence are passed through as single code points.
[[nodiscard]] std::vector<uint32_t> decode_utf8(std::string_view text);

} // namespace parsediag
