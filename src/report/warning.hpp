#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parsediag {

/// "warning: ", in yellow when ANSI output is enabled.
[[nodiscard]] std::string warning_prefix();

/// Report a located warning. The event is posted to the current session,
/// if any, and the warning is printed as
///   warning: <text>
///     <file>[:<line>]
/// followed by a blank line. A missing line becomes 0. Never throws: a failed
/// write to the stream is dropped.
void warn(std::optional<uint32_t> line, std::string_view file, std::string_view text);

/// Report a warning without location: counts it with the current session,
/// if any, and prints `warning: <text>`.
void warn(std::string_view text);

} // namespace parsediag
