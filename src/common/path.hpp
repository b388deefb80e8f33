#pragma once

#include <string>
#include <string_view>

namespace parsediag {

/// Strip `base` from the front of `path` when `path` is an absolute path
/// located under it. Any other path is returned unchanged.
[[nodiscard]] std::string relative_to(std::string_view path, std::string_view base);

/// relative_to() against the current working directory.
[[nodiscard]] std::string relative_to_cwd(std::string_view path);

} // namespace parsediag
