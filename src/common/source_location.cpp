#include "common/source_location.hpp"

#include "common/path.hpp"

#include <fmt/format.h>

namespace parsediag {

ResolvedLocation resolve_location(const LocationMeta& meta, std::string_view fallback_file) {
    if (meta.file) {
        return ResolvedLocation{meta.file->file, meta.file->line};
    }
    return ResolvedLocation{std::string(fallback_file), meta.line.value_or(0)};
}

std::string format_file_location(uint32_t line, std::string_view file) {
    if (line == 0) {
        return relative_to_cwd(file);
    }
    return fmt::format("{}:{}", relative_to_cwd(file), line);
}

} // namespace parsediag
