#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace parsediag {

/// Explicit (file, line) pair recorded on a node that came from another file,
/// for example code injected by a macro or an `@file` attribute.
struct FileOverride {
    std::string file;
    uint32_t line = 0;

    [[nodiscard]] bool operator==(const FileOverride&) const = default;
};

/// Location metadata attached to a syntax node by the parser.
/// A default-constructed value is the absent metadata.
struct LocationMeta {
    std::optional<uint32_t> line;
    std::optional<FileOverride> file;

    [[nodiscard]] static LocationMeta none() { return LocationMeta{}; }

    [[nodiscard]] static LocationMeta at_line(uint32_t line) {
        return LocationMeta{line, std::nullopt};
    }

    [[nodiscard]] static LocationMeta with_file(std::string file, uint32_t line) {
        return LocationMeta{std::nullopt, FileOverride{std::move(file), line}};
    }
};

/// A concrete (file, line) pair. Line 0 means "no specific line".
struct ResolvedLocation {
    std::string file;
    uint32_t line = 0;

    [[nodiscard]] bool operator==(const ResolvedLocation&) const = default;
};

/// Pick the most accurate location for a diagnostic: an explicit file
/// override wins, otherwise the fallback file with the node's line (or 0).
[[nodiscard]] ResolvedLocation resolve_location(const LocationMeta& meta,
                                                std::string_view fallback_file);

/// Render `file` or `file:line` with the file relative to the working directory.
[[nodiscard]] std::string format_file_location(uint32_t line, std::string_view file);

} // namespace parsediag
