#include "report/warning.hpp"

#include "common/config.hpp"
#include "common/source_location.hpp"
#include "report/session.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <system_error>

namespace parsediag {

std::string warning_prefix() {
    if (reporter_config().ansi_enabled) {
        return fmt::format(fmt::fg(fmt::terminal_color::yellow), "warning: ");
    }
    return "warning: ";
}

void warn(std::optional<uint32_t> line, std::string_view file, std::string_view text) {
    uint32_t at = line.value_or(0);
    if (auto* session = current_session()) {
        session->post_warning(WarningEvent{std::string(file), at, std::string(text)});
    }
    warn(fmt::format("{}\n  {}\n", text, format_file_location(at, file)));
}

void warn(std::string_view text) {
    if (auto* session = current_session()) {
        session->register_warning();
    }
    // A failed write loses the line but never fails the warning
    try {
        fmt::print(reporter_config().stream, "{}{}\n", warning_prefix(), text);
    } catch (const std::system_error&) {
    }
}

} // namespace parsediag
