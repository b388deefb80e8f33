#pragma once

#include "common/diagnostic.hpp"
#include "common/source_location.hpp"
#include "report/warning.hpp"

#include <source_location>
#include <string_view>

namespace parsediag {

// Error and warning helpers for passes that describe a failure with their
// own description type. `formatter.format_error(desc)` must return text.

template <typename Formatter, typename Desc>
[[noreturn]] void form_error(const LocationMeta& meta, std::string_view file,
                             const Formatter& formatter, const Desc& desc,
                             std::source_location origin = std::source_location::current()) {
    compile_error(meta, file, formatter.format_error(desc), origin);
}

template <typename Formatter, typename Desc>
void form_warn(const LocationMeta& meta, std::string_view file, const Formatter& formatter,
               const Desc& desc) {
    auto loc = resolve_location(meta, file);
    warn(loc.line, loc.file, formatter.format_error(desc));
}

} // namespace parsediag
