#pragma once

#include <cstdio>

namespace parsediag {

/// Process-wide reporter settings. Installed once at startup, read-only after.
struct ReporterConfig {
    bool ansi_enabled = false;     // color the "warning: " prefix
    std::FILE* stream = stderr;    // diagnostic output stream
};

/// Install the process-wide configuration.
void configure(const ReporterConfig& config);

/// The current process-wide configuration.
[[nodiscard]] const ReporterConfig& reporter_config();

} // namespace parsediag
