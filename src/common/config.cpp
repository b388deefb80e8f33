#include "common/config.hpp"

namespace parsediag {

namespace {

ReporterConfig& global_config() {
    static ReporterConfig config;
    return config;
}

} // namespace

void configure(const ReporterConfig& config) {
    auto& current = global_config();
    current = config;
    if (current.stream == nullptr) {
        current.stream = stderr;
    }
}

const ReporterConfig& reporter_config() {
    return global_config();
}

} // namespace parsediag
