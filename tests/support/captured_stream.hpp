#pragma once

#include "common/config.hpp"

#include <cstdio>
#include <string>

namespace parsediag::test_support {

/// A temporary file installed as the diagnostic stream for the lifetime of
/// the object. The default configuration is restored on destruction.
class CapturedStream {
public:
    explicit CapturedStream(bool ansi_enabled = false) : file_(std::tmpfile()) {
        configure(ReporterConfig{ansi_enabled, file_});
    }

    ~CapturedStream() {
        configure(ReporterConfig{});
        if (file_) {
            std::fclose(file_);
        }
    }

    CapturedStream(const CapturedStream&) = delete;
    CapturedStream& operator=(const CapturedStream&) = delete;

    [[nodiscard]] std::string contents() const {
        std::string out;
        if (!file_) return out;
        std::fflush(file_);
        std::rewind(file_);
        char buf[256];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
            out.append(buf, n);
        }
        return out;
    }

private:
    std::FILE* file_;
};

} // namespace parsediag::test_support
