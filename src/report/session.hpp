#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace parsediag {

/// A located warning, forwarded to the session as it is reported.
struct WarningEvent {
    std::string file;
    uint32_t line = 0;
    std::string text;

    [[nodiscard]] bool operator==(const WarningEvent&) const = default;
};

/// The component that tracks a compilation's accumulated warnings.
/// Implementations must accept calls from any thread and must not block
/// the reporting thread.
class CompilationSession {
public:
    virtual ~CompilationSession() = default;

    /// One-way notification of a located warning.
    virtual void post_warning(WarningEvent event) = 0;

    /// Count one more warning for this compilation.
    virtual void register_warning() = 0;
};

/// A session that keeps every event in memory.
class WarningCollector final : public CompilationSession {
public:
    using WarningHandler = std::function<void(const WarningEvent&)>;

    /// Set a handler called for each posted event (e.g., for testing).
    void set_handler(WarningHandler handler);

    void post_warning(WarningEvent event) override;
    void register_warning() override;

    [[nodiscard]] uint32_t warning_count() const;
    [[nodiscard]] std::vector<WarningEvent> events() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<WarningEvent> events_;
    WarningHandler handler_;
    uint32_t warning_count_ = 0;
};

/// The session installed for the calling thread's compilation, or nullptr.
[[nodiscard]] CompilationSession* current_session();

/// Installs a session for the calling thread for the lifetime of the scope
/// and restores the previous one afterwards.
class SessionScope {
public:
    explicit SessionScope(CompilationSession& session);
    ~SessionScope();

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

private:
    CompilationSession* previous_;
};

} // namespace parsediag
