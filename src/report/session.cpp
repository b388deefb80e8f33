#include "report/session.hpp"

#include <utility>

namespace parsediag {

namespace {

thread_local CompilationSession* tls_session = nullptr;

} // namespace

void WarningCollector::set_handler(WarningHandler handler) {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
}

void WarningCollector::post_warning(WarningEvent event) {
    WarningHandler handler;
    {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
        handler = handler_;
    }
    // Called unlocked so a handler may query the collector
    if (handler) {
        handler(event);
    }
}

void WarningCollector::register_warning() {
    std::lock_guard lock(mutex_);
    ++warning_count_;
}

uint32_t WarningCollector::warning_count() const {
    std::lock_guard lock(mutex_);
    return warning_count_;
}

std::vector<WarningEvent> WarningCollector::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

void WarningCollector::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
    warning_count_ = 0;
}

CompilationSession* current_session() {
    return tls_session;
}

SessionScope::SessionScope(CompilationSession& session) : previous_(tls_session) {
    tls_session = &session;
}

SessionScope::~SessionScope() {
    tls_session = previous_;
}

} // namespace parsediag
