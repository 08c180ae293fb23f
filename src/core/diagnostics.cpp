#include <loom/core/diagnostics.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>

namespace loom::core {

namespace {

struct SeverityLabel {
    Severity severity;
    const char* label;
};

constexpr SeverityLabel kSeverityLabels[] = {
    {Severity::Info, "info"},
    {Severity::Warning, "warning"},
    {Severity::Warning, "warn"},
    {Severity::Error, "error"},
};

}  // namespace

const char* severity_name(Severity severity) {
    for (const auto& entry : kSeverityLabels) {
        if (entry.severity == severity) return entry.label;
    }
    return "?";
}

bool parse_severity(const std::string& text, Severity& out) {
    for (const auto& entry : kSeverityLabels) {
        const std::size_t n = std::strlen(entry.label);
        if (text.size() != n) continue;
        bool same = true;
        for (std::size_t i = 0; i < n && same; ++i) {
            same = std::tolower(static_cast<unsigned char>(text[i])) == entry.label[i];
        }
        if (same) {
            out = entry.severity;
            return true;
        }
    }
    return false;
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string line = "[";
    line += severity_name(event.severity);
    line += ']';
    if (!event.module.empty()) line += ' ' + event.module;
    if (!event.stage.empty()) line += '/' + event.stage;
    if (event.correlation_id != 0) {
        line += " (gen:" + std::to_string(event.correlation_id) + ")";
    }
    line += ": " + event.message;
    return line;
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                              const std::string& stage, const std::string& message,
                              std::uint64_t correlation_id) {
    const DiagnosticEvent event{std::chrono::steady_clock::now(), severity, module, stage,
                                message, correlation_id};
    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard guard(mutex_);
        if (severity < min_severity_) {
            return;
        }
        events_.push_back(event);
        trim_locked();
        observers = observers_;
    }

    // Observers run outside the lock so they may emit themselves.
    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard guard(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard guard(mutex_);
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard guard(mutex_);
    observers_.push_back(std::move(observer));
}

void DiagnosticEmitter::set_retention(std::size_t limit) {
    std::lock_guard guard(mutex_);
    retention_ = limit;
    trim_locked();
}

std::size_t DiagnosticEmitter::retention() const {
    std::lock_guard guard(mutex_);
    return retention_;
}

std::size_t DiagnosticEmitter::dropped() const {
    std::lock_guard guard(mutex_);
    return dropped_;
}

void DiagnosticEmitter::trim_locked() {
    while (events_.size() > retention_) {
        events_.pop_front();
        ++dropped_;
    }
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    std::lock_guard guard(mutex_);
    return {events_.begin(), events_.end()};
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for(std::uint64_t correlation_id) const {
    return select([correlation_id](const DiagnosticEvent& e) {
        return e.correlation_id == correlation_id;
    });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::select(
    const std::function<bool(const DiagnosticEvent&)>& keep) const {
    std::lock_guard guard(mutex_);
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), keep);
    return result;
}

void DiagnosticEmitter::clear() {
    std::lock_guard guard(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard guard(mutex_);
    return events_.size();
}

void DiagnosticScope::emit(Severity severity, const std::string& module,
                           const std::string& message) const {
    if (emitter_) {
        emitter_->emit(severity, module, stage_, message, correlation_id_);
    }
}

} // namespace loom::core
