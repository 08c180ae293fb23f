#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace loom::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// Parses "info", "warning" or "error" (case-insensitive).
bool parse_severity(const std::string& text, Severity& out);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;  // navigation generation, 0 when unknown
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects diagnostics from every pipeline stage. Shared between the
// interactive thread and the pipeline worker, so all members lock.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t correlation_id = 0);

    void info(const std::string& module, const std::string& message) {
        emit(Severity::Info, module, "", message);
    }
    void warning(const std::string& module, const std::string& message) {
        emit(Severity::Warning, module, "", message);
    }
    void error(const std::string& module, const std::string& message) {
        emit(Severity::Error, module, "", message);
    }

    // Events below the minimum are dropped before observers see them.
    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    // Oldest events are dropped once more than `limit` are retained.
    // Observers still see every event.
    static constexpr std::size_t kDefaultRetention = 4096;
    void set_retention(std::size_t limit);
    std::size_t retention() const;
    std::size_t dropped() const;

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_for(std::uint64_t correlation_id) const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> select(const std::function<bool(const DiagnosticEvent&)>& keep) const;

    void trim_locked();

    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
    std::size_t retention_ = kDefaultRetention;
    std::size_t dropped_ = 0;
};

// Stage-scoped view of an emitter. Pipeline stages log through this so every
// event carries the stage name and the navigation generation.
class DiagnosticScope {
public:
    DiagnosticScope(DiagnosticEmitter* emitter, std::string stage,
                    std::uint64_t correlation_id = 0)
        : emitter_(emitter), stage_(std::move(stage)), correlation_id_(correlation_id) {}

    void info(const std::string& module, const std::string& message) const {
        emit(Severity::Info, module, message);
    }
    void warning(const std::string& module, const std::string& message) const {
        emit(Severity::Warning, module, message);
    }
    void error(const std::string& module, const std::string& message) const {
        emit(Severity::Error, module, message);
    }

    DiagnosticScope with_stage(const std::string& stage) const {
        return DiagnosticScope(emitter_, stage, correlation_id_);
    }

    DiagnosticEmitter* emitter() const { return emitter_; }
    std::uint64_t correlation_id() const { return correlation_id_; }

private:
    void emit(Severity severity, const std::string& module, const std::string& message) const;

    DiagnosticEmitter* emitter_ = nullptr;
    std::string stage_;
    std::uint64_t correlation_id_ = 0;
};

} // namespace loom::core
