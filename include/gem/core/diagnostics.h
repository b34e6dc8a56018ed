#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace gem::core {

class Error;

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t run_id = 0;
};

// "[severity] module/stage (run:N): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);
    void emit_error(const std::string& module, const std::string& stage,
                    const Error& error);

    void set_run_id(std::uint64_t id) { run_id_ = id; }
    std::uint64_t run_id() const { return run_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_run(std::uint64_t run_id) const;
    // Most recent Error event, if any.
    const DiagnosticEvent* last_error() const;

    void clear();
    size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t run_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

} // namespace gem::core
