#include <gem/core/diagnostics.h>
#include <gem/core/error.h>
#include <sstream>

namespace gem::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.run_id != 0) {
        oss << " (run:" << event.run_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.run_id = run_id_;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::emit_error(const std::string& module, const std::string& stage,
                                   const Error& error) {
    emit(Severity::Error, module, stage, error.format());
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_run(std::uint64_t run_id) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.run_id == run_id) {
            result.push_back(e);
        }
    }
    return result;
}

const DiagnosticEvent* DiagnosticEmitter::last_error() const {
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->severity == Severity::Error) {
            return &*it;
        }
    }
    return nullptr;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

} // namespace gem::core
