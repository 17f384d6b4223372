#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace shelter::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::system_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes one formatted line per event to `stream`.
DiagnosticObserver stream_observer(std::ostream& stream);

// Thread-safe log sink shared by every component of the worker. Events are
// retained (up to a cap) so tests and the host can inspect them, and each
// one is forwarded to the registered observers.
class DiagnosticEmitter {
public:
    static constexpr std::size_t kDefaultRetainedEvents = 1024;

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t correlation_id = 0);

    void info(const std::string& module, const std::string& stage, const std::string& message);
    void warning(const std::string& module, const std::string& stage, const std::string& message);
    void error(const std::string& module, const std::string& stage, const std::string& message);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void set_retained_limit(std::size_t limit);

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
    std::size_t retained_limit_ = kDefaultRetainedEvents;
};

}  // namespace shelter::core
