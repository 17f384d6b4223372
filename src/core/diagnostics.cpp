#include <shelter/core/diagnostics.h>

#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace shelter::core {

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
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stream_observer(std::ostream& stream) {
    auto mutex = std::make_shared<std::mutex>();
    return [&stream, mutex](const DiagnosticEvent& event) {
        std::time_t t = std::chrono::system_clock::to_time_t(event.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::lock_guard lock(*mutex);
        stream << std::put_time(&tm, "%H:%M:%S") << " " << format_diagnostic(event) << "\n";
    };
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::uint64_t correlation_id) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id;

    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard lock(mutex_);
        if (severity < min_severity_) {
            return;
        }
        if (retained_limit_ > 0) {
            if (events_.size() >= retained_limit_) {
                events_.erase(events_.begin());
            }
            events_.push_back(event);
        }
        observers = observers_;
    }

    // Observers run outside the lock so they may log themselves
    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, module, stage, message);
}

void DiagnosticEmitter::warning(const std::string& module, const std::string& stage,
                                const std::string& message) {
    emit(Severity::Warning, module, stage, message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard lock(mutex_);
    return min_severity_;
}

void DiagnosticEmitter::set_retained_limit(std::size_t limit) {
    std::lock_guard lock(mutex_);
    retained_limit_ = limit;
    if (events_.size() > limit) {
        events_.erase(events_.begin(), events_.end() - static_cast<std::ptrdiff_t>(limit));
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

}  // namespace shelter::core
