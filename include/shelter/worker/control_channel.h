#pragma once
#include <shelter/core/diagnostics.h>
#include <shelter/ipc/message.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace shelter::worker {

// ipc::Message::type used for control messages from the hosting page
inline constexpr uint32_t kControlMessageType = 1;

inline constexpr const char kSkipWaitingMessage[] = "SKIP_WAITING";

struct ControlMessage {
    std::string type;
    std::map<std::string, std::string> fields;
};

ipc::Message encode_control_message(const ControlMessage& message, uint32_t request_id = 0);

// std::nullopt when the message is not a control message or is malformed
std::optional<ControlMessage> decode_control_message(const ipc::Message& message);

// Administrative messages in, errors out. Every error or unhandled rejection
// in the worker ends up in report_error(); nothing is rethrown from here.
class ControlChannel {
public:
    using Handler = std::function<void(const ControlMessage&)>;

    explicit ControlChannel(core::DiagnosticEmitter& diagnostics);

    void on(const std::string& type, Handler handler);

    // True when a registered handler ran. Unknown types are ignored.
    bool dispatch(const ipc::Message& message);
    bool dispatch(const ControlMessage& message);

    void report_error(const std::string& source, const std::string& message,
                      std::uint64_t correlation_id = 0);
    void report_unhandled_rejection(const std::string& source, const std::string& reason,
                                    std::uint64_t correlation_id = 0);

    std::uint64_t error_count() const;

private:
    core::DiagnosticEmitter& diagnostics_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Handler> handlers_;
    std::atomic<std::uint64_t> error_count_{0};
};

} // namespace shelter::worker
