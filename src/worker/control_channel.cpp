#include <shelter/worker/control_channel.h>
#include <shelter/ipc/serializer.h>

#include <exception>

namespace shelter::worker {

namespace {
constexpr const char kModule[] = "control";
} // namespace

ipc::Message encode_control_message(const ControlMessage& message, uint32_t request_id) {
    ipc::Serializer s;
    s.write_string(message.type);
    s.write_u32(static_cast<uint32_t>(message.fields.size()));
    for (const auto& [key, value] : message.fields) {
        s.write_string(key);
        s.write_string(value);
    }

    ipc::Message msg;
    msg.type = kControlMessageType;
    msg.request_id = request_id;
    msg.payload = s.take_data();
    return msg;
}

std::optional<ControlMessage> decode_control_message(const ipc::Message& message) {
    if (message.type != kControlMessageType) {
        return std::nullopt;
    }

    try {
        ipc::Deserializer d(message.payload);
        ControlMessage decoded;
        decoded.type = d.read_string();
        uint32_t count = d.read_u32();
        for (uint32_t i = 0; i < count; ++i) {
            std::string key = d.read_string();
            decoded.fields[key] = d.read_string();
        }
        if (d.has_remaining()) {
            return std::nullopt;
        }
        return decoded;
    } catch (const ipc::DeserializeError&) {
        return std::nullopt;
    }
}

ControlChannel::ControlChannel(core::DiagnosticEmitter& diagnostics)
    : diagnostics_(diagnostics) {}

void ControlChannel::on(const std::string& type, Handler handler) {
    std::lock_guard lock(mutex_);
    handlers_[type] = std::move(handler);
}

bool ControlChannel::dispatch(const ipc::Message& message) {
    auto decoded = decode_control_message(message);
    if (!decoded) {
        diagnostics_.info(kModule, "message", "ignoring non-control message of type " +
                                                  std::to_string(message.type));
        return false;
    }
    return dispatch(*decoded);
}

bool ControlChannel::dispatch(const ControlMessage& message) {
    Handler handler;
    {
        std::lock_guard lock(mutex_);
        auto it = handlers_.find(message.type);
        if (it == handlers_.end()) {
            return false;
        }
        handler = it->second;
    }

    diagnostics_.info(kModule, "message", "received " + message.type);
    try {
        handler(message);
    } catch (const std::exception& e) {
        report_error("message:" + message.type, e.what());
    }
    return true;
}

void ControlChannel::report_error(const std::string& source, const std::string& message,
                                  std::uint64_t correlation_id) {
    ++error_count_;
    diagnostics_.emit(core::Severity::Error, kModule, source,
                      "Error occurred: " + message, correlation_id);
}

void ControlChannel::report_unhandled_rejection(const std::string& source,
                                                const std::string& reason,
                                                std::uint64_t correlation_id) {
    ++error_count_;
    diagnostics_.emit(core::Severity::Error, kModule, source,
                      "Unhandled rejection: " + reason, correlation_id);
}

std::uint64_t ControlChannel::error_count() const {
    return error_count_.load();
}

} // namespace shelter::worker
