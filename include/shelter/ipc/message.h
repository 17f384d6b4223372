#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace shelter::ipc {

struct Message {
    uint32_t type = 0;
    uint32_t request_id = 0;
    std::vector<uint8_t> payload;
};

// Wire format: type(4) + request_id(4) + payload_len(4) + payload(N),
// integers big-endian.
std::vector<uint8_t> encode_frame(const Message& msg);

// Returns std::nullopt for a truncated or over-long frame.
std::optional<Message> decode_frame(const std::vector<uint8_t>& frame);

} // namespace shelter::ipc
