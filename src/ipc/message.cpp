#include <shelter/ipc/message.h>
#include <shelter/ipc/serializer.h>

namespace shelter::ipc {

std::vector<uint8_t> encode_frame(const Message& msg) {
    Serializer s;
    s.write_u32(msg.type);
    s.write_u32(msg.request_id);
    // The payload length doubles as the byte-string prefix
    s.write_bytes(msg.payload);
    return s.take_data();
}

std::optional<Message> decode_frame(const std::vector<uint8_t>& frame) {
    Deserializer d(frame);
    if (d.remaining() < 12) return std::nullopt;

    Message msg;
    msg.type = d.read_u32();
    msg.request_id = d.read_u32();

    uint32_t payload_len = Deserializer(frame.data() + 8, 4).read_u32();
    if (d.remaining() - 4 != payload_len) return std::nullopt;

    msg.payload = d.read_bytes();
    return msg;
}

} // namespace shelter::ipc
