#include <shelter/ipc/serializer.h>

namespace shelter::ipc {

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

void Serializer::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void Serializer::write_u16(uint16_t value) {
    write_u8(static_cast<uint8_t>((value >> 8) & 0xFF));
    write_u8(static_cast<uint8_t>(value & 0xFF));
}

void Serializer::write_u32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        write_u8(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void Serializer::write_u64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        write_u8(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void Serializer::write_i64(int64_t value) {
    uint64_t uval;
    std::memcpy(&uval, &value, sizeof(uval));
    write_u64(uval);
}

void Serializer::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void Serializer::write_string(std::string_view str) {
    write_bytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void Serializer::write_bytes(const uint8_t* data, size_t len) {
    write_u32(static_cast<uint32_t>(len));
    if (data != nullptr && len > 0) {
        buffer_.insert(buffer_.end(), data, data + len);
    }
}

void Serializer::write_bytes(const std::vector<uint8_t>& data) {
    write_bytes(data.data(), data.size());
}

// ---------------------------------------------------------------------------
// Deserializer
// ---------------------------------------------------------------------------

Deserializer::Deserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

Deserializer::Deserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

void Deserializer::check_remaining(size_t needed) const {
    if (needed > size_ - offset_) {
        throw DeserializeError(
            "Deserializer underflow: need " + std::to_string(needed) +
            " bytes but only " + std::to_string(size_ - offset_) + " remaining");
    }
}

uint8_t Deserializer::read_u8() {
    check_remaining(1);
    return data_[offset_++];
}

uint16_t Deserializer::read_u16() {
    uint16_t high = read_u8();
    uint16_t low = read_u8();
    return static_cast<uint16_t>((high << 8) | low);
}

uint32_t Deserializer::read_u32() {
    check_remaining(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

uint64_t Deserializer::read_u64() {
    check_remaining(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

int64_t Deserializer::read_i64() {
    uint64_t uval = read_u64();
    int64_t result;
    std::memcpy(&result, &uval, sizeof(result));
    return result;
}

bool Deserializer::read_bool() {
    return read_u8() != 0;
}

std::string Deserializer::read_string() {
    uint32_t len = read_u32();
    check_remaining(len);
    std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return result;
}

std::vector<uint8_t> Deserializer::read_bytes() {
    uint32_t len = read_u32();
    check_remaining(len);
    std::vector<uint8_t> result(data_ + offset_, data_ + offset_ + len);
    offset_ += len;
    return result;
}

bool Deserializer::has_remaining() const {
    return offset_ < size_;
}

size_t Deserializer::remaining() const {
    return size_ - offset_;
}

} // namespace shelter::ipc
