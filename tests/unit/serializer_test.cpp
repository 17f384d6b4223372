#include <shelter/ipc/message.h>
#include <shelter/ipc/serializer.h>
#include <gtest/gtest.h>

using namespace shelter::ipc;

TEST(SerializerTest, IntegersAreBigEndian) {
    Serializer s;
    s.write_u16(0x0102);
    s.write_u32(0x03040506);
    const auto& data = s.data();
    ASSERT_EQ(data.size(), 6u);
    EXPECT_EQ(data[0], 0x01);
    EXPECT_EQ(data[1], 0x02);
    EXPECT_EQ(data[2], 0x03);
    EXPECT_EQ(data[5], 0x06);
}

TEST(SerializerTest, MixedValuesReadBackInOrder) {
    Serializer s;
    s.write_u8(7);
    s.write_bool(true);
    s.write_i64(-1234567890123);
    s.write_string("attendance-sync");
    s.write_bytes(std::vector<uint8_t>{1, 2, 3});
    s.write_u64(0xFFFFFFFFFFFFull);

    Deserializer d(s.data());
    EXPECT_EQ(d.read_u8(), 7);
    EXPECT_TRUE(d.read_bool());
    EXPECT_EQ(d.read_i64(), -1234567890123);
    EXPECT_EQ(d.read_string(), "attendance-sync");
    EXPECT_EQ(d.read_bytes(), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(d.read_u64(), 0xFFFFFFFFFFFFull);
    EXPECT_FALSE(d.has_remaining());
}

TEST(SerializerTest, ReadingPastTheEndThrows) {
    Serializer s;
    s.write_u16(1);
    Deserializer d(s.data());
    EXPECT_THROW(d.read_u32(), DeserializeError);
}

TEST(SerializerTest, TruncatedStringThrows) {
    Serializer s;
    s.write_u32(100);  // claims 100 bytes
    s.write_u8('x');
    Deserializer d(s.data());
    EXPECT_THROW(d.read_string(), DeserializeError);
}

TEST(MessageFrameTest, EncodeDecode) {
    Message msg;
    msg.type = 1;
    msg.request_id = 42;
    msg.payload = {9, 8, 7};

    auto frame = encode_frame(msg);
    EXPECT_EQ(frame.size(), 12u + 3u);

    auto decoded = decode_frame(frame);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, 1u);
    EXPECT_EQ(decoded->request_id, 42u);
    EXPECT_EQ(decoded->payload, msg.payload);
}

TEST(MessageFrameTest, RejectsShortAndInconsistentFrames) {
    EXPECT_FALSE(decode_frame({0, 0, 0, 1}).has_value());

    Message msg;
    msg.payload = {1, 2};
    auto frame = encode_frame(msg);
    frame.push_back(0xFF);
    EXPECT_FALSE(decode_frame(frame).has_value());
    frame.resize(frame.size() - 2);
    EXPECT_FALSE(decode_frame(frame).has_value());
}
