#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/codec.hpp"
#include "network/message_frame.hpp"
#include "test_utils.hpp"

using namespace chunkd::network;

class CodecTest : public ::testing::Test {
protected:
  Codec codec{1024 * 1024};

  void SetUp() override {
    init_logging();
  }

  // Helper to add payload to a frame
  template <typename Frame>
  void addPayload(Frame& frame, const std::string& data) {
    auto payload = std::make_shared<std::stringstream>();
    payload->write(data.c_str(), data.length());
    payload->seekg(0);
    frame.payload_stream = payload;
    frame.payload_size = data.length();
  }

  template <typename T>
  static void putBig(std::ostream& out, T value) {
    T big = boost::endian::native_to_big(value);
    out.write(reinterpret_cast<const char*>(&big), sizeof(big));
  }
};

TEST_F(CodecTest, UploadRequestRoundTrip) {
  RequestFrame request;
  request.message_type = MessageType::UPLOAD_CHUNK;
  request.session_key = "s1";
  request.number = 7;
  addPayload(request, "Hello, ");

  std::stringstream wire;
  std::size_t written = codec.serialize(request, wire);
  // type + key + number + name + payload
  EXPECT_EQ(written, 1u + (4 + 2) + 8 + (4 + 0) + (8 + 7));
  EXPECT_EQ(wire.str().size(), written);

  RequestFrame decoded = codec.deserialize_request(wire);
  EXPECT_EQ(decoded.message_type, MessageType::UPLOAD_CHUNK);
  EXPECT_EQ(decoded.session_key, "s1");
  EXPECT_EQ(decoded.number, 7);
  EXPECT_TRUE(decoded.name.empty());
  ASSERT_EQ(decoded.payload_size, 7u);
  EXPECT_EQ(decoded.payload_stream->str(), "Hello, ");
}

TEST_F(CodecTest, ResponseRoundTripKeepsMissingIndex) {
  ResponseFrame response;
  response.status = static_cast<uint16_t>(Status::BAD_REQUEST);
  response.error = 2;
  response.missing_index = 1;
  response.message = "Missing chunk: 1";

  std::stringstream wire;
  codec.serialize(response, wire);
  ResponseFrame decoded = codec.deserialize_response(wire);

  EXPECT_EQ(decoded.status, 400);
  EXPECT_EQ(decoded.error, 2);
  EXPECT_EQ(decoded.missing_index, 1);
  EXPECT_EQ(decoded.message, "Missing chunk: 1");
  EXPECT_EQ(decoded.payload_size, 0u);
}

TEST_F(CodecTest, FieldsAreBigEndian) {
  RequestFrame request;
  request.message_type = MessageType::MERGE;
  request.session_key = "k";
  request.number = 0x0102;
  request.name = "f";

  std::stringstream wire;
  codec.serialize(request, wire);
  std::string bytes = wire.str();

  ASSERT_EQ(bytes.size(), 1u + 5 + 8 + 5 + 8);
  EXPECT_EQ(bytes[0], '\x01');
  EXPECT_EQ(bytes.substr(1, 5), std::string("\x00\x00\x00\x01k", 5));
  EXPECT_EQ(bytes.substr(6, 8), std::string("\x00\x00\x00\x00\x00\x00\x01\x02", 8));
}

TEST_F(CodecTest, SeveralFramesOnOneStream) {
  std::stringstream wire;
  for (int i = 0; i < 3; ++i) {
    RequestFrame request;
    request.session_key = "s";
    request.number = i;
    addPayload(request, std::string(i + 1, 'a' + i));
    codec.serialize(request, wire);
  }

  for (int i = 0; i < 3; ++i) {
    RequestFrame decoded = codec.deserialize_request(wire);
    EXPECT_EQ(decoded.number, i);
    EXPECT_EQ(decoded.payload_stream->str(), std::string(i + 1, 'a' + i));
  }
}

TEST_F(CodecTest, LargePayload) {
  std::string data(300000, 'z');
  ResponseFrame response;
  addPayload(response, data);

  std::stringstream wire;
  codec.serialize(response, wire);
  ResponseFrame decoded = codec.deserialize_response(wire);
  EXPECT_EQ(decoded.payload_size, data.size());
  EXPECT_EQ(decoded.payload_stream->str(), data);
}

TEST_F(CodecTest, UnknownMessageTypeIsFrameError) {
  std::stringstream wire;
  wire.put(static_cast<char>(9));
  EXPECT_THROW(codec.deserialize_request(wire), FrameError);
}

TEST_F(CodecTest, OversizeStringIsFrameError) {
  std::stringstream wire;
  wire.put(static_cast<char>(MessageType::UPLOAD_CHUNK));
  putBig<uint32_t>(wire, MAX_STRING_LENGTH + 1);
  EXPECT_THROW(codec.deserialize_request(wire), FrameError);

  RequestFrame request;
  request.session_key = std::string(MAX_STRING_LENGTH + 1, 'k');
  std::stringstream output;
  EXPECT_THROW(codec.serialize(request, output), FrameError);
}

TEST_F(CodecTest, OversizePayloadIsFrameError) {
  Codec small{16};

  std::stringstream wire;
  wire.put(static_cast<char>(MessageType::UPLOAD_CHUNK));
  putBig<uint32_t>(wire, 1);
  wire.put('s');
  putBig<int64_t>(wire, 0);
  putBig<uint32_t>(wire, 0);
  putBig<uint64_t>(wire, 17);
  EXPECT_THROW(small.deserialize_request(wire), FrameError);

  RequestFrame request;
  addPayload(request, std::string(17, 'x'));
  std::stringstream output;
  EXPECT_THROW(small.serialize(request, output), FrameError);
}

TEST_F(CodecTest, TruncatedFrameIsStreamError) {
  RequestFrame request;
  request.session_key = "s1";
  addPayload(request, "payload bytes");

  std::stringstream wire;
  codec.serialize(request, wire);
  std::string bytes = wire.str();

  // Cut inside the header and inside the payload
  for (std::size_t cut : {std::size_t{0}, std::size_t{3}, bytes.size() - 4}) {
    std::stringstream truncated(bytes.substr(0, cut));
    EXPECT_THROW(codec.deserialize_request(truncated), StreamError) << "cut at " << cut;
  }
}

TEST_F(CodecTest, PayloadShorterThanDeclared) {
  RequestFrame request;
  addPayload(request, "abc");
  request.payload_size = 10;

  std::stringstream output;
  EXPECT_THROW(codec.serialize(request, output), StreamError);
}
