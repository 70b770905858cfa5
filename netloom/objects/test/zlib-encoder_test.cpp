#include "netloom/zlib-encoder.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <string>
#include <string_view>

namespace netloom {

namespace {
std::string Inflate(std::string_view compressed, ZStreamRAII::Variant variant) {
  z_stream stream{};
  const int windowBits = variant == ZStreamRAII::Variant::gzip ? MAX_WBITS + 16 : MAX_WBITS;
  EXPECT_EQ(inflateInit2(&stream, windowBits), Z_OK);
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());

  std::string out;
  char buf[4096];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    stream.next_out = reinterpret_cast<Bytef*>(buf);
    stream.avail_out = sizeof(buf);
    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      break;
    }
    out.append(buf, sizeof(buf) - stream.avail_out);
  }
  inflateEnd(&stream);
  EXPECT_EQ(ret, Z_STREAM_END);
  return out;
}

std::string Payload() {
  std::string payload;
  for (int i = 0; i < 500; ++i) {
    payload.append("netloom compresses repetitive text quite well. ");
  }
  return payload;
}
}  // namespace

TEST(ZlibEncoder, GzipRoundTrip) {
  const std::string payload = Payload();
  ZlibEncoder encoder(ZStreamRAII::Variant::gzip, -1);
  const std::string compressed = encoder.encodeFull(payload);
  ASSERT_GE(compressed.size(), 2U);
  EXPECT_EQ(static_cast<unsigned char>(compressed[0]), 0x1F);
  EXPECT_EQ(static_cast<unsigned char>(compressed[1]), 0x8B);
  EXPECT_LT(compressed.size(), payload.size());
  EXPECT_EQ(Inflate(compressed, ZStreamRAII::Variant::gzip), payload);
}

TEST(ZlibEncoder, DeflateRoundTrip) {
  const std::string payload = Payload();
  ZlibEncoder encoder(ZStreamRAII::Variant::deflate, 9);
  const std::string compressed = encoder.encodeFull(payload);
  EXPECT_LT(compressed.size(), payload.size());
  EXPECT_EQ(Inflate(compressed, ZStreamRAII::Variant::deflate), payload);
}

TEST(ZlibEncoder, EmptyInput) {
  ZlibEncoder encoder(ZStreamRAII::Variant::gzip, 6);
  const std::string compressed = encoder.encodeFull({});
  EXPECT_FALSE(compressed.empty());
  EXPECT_EQ(Inflate(compressed, ZStreamRAII::Variant::gzip), "");
}

}  // namespace netloom
