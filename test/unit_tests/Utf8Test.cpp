#include "TestHeaders.hpp"
#include "Utf8.hpp"

using namespace tv;

TEST_CASE("Decoding multi-byte sequences", "[Utf8]") {
  u32string decoded = decodeUtf8("h\xc3\xa9llo");
  REQUIRE(decoded.length() == 5);
  REQUIRE(decoded[1] == char32_t(0xE9));
  REQUIRE(encodeUtf8(decoded) == "h\xc3\xa9llo");

  REQUIRE(decodeUtf8("\xf0\x9f\x98\x80") == u32string(1, char32_t(0x1F600)));
}

TEST_CASE("Malformed input becomes U+FFFD", "[Utf8]") {
  REQUIRE(decodeUtf8("\xff") == u32string(1, char32_t(0xFFFD)));

  u32string truncated = decodeUtf8("\xe4" "a");
  REQUIRE(truncated.length() == 2);
  REQUIRE(truncated[0] == char32_t(0xFFFD));
  REQUIRE(truncated[1] == 'a');
}

TEST_CASE("Incremental decoding", "[Utf8]") {
  Utf8Decoder decoder;
  u32string out;
  decoder.feed(0xe4, &out);
  decoder.feed(0xb8, &out);
  REQUIRE(out.empty());
  decoder.feed(0xad, &out);
  REQUIRE(out == u32string(1, char32_t(0x4E2D)));
}

TEST_CASE("Character widths", "[Utf8]") {
  REQUIRE(charWidth('a') == 1);
  REQUIRE(charWidth(0xE9) == 1);
  REQUIRE(charWidth(0x4E2D) == 2);
  REQUIRE(charWidth(0xAC00) == 2);
  REQUIRE(charWidth(0x1F600) == 2);
  REQUIRE(charWidth(0x2500) == 1);
}
