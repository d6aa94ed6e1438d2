#include "minitest.hpp"
#include "util/Utf8.hpp"
#include <string>

using tether::util::decode_utf8;
using tether::util::encode_utf8;
using tether::util::full_rune;
using tether::util::Utf8State;

TEST(utf8_ascii) {
  auto d = decode_utf8("A", 1);
  ASSERT_TRUE(d.state == Utf8State::Complete);
  ASSERT_EQ(d.code_point, 0x41u);
  ASSERT_EQ(d.size, 1);
}

TEST(utf8_two_to_four_bytes) {
  std::string s = "©";
  auto d = decode_utf8(s.data(), s.size());
  ASSERT_TRUE(d.state == Utf8State::Complete);
  ASSERT_EQ(d.code_point, 0xA9u);
  ASSERT_EQ(d.size, 2);

  s = "日";  // 日
  d = decode_utf8(s.data(), s.size());
  ASSERT_EQ(d.code_point, 0x65E5u);
  ASSERT_EQ(d.size, 3);

  s = "\xF0\x9F\x98\x80";  // U+1F600
  d = decode_utf8(s.data(), s.size());
  ASSERT_EQ(d.code_point, 0x1F600u);
  ASSERT_EQ(d.size, 4);
}

TEST(utf8_incomplete_prefix) {
  ASSERT_TRUE(decode_utf8("\xC2", 1).state == Utf8State::Incomplete);
  ASSERT_TRUE(decode_utf8("\xE6\x97", 2).state == Utf8State::Incomplete);
  ASSERT_TRUE(decode_utf8("\xF0\x9F\x98", 3).state == Utf8State::Incomplete);
  ASSERT_TRUE(!full_rune("\xC2", 1));
  ASSERT_TRUE(full_rune("\xC2\xA9", 2));
}

TEST(utf8_invalid_detected_early) {
  ASSERT_TRUE(decode_utf8("\x80", 1).state == Utf8State::Invalid);      // lone continuation
  ASSERT_TRUE(decode_utf8("\xC0", 1).state == Utf8State::Invalid);      // overlong lead
  ASSERT_TRUE(decode_utf8("\xFF", 1).state == Utf8State::Invalid);
  ASSERT_TRUE(decode_utf8("\xC2\x41", 2).state == Utf8State::Invalid);  // bad continuation
  ASSERT_TRUE(decode_utf8("\xE0\x80", 2).state == Utf8State::Invalid);  // overlong 3-byte
  ASSERT_TRUE(decode_utf8("\xED\xA0", 2).state == Utf8State::Invalid);  // surrogate
  ASSERT_TRUE(decode_utf8("\xF4\x90", 2).state == Utf8State::Invalid);  // > U+10FFFF
  ASSERT_TRUE(full_rune("\xFF", 1));
}

TEST(utf8_decode_only_first_point) {
  std::string s = "©    ";
  auto d = decode_utf8(s.data(), s.size());
  ASSERT_EQ(d.size, 2);
  ASSERT_EQ(d.code_point, 0xA9u);
}

TEST(utf8_encode) {
  char buf[4];
  ASSERT_EQ(encode_utf8(0xA9, buf), 2);
  ASSERT_EQ(std::string(buf, 2), std::string("©"));
  ASSERT_EQ(encode_utf8(0x1F600, buf), 4);
  ASSERT_EQ(std::string(buf, 4), std::string("\xF0\x9F\x98\x80"));
  ASSERT_EQ(encode_utf8(0xD800, buf), 0);
  ASSERT_EQ(encode_utf8(0x110000, buf), 0);
}
