#include "esc.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const s0 = "\a\xa0\b\t\n\v\f\r\\";
  CHECK_EQ(esc(s0), "\\a\\xa0\\b\\t\\n\\v\\f\\r\\\\");

  auto const s1 = "no characters to escape";
  CHECK_EQ(esc(s1), s1);

  // UTF-8 survives, stray bytes do not.
  CHECK_EQ(esc("caf\xc3\xa9"), "caf\xc3\xa9");
  CHECK_EQ(esc("caf\xc3"), "caf\\xc3");
  CHECK_EQ(esc("\xed\xa0\x80"), "\\xed\\xa0\\x80"); // surrogate
  CHECK_EQ(esc("\xc0\xaf"), "\\xc0\\xaf");          // overlong

  CHECK_EQ(esc("one\ntwo\n", esc_line_option::multi), "one\\n\ntwo\\n");

  CHECK(is_valid_utf8(""));
  CHECK(is_valid_utf8("plain"));
  CHECK(is_valid_utf8("\xf0\x9f\x93\xa7"));
  CHECK(!is_valid_utf8("\xf0\x9f\x93"));
  CHECK(!is_valid_utf8("\xff"));

  CHECK_EQ(utf8_seq_len("\xe2\x82\xac!"), 3u);
  CHECK_EQ(utf8_seq_len("a"), 1u);
  CHECK_EQ(utf8_seq_len(""), 0u);
}
