#include "QP.hpp"

#include <string>

#include <glog/logging.h>

namespace {
void check_line_lengths(std::string const& enc)
{
  std::string::size_type pos = 0;
  for (;;) {
    auto const eol = enc.find("\r\n", pos);
    auto const len = (eol == std::string::npos ? enc.size() : eol) - pos;
    CHECK_LE(len, 76u);
    if (eol == std::string::npos)
      break;
    pos = eol + 2;
  }
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(QP::enc(""), "");
  CHECK_EQ(QP::enc("plain text"), "plain text");
  CHECK_EQ(QP::enc("a=b"), "a=3Db");
  CHECK_EQ(QP::enc("caf\xc3\xa9"), "caf=C3=A9");
  CHECK_EQ(QP::enc("one\ntwo\r\nthree\n"), "one\r\ntwo\r\nthree\r\n");
  CHECK_EQ(QP::enc("trailing \nspace\t"), "trailing=20\r\nspace=09");
  CHECK_EQ(QP::enc(std::string("nul\0x", 5)), "nul=00x");

  // Exactly one full line needs no soft break.
  CHECK_EQ(QP::enc(std::string(76, 'x')), std::string(76, 'x'));

  auto const long_line = std::string(2000, 'x');
  auto const enc       = QP::enc(long_line);
  check_line_lengths(enc);
  CHECK_EQ(enc.substr(0, 77), std::string(75, 'x') + "=\r");

  // An escape is never split by a soft break.
  auto const utf8 = std::string(74, 'x') + "\xc3\xa9";
  CHECK_EQ(QP::enc(utf8), std::string(74, 'x') + "=\r\n=C3=A9");

  std::string joined;
  for (auto i = 0; i < 100; ++i)
    joined += "arg=value caf\xc3\xa9 ";
  check_line_lengths(QP::enc(joined));
}
