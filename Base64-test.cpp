#include "Base64.hpp"

#include <stdexcept>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // <https://tools.ietf.org/html/rfc4648#section-10>
  CHECK_EQ(Base64::enc(""), "");
  CHECK_EQ(Base64::enc("f"), "Zg==");
  CHECK_EQ(Base64::enc("fo"), "Zm8=");
  CHECK_EQ(Base64::enc("foo"), "Zm9v");
  CHECK_EQ(Base64::enc("foob"), "Zm9vYg==");
  CHECK_EQ(Base64::enc("fooba"), "Zm9vYmE=");
  CHECK_EQ(Base64::enc("foobar"), "Zm9vYmFy");

  CHECK_EQ(Base64::dec("Zm9vYmE="), "fooba");
  CHECK_EQ(Base64::dec("Zm9v\r\nYmFy"), "foobar");

  // AUTH PLAIN initial response, RFC 4616 example.
  using namespace std::string_literals;
  CHECK_EQ(Base64::enc("\0tim\0tanstaaftanstaaf"s),
           "AHRpbQB0YW5zdGFhZnRhbnN0YWFm");

  auto const bin = std::string("\0\xff\r\n.\x80", 6);
  CHECK_EQ(Base64::dec(Base64::enc(bin)), bin);

  // 57 octets encode to exactly one 76 character line.
  auto const line = std::string(57, 'x');
  auto const one  = Base64::enc(line, 76);
  CHECK_EQ(one.length(), 76u);
  CHECK_EQ(one.find('\r'), std::string::npos);

  auto const two = Base64::enc(line + "x", 76);
  CHECK_EQ(two.substr(76, 2), "\r\n");
  CHECK_EQ(two.length(), 76u + 2 + 4);
  CHECK_EQ(Base64::dec(two), line + "x");

  auto threw = false;
  try {
    Base64::dec("Zm9v!");
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}
