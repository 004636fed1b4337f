#include "Stamp.hpp"

#include <cctype>
#include <cstdlib>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const red  = Stamp::token();
  auto const blue = Stamp::token();
  CHECK_NE(red, blue);
  CHECK_EQ(red.length(), 13u);
  for (auto ch : red)
    CHECK(std::isalnum(static_cast<unsigned char>(ch))) << ch;

  setenv("TZ", "UTC", 1);
  tzset();

  Stamp epoch{0};
  CHECK_EQ(epoch.date(), "Thu, 01 Jan 1970 00:00:00 +0000");

  auto const id = epoch.message_id("example.com");
  CHECK_EQ(id.find("<0."), 0u);
  CHECK_EQ(id.substr(id.size() - 13), "@example.com>");
  CHECK_EQ(id.size(), 3 + 13 + 13u);

  auto const bnd = Stamp::boundary("no boundary in here");
  CHECK_EQ(bnd.substr(0, 2), "=_");
  CHECK_EQ(bnd.size(), 2 + 13 + 1 + 13u);
  CHECK_NE(bnd, Stamp::boundary(""));

  Stamp now;
  CHECK_GT(now.sec(), 0);
  CHECK(!now.date().empty());
}
