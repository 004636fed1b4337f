#include "osutil.hpp"

#include <unistd.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const id = osutil::get_local_identity();

  CHECK_EQ(id.hostname, osutil::get_hostname());
  CHECK(!id.os_name.empty());
  CHECK_EQ(id.uid, getuid());
  CHECK_EQ(id.euid, geteuid());
  CHECK_EQ(id.gid, getgid());

  CHECK_EQ(osutil::get_user_name(0), "root");

  CHECK_EQ(*osutil::get_port("587", "tcp"), 587);
  CHECK(!osutil::get_port("99999", "tcp"));
  CHECK(!osutil::get_port("no-such-service-here", "tcp"));
}
