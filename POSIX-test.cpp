#include "POSIX.hpp"

#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(pipe(fds) == 0);
  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[1]);

  CHECK(!POSIX::input_ready(fds[0], 1ms));
  CHECK(POSIX::output_ready(fds[1], 1ms));

  bool t_o{false};
  char buf[16];
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 10ms, t_o), -1);
  CHECK(t_o);

  t_o = false;
  CHECK_EQ(POSIX::write(fds[1], "hello", 5, 10ms, t_o), 5);
  CHECK(!t_o);
  CHECK(POSIX::input_ready(fds[0], 1ms));
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 10ms, t_o), 5);
  CHECK_EQ(std::string(buf, 5), "hello");

  PCHECK(close(fds[1]) == 0);
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 10ms, t_o), 0);
  PCHECK(close(fds[0]) == 0);

  // A listener on an ephemeral port accepts the connect.
  int lsn;
  PCHECK((lsn = socket(AF_INET, SOCK_STREAM, 0)) != -1);
  sockaddr_in addr;
  std::memset(&addr, 0, sizeof addr);
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(lsn, reinterpret_cast<sockaddr*>(&addr), sizeof addr) == 0);
  PCHECK(listen(lsn, 1) == 0);
  socklen_t len = sizeof addr;
  PCHECK(getsockname(lsn, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

  std::string err;
  int         fd;
  PCHECK((fd = socket(AF_INET, SOCK_STREAM, 0)) != -1);
  CHECK(POSIX::connect(fd, reinterpret_cast<sockaddr*>(&addr), len, 1s, err))
      << err;
  PCHECK(close(fd) == 0);

  // Nobody listening once it is closed.
  PCHECK(close(lsn) == 0);
  PCHECK((fd = socket(AF_INET, SOCK_STREAM, 0)) != -1);
  CHECK(!POSIX::connect(fd, reinterpret_cast<sockaddr*>(&addr), len, 1s, err));
  CHECK(!err.empty());
  LOG(INFO) << err;
  PCHECK(close(fd) == 0);
}
