#include "Sock.hpp"

#include <string>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    int sv[2];
    PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

    Sock sock(sv[0], sv[0], 1s, 1s, 1s);
    CHECK(!sock.has_peername());
    CHECK(!sock.tls());

    CHECK(!sock.log_data(true));
    {
      Sock::redacted quiet(sock);
      CHECK(!sock.log_data(false));
    }
    CHECK(sock.log_data(false));

    constexpr char greeting[]{"220 ready\r\n"};
    PCHECK(write(sv[1], greeting, sizeof(greeting) - 1)
           == sizeof(greeting) - 1);

    CHECK(sock.input_ready(1s));
    std::string line;
    CHECK(std::getline(sock.in(), line));
    CHECK_EQ(line, "220 ready\r");

    sock.out() << "QUIT\r\n" << std::flush;
    char bfr[16]{};
    PCHECK(read(sv[1], bfr, sizeof bfr) == 6);
    CHECK_EQ(std::string(bfr, 6), "QUIT\r\n");

    PCHECK(close(sv[1]) == 0);
    CHECK(!std::getline(sock.in(), line));
    CHECK(!sock.timed_out());
    sock.log_totals();
  }

  {
    auto const lsn = socket(AF_INET, SOCK_STREAM, 0);
    PCHECK(lsn != -1);
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    PCHECK(bind(lsn, reinterpret_cast<sockaddr*>(&addr), sizeof addr) == 0);
    PCHECK(listen(lsn, 1) == 0);
    socklen_t len = sizeof addr;
    PCHECK(getsockname(lsn, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    auto const port = std::to_string(ntohs(addr.sin_port));

    std::string err;
    auto const  fd = Sock::connect("127.0.0.1", port.c_str(), 1s, err);
    CHECK_NE(fd, -1) << err;

    Sock sock(fd, fd);
    CHECK(sock.has_peername());
    CHECK_EQ(std::string(sock.them_c_str()), "127.0.0.1");

    PCHECK(close(lsn) == 0);
  }

  {
    std::string err;
    CHECK_EQ(Sock::connect("host.invalid", "587", 1s, err), -1);
    CHECK(!err.empty());
    LOG(INFO) << err;
  }
}
