#include "TLS-OpenSSL.hpp"

#include <csignal>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);
  signal(SIGPIPE, SIG_IGN);

  {
    // The peer hangs up before saying anything.
    int fds[2];
    PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    PCHECK(close(fds[1]) == 0);

    TLS         tls;
    std::string err;
    CHECK(!tls.starttls_client(fds[0], fds[0], "relay.example.com", 1s, err));
    CHECK(!err.empty());
    LOG(INFO) << err;
    PCHECK(close(fds[0]) == 0);
  }

  {
    // The peer is not speaking TLS.
    int fds[2];
    PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    auto constexpr junk = "220 relay.example.com ESMTP\r\n";
    PCHECK(write(fds[1], junk, strlen(junk)) > 0);
    PCHECK(shutdown(fds[1], SHUT_WR) == 0);

    TLS         tls;
    std::string err;
    CHECK(!tls.starttls_client(fds[0], fds[0], "relay.example.com", 1s, err));
    CHECK(!err.empty());
    PCHECK(close(fds[0]) == 0);
    PCHECK(close(fds[1]) == 0);
  }
}
