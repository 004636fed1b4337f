#include "Sock.hpp"

#include <cerrno>
#include <cstring>
#include <memory>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

Sock::descriptors::~descriptors()
{
  if (in != -1 && close(in) == -1)
    PLOG(WARNING) << "close(" << in << ") failed";
  if (out != -1 && out != in && close(out) == -1)
    PLOG(WARNING) << "close(" << out << ") failed";
}

Sock::Sock(int                       fd_in,
           int                       fd_out,
           std::chrono::milliseconds read_timeout,
           std::chrono::milliseconds write_timeout,
           std::chrono::milliseconds starttls_timeout)
  : fds_{fd_in, fd_out}
  , iostream_(fd_in, fd_out, read_timeout, write_timeout, starttls_timeout)
{
  sockaddr_storage them{};
  socklen_t        them_len = sizeof them;

  if (-1 == getpeername(fd_in, reinterpret_cast<sockaddr*>(&them), &them_len)) {
    // Ignore ENOTSOCK errors from getpeername, useful for testing.
    PLOG_IF(WARNING, ENOTSOCK != errno) << "getpeername failed";
    return;
  }

  switch (them.ss_family) {
  case AF_INET: {
    auto const in4 = reinterpret_cast<sockaddr_in const*>(&them);
    PCHECK(inet_ntop(AF_INET, &in4->sin_addr, them_addr_str_,
                     sizeof them_addr_str_)
           != nullptr);
    break;
  }
  case AF_INET6: {
    auto const in6 = reinterpret_cast<sockaddr_in6 const*>(&them);
    PCHECK(inet_ntop(AF_INET6, &in6->sin6_addr, them_addr_str_,
                     sizeof them_addr_str_)
           != nullptr);
    break;
  }
  default:
    LOG(WARNING) << "unexpected address family " << them.ss_family;
    break;
  }
}

int Sock::connect(char const*               host,
                  char const*               service,
                  std::chrono::milliseconds timeout,
                  std::string&              err)
{
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* res = nullptr;
  if (auto const rc = getaddrinfo(host, service, &hints, &res); rc != 0) {
    err = std::string("can't resolve ") + host + ": "
          + (rc == EAI_SYSTEM ? strerror(errno) : gai_strerror(rc));
    return -1;
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs(res, freeaddrinfo);

  err = std::string("no addresses for ") + host;

  for (auto ai = addrs.get(); ai; ai = ai->ai_next) {
    char addr[INET6_ADDRSTRLEN]{'\0'};
    char port[NI_MAXSERV]{'\0'};
    getnameinfo(ai->ai_addr, ai->ai_addrlen, addr, sizeof addr, port,
                sizeof port, NI_NUMERICHOST | NI_NUMERICSERV);

    auto const fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      err = std::string("socket() failed: ") + strerror(errno);
      PLOG(WARNING) << "socket() failed for " << addr;
      continue;
    }

    std::string why;
    if (!POSIX::connect(fd, ai->ai_addr, ai->ai_addrlen, timeout, why)) {
      LOG(WARNING) << "connect failed " << addr << " port " << port << ": "
                   << why;
      err = std::string("connect to ") + host + " (" + addr + ") port " + port
            + ": " + why;
      close(fd);
      continue;
    }

    LOG(INFO) << "connected to " << host << " (" << addr << ") port " << port;
    return fd;
  }

  return -1;
}
