#include "POSIX.hpp"

#include <cerrno>
#include <cstring>

#include <glog/logging.h>

#include <fcntl.h>
#include <sys/select.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::system_clock;

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

static timeval to_timeval(milliseconds wait)
{
  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;
  return tv;
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_in, &fds);

  auto tv{to_timeval(wait)};

  int puts;
  while ((puts = select(fd_in + 1, &fds, nullptr, nullptr, &tv)) == -1) {
    if (errno != EINTR) {
      PLOG(WARNING) << "select(2) failed";
      return false;
    }
  }

  return 0 != puts;
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_out, &fds);

  auto tv{to_timeval(wait)};

  int puts;
  while ((puts = select(fd_out + 1, nullptr, &fds, nullptr, &tv)) == -1) {
    if (errno != EINTR) {
      PLOG(WARNING) << "select(2) failed";
      return false;
    }
  }

  return 0 != puts;
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const start    = system_clock::now();
  auto const end_time = start + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try read again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "error from read(2)"; return -1;
      }
    }
    else {
      return n_ret;
    }

    auto const now = system_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const start    = system_clock::now();
  auto const end_time = start + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret = ::write(fd, static_cast<const void*>(s), n - written);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "error from write(2)"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = system_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o = true;
    LOG(WARNING) << "write(2) timed out";
    return -1;
  }
}

bool POSIX::connect(int             fd,
                    sockaddr const* addr,
                    socklen_t       addrlen,
                    milliseconds    timeout,
                    std::string&    err)
{
  set_nonblocking(fd);

  if (::connect(fd, addr, addrlen) == 0)
    return true;

  if (errno != EINPROGRESS) {
    err = strerror(errno);
    return false;
  }

  if (!output_ready(fd, timeout)) {
    err = "connect timed out";
    return false;
  }

  int       so_error = 0;
  socklen_t len      = sizeof(so_error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == -1) {
    err = strerror(errno);
    return false;
  }
  if (so_error != 0) {
    err = strerror(so_error);
    return false;
  }

  return true;
}
