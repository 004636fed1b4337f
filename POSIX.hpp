#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <ios>
#include <string>

#include <sys/socket.h>
#include <unistd.h>

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  // Returns -1 on error or time out; t_o is set on time out.
  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);

  // Non-blocking connect(2) bounded by timeout; on failure returns
  // false with a description in err.
  static bool connect(int                       fd,
                      sockaddr const*           addr,
                      socklen_t                 addrlen,
                      std::chrono::milliseconds timeout,
                      std::string&              err);
};

#endif // POSIX_DOT_HPP
