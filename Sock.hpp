#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <chrono>
#include <string>

#include <netinet/in.h>

#include "SockBuffer.hpp"

namespace Config {
constexpr std::chrono::seconds default_connect_timeout{30};
} // namespace Config

// A connection to a server, as an iostream. Owns the descriptors.

class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  Sock(int                       fd_in,
       int                       fd_out,
       std::chrono::milliseconds read_timeout  = Config::default_read_timeout,
       std::chrono::milliseconds write_timeout = Config::default_write_timeout,
       std::chrono::milliseconds starttls_timeout
       = Config::default_starttls_timeout);

  // Try each address of host in turn; returns a connected socket, or -1
  // with the reason for the last failure in err.
  static int connect(char const*               host,
                     char const*               service,
                     std::chrono::milliseconds timeout,
                     std::string&              err);

  char const* them_c_str() const { return them_addr_str_; }
  bool        has_peername() const { return them_addr_str_[0] != '\0'; }

  bool input_ready(std::chrono::milliseconds wait)
  {
    return iostream_->input_ready(wait);
  }
  bool timed_out() { return iostream_->timed_out(); }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  bool starttls_client(char const* server_name, std::string& err)
  {
    return iostream_->starttls_client(server_name, err);
  }
  bool        tls() { return iostream_->tls(); }
  std::string tls_info() { return iostream_->tls_info(); }

  bool log_data(bool on) { return iostream_->log_data(on); }
  void log_totals() { return iostream_->log_totals(); }

  // Keeps protocol data, credentials say, out of the log while in scope.
  class redacted {
  public:
    redacted(redacted const&) = delete;
    redacted& operator=(redacted const&) = delete;

    explicit redacted(Sock& sock)
      : sock_(sock)
      , was_(sock.log_data(false))
    {
    }
    ~redacted() { sock_.log_data(was_); }

  private:
    Sock& sock_;
    bool  was_;
  };

private:
  // Declared before the stream, so closed after it is gone.
  struct descriptors {
    int in;
    int out;
    ~descriptors();
  } fds_;

  boost::iostreams::stream<SockBuffer> iostream_;

  char them_addr_str_[INET6_ADDRSTRLEN]{'\0'};
};

#endif // SOCK_DOT_HPP
