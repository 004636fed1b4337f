#ifndef RELAY_DOT_HPP
#define RELAY_DOT_HPP

#include <chrono>
#include <optional>
#include <string>

#include "Error.hpp"

struct RelayConfig;

namespace Wrapper {
struct outbound;
}

namespace Config {
auto constexpr submission_service  = "587";
auto constexpr submissions_service = "465";
} // namespace Config

// One SMTP submission to the configured relay: TLS, AUTH, a single
// MAIL FROM and RCPT TO, DATA. Nothing is retried.

class Relay {
public:
  enum class state {
    connecting,
    tls_handshake,
    authenticating,
    sending_envelope,
    sending_data,
    completed,
    failed,
  };

  enum class tls_mode {
    starttls, // submission, RFC 6409 and RFC 3207
    implicit, // submissions, RFC 8314
    none,     // plain text, for scripted sessions only
  };

  struct result {
    std::optional<error_kind> error; // none on success

    // The relay's reply that decided the outcome, empty if it never got
    // that far.
    std::string reply_code;
    std::string reply_text;

    std::string message;

    bool ok() const { return !error; }
    bool transient() const
    {
      return !reply_code.empty() && reply_code[0] == '4';
    }
    int exit_code() const
    {
      return ok() ? EX_OK : ::exit_code(*error, transient());
    }
  };

  // Settings not given here come from the command line flags.
  Relay(RelayConfig const& cfg, std::string client_id);
  Relay(RelayConfig const& cfg, std::string client_id, tls_mode mode);

  // Connect to the relay and submit.
  result deliver(Wrapper::outbound const& msg);

  // Submit over an established connection, the descriptors are closed
  // before returning.
  result deliver(Wrapper::outbound const& msg, int fd_in, int fd_out);

  state current_state() const { return state_; }

  // The name for EHLO: the host name if it is qualified, otherwise the
  // domain of the configured sender.
  static std::string client_name(std::string const& hostname,
                                 RelayConfig const& cfg);

private:
  RelayConfig const& cfg_;
  std::string        client_id_;
  tls_mode           tls_mode_;

  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds read_timeout_;
  std::chrono::milliseconds write_timeout_;
  std::chrono::milliseconds starttls_timeout_;

  state state_{state::connecting};
};

char const* to_string(Relay::state st);

#endif // RELAY_DOT_HPP
