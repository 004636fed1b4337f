#ifndef ERROR_DOT_HPP
#define ERROR_DOT_HPP

#include <stdexcept>
#include <string>

#include <sysexits.h>

// Every way a single invocation can fail, each terminal.

enum class error_kind {
  usage,           // bad command line
  config,          // missing or invalid configuration file
  malformed_input, // standard input could not be read
  transport,       // connection, TLS, or protocol failure
  auth,            // relay refused our credentials
  relay_rejected,  // relay refused the envelope or the data
};

constexpr char const* to_string(error_kind kind)
{
  switch (kind) {
  case error_kind::usage: return "UsageError";
  case error_kind::config: return "ConfigError";
  case error_kind::malformed_input: return "MalformedInputError";
  case error_kind::transport: return "TransportError";
  case error_kind::auth: return "AuthError";
  case error_kind::relay_rejected: return "RelayRejectedError";
  }
  return "UnknownError";
}

// Process exit status, from <sysexits.h>; a rejection is temporary
// when the relay answered with a 4xx code.
constexpr int exit_code(error_kind kind, bool transient = false)
{
  switch (kind) {
  case error_kind::usage: return EX_USAGE;
  case error_kind::config: return EX_CONFIG;
  case error_kind::malformed_input: return EX_IOERR;
  case error_kind::transport: return EX_TEMPFAIL;
  case error_kind::auth: return EX_NOPERM;
  case error_kind::relay_rejected:
    return transient ? EX_TEMPFAIL : EX_UNAVAILABLE;
  }
  return EX_SOFTWARE;
}

class faamta_error : public std::runtime_error {
public:
  faamta_error(error_kind kind, std::string const& what)
    : std::runtime_error(what)
    , kind_(kind)
  {
  }

  error_kind kind() const { return kind_; }

private:
  error_kind kind_;
};

#endif // ERROR_DOT_HPP
