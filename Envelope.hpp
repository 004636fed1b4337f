#ifndef ENVELOPE_DOT_HPP
#define ENVELOPE_DOT_HPP

#include <optional>
#include <string>
#include <vector>

// How sendmail was invoked: the mode, the original recipients and the
// original envelope sender. None of it decides where the message goes,
// it only has to be consumed correctly and reported.

class Envelope {
public:
  enum class mode {
    deliver,      // -bm, the default: a message on stdin
    print_queue,  // -bp, mailq
    queue_run,    // -q
    init_aliases, // -bi, newaliases
  };

  enum class recipient_source {
    arguments, // trailing addresses
    headers,   // -t, the To, Cc and Bcc of the message
  };

  // argv[0] is the program name; throws faamta_error of kind usage when a
  // flag is missing its value, or asks for an SMTP dialog on stdin.
  static Envelope parse(int argc, char const* const argv[]);
  static Envelope parse(std::vector<std::string> const& args);

  mode             op_mode() const { return mode_; }
  recipient_source rcpt_source() const { return rcpt_source_; }

  std::vector<std::string> const& recipients() const { return recipients_; }

  // Set when exactly one -f or -r was given and every argument is UTF-8.
  std::optional<std::string> const& sender() const { return sender_; }
  std::optional<std::string> const& full_name() const { return full_name_; }

  bool ignore_dots() const { return ignore_dots_; }
  bool all_utf8() const { return all_utf8_; }

  std::vector<std::string> const& ignored() const { return ignored_; }

  // Every argument, escaped and separated by spaces.
  std::string invocation() const;

private:
  std::vector<std::string> args_;

  mode             mode_{mode::deliver};
  recipient_source rcpt_source_{recipient_source::arguments};

  std::vector<std::string>   recipients_;
  std::optional<std::string> sender_;
  std::optional<std::string> full_name_;
  std::vector<std::string>   ignored_;

  bool ignore_dots_{false};
  bool all_utf8_{true};
};

#endif // ENVELOPE_DOT_HPP
