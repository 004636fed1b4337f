#ifndef MAILBOX_DOT_HPP
#define MAILBOX_DOT_HPP

#include <ostream>
#include <string>
#include <string_view>

// An RFC 5321 Mailbox, as used in MAIL FROM and RCPT TO.

class Mailbox {
public:
  Mailbox() = default;

  // Parse the input string against the RFC-5321 Mailbox grammar, throws
  // std::invalid_argument if it does not match.
  explicit Mailbox(std::string_view mailbox);

  static bool
  validate(std::string_view mailbox, std::string& msg, Mailbox& mbx);

  void set_local(std::string_view local_part) { local_part_ = local_part; }
  void set_domain(std::string_view domain) { domain_ = domain; }
  void clear()
  {
    local_part_.clear();
    domain_.clear();
  }

  std::string const& local_part() const { return local_part_; }
  std::string const& domain() const { return domain_; }

  bool empty() const { return local_part_.empty() && domain_.empty(); }

  std::string as_string() const
  {
    return empty() ? "" : local_part_ + "@" + domain_;
  }
  operator std::string() const { return as_string(); }

  bool operator==(Mailbox const& rhs) const
  {
    return (local_part_ == rhs.local_part_) && (domain_ == rhs.domain_);
  }
  bool operator!=(Mailbox const& rhs) const { return !(*this == rhs); }

private:
  bool set_(std::string_view mailbox, bool should_throw, std::string& msg);

  std::string local_part_;
  std::string domain_;
};

inline std::ostream& operator<<(std::ostream& s, Mailbox const& mb)
{
  return s << mb.as_string();
}

#endif // MAILBOX_DOT_HPP
