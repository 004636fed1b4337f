#ifndef STAMP_DOT_HPP
#define STAMP_DOT_HPP

#include <ctime>
#include <string>
#include <string_view>

// The moment a wrapper is made, and the unique names derived from it.

class Stamp {
public:
  Stamp();
  explicit Stamp(time_t sec);

  time_t sec() const { return sec_; }

  // RFC 5322 section 3.3 date-time, local zone.
  std::string const& date() const { return date_; }

  // <sec.token@domain>
  std::string message_id(std::string_view domain) const;

  // A MIME boundary that does not occur in avoid.
  static std::string boundary(std::string_view avoid);

  // 64 random bits in human-oriented base 32, safe in boundaries and
  // Message-ID local parts.
  static std::string token();

private:
  time_t      sec_;
  std::string date_;
};

#endif // STAMP_DOT_HPP
