#include "Stamp.hpp"

#include <climits>
#include <random>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
// <http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt>
constexpr char b32_charset[]{"ybndrfg8ejkmcpqxot1uwisza345h769"};

auto constexpr token_bits    = sizeof(unsigned long long) * CHAR_BIT;
auto constexpr token_ndigits = (token_bits + 4) / 5;

std::string rfc5322_date(time_t sec)
{
  tm   tm_buf;
  tm*  ptm = CHECK_NOTNULL(localtime_r(&sec, &tm_buf));
  char bfr[32];
  auto const len
      = strftime(bfr, sizeof bfr, "%a, %d %b %Y %H:%M:%S %z", ptm);
  CHECK_NE(len, 0u) << "date does not fit";
  return std::string(bfr, len);
}
} // namespace

Stamp::Stamp()
  : Stamp(time(nullptr))
{
}

Stamp::Stamp(time_t sec)
  : sec_(sec)
  , date_(rfc5322_date(sec))
{
}

std::string Stamp::message_id(std::string_view domain) const
{
  return fmt::format("<{}.{}@{}>", sec_, token(), domain);
}

std::string Stamp::token()
{
  static std::random_device rd;

  std::uniform_int_distribution<unsigned long long> uni_dist;
  auto x = uni_dist(rd);

  std::string tok(token_ndigits, ' ');
  for (auto pos = token_ndigits; pos > 0; --pos) {
    tok[pos - 1] = b32_charset[x % 32];
    x /= 32;
  }
  return tok;
}

std::string Stamp::boundary(std::string_view avoid)
{
  for (;;) {
    auto bnd = fmt::format("=_{}_{}", token(), token());
    if (avoid.find(bnd) == std::string_view::npos)
      return bnd;
    LOG(INFO) << "boundary " << bnd << " collides with the message, again";
  }
}
