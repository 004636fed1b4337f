#include "Mailbox.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC3629 {
// clang-format off

struct UTF8_tail : range<'\x80', '\xBF'> {};

struct UTF8_2 : seq<range<'\xC2', '\xDF'>, UTF8_tail> {};

struct UTF8_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, UTF8_tail>,
                    seq<range<'\xE1', '\xEC'>, rep<2, UTF8_tail>>,
                    seq<one<'\xED'>, range<'\x80', '\x9F'>, UTF8_tail>,
                    seq<range<'\xEE', '\xEF'>, rep<2, UTF8_tail>>> {};

struct UTF8_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, UTF8_tail>>,
                    seq<range<'\xF1', '\xF3'>, rep<3, UTF8_tail>>,
                    seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, UTF8_tail>>> {};

struct non_ascii : sor<UTF8_2, UTF8_3, UTF8_4> {};

} // namespace RFC3629

namespace RFC5321 {
// <https://tools.ietf.org/html/rfc5321#section-4.1.2>

using dot = one<'.'>;

struct atext : sor<ALPHA, DIGIT,
                   one<'!', '#', '$', '%', '&', '\'', '*', '+', '-', '/',
                       '=', '?', '^', '_', '`', '{', '|', '}', '~'>,
                   RFC3629::non_ascii> {};

struct u_let_dig : sor<ALPHA, DIGIT, RFC3629::non_ascii> {};

struct u_ldh_tail : star<sor<seq<plus<one<'-'>>, u_let_dig>, u_let_dig>> {};

struct sub_domain : seq<u_let_dig, u_ldh_tail> {};

struct domain : list<sub_domain, dot> {};

struct dcontent : ranges<33, 90, 94, 126> {};

// 4.1.3.  Address Literals, IPv4, IPv6 and general forms alike.
struct address_literal : seq<one<'['>, plus<dcontent>, one<']'>> {};

struct qtextSMTP : sor<ranges<32, 33, 35, 91, 93, 126>, RFC3629::non_ascii> {};
struct graphic : range<32, 126> {};
struct quoted_pairSMTP : seq<one<'\\'>, graphic> {};
struct qcontentSMTP : sor<qtextSMTP, quoted_pairSMTP> {};

struct atom : plus<atext> {};
struct dot_string : list<atom, dot> {};
struct quoted_string : seq<one<'"'>, star<qcontentSMTP>, one<'"'>> {};
struct local_part : sor<dot_string, quoted_string> {};
struct non_local_part : sor<domain, address_literal> {};
struct mailbox : seq<local_part, one<'@'>, non_local_part> {};
struct mailbox_only : seq<mailbox, eof> {};

// clang-format on
// Actions

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<local_part> {
  template <typename Input>
  static void apply(Input const& in, Mailbox& addr)
  {
    addr.set_local(in.string());
  }
};

template <>
struct action<non_local_part> {
  template <typename Input>
  static void apply(Input const& in, Mailbox& addr)
  {
    addr.set_domain(in.string());
  }
};
} // namespace RFC5321

Mailbox::Mailbox(std::string_view mailbox)
{
  std::string msg;
  set_(mailbox, true /* throw */, msg);
}

bool Mailbox::validate(std::string_view mailbox, std::string& msg, Mailbox& mbx)
{
  return mbx.set_(mailbox, false /* don't throw */, msg);
}

bool Mailbox::set_(std::string_view mailbox, bool should_throw, std::string& msg)
{
  clear();

  auto fail = [&](std::string m) {
    clear();
    msg = std::move(m);
    if (should_throw)
      throw std::invalid_argument(msg);
    return false;
  };

  if (mailbox.empty())
    return fail("empty mailbox");

  memory_input<> address_in(mailbox.data(), mailbox.size(), "mailbox");
  try {
    if (!parse<RFC5321::mailbox_only, RFC5321::action>(address_in, *this))
      return fail(fmt::format("invalid mailbox syntax «{}»", mailbox));
  }
  catch (parse_error const&) {
    return fail(fmt::format("invalid mailbox syntax «{}»", mailbox));
  }

  // RFC-5321 section 4.5.3.1.  Size Limits and Minimums

  if (local_part().length() > 64) // Section 4.5.3.1.1.  Local-part
    return fail(fmt::format("local part > 64 octets «{}»", mailbox));

  if (domain().length() > 255) // Section 4.5.3.1.2.
    return fail(fmt::format("domain > 255 octets «{}»", mailbox));

  return true;
}
