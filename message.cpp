#include "message.hpp"

#include "Base64.hpp"
#include "esc.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

static std::string_view trim(std::string_view v)
{
  auto constexpr WS = " \t\r\n";
  v.remove_prefix(std::min(v.find_first_not_of(WS), v.size()));
  v.remove_suffix(std::min(v.size() - v.find_last_not_of(WS) - 1, v.size()));
  return v;
}

template <typename Input>
static std::string_view make_view(Input const& in)
{
  return std::string_view(in.begin(), std::distance(in.begin(), in.end()));
}

namespace chars {
// clang-format off
struct tail : range<'\x80', '\xBF'> {};

struct ch_1 : range<'\x00', '\x7F'> {};

struct ch_2 : seq<range<'\xC2', '\xDF'>, tail> {};

struct ch_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, tail>,
                  seq<range<'\xE1', '\xEC'>, rep<2, tail>>,
                  seq<one<'\xED'>, range<'\x80', '\x9F'>, tail>,
                  seq<range<'\xEE', '\xEF'>, rep<2, tail>>> {};

struct ch_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, tail>>,
                  seq<range<'\xF1', '\xF3'>, rep<3, tail>>,
                  seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, tail>>> {};

struct non_ascii : sor<ch_2, ch_3, ch_4> {};
// clang-format on
} // namespace chars

namespace RFC5322 {

using dot   = one<'.'>;
using colon = one<':'>;

// clang-format off

struct VUCHAR           : sor<VCHAR, chars::non_ascii> {};

//.............................................................................

// Tolerant message structure: anything that is not a header field or the
// blank line ending the header section is kept as an opaque run.

struct ftext            : ranges<33, 57, 59, 126> {};

struct field_name       : plus<ftext> {};

struct line_rest        : star<seq<not_at<eol>, any>> {};

struct continuation     : seq<eol, plus<WSP>, line_rest> {};

struct field_value      : seq<line_rest, star<continuation>> {};

// star<WSP> before the colon is the obsolete syntax of section 4.5.
struct field            : seq<field_name, star<WSP>, colon, field_value,
                              sor<eol, eof>> {};

struct separator        : eol {};

struct body             : star<any> {};

struct opaque_rest      : plus<any> {};

struct message          : seq<star<field>,
                              sor<seq<separator, body>, opaque_rest, eof>,
                              eof> {};

//.............................................................................

// All 7-bit ASCII except NUL (0), LF (10) and CR (13).
struct text_ascii       : ranges<1, 9, 11, 12, 14, 127> {};

// Short lines of ASCII text.  LF or CRLF line separators.
struct body_ascii       : seq<star<seq<rep_max<998, text_ascii>, eol>>,
                              opt<rep_max<998, text_ascii>>, eof> {};

struct text_utf8        : sor<text_ascii, chars::non_ascii> {};

// Short lines of UTF-8 text.  LF or CRLF line separators.
struct body_utf8        : seq<star<seq<rep_max<998, text_utf8>, eol>>,
                              opt<rep_max<998, text_utf8>>, eof> {};

//.............................................................................

struct FWS              : seq<opt<seq<star<WSP>, eol>>, plus<WSP>> {};

// Comments are recursive, hence the forward declaration:
struct comment;

struct quoted_pair      : seq<one<'\\'>, sor<VUCHAR, WSP>> {};

// ctext is ASCII not '(' or ')' or '\\'
struct ctext            : sor<ranges<33, 39, 42, 91, 93, 126>, chars::non_ascii> {};

struct ccontent         : sor<ctext, quoted_pair, comment> {};

struct comment          : seq<one<'('>,
                              star<seq<opt<FWS>, ccontent>>,
                              opt<FWS>,
                              one<')'>
                             > {};

struct CFWS             : sor<seq<plus<seq<opt<FWS>, comment>, opt<FWS>>>,
                              FWS> {};

struct qtext            : sor<one<33>, ranges<35, 91, 93, 126>, chars::non_ascii> {};

struct qcontent         : sor<qtext, quoted_pair> {};

// Corrected in RFC-5322, errata ID: 3135 <https://www.rfc-editor.org/errata/eid3135>
struct quoted_string    : seq<opt<CFWS>,
                              DQUOTE,
                              sor<seq<star<seq<opt<FWS>, qcontent>>, opt<FWS>>, FWS>,
                              DQUOTE,
                              opt<CFWS>
                             > {};

struct atext            : sor<ALPHA, DIGIT,
                              one<'!', '#',
                                  '$', '%',
                                  '&', '\'',
                                  '*', '+',
                                  '-', '/',
                                  '=', '?',
                                  '^', '_',
                                  '`', '{',
                                  '|', '}',
                                  '~'>,
                              chars::non_ascii> {};

struct atom             : seq<opt<CFWS>, plus<atext>, opt<CFWS>> {};

struct dot_atom_text    : list<plus<atext>, dot> {};

struct dot_atom         : seq<opt<CFWS>, dot_atom_text, opt<CFWS>> {};

struct word             : sor<atom, quoted_string> {};

// obs-phrase allows the dots of "Jr." and the like.
struct phrase           : seq<word, star<sor<word, dot, CFWS>>> {};

struct obs_local_part   : seq<word, star<seq<dot, word>>> {};

struct local_part       : sor<quoted_string, dot_atom> {};

struct dtext            : ranges<33, 90, 94, 126> {};

struct domain_literal   : seq<opt<CFWS>,
                              one<'['>,
                              star<seq<opt<FWS>, dtext>>,
                              opt<FWS>,
                              one<']'>,
                              opt<CFWS>> {};

struct domain           : sor<dot_atom, domain_literal> {};

struct obs_domain       : sor<list<atom, dot>, domain_literal> {};

struct new_addr_spec    : seq<local_part, one<'@'>, domain> {};

struct obs_addr_spec    : seq<obs_local_part, one<'@'>, obs_domain> {};

struct addr_spec        : sor<obs_addr_spec, new_addr_spec> {};

struct obs_domain_list  : seq<
                              star<sor<CFWS, one<','>>>, one<'@'>, domain,
                              star<seq<one<','>, opt<CFWS>, opt<seq<one<'@'>, domain>>>>
                             > {};

struct obs_route        : seq<obs_domain_list, colon> {};

struct obs_angle_addr   : seq<opt<CFWS>, one<'<'>, obs_route, addr_spec, one<'>'>, opt<CFWS>> {};

struct angle_addr       : sor<seq<opt<CFWS>, one<'<'>, addr_spec, one<'>'>, opt<CFWS>>,
                              obs_angle_addr
                             > {};

struct display_name     : phrase {};

struct name_addr        : seq<opt<display_name>, angle_addr> {};

// An addr-spec standing alone, without a display name.
struct bare_addr_spec   : addr_spec {};

struct mailbox          : sor<name_addr, bare_addr_spec> {};

struct obs_mbox_list    : seq<star<seq<opt<CFWS>, one<','>>>,
                              mailbox,
                              star<seq<one<','>, opt<sor<mailbox, CFWS>>>>
                             > {};

// obs-mbox-list accepts everything mailbox-list does.
struct mailbox_list     : obs_mbox_list {};

struct mailbox_list_only: seq<mailbox_list, eof> {};

// clang-format on

//.............................................................................

template <typename Rule>
struct msg_action : nothing<Rule> {
};

template <>
struct msg_action<field_name> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.field_name = make_view(in);
  }
};

template <>
struct msg_action<field_value> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.field_value = make_view(in);
  }
};

template <>
struct msg_action<field> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.fields.emplace_back(
        ::message::header{msg.field_name, msg.field_value, make_view(in)});
  }
};

template <>
struct msg_action<separator> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.separator = make_view(in);
  }
};

template <>
struct msg_action<body> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.body = make_view(in);
  }
};

template <>
struct msg_action<opaque_rest> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.fields.emplace_back(::message::opaque{make_view(in)});
  }
};

//.............................................................................

// Comments and white space outside of quoted strings are not part of
// an address.
static std::string strip_cfws(std::string_view addr)
{
  std::string ret;
  ret.reserve(addr.length());

  auto depth  = 0;
  auto quoted = false;
  for (auto p = addr.begin(); p != addr.end(); ++p) {
    auto const ch = *p;
    if (ch == '\\' && (quoted || depth) && std::next(p) != addr.end()) {
      if (quoted) {
        ret += ch;
        ret += *std::next(p);
      }
      ++p;
      continue;
    }
    if (depth) {
      if (ch == '(')
        ++depth;
      else if (ch == ')')
        --depth;
      continue;
    }
    if (ch == '"') {
      quoted = !quoted;
      ret += ch;
      continue;
    }
    if (!quoted) {
      if (ch == '(') {
        ++depth;
        continue;
      }
      if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n')
        continue;
    }
    ret += ch;
  }

  return ret;
}

template <typename Rule>
struct mailbox_list_action : nothing<Rule> {
};

template <>
struct mailbox_list_action<display_name> {
  template <typename Input>
  static void apply(Input const&                       in,
                    ::message::mailbox_name_addr_list& from_parsed)
  {
    from_parsed.maybe_name = std::string(trim(make_view(in)));
  }
};

template <>
struct mailbox_list_action<addr_spec> {
  template <typename Input>
  static void apply(Input const&                       in,
                    ::message::mailbox_name_addr_list& from_parsed)
  {
    from_parsed.maybe_addr = strip_cfws(make_view(in));
  }
};

template <>
struct mailbox_list_action<name_addr> {
  template <typename Input>
  static void apply(Input const&                       in,
                    ::message::mailbox_name_addr_list& from_parsed)
  {
    from_parsed.name_addr_list.push_back(
        {from_parsed.maybe_name, from_parsed.maybe_addr});
    from_parsed.maybe_name.clear();
    from_parsed.maybe_addr.clear();
  }
};

template <>
struct mailbox_list_action<bare_addr_spec> {
  template <typename Input>
  static void apply(Input const&                       in,
                    ::message::mailbox_name_addr_list& from_parsed)
  {
    from_parsed.name_addr_list.push_back({"", strip_cfws(make_view(in))});
    from_parsed.maybe_name.clear();
    from_parsed.maybe_addr.clear();
  }
};

} // namespace RFC5322

namespace message {

void parsed::parse(std::string_view input)
{
  fields.clear();
  separator = body = field_name = field_value = std::string_view{};

  auto in{memory_input<>(input.data(), input.size(), "message")};
  if (!tao::pegtl::parse<RFC5322::message, RFC5322::msg_action>(in, *this)) {
    // Can't happen with this grammar, but the bytes must survive anyway.
    LOG(WARNING) << "message grammar did not match, keeping input as opaque";
    fields.clear();
    separator = body = std::string_view{};
    if (!input.empty())
      fields.emplace_back(opaque{input});
  }
}

std::vector<std::string_view> parsed::get_all(std::string_view name) const
{
  std::vector<std::string_view> ret;
  for (auto const& f : fields) {
    if (auto hdr = std::get_if<header>(&f); hdr && (*hdr == name))
      ret.push_back(hdr->value);
  }
  return ret;
}

bool parsed::has_opaque() const
{
  return std::any_of(begin(fields), end(fields), [](field const& f) {
    return std::holds_alternative<opaque>(f);
  });
}

std::string parsed::as_string() const
{
  fmt::memory_buffer bfr;

  for (auto const& f : fields) {
    auto const raw = std::visit([](auto const& v) { return v.raw; }, f);
    bfr.append(raw.data(), raw.data() + raw.size());
  }
  bfr.append(separator.data(), separator.data() + separator.size());
  bfr.append(body.data(), body.data() + body.size());

  return fmt::to_string(bfr);
}

data_type classify(std::string_view data)
{
  {
    auto in{memory_input<>(data.data(), data.size(), "data")};
    if (tao::pegtl::parse<RFC5322::body_ascii>(in))
      return data_type::ascii;
  }
  {
    auto in{memory_input<>(data.data(), data.size(), "data")};
    if (tao::pegtl::parse<RFC5322::body_utf8>(in))
      return data_type::utf8;
  }
  return data_type::binary;
}

static bool too_deep(std::string_view input)
{
  auto depth = 0;
  for (auto ch : input) {
    if (ch == '(' && ++depth > Config::max_comment_depth)
      return true;
    if (ch == ')' && depth > 0)
      --depth;
  }
  return false;
}

bool mailbox_list_parse(std::string_view        input,
                        mailbox_name_addr_list& name_addr_list)
{
  if (input.size() > Config::max_mailbox_list_length) {
    LOG(WARNING) << "not parsing a mailbox list of " << input.size()
                 << " octets";
    return false;
  }
  if (too_deep(input)) {
    LOG(WARNING) << "not parsing a mailbox list with comments nested over "
                 << Config::max_comment_depth << " deep";
    return false;
  }

  auto in{memory_input<>(input.data(), input.size(), "mailbox_list_only")};
  try {
    return tao::pegtl::parse<RFC5322::mailbox_list_only,
                             RFC5322::mailbox_list_action>(in, name_addr_list);
  }
  catch (parse_error const& e) {
    LOG(INFO) << "mailbox list parse error: " << e.what();
    return false;
  }
}

std::optional<std::string> from_address(std::string_view value)
{
  auto const val = unfold(value);

  mailbox_name_addr_list lst;
  if (mailbox_list_parse(val, lst) && lst.name_addr_list.size() == 1)
    return lst.name_addr_list[0].addr;

  // The word before the first " (Cron Daemon)".
  auto const cron = val.find(" (Cron Daemon)");
  if (cron == std::string::npos || cron == 0)
    return {};
  auto const is_space
      = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)); };
  auto pos = cron;
  while (pos > 0 && !is_space(val[pos - 1]))
    --pos;
  if (pos == cron)
    return {};
  return val.substr(pos, cron - pos);
}

std::string unfold(std::string_view value)
{
  std::string ret;
  ret.reserve(value.length());
  for (auto ch : trim(value)) {
    if (ch != '\r' && ch != '\n')
      ret += ch;
  }
  return ret;
}

static int hex_value(char ch)
{
  if (ch >= '0' && ch <= '9')
    return ch - '0';
  if (ch >= 'A' && ch <= 'F')
    return ch - 'A' + 10;
  if (ch >= 'a' && ch <= 'f')
    return ch - 'a' + 10;
  return -1;
}

// One encoded-word, "=?charset?encoding?encoded-text?=", starting at
// the front of str; returns the number of octets used, zero if str does
// not start with one this code can decode.
static std::string_view::size_type decode_word(std::string_view str,
                                               std::string&     out)
{
  if (str.substr(0, 2) != "=?")
    return 0;

  auto const q1 = str.find('?', 2);
  if (q1 == std::string_view::npos)
    return 0;
  auto const q2 = str.find('?', q1 + 1);
  if (q2 == std::string_view::npos || q2 != q1 + 2)
    return 0;
  auto const end = str.find("?=", q2 + 1);
  if (end == std::string_view::npos)
    return 0;

  auto charset = str.substr(2, q1 - 2);
  // RFC 2231 language suffix
  if (auto const star = charset.find('*'); star != std::string_view::npos)
    charset = charset.substr(0, star);

  if (!boost::algorithm::iequals(charset, "UTF-8")
      && !boost::algorithm::iequals(charset, "US-ASCII"))
    return 0;

  auto const encoding = str[q1 + 1];
  auto const text     = str.substr(q2 + 1, end - (q2 + 1));
  if (text.find_first_of(" \t") != std::string_view::npos)
    return 0;

  std::string decoded;
  switch (encoding) {
  case 'B':
  case 'b':
    try {
      decoded = Base64::dec(text);
    }
    catch (std::invalid_argument const&) {
      return 0;
    }
    break;

  case 'Q':
  case 'q':
    for (std::string_view::size_type i = 0; i < text.length(); ++i) {
      if (text[i] == '_') {
        decoded += ' ';
      }
      else if (text[i] == '=') {
        if (i + 2 >= text.length())
          return 0;
        auto const hi = hex_value(text[i + 1]);
        auto const lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0)
          return 0;
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
      }
      else {
        decoded += text[i];
      }
    }
    break;

  default: return 0;
  }

  if (!is_valid_utf8(decoded))
    return 0;

  out += decoded;
  return end + 2;
}

std::string decode_encoded_words(std::string_view value)
{
  std::string ret;
  ret.reserve(value.length());

  auto last_was_word = false;
  while (!value.empty()) {
    if (auto const len = decode_word(value, ret); len) {
      value.remove_prefix(len);
      last_was_word = true;
      continue;
    }

    // White space between adjacent encoded-words is dropped.
    if (last_was_word) {
      auto const ws = value.find_first_not_of(" \t\r\n");
      if (ws != std::string_view::npos && ws > 0) {
        std::string scratch;
        if (decode_word(value.substr(ws), scratch)) {
          value.remove_prefix(ws);
          continue;
        }
      }
    }

    ret += value.front();
    value.remove_prefix(1);
    last_was_word = false;
  }

  return ret;
}

} // namespace message
