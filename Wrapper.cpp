#include "Wrapper.hpp"

#include "Base64.hpp"
#include "Envelope.hpp"
#include "Mailbox.hpp"
#include "QP.hpp"
#include "RelayConfig.hpp"
#include "Stamp.hpp"
#include "esc.hpp"
#include "osutil.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
// An encoded-word may be at most 75 octets, RFC 2047 section 2; this
// much UTF-8 keeps the whole "Subject: =?UTF-8?B?...?=" line under 78.
auto constexpr encoded_word_octets = 42;

auto constexpr base64_line_length = 76;

// RFC 5322 section 2.1.1
auto constexpr max_header_line = 78u;
auto constexpr max_line        = 998u;

bool is_printable_ascii(std::string_view str)
{
  return std::all_of(begin(str), end(str),
                     [](char ch) { return ch >= ' ' && ch <= '~'; });
}

bool is_ascii(std::string_view str)
{
  return std::all_of(begin(str), end(str), [](char ch) {
    return static_cast<unsigned char>(ch) < 0x80;
  });
}

// Longest prefix of str no longer than len that does not split a UTF-8
// sequence.
std::string_view utf8_prefix(std::string_view str, std::string_view::size_type len)
{
  std::string_view::size_type pos = 0;
  while (pos < str.length()) {
    auto n = utf8_seq_len(str.substr(pos));
    if (n == 0)
      n = 1;
    if (pos + n > len)
      break;
    pos += n;
  }
  return str.substr(0, pos);
}

std::string clip(std::string_view str, std::string_view::size_type len)
{
  if (str.length() <= len)
    return std::string(str);
  return fmt::format("{}...", utf8_prefix(str, len));
}

bool has_long_line(std::string_view text)
{
  while (!text.empty()) {
    auto const eol = text.find('\n');
    if (std::min(eol, text.length()) > max_line)
      return true;
    if (eol == std::string_view::npos)
      break;
    text.remove_prefix(eol + 1);
  }
  return false;
}

// Break before spaces to keep lines within max_header_line; none if a
// single word is too long for a line of its own.
std::optional<std::string> fold(std::string_view            value,
                                std::string_view::size_type used)
{
  std::string ret;
  auto        len = used;
  while (!value.empty()) {
    auto const word = value.substr(0, value.find(' ', 1));
    if (!ret.empty() && word.length() > 1
        && len + word.length() > max_header_line) {
      ret += "\r\n";
      len = 0;
    }
    if (len + word.length() > max_header_line)
      return {};
    ret += word;
    len += word.length();
    value.remove_prefix(word.length());
  }
  return ret;
}

void append_crlf_lines(fmt::memory_buffer& bfr, std::string_view text)
{
  while (!text.empty()) {
    auto const eol  = text.find('\n');
    auto       line = text.substr(0, eol);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    bfr.append(line.data(), line.data() + line.size());
    bfr.append(std::string_view("\r\n"));
    if (eol == std::string_view::npos)
      break;
    text.remove_prefix(eol + 1);
  }
}

// The addresses in the To, Cc and Bcc fields of the original.
std::vector<std::string> header_recipients(message::parsed const& msg)
{
  std::vector<std::string> rcpts;
  for (auto const name : {message::To, message::Cc, message::Bcc}) {
    for (auto const value : msg.get_all(name)) {
      auto const                      unfolded = message::unfold(value);
      message::mailbox_name_addr_list lst;
      if (message::mailbox_list_parse(unfolded, lst)) {
        for (auto const& na : lst.name_addr_list)
          rcpts.push_back(esc(na.addr));
      }
      else {
        rcpts.push_back(fmt::format("{}: {} (unparsed)", name, esc(unfolded)));
      }
    }
  }
  return rcpts;
}

std::string join(std::vector<std::string> const& strs)
{
  fmt::memory_buffer bfr;
  for (auto const& s : strs) {
    if (bfr.size())
      bfr.append(std::string_view(", "));
    bfr.append(s.data(), s.data() + s.size());
  }
  return fmt::to_string(bfr);
}

std::string or_none(std::string const& s)
{
  return s.empty() ? std::string("(none)") : esc(s);
}

Wrapper::attachment make_attachment(std::string_view raw)
{
  Wrapper::attachment att;
  switch (message::classify(raw)) {
  case message::data_type::ascii:
    att.content_type      = "message/rfc822";
    att.transfer_encoding = "7bit";
    att.encoded           = std::string(raw);
    break;
  case message::data_type::utf8:
    att.content_type      = "message/rfc822";
    att.transfer_encoding = "8bit";
    att.encoded           = std::string(raw);
    break;
  case message::data_type::binary:
    LOG(INFO) << "input is not text, attaching it base64 encoded";
    att.content_type      = "application/octet-stream";
    att.transfer_encoding = "base64";
    att.encoded           = Base64::enc(raw, base64_line_length);
    break;
  }
  return att;
}

std::string summary_body(std::string_view              raw,
                         message::parsed const&        msg,
                         Envelope const&               env,
                         RelayConfig const&            cfg,
                         osutil::local_identity const& id,
                         Wrapper::attachment const&    att)
{
  fmt::memory_buffer bfr;
  auto               out = std::back_inserter(bfr);

  fmt::format_to(out, "A process on host \"{}\" invoked the sendmail binary.\n",
                 esc(id.hostname));
  fmt::format_to(out, "On that host, the sendmail binary is provided by {}.\n",
                 Config::mailer);

  switch (cfg.file_permissions) {
  case RelayConfig::permissions::ok: break;
  case RelayConfig::permissions::too_open:
    fmt::format_to(out,
                   "WARNING: the config file {} contains SMTP credentials and "
                   "is accessible by group or others.\n",
                   esc(cfg.path.string()));
    break;
  case RelayConfig::permissions::unknown:
    fmt::format_to(out,
                   "WARNING: could not determine permissions of the config "
                   "file {}, they may or may not be too lax.\n",
                   esc(cfg.path.string()));
    break;
  }

  if (att.content_type == "message/rfc822")
    fmt::format_to(out, "The original message is attached inline to this "
                        "wrapper message.\n");
  else
    fmt::format_to(out,
                   "The original input ({} octets) is not a valid message, it "
                   "is attached as {}.\n",
                   raw.size(), Config::attachment_filename);
  if (msg.has_opaque())
    fmt::format_to(out, "Part of the original header section could not be "
                        "parsed, it is preserved in the attachment.\n");
  fmt::format_to(out, "\n");

  fmt::format_to(out, "Invocation args: {}{}\n", env.invocation(),
                 env.all_utf8() ? "" : " (non-utf-8)");
  fmt::format_to(out, "Original envelope sender: {}\n",
                 env.sender() ? esc(*env.sender()) : "(none)");
  if (env.full_name())
    fmt::format_to(out, "Original sender full name: {}\n",
                   esc(*env.full_name()));
  if (env.rcpt_source() == Envelope::recipient_source::headers) {
    auto const rcpts = header_recipients(msg);
    fmt::format_to(out, "Original recipients (from headers): {}\n",
                   rcpts.empty() ? "(none)" : join(rcpts));
  }
  else {
    std::vector<std::string> rcpts;
    std::transform(begin(env.recipients()), end(env.recipients()),
                   std::back_inserter(rcpts),
                   [](std::string const& r) { return esc(r); });
    fmt::format_to(out, "Original recipients: {}\n",
                   rcpts.empty() ? "(none)" : join(rcpts));
  }
  fmt::format_to(out, "\n");

  fmt::format_to(out, "uid:{} gid:{} euid:{} egid:{}\n", id.uid, id.gid,
                 id.euid, id.egid);
  fmt::format_to(out, "username: {}\n", esc(id.user_name));
  fmt::format_to(out, "groupname: {}\n", esc(id.group_name));
  fmt::format_to(out, "effective username: {}\n", esc(id.effective_user_name));
  fmt::format_to(out, "effective groupname: {}\n",
                 esc(id.effective_group_name));
  fmt::format_to(out, "\n");

  fmt::format_to(out, "hostname: {}\n", or_none(id.hostname));
  fmt::format_to(out, "os: {} {}\n", or_none(id.os_name), esc(id.os_release));
  fmt::format_to(out, "machine: {}\n", or_none(id.machine));

  return fmt::to_string(bfr);
}
} // namespace

namespace Wrapper {

std::string attachment::decoded() const
{
  if (transfer_encoding == "base64")
    return Base64::dec(encoded);
  return encoded;
}

std::string outbound::text_transfer_encoding() const
{
  if (has_long_line(summary_body))
    return "quoted-printable";
  return is_ascii(summary_body) ? "7bit" : "8bit";
}

bool outbound::eight_bit() const
{
  return attached.transfer_encoding == "8bit"
         || text_transfer_encoding() == "8bit";
}

std::string outbound::serialized() const
{
  fmt::memory_buffer bfr;
  auto               out = std::back_inserter(bfr);

  auto hdr = [&out](char const* name, std::string_view value) {
    fmt::format_to(out, "{}: {}\r\n", name, value);
  };

  hdr(message::Message_ID, message_id);
  hdr(message::Date, date);
  hdr(message::From, header_from);
  hdr(message::To, header_to);
  hdr(message::Subject, encode_header_value(subject));
  hdr(message::MIME_Version, "1.0");
  hdr(message::Content_Type,
      fmt::format("multipart/mixed; boundary=\"{}\"", boundary));
  hdr(message::Auto_Submitted, "auto-generated");
  hdr("X-Mailer", Config::mailer);
  fmt::format_to(out, "\r\n");

  fmt::format_to(out, "This is a multi-part message in MIME format.\r\n");

  fmt::format_to(out, "\r\n--{}\r\n", boundary);
  hdr(message::Content_Type, "text/plain; charset=utf-8");
  auto const text_cte = text_transfer_encoding();
  hdr(message::Content_Transfer_Encoding, text_cte);
  fmt::format_to(out, "\r\n");
  if (text_cte == "quoted-printable") {
    auto const qp = QP::enc(summary_body);
    bfr.append(qp.data(), qp.data() + qp.size());
  }
  else {
    append_crlf_lines(bfr, summary_body);
  }

  fmt::format_to(out, "\r\n--{}\r\n", boundary);
  hdr(message::Content_Type, attached.content_type);
  hdr(message::Content_Disposition,
      fmt::format("inline; filename=\"{}\"", Config::attachment_filename));
  hdr(message::Content_Transfer_Encoding, attached.transfer_encoding);
  fmt::format_to(out, "\r\n");
  bfr.append(attached.encoded.data(),
             attached.encoded.data() + attached.encoded.size());

  // The CRLF before the delimiter belongs to the delimiter.
  fmt::format_to(out, "\r\n--{}--\r\n", boundary);

  return fmt::to_string(bfr);
}

std::string escape_parens(std::string_view str)
{
  std::string ret;
  ret.reserve(str.length());
  for (auto ch : str) {
    if (ch == '(' || ch == ')')
      ret += '\\';
    ret += ch;
  }
  return ret;
}

std::string sender_tag(std::optional<std::string> const& envelope_sender,
                       std::optional<std::string> const& header_sender)
{
  auto const shown = [](std::string const& addr) {
    return escape_parens(clip(addr, Config::max_sender_length));
  };
  if (envelope_sender && header_sender) {
    if (*envelope_sender == *header_sender)
      return fmt::format("evlp+hdr({})", shown(*envelope_sender));
    return fmt::format("evlp({})+hdr({})", shown(*envelope_sender),
                       shown(*header_sender));
  }
  if (envelope_sender)
    return fmt::format("evlp({})", shown(*envelope_sender));
  if (header_sender)
    return fmt::format("hdr({})", shown(*header_sender));
  return "(unknown sender)";
}

std::optional<std::string> header_sender(message::parsed const& msg)
{
  auto const froms = msg.get_all(message::From);
  if (froms.size() != 1) {
    if (froms.size() > 1)
      LOG(INFO) << "multiple From headers, ignoring them";
    return {};
  }
  auto addr = message::from_address(froms[0]);
  if (addr && !is_valid_utf8(*addr))
    return esc(*addr);
  return addr;
}

std::string summary(message::parsed const& msg)
{
  auto const subjects = msg.get_all(message::Subject);
  if (subjects.empty())
    return "(no subject)";
  if (subjects.size() > 1)
    return "(multiple Subject headers)";

  auto decoded = message::decode_encoded_words(message::unfold(subjects[0]));
  std::replace(begin(decoded), end(decoded), '\t', ' ');
  auto const subj = esc(decoded);
  if (subj.empty())
    return "(no subject)";

  return clip(subj, Config::max_summary_length);
}

std::string encode_header_value(std::string_view            value,
                                std::string_view::size_type used)
{
  if (is_printable_ascii(value)) {
    if (used + value.length() <= max_header_line)
      return std::string(value);
    if (auto folded = fold(value, used))
      return *folded;
  }

  fmt::memory_buffer bfr;
  while (!value.empty()) {
    auto const chunk = utf8_prefix(value, encoded_word_octets);
    if (bfr.size())
      bfr.append(std::string_view("\r\n "));
    fmt::format_to(std::back_inserter(bfr), "=?UTF-8?B?{}?=",
                   Base64::enc(chunk));
    value.remove_prefix(chunk.length());
  }
  return fmt::to_string(bfr);
}

outbound build(std::string_view              raw,
               message::parsed const&        msg,
               Envelope const&               env,
               RelayConfig const&            cfg,
               osutil::local_identity const& id)
{
  outbound ob;

  ob.envelope_from = cfg.sender_email;
  ob.envelope_to   = cfg.recipient_email;
  ob.header_from   = cfg.sender_email;
  ob.header_to     = cfg.recipient_email;

  auto const host = id.hostname.empty()
                        ? std::string("(unknown host)")
                        : clip(esc(id.hostname), Config::max_sender_length);
  ob.subject = fmt::format("{}@{}: {}",
                           sender_tag(env.sender(), header_sender(msg)), host,
                           summary(msg));

  ob.attached     = make_attachment(raw);
  ob.summary_body = summary_body(raw, msg, env, cfg, id, ob.attached);
  ob.boundary     = Stamp::boundary(raw);

  Mailbox     mbx;
  std::string err;
  auto const  domain = Mailbox::validate(cfg.sender_email, err, mbx)
                          ? mbx.domain()
                          : id.hostname;
  Stamp const stamp;
  ob.message_id = stamp.message_id(domain);
  ob.date       = stamp.date();

  LOG(INFO) << "wrapper subject: " << ob.subject;

  return ob;
}

} // namespace Wrapper
