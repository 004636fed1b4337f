#include "Relay.hpp"

#include "Base64.hpp"
#include "Mailbox.hpp"
#include "RelayConfig.hpp"
#include "Sock.hpp"
#include "Wrapper.hpp"
#include "esc.hpp"
#include "osutil.hpp"

#include <algorithm>
#include <cstdlib>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

#include <gflags/gflags.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

DEFINE_bool(smtps,
            false,
            "connect with TLS to the submissions port, instead of STARTTLS "
            "on the submission port");
DEFINE_string(service,
              "",
              "relay port or service name, default 587, or 465 with --smtps");

DEFINE_int32(connect_timeout, 30, "seconds to wait for a connection");
DEFINE_int32(read_timeout, 120, "seconds to wait for a reply");
DEFINE_int32(write_timeout, 120, "seconds to wait to send");
DEFINE_int32(starttls_timeout, 30, "seconds to wait for the TLS handshake");

// A reply longer than this is not from an SMTP server.
DEFINE_uint64(bfr_size, 4 * 1024, "reply buffer size");

namespace RFC5321 {

struct Connection {
  Sock sock;

  std::string reply;
  std::string reply_code;
  std::string reply_text;

  std::string server_id;

  std::string                                               ehlo_keyword;
  std::vector<std::string>                                  ehlo_param;
  std::unordered_map<std::string, std::vector<std::string>> ehlo_params;

  bool ehlo_ok{false};
  bool greeted{false};

  Connection(int                       fd_in,
             int                       fd_out,
             std::chrono::milliseconds read_timeout,
             std::chrono::milliseconds write_timeout,
             std::chrono::milliseconds starttls_timeout)
    : sock(fd_in, fd_out, read_timeout, write_timeout, starttls_timeout)
  {
  }

  bool has_extension(char const* keyword) const
  {
    return ehlo_params.find(keyword) != end(ehlo_params);
  }

  bool has_param(char const* keyword, char const* param) const
  {
    auto const ext = ehlo_params.find(keyword);
    return ext != end(ehlo_params)
           && std::find(begin(ext->second), end(ext->second), param)
                  != end(ext->second);
  }
};

// clang-format off

using dot = one<'.'>;
using dash = one<'-'>;

struct let_dig : sor<ALPHA, DIGIT> {};

struct ldh_tail : star<sor<seq<plus<one<'-'>>, let_dig>, let_dig>> {};

struct ldh_str : seq<let_dig, ldh_tail> {};

struct sub_domain : ldh_str {};

struct domain : list<sub_domain, dot> {};

struct dcontent : ranges<33, 90, 94, 126> {};

struct address_literal : seq<one<'['>, plus<dcontent>, one<']'>> {};

struct server_id : sor<domain, address_literal> {};

// textstring     = 1*(%d09 / %d32-126) ; HT, SP, Printable US-ASCII

struct textstring : plus<sor<one<9>, range<32, 126>>> {};

// Reply-code     = %x32-35 %x30-35 %x30-39

struct reply_code
: seq<range<0x32, 0x35>, range<0x30, 0x35>, range<0x30, 0x39>> {};

// Reply-line     = *( Reply-code "-" [ textstring ] CRLF )
//                     Reply-code  [ SP textstring ] CRLF

struct reply_lines
: seq<star<seq<reply_code, one<'-'>, opt<textstring>, CRLF>>,
           seq<reply_code, opt<seq<SP, textstring>>, CRLF>> {};

// ehlo-greet     = 1*(%d0-9 / %d11-12 / %d14-127)

struct ehlo_greet : plus<ranges<0, 9, 11, 12, 14, 127>> {};

// ehlo-keyword   = (ALPHA / DIGIT) *(ALPHA / DIGIT / "-")

struct ehlo_keyword : seq<sor<ALPHA, DIGIT>, star<sor<ALPHA, DIGIT, dash, dot>>> {};

// ehlo-param     = 1*(%d33-126)

struct ehlo_param : plus<range<33, 126>> {};

// Postfix and others still send "AUTH=PLAIN LOGIN".

struct ehlo_line
: seq<ehlo_keyword, star<seq<sor<SP, one<'='>>, ehlo_param>>> {};

// ehlo-ok-rsp    = ( "250 " Domain [ SP ehlo-greet ] CRLF )
//                  /
//                  ( "250-" Domain [ SP ehlo-greet ] CRLF
//                 *( "250-" ehlo-line CRLF )
//                    "250 " ehlo-line CRLF )

struct ehlo_ok_rsp
: sor<seq<TAO_PEGTL_ISTRING("250 "), opt<server_id>, opt<ehlo_greet>, CRLF>,

      seq<TAO_PEGTL_ISTRING("250-"), opt<server_id>, opt<ehlo_greet>, CRLF,
 star<seq<TAO_PEGTL_ISTRING("250-"), ehlo_line, CRLF>>,
      seq<TAO_PEGTL_ISTRING("250 "), opt<ehlo_line>, CRLF>>
      > {};

struct ehlo_rsp
  : sor<ehlo_ok_rsp, reply_lines> {};

// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<server_id> {
  template <typename Input>
  static void apply(Input const& in, Connection& cnn)
  {
    cnn.server_id = in.string();
  }
};

template <>
struct action<ehlo_ok_rsp> {
  template <typename Input>
  static void apply(Input const& in, Connection& cnn)
  {
    cnn.ehlo_ok = true;
  }
};

template <>
struct action<ehlo_keyword> {
  template <typename Input>
  static void apply(Input const& in, Connection& cnn)
  {
    cnn.ehlo_keyword = in.string();
  }
};

template <>
struct action<ehlo_param> {
  template <typename Input>
  static void apply(Input const& in, Connection& cnn)
  {
    cnn.ehlo_param.push_back(in.string());
    boost::to_upper(cnn.ehlo_param.back());
  }
};

template <>
struct action<ehlo_line> {
  template <typename Input>
  static void apply(Input const& in, Connection& cnn)
  {
    boost::to_upper(cnn.ehlo_keyword);
    cnn.ehlo_params[cnn.ehlo_keyword] = std::move(cnn.ehlo_param);
    cnn.ehlo_keyword.clear();
    cnn.ehlo_param.clear();
  }
};
} // namespace RFC5321

namespace {

using RFC5321::Connection;

class session_failure : public faamta_error {
public:
  session_failure(error_kind kind, std::string const& what, bool with_reply)
    : faamta_error(kind, what)
    , with_reply_(with_reply)
  {
  }

  // The last reply from the relay is the reason.
  bool with_reply() const { return with_reply_; }

private:
  bool with_reply_;
};

[[noreturn]] void fail(error_kind kind, std::string const& msg)
{
  throw session_failure(kind, msg, false);
}

[[noreturn]] void fail_reply(error_kind         kind,
                             Connection const&  cnn,
                             std::string const& msg)
{
  throw session_failure(
      kind, fmt::format("{}: {} {}", msg, cnn.reply_code, cnn.reply_text),
      true);
}

void write_line(Connection& cnn, std::string_view cmd)
{
  cnn.sock.out() << cmd << "\r\n" << std::flush;
  if (!cnn.sock.out().good()) {
    fail(error_kind::transport,
         cnn.sock.timed_out() ? "timed out sending to relay"
                              : "write to relay failed");
  }
}

void command(Connection& cnn, std::string_view cmd)
{
  LOG(INFO) << "C: " << cmd;
  write_line(cnn, cmd);
}

// Read lines up to the last line of a reply, then check it against Rule.
template <typename Rule>
void read_reply(Connection& cnn, char const* what)
{
  cnn.reply.clear();
  cnn.reply_code.clear();
  cnn.reply_text.clear();

  std::string line;
  for (;;) {
    if (!std::getline(cnn.sock.in(), line)) {
      fail(error_kind::transport,
           fmt::format("{} waiting for the reply to {}",
                       cnn.sock.timed_out() ? "timed out"
                                            : "connection closed",
                       what));
    }
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    LOG(INFO) << "S: " << esc(line);

    cnn.reply += line;
    cnn.reply += "\r\n";
    if (cnn.reply.size() > FLAGS_bfr_size)
      fail(error_kind::transport,
           fmt::format("reply to {} is too long", what));

    if (line.size() > 4) {
      if (!cnn.reply_text.empty())
        cnn.reply_text += ' ';
      cnn.reply_text += line.substr(4);
    }
    if (line.size() < 4 || line[3] != '-') {
      cnn.reply_code = line.substr(0, 3);
      break;
    }
  }

  memory_input<> in(cnn.reply, what);
  if (!tao::pegtl::parse<seq<Rule, eof>, RFC5321::action>(in, cnn)) {
    fail(error_kind::transport,
         fmt::format("garbled reply to {}: {}", what, esc(cnn.reply)));
  }
}

void starttls(Connection& cnn, std::string const& server_name)
{
  // Anything already read would be taken as coming over TLS, RFC 3207
  // section 6.
  if (cnn.sock.in().rdbuf()->in_avail() > 0) {
    fail(error_kind::transport,
         fmt::format("{} sent unprotected data before the TLS handshake",
                     server_name));
  }

  cnn.sock.out() << std::flush;
  std::string err;
  if (!cnn.sock.starttls_client(server_name.c_str(), err)) {
    fail(error_kind::transport,
         fmt::format("TLS negotiation with {} failed: {}", server_name, err));
  }
  LOG(INFO) << "TLS: " << cnn.sock.tls_info();
}

void ehlo(Connection& cnn, std::string const& client_id)
{
  cnn.ehlo_ok = false;
  cnn.ehlo_keyword.clear();
  cnn.ehlo_param.clear();
  cnn.ehlo_params.clear();

  command(cnn, fmt::format("EHLO {}", client_id));
  read_reply<RFC5321::ehlo_rsp>(cnn, "EHLO");
  if (!cnn.ehlo_ok || cnn.reply_code != "250")
    fail_reply(error_kind::relay_rejected, cnn, "relay refused EHLO");
}

void auth(Connection& cnn, RelayConfig const& cfg)
{
  // Prefer the PLAIN mechanism.
  if (cnn.has_param("AUTH", "PLAIN")) {
    std::string tok;
    tok.reserve(cfg.smtp_username.length() + cfg.smtp_password.length() + 2);
    tok += '\0';
    tok += cfg.smtp_username;
    tok += '\0';
    tok += cfg.smtp_password;

    LOG(INFO) << "C: AUTH PLAIN";
    {
      Sock::redacted quiet(cnn.sock);
      write_line(cnn, fmt::format("AUTH PLAIN {}", Base64::enc(tok)));
    }
    read_reply<RFC5321::reply_lines>(cnn, "AUTH PLAIN");
  }
  // The LOGIN SASL mechanism is obsolete.
  else if (cnn.has_param("AUTH", "LOGIN")) {
    command(cnn, "AUTH LOGIN");
    read_reply<RFC5321::reply_lines>(cnn, "AUTH LOGIN");
    if (cnn.reply_code != "334")
      fail_reply(error_kind::auth, cnn, "relay refused AUTH LOGIN");

    Sock::redacted quiet(cnn.sock);
    LOG(INFO) << "C: (username)";
    write_line(cnn, Base64::enc(cfg.smtp_username));
    read_reply<RFC5321::reply_lines>(cnn, "AUTH LOGIN username");
    if (cnn.reply_code != "334")
      fail_reply(error_kind::auth, cnn, "relay refused the username");
    LOG(INFO) << "C: (password)";
    write_line(cnn, Base64::enc(cfg.smtp_password));
    read_reply<RFC5321::reply_lines>(cnn, "AUTH LOGIN password");
  }
  else {
    fail(error_kind::auth,
         cnn.has_extension("AUTH")
             ? "relay offers neither AUTH PLAIN nor AUTH LOGIN"
             : "relay does not offer AUTH");
  }

  if (cnn.reply_code != "235")
    fail_reply(error_kind::auth, cnn, "relay rejected the credentials");
}

// Lines end in CRLF, a leading dot is doubled, RFC 5321 section 4.5.2.
void send_data(Connection& cnn, std::string_view data)
{
  auto& out = cnn.sock.out();
  while (!data.empty()) {
    auto const eol  = data.find('\n');
    auto       line = data.substr(0, eol);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (!line.empty() && line.front() == '.')
      out << '.';
    out << line << "\r\n";
    if (!out.good())
      fail(error_kind::transport, "write to relay failed during DATA");
    if (eol == std::string_view::npos)
      break;
    data.remove_prefix(eol + 1);
  }
  LOG(INFO) << "C: .";
  write_line(cnn, ".");
}

void submit(Connection&              cnn,
            RelayConfig const&       cfg,
            std::string const&       client_id,
            Relay::tls_mode          mode,
            Wrapper::outbound const& msg,
            Relay::state&            st)
{
  if (mode == Relay::tls_mode::implicit) {
    st = Relay::state::tls_handshake;
    starttls(cnn, cfg.smtp_host);
  }

  read_reply<RFC5321::reply_lines>(cnn, "greeting");
  cnn.greeted = true;
  if (cnn.reply_code != "220")
    fail_reply(error_kind::relay_rejected, cnn, "relay refused the session");

  ehlo(cnn, client_id);
  if (!cnn.server_id.empty())
    LOG(INFO) << "relay identifies as " << cnn.server_id;

  if (mode == Relay::tls_mode::starttls) {
    if (!cnn.has_extension("STARTTLS"))
      fail(error_kind::transport, "relay does not offer STARTTLS");
    command(cnn, "STARTTLS");
    read_reply<RFC5321::reply_lines>(cnn, "STARTTLS");
    if (cnn.reply_code != "220")
      fail_reply(error_kind::transport, cnn, "relay refused STARTTLS");

    st = Relay::state::tls_handshake;
    starttls(cnn, cfg.smtp_host);
    ehlo(cnn, client_id);
  }

  st = Relay::state::authenticating;
  auth(cnn, cfg);

  st = Relay::state::sending_envelope;

  auto const data = msg.serialized();

  std::string params;
  if (cnn.has_extension("8BITMIME")) {
    params += " BODY=8BITMIME";
  }
  else if (msg.eight_bit()) {
    LOG(WARNING) << "relay does not offer 8BITMIME, sending 8bit data anyway";
  }
  if (cnn.has_extension("SIZE")) {
    auto const& size_params = cnn.ehlo_params["SIZE"];
    if (!size_params.empty()) {
      char*      ep  = nullptr;
      auto const max = strtoull(size_params[0].c_str(), &ep, 10);
      if (ep && *ep != '\0') {
        LOG(WARNING) << "garbage in SIZE argument: " << size_params[0];
      }
      else if (max && data.size() > max) {
        fail(error_kind::relay_rejected,
             fmt::format("message size {} exceeds the relay's limit of {}",
                         data.size(), max));
      }
    }
    params += fmt::format(" SIZE={}", data.size());
  }

  command(cnn, fmt::format("MAIL FROM:<{}>{}", msg.envelope_from, params));
  read_reply<RFC5321::reply_lines>(cnn, "MAIL FROM");
  if (cnn.reply_code[0] != '2')
    fail_reply(error_kind::relay_rejected, cnn, "relay rejected MAIL FROM");

  command(cnn, fmt::format("RCPT TO:<{}>", msg.envelope_to));
  read_reply<RFC5321::reply_lines>(cnn, "RCPT TO");
  if (cnn.reply_code[0] != '2')
    fail_reply(error_kind::relay_rejected, cnn, "relay rejected RCPT TO");

  st = Relay::state::sending_data;

  command(cnn, "DATA");
  read_reply<RFC5321::reply_lines>(cnn, "DATA");
  if (cnn.reply_code != "354")
    fail_reply(error_kind::relay_rejected, cnn, "relay refused DATA");

  send_data(cnn, data);
  read_reply<RFC5321::reply_lines>(cnn, "end of data");
  if (cnn.reply_code[0] != '2')
    fail_reply(error_kind::relay_rejected, cnn, "relay rejected the message");

  st = Relay::state::completed;
}

// Best effort, the outcome is already decided.
void quit(Connection& cnn)
{
  try {
    command(cnn, "QUIT");
    read_reply<RFC5321::reply_lines>(cnn, "QUIT");
  }
  catch (session_failure const& f) {
    LOG(INFO) << "QUIT: " << f.what();
  }
}
} // namespace

char const* to_string(Relay::state st)
{
  switch (st) {
  case Relay::state::connecting: return "connecting";
  case Relay::state::tls_handshake: return "tls_handshake";
  case Relay::state::authenticating: return "authenticating";
  case Relay::state::sending_envelope: return "sending_envelope";
  case Relay::state::sending_data: return "sending_data";
  case Relay::state::completed: return "completed";
  case Relay::state::failed: return "failed";
  }
  return "unknown";
}

std::string Relay::client_name(std::string const& hostname,
                               RelayConfig const& cfg)
{
  if (hostname.find('.') != std::string::npos)
    return hostname;

  Mailbox     mbx;
  std::string err;
  if (Mailbox::validate(cfg.sender_email, err, mbx)) {
    LOG(INFO) << "host name " << esc(hostname) << " is not qualified, using "
              << mbx.domain();
    return mbx.domain();
  }
  return hostname.empty() ? std::string("localhost") : hostname;
}

Relay::Relay(RelayConfig const& cfg, std::string client_id)
  : Relay(cfg,
          std::move(client_id),
          FLAGS_smtps ? tls_mode::implicit : tls_mode::starttls)
{
}

Relay::Relay(RelayConfig const& cfg, std::string client_id, tls_mode mode)
  : cfg_(cfg)
  , client_id_(std::move(client_id))
  , tls_mode_(mode)
  , connect_timeout_(std::chrono::seconds(FLAGS_connect_timeout))
  , read_timeout_(std::chrono::seconds(FLAGS_read_timeout))
  , write_timeout_(std::chrono::seconds(FLAGS_write_timeout))
  , starttls_timeout_(std::chrono::seconds(FLAGS_starttls_timeout))
{
}

Relay::result Relay::deliver(Wrapper::outbound const& msg)
{
  state_ = state::connecting;

  auto const service
      = !FLAGS_service.empty()
            ? FLAGS_service
            : std::string(tls_mode_ == tls_mode::implicit
                              ? Config::submissions_service
                              : Config::submission_service);

  result res;

  auto const port = osutil::get_port(service.c_str(), "tcp");
  if (!port) {
    state_      = state::failed;
    res.error   = error_kind::transport;
    res.message = fmt::format("unknown service {}", esc(service));
    return res;
  }

  std::string err;
  auto const  fd = Sock::connect(cfg_.smtp_host.c_str(),
                                std::to_string(*port).c_str(),
                                connect_timeout_, err);
  if (fd == -1) {
    state_      = state::failed;
    res.error   = error_kind::transport;
    res.message = err;
    return res;
  }

  return deliver(msg, fd, fd);
}

Relay::result Relay::deliver(Wrapper::outbound const& msg,
                             int                      fd_in,
                             int                      fd_out)
{
  state_ = state::connecting;

  Connection cnn(fd_in, fd_out, read_timeout_, write_timeout_,
                 starttls_timeout_);
  if (cnn.sock.has_peername())
    LOG(INFO) << "connected to " << cfg_.smtp_host << " at "
              << cnn.sock.them_c_str();

  result res;
  try {
    submit(cnn, cfg_, client_id_, tls_mode_, msg, state_);
    res.reply_code = cnn.reply_code;
    res.reply_text = cnn.reply_text;
    res.message    = "message accepted";
    LOG(INFO) << "relay accepted the message: " << cnn.reply_code << ' '
              << cnn.reply_text;
    quit(cnn);
  }
  catch (session_failure const& f) {
    LOG(ERROR) << to_string(f.kind()) << " while " << to_string(state_)
               << ": " << f.what();

    state_      = state::failed;
    res.error   = f.kind();
    res.message = f.what();
    if (f.with_reply()) {
      res.reply_code = cnn.reply_code;
      res.reply_text = cnn.reply_text;
    }
    if (cnn.greeted && f.kind() != error_kind::transport)
      quit(cnn);
  }

  cnn.sock.log_totals();

  return res;
}
