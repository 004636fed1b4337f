#include "Relay.hpp"

#include "Envelope.hpp"
#include "RelayConfig.hpp"
#include "Wrapper.hpp"
#include "osutil.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
auto constexpr ehlo_reply = "220 relay.example.com ESMTP ready\r\n"
                            "250-relay.example.com greets you\r\n"
                            "250-PIPELINING\r\n"
                            "250-SIZE 10240000\r\n"
                            "250-AUTH PLAIN LOGIN\r\n"
                            "250 8BITMIME\r\n";

struct session {
  Relay::result result;
  Relay::state  state;
  std::string   client_output;
};

// Play the server's side from a file, capture what the client says.
session run(Relay&                   relay,
            Wrapper::outbound const& msg,
            std::string const&       server_script)
{
  char in_path[]{"/tmp/Relay-test-in-XXXXXX"};
  int  fd_in;
  PCHECK((fd_in = mkstemp(in_path)) != -1);
  PCHECK(write(fd_in, server_script.data(), server_script.size())
         == static_cast<ssize_t>(server_script.size()));
  PCHECK(lseek(fd_in, 0, SEEK_SET) == 0);

  char out_path[]{"/tmp/Relay-test-out-XXXXXX"};
  int  fd_out;
  PCHECK((fd_out = mkstemp(out_path)) != -1);

  session s;
  s.result = relay.deliver(msg, fd_in, fd_out); // closes both
  s.state  = relay.current_state();

  std::ifstream out(out_path, std::ios::binary);
  s.client_output.assign(std::istreambuf_iterator<char>(out), {});

  PCHECK(unlink(in_path) == 0);
  PCHECK(unlink(out_path) == 0);

  LOG(INFO) << to_string(s.state) << ": " << s.result.message;
  return s;
}

bool contains(std::string const& haystack, std::string const& needle)
{
  return haystack.find(needle) != std::string::npos;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const cfg = RelayConfig::parse(R"(
sender_email = "box@example.com"
recipient_email = "ops@example.org"
smtp_host = "relay.example.com"
smtp_username = "box@example.com"
smtp_password = "hunter2"
)",
                                      "test.toml");

  osutil::local_identity id;
  id.hostname = "box.example.com";

  auto const raw = "From: cron@box\nSubject: job failed\n\n.hidden\nexit 1\n"s;
  message::parsed parsed;
  parsed.parse(raw);
  auto const env = Envelope::parse({"sendmail", "-i", "root"});
  auto const msg = Wrapper::build(raw, parsed, env, cfg, id);

  CHECK_EQ(Relay::client_name("box.example.com", cfg), "box.example.com");
  CHECK_EQ(Relay::client_name("box", cfg), "example.com");
  CHECK_EQ(Relay::client_name("", cfg), "example.com");

  Relay relay(cfg, "box.example.com", Relay::tls_mode::none);

  {
    // Accepted.
    auto const s = run(relay, msg,
                       ehlo_reply + "235 2.7.0 Authentication successful\r\n"s
                           + "250 2.1.0 Ok\r\n"
                           + "250 2.1.5 Ok\r\n"
                           + "354 End data with <CR><LF>.<CR><LF>\r\n"
                           + "250 2.0.0 Ok: queued as 4F2B1\r\n"
                           + "221 2.0.0 Bye\r\n");
    CHECK(s.result.ok());
    CHECK_EQ(s.result.exit_code(), EX_OK);
    CHECK_EQ(s.result.reply_code, "250");
    CHECK(s.state == Relay::state::completed);

    auto const& out = s.client_output;
    CHECK_EQ(out.find("EHLO box.example.com\r\n"), 0u);
    CHECK(contains(out, "AUTH PLAIN AGJveEBleGFtcGxlLmNvbQBodW50ZXIy\r\n"));
    CHECK(contains(out, "MAIL FROM:<box@example.com> BODY=8BITMIME SIZE="));
    CHECK(contains(out, "RCPT TO:<ops@example.org>\r\n"));
    CHECK(contains(out, "DATA\r\n"));
    CHECK(contains(out, "\r\nSubject: hdr(cron@box)@box.example.com: job "
                        "failed\r\n"));
    CHECK(contains(out, "\r\n..hidden\r\nexit 1\r\n"));
    CHECK(!contains(out, "\r\n.hidden"));
    CHECK(contains(out, "\r\n.\r\nQUIT\r\n"));
    CHECK(out.find("MAIL FROM") < out.find("RCPT TO"));
    CHECK(out.find("RCPT TO") < out.find("DATA"));
  }

  {
    // Bad credentials stop the session before the envelope.
    auto const s = run(relay, msg,
                       ehlo_reply + "535 5.7.8 auth failed\r\n"s
                           + "221 2.0.0 Bye\r\n");
    CHECK(!s.result.ok());
    CHECK(*s.result.error == error_kind::auth);
    CHECK_EQ(s.result.reply_code, "535");
    CHECK_EQ(s.result.reply_text, "5.7.8 auth failed");
    CHECK_EQ(s.result.exit_code(), EX_NOPERM);
    CHECK(s.state == Relay::state::failed);
    CHECK(!contains(s.client_output, "MAIL FROM"));
    CHECK(contains(s.client_output, "QUIT\r\n"));
  }

  {
    auto const s = run(relay, msg,
                       "220 relay.example.com\r\n"
                       "250-relay.example.com\r\n"
                       "250 AUTH LOGIN\r\n"
                       "334 VXNlcm5hbWU6\r\n"
                       "334 UGFzc3dvcmQ6\r\n"
                       "235 ok\r\n"
                       "250 ok\r\n"
                       "250 ok\r\n"
                       "354 go\r\n"
                       "250 ok\r\n"
                       "221 bye\r\n");
    CHECK(s.result.ok());
    auto const& out = s.client_output;
    CHECK(contains(out, "AUTH LOGIN\r\nYm94QGV4YW1wbGUuY29t\r\naHVudGVyMg==\r\n"));
    CHECK(contains(out, "MAIL FROM:<box@example.com>\r\n"));
  }

  {
    auto const s = run(relay, msg,
                       "220 relay.example.com\r\n"
                       "250-relay.example.com\r\n"
                       "250 AUTH CRAM-MD5\r\n"
                       "221 bye\r\n");
    CHECK(*s.result.error == error_kind::auth);
    CHECK(s.result.reply_code.empty());
    CHECK(!contains(s.client_output, "AUTH"));
  }

  {
    // Temporary rejection of the recipient.
    auto const s = run(relay, msg,
                       ehlo_reply + "235 ok\r\n"s + "250 ok\r\n"
                           + "450 4.2.1 mailbox busy\r\n" + "221 bye\r\n");
    CHECK(*s.result.error == error_kind::relay_rejected);
    CHECK(s.result.transient());
    CHECK_EQ(s.result.exit_code(), EX_TEMPFAIL);
    CHECK(!contains(s.client_output, "DATA\r\n"));
  }

  {
    // Permanent rejection of the message.
    auto const s = run(relay, msg,
                       ehlo_reply + "235 ok\r\n"s + "250 ok\r\n" + "250 ok\r\n"
                           + "354 go\r\n" + "554 5.6.0 message rejected\r\n"
                           + "221 bye\r\n");
    CHECK(*s.result.error == error_kind::relay_rejected);
    CHECK(!s.result.transient());
    CHECK_EQ(s.result.exit_code(), EX_UNAVAILABLE);
  }

  {
    // Connection dropped in the middle.
    auto const s = run(relay, msg, ehlo_reply + "235 ok\r\n"s);
    CHECK(*s.result.error == error_kind::transport);
    CHECK_EQ(s.result.exit_code(), EX_TEMPFAIL);
    CHECK(s.state == Relay::state::failed);
  }

  {
    auto const s = run(relay, msg, "this is not smtp\r\n");
    CHECK(*s.result.error == error_kind::transport);
  }

  {
    auto const s = run(relay, msg,
                       "554 5.7.1 go away\r\n"
                       "221 bye\r\n");
    CHECK(*s.result.error == error_kind::relay_rejected);
    CHECK_EQ(s.result.exit_code(), EX_UNAVAILABLE);
  }

  {
    // A relay without STARTTLS is refused.
    Relay starttls_relay(cfg, "box.example.com", Relay::tls_mode::starttls);
    auto const s = run(starttls_relay, msg, ehlo_reply + "221 bye\r\n"s);
    CHECK(*s.result.error == error_kind::transport);
    CHECK(!contains(s.client_output, "AUTH"));
  }

  {
    // Replies smuggled in after the 220 to STARTTLS are refused before
    // any handshake.
    Relay starttls_relay(cfg, "box.example.com", Relay::tls_mode::starttls);
    auto const s = run(starttls_relay, msg,
                       "220 relay.example.com\r\n"
                       "250-relay.example.com\r\n"
                       "250 STARTTLS\r\n"
                       "220 go\r\n"
                       "250 injected\r\n");
    CHECK(*s.result.error == error_kind::transport);
    CHECK(s.state == Relay::state::failed);
    CHECK(contains(s.result.message, "before the TLS handshake"));
    auto const& out = s.client_output;
    CHECK_EQ(out.substr(out.size() - 10), "STARTTLS\r\n");
  }

  {
    // Too big for the relay.
    auto const s = run(relay, msg,
                       "220 relay.example.com\r\n"
                       "250-relay.example.com\r\n"
                       "250-SIZE 100\r\n"
                       "250 AUTH PLAIN\r\n"
                       "235 ok\r\n"
                       "221 bye\r\n");
    CHECK(*s.result.error == error_kind::relay_rejected);
    CHECK(!contains(s.client_output, "MAIL FROM"));
  }
}
