#include "Wrapper.hpp"

#include "Envelope.hpp"
#include "RelayConfig.hpp"
#include "osutil.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
RelayConfig test_config()
{
  auto cfg = RelayConfig::parse(R"(
sender_email = "box@example.com"
recipient_email = "ops@example.org"
smtp_host = "smtp.example.com"
smtp_username = "box@example.com"
smtp_password = "secret"
)",
                                "test.toml");
  cfg.path             = "/etc/forward-as-attachment-mta.config.toml";
  cfg.file_permissions = RelayConfig::permissions::ok;
  return cfg;
}

osutil::local_identity test_identity()
{
  osutil::local_identity id;
  id.hostname             = "box";
  id.os_name              = "Linux";
  id.os_release           = "6.1.0";
  id.machine              = "x86_64";
  id.uid                  = 1000;
  id.gid                  = 1000;
  id.euid                 = 0;
  id.egid                 = 0;
  id.user_name            = "cron";
  id.group_name           = "cron";
  id.effective_user_name  = "root";
  id.effective_group_name = "root";
  return id;
}

bool contains(std::string const& haystack, std::string const& needle)
{
  return haystack.find(needle) != std::string::npos;
}

Wrapper::outbound wrap(std::string const&              raw,
                       std::vector<std::string> const& args,
                       RelayConfig const& cfg = test_config())
{
  message::parsed msg;
  msg.parse(raw);
  auto const env = Envelope::parse(args);
  return Wrapper::build(raw, msg, env, cfg, test_identity());
}

// RFC 5322 section 2.1.1 limits every line, folded headers too. The
// attachment keeps the original line endings until DATA.
std::string::size_type longest_line(std::string const& eml)
{
  std::string::size_type longest = 0;
  std::string::size_type pos     = 0;
  for (;;) {
    auto const eol = eml.find('\n', pos);
    auto       len = (eol == std::string::npos ? eml.size() : eol) - pos;
    if (len && eml[pos + len - 1] == '\r')
      --len;
    longest = std::max(longest, len);
    if (eol == std::string::npos)
      return longest;
    pos = eol + 1;
  }
}

void check_fixed_addresses(Wrapper::outbound const& ob)
{
  CHECK_EQ(ob.envelope_from, "box@example.com");
  CHECK_EQ(ob.envelope_to, "ops@example.org");
  CHECK_EQ(ob.header_from, "box@example.com");
  CHECK_EQ(ob.header_to, "ops@example.org");

  auto const eml = ob.serialized();
  CHECK(contains(eml, "\r\nFrom: box@example.com\r\n"));
  CHECK(contains(eml, "\r\nTo: ops@example.org\r\n"));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    // What cron sends.
    auto const raw = "From: cron@host\nSubject: job failed\n\nexit 1"s;
    auto const ob  = wrap(raw, {"sendmail", "-i", "root"});
    check_fixed_addresses(ob);

    CHECK_EQ(ob.subject, "hdr(cron@host)@box: job failed");
    CHECK_EQ(ob.attached.content_type, "message/rfc822");
    CHECK_EQ(ob.attached.transfer_encoding, "7bit");
    CHECK_EQ(ob.attached.decoded(), raw);
    CHECK(!ob.eight_bit());

    CHECK(contains(ob.summary_body, "host \"box\""));
    CHECK(contains(ob.summary_body, "attached inline"));
    CHECK(contains(ob.summary_body, "Invocation args: sendmail -i root\n"));
    CHECK(contains(ob.summary_body, "Original recipients: root\n"));
    CHECK(!contains(ob.summary_body, "full name"));
    CHECK(contains(ob.summary_body, "uid:1000 gid:1000 euid:0 egid:0\n"));
    CHECK(contains(ob.summary_body, "effective username: root\n"));
    CHECK(!contains(ob.summary_body, "WARNING"));

    auto const eml = ob.serialized();
    CHECK(contains(eml, "\r\nSubject: hdr(cron@host)@box: job failed\r\n"));
    CHECK(contains(eml, "\r\nMIME-Version: 1.0\r\n"));
    CHECK(contains(eml, "\r\nAuto-Submitted: auto-generated\r\n"));
    CHECK(contains(eml, "Content-Disposition: inline; filename=\"stdin.eml\""));
    CHECK(contains(eml, "\r\n\r\n" + raw + "\r\n--" + ob.boundary + "--\r\n"));
    CHECK_EQ(eml.find("Message-ID: <"), 0u);
    CHECK(contains(ob.message_id, "@example.com>"));
  }

  {
    auto const ob = wrap("From: root@box\nSubject: x\n\n",
                         {"sendmail", "-f", "root@box", "ops"});
    CHECK_EQ(ob.subject, "evlp+hdr(root@box)@box: x");
  }

  {
    auto const ob = wrap("From: Cron Daemon <root@box>\n\n",
                         {"sendmail", "-fcron(job)@box", "ops"});
    CHECK_EQ(ob.subject,
             "evlp(cron\\(job\\)@box)+hdr(root@box)@box: (no subject)");
  }

  CHECK_EQ(Wrapper::sender_tag({}, {}), "(unknown sender)");
  CHECK_EQ(Wrapper::sender_tag("a@b"s, {}), "evlp(a@b)");
  CHECK_EQ(Wrapper::escape_parens("foo(bar)"), "foo\\(bar\\)");

  {
    // Empty input still makes a complete message.
    auto const ob = wrap("", {"sendmail", "-t"});
    check_fixed_addresses(ob);
    CHECK_EQ(ob.subject, "(unknown sender)@box: (no subject)");
    CHECK_EQ(ob.attached.decoded(), "");
    CHECK(contains(ob.summary_body, "Original recipients (from headers): (none)"));
  }

  {
    auto const raw = "To: a@example.com, B <b@example.com>\n"
                     "Cc: c@example.com\n"
                     "Subject: one\n"
                     "Subject: two\n"
                     "\n"
                     "body\n"s;
    auto const ob  = wrap(raw, {"sendmail", "-t"});
    CHECK_EQ(ob.subject, "(unknown sender)@box: (multiple Subject headers)");
    CHECK(contains(ob.summary_body,
                   "Original recipients (from headers): a@example.com, "
                   "b@example.com, c@example.com\n"));
    CHECK_EQ(ob.attached.decoded(), raw);
  }

  {
    // Not a header; everything is still attached.
    auto const raw = "From: a@example.com\nnot a header\nSubject: hidden\n"s;
    auto const ob  = wrap(raw, {"sendmail", "root"});
    CHECK_EQ(ob.subject, "hdr(a@example.com)@box: (no subject)");
    CHECK(contains(ob.summary_body, "could not be parsed"));
    CHECK_EQ(ob.attached.decoded(), raw);
  }

  {
    // Two From headers are ambiguous.
    auto const ob = wrap("From: a@example.com\nFrom: b@example.com\n\n",
                         {"sendmail", "root"});
    CHECK_EQ(ob.subject, "(unknown sender)@box: (no subject)");
  }

  {
    auto const raw = "Subject: =?UTF-8?Q?caf=C3=A9?= ok\n\ncaf\xc3\xa9\n"s;
    auto const ob  = wrap(raw, {"sendmail", "root"});
    CHECK_EQ(ob.subject, "(unknown sender)@box: caf\xc3\xa9 ok");
    CHECK_EQ(ob.attached.transfer_encoding, "8bit");
    CHECK(ob.eight_bit());
    auto const eml = ob.serialized();
    CHECK(contains(eml, "\r\nSubject: =?UTF-8?B?"));
    CHECK(!contains(eml, "Subject: (unknown"));
  }

  {
    auto const ob = wrap("Subject: " + std::string(500, 'x') + "\n\n",
                         {"sendmail", "root"});
    CHECK_EQ(ob.subject, "(unknown sender)@box: "
                             + std::string(Config::max_summary_length, 'x')
                             + "...");
  }

  {
    // Binary input can't be message/rfc822.
    auto const raw = "Subject: nul\n\n\0\r\x01\xff"s;
    auto const ob  = wrap(raw, {"sendmail", "root"});
    CHECK_EQ(ob.attached.content_type, "application/octet-stream");
    CHECK_EQ(ob.attached.transfer_encoding, "base64");
    CHECK_EQ(ob.attached.decoded(), raw);
    CHECK(contains(ob.serialized(),
                   "Content-Disposition: inline; filename=\"stdin.eml\""));
  }

  {
    auto cfg             = test_config();
    cfg.file_permissions = RelayConfig::permissions::too_open;
    auto const ob        = wrap("\n", {"sendmail", "root"}, cfg);
    check_fixed_addresses(ob);
    CHECK(contains(ob.summary_body, "WARNING: the config file"));
  }

  {
    auto const ob = wrap("Subject: x\n\nbody\n", {"sendmail", "root"});
    CHECK(!contains("Subject: x\n\nbody\n", ob.boundary));
    CHECK(contains(ob.serialized(),
                   "Content-Type: multipart/mixed; boundary=\"" + ob.boundary
                       + "\""));
  }

  {
    // A long envelope sender is shortened in the subject, and the summary
    // that repeats it is sent quoted-printable.
    auto const sender = std::string(2000, 'a') + "@example.com";
    auto const ob     = wrap("From: cron@host\nSubject: job failed\n\nexit 1\n",
                         {"sendmail", "-f", sender, "root"});
    check_fixed_addresses(ob);
    CHECK_EQ(ob.subject, "evlp(" + std::string(Config::max_sender_length, 'a')
                             + "...)+hdr(cron@host)@box: job failed");
    CHECK_EQ(ob.text_transfer_encoding(), "quoted-printable");
    CHECK(contains(ob.summary_body, sender));

    auto const eml = ob.serialized();
    CHECK_LE(longest_line(eml), 998u);
    CHECK(contains(eml, "Content-Type: text/plain; charset=utf-8\r\n"
                        "Content-Transfer-Encoding: quoted-printable\r\n"));
    CHECK(contains(eml, "Invocation args: sendmail -f aaa"));
    CHECK(!contains(eml, std::string(100, 'a')));
  }

  {
    auto const ob = wrap("Subject: x\n\n", {"sendmail", "-F", "Cron Daemon",
                                             "-f", "root@box", "root"});
    CHECK(contains(ob.summary_body, "Original sender full name: Cron Daemon\n"));
    CHECK(contains(ob.summary_body, "Original envelope sender: root@box\n"));
  }

  {
    // A huge From value is not an address, and the alert still goes out.
    auto const raw
        = "From: " + std::string(100 * 1024, 'x') + "\nSubject: x\n\nbody\n";
    auto const ob = wrap(raw, {"sendmail", "root"});
    check_fixed_addresses(ob);
    CHECK_EQ(ob.subject, "(unknown sender)@box: x");
    CHECK_EQ(ob.attached.transfer_encoding, "base64");
    CHECK_EQ(ob.attached.decoded(), raw);
    CHECK_LE(longest_line(ob.serialized()), 998u);
  }

  {
    // Nor is one made of nested comments.
    auto const raw
        = "From: " + std::string(100 * 1024, '(') + "a@example.com\n\n";
    auto const ob = wrap(raw, {"sendmail", "root"});
    CHECK_EQ(ob.subject, "(unknown sender)@box: (no subject)");
  }

  {
    // Long recipient lists in -t mode.
    std::string to = "To: ";
    for (auto i = 0; i < 100; ++i)
      to += fmt::format("{}user{}@example.com", i ? ",\n " : "", i);
    auto const ob = wrap(to + "\nSubject: x\n\n", {"sendmail", "-t"});
    CHECK(contains(ob.summary_body, "user99@example.com\n"));
    CHECK_EQ(ob.text_transfer_encoding(), "quoted-printable");
    CHECK(!ob.eight_bit());
    CHECK_LE(longest_line(ob.serialized()), 998u);
  }

  {
    // A long ASCII subject is folded at spaces.
    std::string words;
    for (auto i = 0; i < 20; ++i)
      words += " word";
    auto const ob  = wrap("Subject:" + words + "\n\n", {"sendmail", "root"});
    auto const eml = ob.serialized();
    CHECK(contains(eml, "\r\nSubject: (unknown sender)@box: word word"));
    CHECK(contains(eml, "\r\n word"));
    CHECK_LE(longest_line(eml.substr(0, eml.find("\r\n\r\n"))), 78u);
    CHECK_EQ(ob.text_transfer_encoding(), "7bit");
  }

  CHECK_EQ(Wrapper::encode_header_value("plain"), "plain");
  CHECK_EQ(Wrapper::encode_header_value("caf\xc3\xa9"), "=?UTF-8?B?Y2Fmw6k=?=");
  auto const long_utf8 = std::string(50, 'a') + "\xc3\xa9";
  CHECK_EQ(Wrapper::encode_header_value(long_utf8).find("\r\n =?UTF-8?B?"),
           68u);

  auto const folded = Wrapper::encode_header_value(
      "one two three four five six seven eight nine ten eleven twelve "
      "thirteen");
  CHECK_EQ(folded.find("\r\n "), 62u);
  CHECK(!contains(folded, "=?"));

  // No room for one long word, so it is encoded instead.
  auto const word = std::string(100, 'w');
  CHECK_EQ(Wrapper::encode_header_value(word).find("=?UTF-8?B?"), 0u);
}
