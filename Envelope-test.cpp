#include "Envelope.hpp"

#include "Error.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

static bool usage_error(std::vector<std::string> const& args)
{
  try {
    Envelope::parse(args);
  }
  catch (faamta_error const& e) {
    LOG(INFO) << e.what();
    return e.kind() == error_kind::usage;
  }
  return false;
}

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    // What cron does.
    auto const env = Envelope::parse({"/usr/sbin/sendmail", "-FCronDaemon",
                                      "-i", "-B8BITMIME", "-oem", "root"});
    CHECK(env.op_mode() == Envelope::mode::deliver);
    CHECK(env.rcpt_source() == Envelope::recipient_source::arguments);
    CHECK_EQ(env.recipients().size(), 1u);
    CHECK_EQ(env.recipients()[0], "root");
    CHECK_EQ(*env.full_name(), "CronDaemon");
    CHECK(env.ignore_dots());
    CHECK(!env.sender());
    CHECK(env.all_utf8());
  }

  {
    auto const env
        = Envelope::parse({"sendmail", "-t", "-oi", "-f", "smartd@host"});
    CHECK(env.rcpt_source() == Envelope::recipient_source::headers);
    CHECK(env.recipients().empty());
    CHECK(env.ignore_dots());
    CHECK_EQ(*env.sender(), "smartd@host");
  }

  {
    auto const env = Envelope::parse({"sendmail", "-rbounce@host", "a@b"});
    CHECK_EQ(*env.sender(), "bounce@host");
    CHECK_EQ(env.recipients()[0], "a@b");
  }

  {
    // Two senders are ambiguous.
    auto const env
        = Envelope::parse({"sendmail", "-fone@host", "-f", "two@host", "x"});
    CHECK(!env.sender());
    CHECK_EQ(env.recipients().size(), 1u);
  }

  {
    // Unknown flags are accepted and ignored.
    auto const env = Envelope::parse(
        {"sendmail", "-v", "-Am", "-U", "--long", "-h", "17", "-N", "never",
         "user@example.com", "other@example.com"});
    CHECK_EQ(env.recipients().size(), 2u);
    CHECK_EQ(env.ignored().size(), 6u);
  }

  {
    auto const env = Envelope::parse({"sendmail", "--", "-t", "-x"});
    CHECK(env.rcpt_source() == Envelope::recipient_source::arguments);
    CHECK_EQ(env.recipients().size(), 2u);
    CHECK_EQ(env.recipients()[0], "-t");
  }

  {
    auto const env = Envelope::parse({"sendmail", "-f", "\xff@host", "root"});
    CHECK(!env.all_utf8());
    CHECK(!env.sender());
    CHECK_EQ(env.invocation(), "sendmail -f \\xff@host root");
  }

  CHECK_EQ(Envelope::parse({"sendmail", "-F", "Cron Daemon", "root"})
               .invocation(),
           "sendmail -F \"Cron Daemon\" root");

  CHECK(Envelope::parse({"mailq", "-bp"}).op_mode()
        == Envelope::mode::print_queue);
  CHECK(Envelope::parse({"sendmail", "-q30m"}).op_mode()
        == Envelope::mode::queue_run);
  CHECK(Envelope::parse({"sendmail", "-bm", "root"}).op_mode()
        == Envelope::mode::deliver);

  CHECK(Envelope::parse({"newaliases", "-bi"}).op_mode()
        == Envelope::mode::init_aliases);

  // Modes with no meaning here are ignored, the message is still sent.
  {
    auto const env = Envelope::parse({"sendmail", "-bv", "-bt", "root"});
    CHECK(env.op_mode() == Envelope::mode::deliver);
    CHECK_EQ(env.ignored().size(), 2u);
    CHECK_EQ(env.ignored()[0], "-bv");
    CHECK_EQ(env.recipients().size(), 1u);
  }

  CHECK(Envelope::parse({"sendmail"}).recipients().empty());

  CHECK(usage_error({"sendmail", "-f"}));
  CHECK(usage_error({"sendmail", "root", "-F"}));
  CHECK(usage_error({"sendmail", "-h"}));
  CHECK(usage_error({"sendmail", "-bs"}));
  CHECK(usage_error({"sendmail", "-bd"}));
  CHECK(usage_error({"sendmail", "-bD"}));
  CHECK(usage_error({"sendmail", "-b"}));
}
