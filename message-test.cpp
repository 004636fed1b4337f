#include "message.hpp"

#include <string>
#include <variant>

#include <glog/logging.h>

using namespace std::string_literals;

static void check_round_trip(std::string const& input)
{
  message::parsed msg;
  msg.parse(input);
  CHECK_EQ(msg.as_string(), input);
}

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    auto const input = "From: cron@host\nSubject: job failed\n\nexit 1"s;

    message::parsed msg;
    msg.parse(input);

    CHECK_EQ(msg.fields.size(), 2u);
    CHECK(!msg.has_opaque());
    CHECK_EQ(msg.separator, "\n");
    CHECK_EQ(msg.body, "exit 1");

    auto const subjects = msg.get_all("subject");
    CHECK_EQ(subjects.size(), 1u);
    CHECK_EQ(subjects[0], " job failed");

    auto const& from = std::get<message::header>(msg.fields[0]);
    CHECK_EQ(from.name, "From");
    CHECK_EQ(from.raw, "From: cron@host\n");

    CHECK_EQ(msg.as_string(), input);

    // Parsing is a pure function of the input.
    message::parsed again;
    again.parse(input);
    CHECK_EQ(again.as_string(), msg.as_string());
    CHECK_EQ(again.fields.size(), msg.fields.size());
    CHECK_EQ(again.body, msg.body);
  }

  {
    // Folded values keep their line breaks, CRLF is fine.
    auto const input
        = "Subject: a long\r\n subject line\r\nTo: root\r\n\r\nbody\r\n"s;

    message::parsed msg;
    msg.parse(input);
    auto const subjects = msg.get_all(message::Subject);
    CHECK_EQ(subjects.size(), 1u);
    CHECK_EQ(subjects[0], " a long\r\n subject line");
    CHECK_EQ(message::unfold(subjects[0]), "a long subject line");
    CHECK_EQ(msg.as_string(), input);
  }

  {
    // A line that is not a header ends the header section.
    auto const input
        = "Subject: one\nthis is not a header\nSubject: two\n\nbody"s;

    message::parsed msg;
    msg.parse(input);
    CHECK_EQ(msg.fields.size(), 2u);
    CHECK(msg.has_opaque());
    auto const& op = std::get<message::opaque>(msg.fields[1]);
    CHECK_EQ(op.raw, "this is not a header\nSubject: two\n\nbody");
    CHECK_EQ(msg.get_all("Subject").size(), 1u);
    CHECK(msg.body.empty());
    CHECK_EQ(msg.as_string(), input);
  }

  {
    message::parsed msg;
    msg.parse("");
    CHECK(msg.fields.empty());
    CHECK(msg.body.empty());
    CHECK_EQ(msg.as_string(), "");
  }

  check_round_trip("\n\nbody only");
  check_round_trip("Subject: no newline at end");
  check_round_trip("Subject: x\nSubject: y\n\n");
  check_round_trip("From cron@host Mon Jan  1 00:00:00 2024\nSubject: x\n\n");
  check_round_trip("Subject: \x80\xff binary\r\n\r\n\0\0\0"s);
  check_round_trip("Subject : obsolete spacing\n\n.\n");
  check_round_trip("X-Bare-CR: a\rb\n\nbody\r");

  {
    message::parsed msg;
    msg.parse("Subject: x\nsubject: y\nSUBJECT: z\n\n");
    CHECK_EQ(msg.get_all("Subject").size(), 3u);
  }

  CHECK(message::classify("plain\r\ntext\n") == message::data_type::ascii);
  CHECK(message::classify("caf\xc3\xa9\n") == message::data_type::utf8);
  CHECK(message::classify("nul\0byte"s) == message::data_type::binary);
  CHECK(message::classify("bare\rcr") == message::data_type::binary);
  CHECK(message::classify(std::string(999, 'x')) == message::data_type::binary);
  CHECK(message::classify(std::string(998, 'x')) == message::data_type::ascii);
  CHECK(message::classify("") == message::data_type::ascii);

  CHECK_EQ(*message::from_address(" cron@host"), "cron@host");
  CHECK_EQ(*message::from_address(" Cron Daemon <root@host.example>"),
           "root@host.example");
  CHECK_EQ(*message::from_address(" \"Doe, Jane\" <jane@example.com>"),
           "jane@example.com");
  CHECK_EQ(*message::from_address(" root@host (Cron Daemon)"), "root@host");
  CHECK_EQ(*message::from_address(" root (Cron Daemon)"), "root");
  CHECK(!message::from_address(" a@example.com, b@example.com"));
  CHECK(!message::from_address(" not an address"));
  CHECK(!message::from_address(""));
  CHECK(!message::from_address(" (Cron Daemon)"));

  // Hostile From values are refused, not parsed.
  CHECK(!message::from_address(std::string(100 * 1024, 'x')));
  CHECK_EQ(message::from_address(std::string(100 * 1024, 'x')
                                 + " (Cron Daemon)")
               ->size(),
           100 * 1024u);
  CHECK(!message::from_address(std::string(100 * 1024, '(') + "a@example.com"));
  {
    message::mailbox_name_addr_list deep;
    CHECK(message::mailbox_list_parse("a@example.com ((nested) comment)",
                                      deep));
    CHECK(!message::mailbox_list_parse(
        "a@example.com " + std::string(33, '(') + std::string(33, ')'),
        deep));
  }

  message::mailbox_name_addr_list lst;
  CHECK(message::mailbox_list_parse("Joe Q. Public <john.q.public@example.com>",
                                    lst));
  CHECK_EQ(lst.name_addr_list.size(), 1u);
  CHECK_EQ(lst.name_addr_list[0].name, "Joe Q. Public");
  CHECK_EQ(lst.name_addr_list[0].addr, "john.q.public@example.com");

  CHECK_EQ(message::decode_encoded_words("=?UTF-8?B?Y2Fmw6k=?="), "caf\xc3\xa9");
  CHECK_EQ(message::decode_encoded_words("=?utf-8?q?caf=C3=A9_au_lait?="),
           "caf\xc3\xa9 au lait");
  CHECK_EQ(message::decode_encoded_words("=?UTF-8?Q?a?= =?UTF-8?Q?b?= c"),
           "ab c");
  CHECK_EQ(message::decode_encoded_words("=?ISO-8859-1?Q?caf=E9?="),
           "=?ISO-8859-1?Q?caf=E9?=");
  CHECK_EQ(message::decode_encoded_words("plain =?bogus"), "plain =?bogus");
}
