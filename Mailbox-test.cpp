#include "Mailbox.hpp"

#include <stdexcept>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Mailbox mb;
  CHECK(mb.empty());
  CHECK_EQ(mb.as_string(), "");

  Mailbox ops{"ops@example.com"};
  CHECK_EQ(ops.local_part(), "ops");
  CHECK_EQ(ops.domain(), "example.com");
  CHECK_EQ(static_cast<std::string>(ops), "ops@example.com");

  ops.clear();
  CHECK(ops.empty());

  auto threw = false;
  try {
    Mailbox bad("should throw@example.com");
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  std::string msg;
  Mailbox     mbx;
  CHECK(Mailbox::validate("simple@example.com", msg, mbx));
  CHECK(Mailbox::validate("disposable.style.email.with+symbol@example.com", msg,
                          mbx));
  CHECK(Mailbox::validate("cron-daemon@host-1.example", msg, mbx));
  CHECK(Mailbox::validate("\"john..doe\"@example.org", msg, mbx));
  CHECK(Mailbox::validate("root@[192.0.2.1]", msg, mbx));
  CHECK(Mailbox::validate("root@[IPv6:2001:db8::1]", msg, mbx));
  CHECK(Mailbox::validate("user@xn--bcher-kva.example", msg, mbx));
  CHECK_EQ(mbx.domain(), "xn--bcher-kva.example");

  CHECK(!Mailbox::validate("", msg, mbx));
  CHECK_EQ(msg, "empty mailbox");

  CHECK(!Mailbox::validate("Abc.example.com", msg, mbx)); // no @
  CHECK_EQ(msg, "invalid mailbox syntax «Abc.example.com»"s);
  CHECK(mbx.empty());

  CHECK(!Mailbox::validate("A@b@c@example.com", msg, mbx));
  CHECK(!Mailbox::validate("root", msg, mbx));
  CHECK(!Mailbox::validate("a\"b(c)d,e:f;g<h>i[j\\k]l@example.com", msg, mbx));
  CHECK(!Mailbox::validate("<ops@example.com>", msg, mbx));

  auto const long_local = std::string(65, 'x') + "@example.com";
  CHECK(!Mailbox::validate(long_local, msg, mbx));
  CHECK_EQ(msg, "local part > 64 octets «" + long_local + "»");
}
