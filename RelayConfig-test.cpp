#include "RelayConfig.hpp"

#include "Error.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

auto constexpr good = R"(# relay for this host
sender_email = "host-1@example.com"
recipient_email = 'ops@example.com'   # literal string
smtp_host = "smtp.example.com"

smtp_username = "host-1@example.com"
smtp_password = "päss\"word\\"
)";

static bool config_error_containing(std::string const& text,
                                    char const*        expected)
{
  try {
    RelayConfig::parse(text, "test.toml");
  }
  catch (faamta_error const& e) {
    CHECK(e.kind() == error_kind::config);
    if (std::string(e.what()).find(expected) == std::string::npos) {
      LOG(ERROR) << "unexpected message: " << e.what();
      return false;
    }
    return true;
  }
  return false;
}

static std::string write_temp(std::string const& text, mode_t mode)
{
  char path[]{"/tmp/RelayConfig-test-XXXXXX"};
  int  fd;
  PCHECK((fd = mkstemp(path)) != -1);
  PCHECK(write(fd, text.data(), text.size())
         == static_cast<ssize_t>(text.size()));
  PCHECK(fchmod(fd, mode) == 0);
  PCHECK(close(fd) == 0);
  return path;
}

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const cfg = RelayConfig::parse(good, "test.toml");
  CHECK_EQ(cfg.sender_email, "host-1@example.com");
  CHECK_EQ(cfg.recipient_email, "ops@example.com");
  CHECK_EQ(cfg.smtp_host, "smtp.example.com");
  CHECK_EQ(cfg.smtp_username, "host-1@example.com");
  CHECK_EQ(cfg.smtp_password, "p\xc3\xa4ss\"word\\");

  auto const with = [](std::string const& extra) {
    return std::string(good) + extra + "\n";
  };

  CHECK(config_error_containing(with("smtp_port = \"587\""),
                                "test.toml:8: unknown key smtp_port"));
  CHECK(config_error_containing(with("smtp_host = \"other.example.com\""),
                                "duplicate key smtp_host"));
  CHECK(config_error_containing(with("[table]"), "expected 'key"));
  CHECK(config_error_containing(with("timeout = 30"), "quoted string"));
  CHECK(config_error_containing(with("x = \"unterminated"), "unterminated"));
  CHECK(config_error_containing(with("noequals \"x\""), "expected '='"));
  CHECK(config_error_containing("sender_email = \"a@example.com\" trailing\n",
                                "expected 'key"));

  CHECK(config_error_containing("sender_email = \"a@example.com\"\n",
                                "missing or empty recipient_email"));
  CHECK(config_error_containing("", "missing or empty sender_email"));

  auto bad_sender = std::string(good);
  bad_sender.replace(bad_sender.find("host-1@example.com"), 18, "not-an-address");
  CHECK(config_error_containing(bad_sender, "sender_email: invalid mailbox"));

  // Files

  auto const private_path = write_temp(good, 0600);
  auto const loaded       = RelayConfig::load(private_path);
  CHECK(loaded.file_permissions == RelayConfig::permissions::ok);
  CHECK_EQ(loaded.path, fs::path(private_path));
  CHECK_EQ(loaded.smtp_password, cfg.smtp_password);
  PCHECK(unlink(private_path.c_str()) == 0);

  auto const open_path = write_temp(good, 0644);
  CHECK(RelayConfig::load(open_path).file_permissions
        == RelayConfig::permissions::too_open);
  PCHECK(unlink(open_path.c_str()) == 0);

  auto threw = false;
  try {
    RelayConfig::load("/nonexistent/forward-as-attachment-mta.toml");
  }
  catch (faamta_error const& e) {
    threw = (e.kind() == error_kind::config);
  }
  CHECK(threw);

  unsetenv(Config::config_path_env);
  CHECK_EQ(RelayConfig::default_path(), fs::path(Config::default_config_path));
  setenv(Config::config_path_env, "/tmp/other.toml", 1);
  CHECK_EQ(RelayConfig::default_path(), fs::path("/tmp/other.toml"));
}
