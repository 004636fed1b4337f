#ifndef RELAYCONFIG_DOT_HPP
#define RELAYCONFIG_DOT_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace Config {
auto constexpr default_config_path = "/etc/forward-as-attachment-mta.config.toml";
auto constexpr config_path_env     = "FORWARD_AS_ATTACHMENT_MTA_CONFIG_FILE";
} // namespace Config

// The relay and the fixed envelope, read once from a TOML file:
//
//   sender_email = "host@example.com"
//   recipient_email = "ops@example.com"
//   smtp_host = "smtp.example.com"
//   smtp_username = "host@example.com"
//   smtp_password = "secret"

struct RelayConfig {
  enum class permissions {
    ok,       // no group or other access
    too_open, // group or other may access the credentials
    unknown,  // could not stat the file
  };

  std::string sender_email;
  std::string recipient_email;
  std::string smtp_host;
  std::string smtp_username;
  std::string smtp_password;

  fs::path    path;
  permissions file_permissions{permissions::unknown};

  // Config::default_config_path, unless overridden by the environment.
  static fs::path default_path();

  // Both throw faamta_error of kind config.
  static RelayConfig load(fs::path const& path);
  static RelayConfig parse(std::string_view text, std::string const& source);
};

#endif // RELAYCONFIG_DOT_HPP
