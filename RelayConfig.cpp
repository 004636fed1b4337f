#include "RelayConfig.hpp"

#include "Error.hpp"
#include "Mailbox.hpp"
#include "esc.hpp"

#include <cstdlib>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>

using namespace tao::pegtl;

namespace TOML {
// The subset of <https://toml.io/en/v1.0.0> a flat key/value file needs.

// clang-format off

struct ws             : star<blank> {};

struct comment        : seq<one<'#'>, star<not_one<'\r', '\n'>>> {};

struct line_end       : seq<ws, opt<comment>, sor<eol, eof>> {};

struct key            : plus<sor<alnum, one<'_', '-'>>> {};

struct escaped        : seq<one<'\\'>,
                            sor<one<'"', '\\', 'b', 't', 'n', 'f', 'r'>,
                                seq<one<'u'>, rep<4, xdigit>>,
                                seq<one<'U'>, rep<8, xdigit>>>> {};

struct basic_char     : sor<escaped, not_one<'"', '\\', '\r', '\n'>> {};

struct basic_body     : star<basic_char> {};

struct basic_string   : seq<one<'"'>, basic_body, must<one<'"'>>> {};

struct literal_body   : star<not_one<'\'', '\r', '\n'>> {};

struct literal_string : seq<one<'\''>, literal_body, must<one<'\''>>> {};

struct value          : sor<basic_string, literal_string> {};

struct keyval         : seq<key, ws, must<one<'='>>, ws, must<value>> {};

struct line           : seq<ws, opt<keyval>, must<line_end>> {};

struct file           : until<eof, line> {};

// clang-format on

template <typename Rule>
constexpr char const* error_message()
{
  return "syntax error";
}
template <>
constexpr char const* error_message<line_end>()
{
  return "expected 'key = \"value\"', a comment, or an empty line";
}
template <>
constexpr char const* error_message<one<'='>>()
{
  return "expected '=' after key";
}
template <>
constexpr char const* error_message<value>()
{
  return "expected a quoted string value";
}
template <>
constexpr char const* error_message<one<'"'>>()
{
  return "unterminated or invalid basic string";
}
template <>
constexpr char const* error_message<one<'\''>>()
{
  return "unterminated literal string";
}

template <typename Rule>
struct control : normal<Rule> {
  template <typename Input, typename... States>
  [[noreturn]] static void raise(Input const& in, States&&...)
  {
    throw parse_error(error_message<Rule>(), in);
  }
};

struct state {
  std::string const& source;
  RelayConfig&       cfg;

  std::string key;
  std::string value;

  bool seen[5]{};
};

static void append_utf8(std::string& out, unsigned long cp)
{
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  }
  else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

template <typename Input>
[[noreturn]] static void config_error(Input const& in,
                                      state const& st,
                                      std::string  msg)
{
  throw faamta_error(error_kind::config,
                     fmt::format("{}:{}: {}", st.source,
                                 in.position().line, msg));
}

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<key> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    st.key = in.string();
  }
};

template <>
struct action<basic_body> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    auto const body = in.string();
    st.value.clear();
    for (std::string::size_type i = 0; i < body.length(); ++i) {
      if (body[i] != '\\') {
        st.value += body[i];
        continue;
      }
      auto const esc = body[++i];
      switch (esc) {
      case 'b': st.value += '\b'; break;
      case 't': st.value += '\t'; break;
      case 'n': st.value += '\n'; break;
      case 'f': st.value += '\f'; break;
      case 'r': st.value += '\r'; break;
      case 'u':
      case 'U': {
        auto const len = (esc == 'u') ? 4u : 8u;
        auto const cp  = std::strtoul(body.substr(i + 1, len).c_str(), nullptr,
                                     16);
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
          config_error(in, st, "escape is not a Unicode scalar value");
        append_utf8(st.value, cp);
        i += len;
        break;
      }
      default: st.value += esc; break; // '"' and '\\'
      }
    }
  }
};

template <>
struct action<literal_body> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    st.value = in.string();
  }
};

template <>
struct action<keyval> {
  template <typename Input>
  static void apply(Input const& in, state& st)
  {
    struct {
      char const*  name;
      std::string* field;
    } const fields[]{
        {"sender_email", &st.cfg.sender_email},
        {"recipient_email", &st.cfg.recipient_email},
        {"smtp_host", &st.cfg.smtp_host},
        {"smtp_username", &st.cfg.smtp_username},
        {"smtp_password", &st.cfg.smtp_password},
    };

    if (!is_valid_utf8(st.value))
      config_error(in, st, fmt::format("value of {} is not UTF-8", st.key));

    for (auto i = 0u; i < std::size(fields); ++i) {
      if (st.key == fields[i].name) {
        if (st.seen[i])
          config_error(in, st, fmt::format("duplicate key {}", st.key));
        st.seen[i]        = true;
        *fields[i].field = st.value;
        return;
      }
    }
    config_error(in, st, fmt::format("unknown key {}", esc(st.key)));
  }
};

} // namespace TOML

fs::path RelayConfig::default_path()
{
  if (auto const env = getenv(Config::config_path_env); env && *env)
    return env;
  return Config::default_config_path;
}

RelayConfig RelayConfig::parse(std::string_view text, std::string const& source)
{
  RelayConfig cfg;
  TOML::state st{source, cfg};

  memory_input<> in(text.data(), text.size(), source);
  try {
    if (!tao::pegtl::parse<TOML::file, TOML::action, TOML::control>(in, st)) {
      throw faamta_error(error_kind::config,
                         fmt::format("{}: can't parse", source));
    }
  }
  catch (parse_error const& e) {
    throw faamta_error(error_kind::config, e.what());
  }

  auto require = [&](std::string const& value, char const* name) {
    if (value.empty())
      throw faamta_error(error_kind::config,
                         fmt::format("{}: missing or empty {}", source, name));
  };
  require(cfg.sender_email, "sender_email");
  require(cfg.recipient_email, "recipient_email");
  require(cfg.smtp_host, "smtp_host");
  require(cfg.smtp_username, "smtp_username");
  require(cfg.smtp_password, "smtp_password");

  std::string msg;
  Mailbox     mbx;
  if (!Mailbox::validate(cfg.sender_email, msg, mbx))
    throw faamta_error(error_kind::config,
                       fmt::format("{}: sender_email: {}", source, msg));
  if (!Mailbox::validate(cfg.recipient_email, msg, mbx))
    throw faamta_error(error_kind::config,
                       fmt::format("{}: recipient_email: {}", source, msg));

  if (cfg.smtp_host.find_first_of(" \t\r\n") != std::string::npos)
    throw faamta_error(error_kind::config,
                       fmt::format("{}: smtp_host «{}» contains white space",
                                   source, esc(cfg.smtp_host)));

  return cfg;
}

RelayConfig RelayConfig::load(fs::path const& path)
{
  std::string text;
  try {
    file_input<> in(path);
    text.assign(in.begin(), in.end());
  }
  catch (std::system_error const& e) {
    auto const hint = (e.code() == std::errc::permission_denied)
                          ? " (is the binary installed setuid to the "
                            "owner of the file?)"
                          : "";
    throw faamta_error(error_kind::config,
                       fmt::format("can't read configuration file {}: {}{}",
                                   path.string(), e.code().message(), hint));
  }

  auto cfg = parse(text, path.string());
  cfg.path = path;

  std::error_code ec;
  auto const      st = fs::status(path, ec);
  if (ec) {
    LOG(WARNING) << "can't determine permissions of " << path << ": "
                 << ec.message();
    cfg.file_permissions = permissions::unknown;
  }
  else {
    auto const open_bits = fs::perms::group_all | fs::perms::others_all;
    if ((st.permissions() & open_bits) != fs::perms::none) {
      LOG(WARNING) << "configuration file " << path
                   << " holding credentials is accessible by group or others";
      cfg.file_permissions = permissions::too_open;
    }
    else {
      cfg.file_permissions = permissions::ok;
    }
  }

  LOG(INFO) << "loaded " << path << ": relay " << cfg.smtp_host << " as "
            << cfg.smtp_username;

  return cfg;
}
