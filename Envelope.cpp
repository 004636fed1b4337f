#include "Envelope.hpp"

#include "Error.hpp"
#include "esc.hpp"

#include <cstring>
#include <iterator>
#include <string_view>

#include <fmt/format.h>

#include <glog/logging.h>

// Flags, other than -f, -r and -F, that take a value, either attached
// ("-h17") or as the next argument ("-h 17").
static bool takes_value(char flag)
{
  return flag && std::strchr("BCLNOVXhpR", flag) != nullptr;
}

Envelope Envelope::parse(int argc, char const* const argv[])
{
  return parse(std::vector<std::string>(argv, argv + argc));
}

Envelope Envelope::parse(std::vector<std::string> const& args)
{
  Envelope env;
  env.args_ = args;

  for (auto const& arg : args) {
    if (!is_valid_utf8(arg))
      env.all_utf8_ = false;
  }

  auto nsenders = 0;

  auto const argc = args.size();
  for (std::vector<std::string>::size_type i = 1; i < argc; ++i) {
    std::string_view const arg = args[i];

    if (arg.size() < 2 || arg[0] != '-') {
      env.recipients_.emplace_back(arg);
      continue;
    }

    if (arg == "--") {
      for (++i; i < argc; ++i)
        env.recipients_.emplace_back(args[i]);
      break;
    }

    auto const flag     = arg[1];
    auto const attached = arg.substr(2);

    // The value of a flag, attached or from the next argument.
    auto value = [&]() -> std::string {
      if (!attached.empty())
        return std::string(attached);
      if (i + 1 < argc)
        return args[++i];
      throw faamta_error(error_kind::usage,
                         fmt::format("option requires an argument -- '{}'",
                                     esc(std::string_view(&flag, 1))));
    };

    switch (flag) {
    case 't':
      if (attached.empty()) {
        env.rcpt_source_ = recipient_source::headers;
        continue;
      }
      break;

    case 'i':
      if (attached.empty()) {
        env.ignore_dots_ = true;
        continue;
      }
      break;

    case 'f':
    case 'r': {
      auto const sender = value();
      if (++nsenders == 1)
        env.sender_ = sender;
      else
        env.sender_.reset(); // ambiguous
      continue;
    }

    case 'F': env.full_name_ = value(); continue;

    case 'o': {
      auto const opt = value();
      if (opt == "i")
        env.ignore_dots_ = true;
      else
        env.ignored_.push_back(fmt::format("-o{}", opt));
      continue;
    }

    case 'b':
      if (attached == "m") {
        env.mode_ = mode::deliver;
        continue;
      }
      if (attached == "p") {
        env.mode_ = mode::print_queue;
        continue;
      }
      if (attached == "i") {
        env.mode_ = mode::init_aliases;
        continue;
      }
      // An SMTP dialog read as a message body would be mangled.
      if (attached.empty() || attached == "s" || attached == "d"
          || attached == "D") {
        throw faamta_error(
            error_kind::usage,
            fmt::format("unsupported operation mode {}", esc(arg)));
      }
      LOG(INFO) << "ignoring operation mode " << esc(arg);
      break;

    case 'q': env.mode_ = mode::queue_run; continue;

    default:
      if (takes_value(flag)) {
        auto const val = value();
        env.ignored_.push_back(
            fmt::format("-{} {}", esc(std::string_view(&flag, 1)), esc(val)));
        continue;
      }
      break;
    }

    // -v, -U, -Am, -n, -m, --long-option and anything else we don't know.
    env.ignored_.emplace_back(esc(arg));
  }

  if (!env.all_utf8_ && env.sender_) {
    LOG(WARNING) << "arguments are not all UTF-8, ignoring -f "
                 << esc(*env.sender_);
    env.sender_.reset();
  }

  return env;
}

std::string Envelope::invocation() const
{
  fmt::memory_buffer bfr;
  for (auto const& arg : args_) {
    if (bfr.size())
      bfr.push_back(' ');
    auto const e = esc(arg);
    if (e.empty() || e.find(' ') != std::string::npos)
      fmt::format_to(std::back_inserter(bfr), "\"{}\"", e);
    else
      bfr.append(e.data(), e.data() + e.size());
  }
  return fmt::to_string(bfr);
}
