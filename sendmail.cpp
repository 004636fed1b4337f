// A sendmail(8) for hosts that have no business delivering mail: every
// message is wrapped, with the original attached, and submitted to one
// relay for one recipient.

#include "Envelope.hpp"
#include "Error.hpp"
#include "Relay.hpp"
#include "RelayConfig.hpp"
#include "Wrapper.hpp"
#include "message.hpp"
#include "osutil.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

namespace Config {
auto constexpr flags_env = "FORWARD_AS_ATTACHMENT_MTA_FLAGS";
} // namespace Config

namespace {
// Flags are taken from the environment, argv belongs to sendmail.
void read_tunables(char const* prog)
{
  auto const env = getenv(Config::flags_env);
  if (!env || !*env)
    return;

  // The flag-file format has one flag per line.
  std::string flags(env);
  std::replace(begin(flags), end(flags), ' ', '\n');

  if (!gflags::ReadFlagsFromString(flags, prog, false)) {
    throw faamta_error(error_kind::usage,
                       std::string("bad flags in ") + Config::flags_env);
  }
}

std::string read_stdin()
{
  std::string raw{std::istreambuf_iterator<char>(std::cin), {}};
  if (std::cin.bad())
    throw faamta_error(error_kind::malformed_input,
                       "can't read the message from standard input");
  LOG(INFO) << "read " << raw.size() << " octets from standard input";
  return raw;
}

int fail(error_kind kind, std::string const& msg, int status)
{
  LOG(ERROR) << to_string(kind) << ": " << msg;
  std::cerr << "sendmail: " << to_string(kind) << ": " << msg << '\n';
  return status;
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  // A setuid program must not leave log files in /tmp.
  if (!getenv("GLOG_logtostderr"))
    FLAGS_logtostderr = true;
  if (!getenv("GLOG_minloglevel"))
    FLAGS_minloglevel = google::GLOG_WARNING;

  google::InitGoogleLogging(argv[0]);

  // A relay that hangs up is reported, not fatal.
  signal(SIGPIPE, SIG_IGN);

  try {
    read_tunables(argv[0]);

    auto const env = Envelope::parse(argc, argv);
    for (auto const& ign : env.ignored())
      LOG(INFO) << "ignoring " << ign;
    if (env.ignore_dots())
      LOG(INFO) << "a lone dot never ends the input, -i changes nothing";
    switch (env.op_mode()) {
    case Envelope::mode::print_queue:
      std::cout << "Mail queue is empty\n";
      return EX_OK;
    case Envelope::mode::queue_run:
      LOG(INFO) << "no queue to run";
      return EX_OK;
    case Envelope::mode::init_aliases:
      LOG(INFO) << "no aliases database to build";
      return EX_OK;
    case Envelope::mode::deliver: break;
    }

    auto const cfg = RelayConfig::load(RelayConfig::default_path());
    auto const id  = osutil::get_local_identity();

    auto const      raw = read_stdin();
    message::parsed msg;
    msg.parse(raw);

    auto const outbound = Wrapper::build(raw, msg, env, cfg, id);

    Relay      relay(cfg, Relay::client_name(id.hostname, cfg));
    auto const res = relay.deliver(outbound);
    if (!res.ok())
      return fail(*res.error, res.message, res.exit_code());
  }
  catch (faamta_error const& e) {
    return fail(e.kind(), e.what(), exit_code(e.kind()));
  }

  std::cout << "Email sent successfully\n";
  return EX_OK;
}
