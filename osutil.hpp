#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <string>

#include <sys/types.h>

namespace osutil {

// Facts about the invoking process and its host, for display only.
struct local_identity {
  std::string hostname;
  std::string os_name;
  std::string os_release;
  std::string machine;

  uid_t uid{0};
  gid_t gid{0};
  uid_t euid{0};
  gid_t egid{0};

  std::string user_name;
  std::string group_name;
  std::string effective_user_name;
  std::string effective_group_name;
};

local_identity get_local_identity();

std::string get_hostname();

// Empty if the id has no entry.
std::string get_user_name(uid_t uid);
std::string get_group_name(gid_t gid);

// Numeric string or a name from services(5).
std::optional<uint16_t> get_port(char const* const service,
                                 char const* const proto);

} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
