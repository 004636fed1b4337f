#include "osutil.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include <grp.h>
#include <netdb.h>
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <arpa/inet.h>

#include <glog/logging.h>

namespace osutil {

std::string get_hostname()
{
  utsname un;
  if (uname(&un) != 0) {
    PLOG(WARNING) << "uname";
    return "";
  }
  return un.nodename;
}

// The reentrant lookups want a scratch buffer, sized as suggested by
// sysconf(3) and grown on ERANGE.

static std::vector<char> scratch_buffer(int name)
{
  auto const sz = sysconf(name);
  return std::vector<char>(sz > 0 ? static_cast<size_t>(sz) : 1024);
}

std::string get_user_name(uid_t uid)
{
  auto    buf = scratch_buffer(_SC_GETPW_R_SIZE_MAX);
  passwd  pw;
  passwd* result = nullptr;
  int     rc;
  while ((rc = getpwuid_r(uid, &pw, buf.data(), buf.size(), &result))
         == ERANGE) {
    if (buf.size() >= 1024 * 1024)
      break; // ridiculous
    buf.resize(buf.size() * 2);
  }
  if (rc != 0 || result == nullptr)
    return "";
  return pw.pw_name;
}

std::string get_group_name(gid_t gid)
{
  auto   buf = scratch_buffer(_SC_GETGR_R_SIZE_MAX);
  group  gr;
  group* result = nullptr;
  int    rc;
  while ((rc = getgrgid_r(gid, &gr, buf.data(), buf.size(), &result))
         == ERANGE) {
    if (buf.size() >= 1024 * 1024)
      break;
    buf.resize(buf.size() * 2);
  }
  if (rc != 0 || result == nullptr)
    return "";
  return gr.gr_name;
}

local_identity get_local_identity()
{
  local_identity id;

  utsname un;
  if (uname(&un) == 0) {
    id.hostname   = un.nodename;
    id.os_name    = un.sysname;
    id.os_release = un.release;
    id.machine    = un.machine;
  }
  else {
    PLOG(WARNING) << "uname";
  }

  id.uid  = getuid();
  id.gid  = getgid();
  id.euid = geteuid();
  id.egid = getegid();

  id.user_name            = get_user_name(id.uid);
  id.group_name           = get_group_name(id.gid);
  id.effective_user_name  = get_user_name(id.euid);
  id.effective_group_name = get_group_name(id.egid);

  return id;
}

std::optional<uint16_t> get_port(char const* const service,
                                 char const* const proto)
{
  char*      ep = nullptr;
  auto const service_no{strtoul(service, &ep, 10)};
  if (ep && (ep != service) && (*ep == '\0')) {
    if (service_no > std::numeric_limits<uint16_t>::max())
      return {};
    return static_cast<uint16_t>(service_no);
  }

  std::vector<char> str_buf(1024); // suggested by getservbyname_r(3)

  auto     result_buf{servent{}};
  servent* result_ptr = nullptr;
  while (getservbyname_r(service, proto, &result_buf, str_buf.data(),
                         str_buf.size(), &result_ptr)
         == ERANGE) {
    if (str_buf.size() >= 64 * 1024) // ridiculous
      return {};
    str_buf.resize(str_buf.size() * 2);
  }
  if (result_ptr == nullptr) {
    LOG(WARNING) << "service " << service << " unknown";
    return {};
  }
  return ntohs(result_buf.s_port);
}

} // namespace osutil
