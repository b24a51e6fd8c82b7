#include "privilege.hpp"

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "log.hpp"

namespace tftpff {

void drop_privilege(const std::string &user, const std::string &group) {
  const struct group *gr = getgrnam(group.c_str());
  if (gr == nullptr) {
    throw std::runtime_error("group is not found: " + group);
  }
  const struct passwd *pw = getpwnam(user.c_str());
  if (pw == nullptr) {
    throw std::runtime_error("user is not found: " + user);
  }
  gid_t gid = gr->gr_gid;
  uid_t uid = pw->pw_uid;

  if (geteuid() != 0) {
    if (getegid() == gid && geteuid() == uid) {
      return;
    }
    log_stream(LogLevel::Warn) << "Not running as root, staying as uid " << geteuid() << " instead of "
                     << user << ":" << group << std::endl;
    return;
  }

  if (setgroups(1, &gid) != 0) {
    throw std::runtime_error(std::string("setgroups failed: ") + strerror(errno));
  }
  if (setgid(gid) != 0) {
    throw std::runtime_error("setgid(" + group + ") failed: " + strerror(errno));
  }
  if (setuid(uid) != 0) {
    throw std::runtime_error("setuid(" + user + ") failed: " + strerror(errno));
  }
  log_stream(LogLevel::Info) << "Running as " << user << ":" << group << std::endl;
}

} // namespace tftpff
