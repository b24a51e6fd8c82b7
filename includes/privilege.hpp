#ifndef TFTPFF_PRIVILEGE_HPP
#define TFTPFF_PRIVILEGE_HPP

#include <string>

namespace tftpff {

// Switches the process to `user`/`group`. The group is dropped first, while
// the process still has the right to change it. Throws std::runtime_error if
// either name is unknown or the switch fails. Without root privileges the
// current identity is kept and a warning is logged.
void drop_privilege(const std::string &user, const std::string &group);

} // namespace tftpff

#endif // TFTPFF_PRIVILEGE_HPP
