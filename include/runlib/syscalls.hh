#pragma once

#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

#ifdef SYS_gettid
inline pid_t gettid() noexcept { return static_cast<pid_t>(syscall(SYS_gettid)); }
#endif

#ifdef SYS_waitid
inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}
#endif

#ifdef SYS_pidfd_open
inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}
#endif

} // namespace syscalls
