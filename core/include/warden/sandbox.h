#pragma once

// Warden sandbox: seccomp-BPF network denial and Landlock filesystem
// confinement for sandboxed children.
//
// The filter is narrow on purpose: arbitrary interpreters must keep working,
// so nothing is killed except foreign-ABI syscalls. It makes
//   socket(family != AF_UNIX, ...)  fail with EACCES
//   io_uring_setup(...)             fail with EPERM (io_uring can open sockets)
// Without an inet socket there is nothing to connect(), bind() or sendto().
//
// Architecture-aware: x86_64 and aarch64.

#include <string>

namespace warden {

// Install the filter on the calling thread. Requires PR_SET_NO_NEW_PRIVS
// (or CAP_SYS_ADMIN). Returns empty string on success, error message on failure.
std::string install_network_deny_filter();

// Check if seccomp filtering is available on this system.
bool seccomp_available();

// Landlock ABI version offered by the kernel, 0 when Landlock is missing or
// disabled.
int landlock_abi_version();

// Confine the calling thread and its future children: read and execute only
// below read_paths, full access only below write_paths. Both are
// nullptr-terminated; paths that do not exist are skipped. Needs
// PR_SET_NO_NEW_PRIVS. Returns 0 or an errno value (ENOSYS / EOPNOTSUPP when
// the kernel has no Landlock).
//
// Only async-signal-safe calls: meant for the window between fork() and exec().
int install_fs_confinement(const char* const* read_paths, const char* const* write_paths);

} // namespace warden
