#include "warden/sandbox.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/landlock.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#if defined(__x86_64__)
  #define WARDEN_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define WARDEN_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define WARDEN_AUDIT_ARCH 0
#endif

#ifndef __NR_io_uring_setup
  #define __NR_io_uring_setup 425
#endif

#ifndef __NR_landlock_create_ruleset
  #define __NR_landlock_create_ruleset 444
  #define __NR_landlock_add_rule 445
  #define __NR_landlock_restrict_self 446
#endif

#ifndef SECCOMP_RET_KILL_PROCESS
  #define SECCOMP_RET_KILL_PROCESS SECCOMP_RET_KILL
#endif

#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace warden {

std::string install_network_deny_filter() {
#if WARDEN_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    // x32 syscalls on x86_64 carry this bit; no aarch64 syscall number reaches it.
    constexpr unsigned int kForeignAbiBit = 0x40000000u;

    struct sock_filter filter[] = {
        // [0] load arch, [1] same arch -> [3], [2] foreign arch -> kill
        BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)),
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, WARDEN_AUDIT_ARCH, 1, 0),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS),

        // [3] load syscall nr, [4] x32 ABI -> [5] kill, else [6]
        BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)),
        BPF_JUMP_SC(BPF_JMP | BPF_JGE | BPF_K, kForeignAbiBit, 0, 1),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS),

        // [6] io_uring_setup -> [7] EPERM, else [8]
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, __NR_io_uring_setup, 0, 1),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)),

        // [8] socket -> [9], anything else -> [12] allow
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, __NR_socket, 0, 3),
        // [9] load low word of args[0] (family); little-endian on both arches
        BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args[0])),
        // [10] AF_UNIX -> [12] allow, else [11]
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, AF_UNIX, 1, 0),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA)),

        // [12]
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
    };

    struct sock_fprog prog = {};
    prog.len = (unsigned short)(sizeof(filter) / sizeof(filter[0]));
    prog.filter = filter;

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: not in seccomp mode but supported; -1/EINVAL: kernel without seccomp
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return ret >= 0;
}

namespace {

constexpr uint64_t kFsReadAccess =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;

constexpr uint64_t kFsWriteAccessV1 =
    LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
    LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

// Rights the kernel accepts on a rule for a non-directory.
uint64_t file_access_mask(int abi) {
    uint64_t m = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE;
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (abi >= 3) m |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif
    (void)abi;
    return m;
}

uint64_t handled_access(int abi) {
    uint64_t a = kFsReadAccess | kFsWriteAccessV1;
#ifdef LANDLOCK_ACCESS_FS_REFER
    if (abi >= 2) a |= LANDLOCK_ACCESS_FS_REFER;
#endif
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (abi >= 3) a |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif
    return a;
}

// 0 on success or when the path does not exist.
int add_path_rule(int ruleset_fd, const char* path, uint64_t access, int abi) {
    int fd = ::open(path, O_PATH | O_CLOEXEC);
    if (fd < 0) return (errno == ENOENT || errno == ENOTDIR) ? 0 : errno;

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int e = errno;
        ::close(fd);
        return e;
    }
    if (!S_ISDIR(st.st_mode)) access &= file_access_mask(abi);

    struct landlock_path_beneath_attr attr;
    std::memset(&attr, 0, sizeof(attr));
    attr.allowed_access = access;
    attr.parent_fd = fd;
    long r = ::syscall(__NR_landlock_add_rule, ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &attr, 0);
    int e = r == 0 ? 0 : errno;
    ::close(fd);
    return e;
}

} // namespace

int landlock_abi_version() {
    long v = ::syscall(__NR_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return v > 0 ? static_cast<int>(v) : 0;
}

int install_fs_confinement(const char* const* read_paths, const char* const* write_paths) {
    long v = ::syscall(__NR_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    if (v <= 0) return v < 0 ? errno : ENOSYS;
    const int abi = static_cast<int>(v);
    const uint64_t handled = handled_access(abi);

    struct landlock_ruleset_attr attr;
    std::memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = handled;
    int ruleset_fd = static_cast<int>(::syscall(__NR_landlock_create_ruleset, &attr, sizeof(attr), 0));
    if (ruleset_fd < 0) return errno;

    int e = 0;
    for (const char* const* p = read_paths; e == 0 && p && *p; ++p) {
        e = add_path_rule(ruleset_fd, *p, kFsReadAccess, abi);
    }
    for (const char* const* p = write_paths; e == 0 && p && *p; ++p) {
        e = add_path_rule(ruleset_fd, *p, handled, abi);
    }
    if (e == 0 && ::syscall(__NR_landlock_restrict_self, ruleset_fd, 0) != 0) e = errno;
    ::close(ruleset_fd);
    return e;
}

} // namespace warden

#else // !__linux__

#include <cerrno>

namespace warden {

std::string install_network_deny_filter() {
    return "seccomp: not supported on this platform";
}

bool seccomp_available() {
    return false;
}

int landlock_abi_version() {
    return 0;
}

int install_fs_confinement(const char* const*, const char* const*) {
    return ENOSYS;
}

} // namespace warden

#endif
