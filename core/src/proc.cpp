#include "warden/proc.h"
#include "warden/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace warden {

namespace {

const char* const kChildPath = "/usr/local/bin:/usr/bin:/bin";

// Child -> parent setup report. Written only when something fails before
// exec; a successful exec closes the CLOEXEC pipe with nothing written.
struct SetupReport {
    int stage{0};
    int err{0};
};

enum SetupStage {
    STAGE_DUP = 1,
    STAGE_CHDIR,
    STAGE_RLIMIT,
    STAGE_NO_NEW_PRIVS,
    STAGE_FS_CONFINE,
    STAGE_NETNS,
    STAGE_SECCOMP,
    STAGE_EXEC,
};

const char* stage_name(int stage) {
    switch (stage) {
        case STAGE_DUP:          return "dup2";
        case STAGE_CHDIR:        return "chdir";
        case STAGE_RLIMIT:       return "setrlimit";
        case STAGE_NO_NEW_PRIVS: return "no_new_privs";
        case STAGE_FS_CONFINE:   return "filesystem confinement";
        case STAGE_NETNS:        return "network namespace";
        case STAGE_SECCOMP:      return "seccomp network filter";
        case STAGE_EXEC:         return "exec";
    }
    return "setup";
}

[[noreturn]] void child_fail(int report_fd, int stage, int err) {
    SetupReport r{stage, err};
    ssize_t n;
    do {
        n = ::write(report_fd, &r, sizeof(r));
    } while (n < 0 && errno == EINTR);
    _exit(127);
}

bool set_rlimit(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value;
    return setrlimit(resource, &rl) == 0;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

class Capture {
public:
    Capture(std::string* dst, size_t cap, bool* truncated) : dst_(dst), cap_(cap), truncated_(truncated) {}

    // Reads whatever is available. Returns false once the pipe hit EOF or failed.
    bool pump(int fd) {
        char buf[4096];
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                size_t room = cap_ > dst_->size() ? cap_ - dst_->size() : 0;
                size_t take = std::min(room, static_cast<size_t>(n));
                if (take < static_cast<size_t>(n)) *truncated_ = true;
                dst_->append(buf, take);
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            return false;
        }
    }

private:
    std::string* dst_;
    size_t cap_;
    bool* truncated_;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::string resolve_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : "";
    }
    std::string path = kChildPath;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string cand = path.substr(start, end - start) + "/" + name;
        struct stat st{};
        if (::stat(cand.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(cand.c_str(), X_OK) == 0) {
            return cand;
        }
        start = end + 1;
    }
    return "";
}

bool proc_run_sandboxed(const std::vector<std::string>& argv,
                        const std::string& cwd,
                        const ProcLimits& lim,
                        ProcResult* res,
                        const std::atomic<bool>* cancel) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }
    const std::string exe = resolve_executable(argv[0]);
    if (exe.empty()) {
        res->setup_error = "executable not found: " + argv[0];
        return false;
    }

    // Everything the child needs is built before fork(): after fork only
    // async-signal-safe calls are made.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_store = {
        std::string("PATH=") + kChildPath,
        "LANG=C.UTF-8",
        "HOME=" + (cwd.empty() ? std::string("/") : cwd),
        "TMPDIR=" + (cwd.empty() ? std::string("/tmp") : cwd),
    };
    env_store.insert(env_store.end(), lim.extra_env.begin(), lim.extra_env.end());
    std::vector<char*> cenv;
    for (auto& s : env_store) cenv.push_back(s.data());
    cenv.push_back(nullptr);

    const bool confine_fs = !lim.fs_write_paths.empty();
    std::vector<const char*> fs_ro;
    std::vector<const char*> fs_rw;
    for (const auto& p : lim.fs_read_paths) fs_ro.push_back(p.c_str());
    for (const auto& p : lim.fs_write_paths) fs_rw.push_back(p.c_str());
    fs_ro.push_back(nullptr);
    fs_rw.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int rep_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(rep_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, rep_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, rep_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        return false;
    }

    if (pid == 0) {
        // child
        const int rep = rep_pipe[1];
        (void)setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
            dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
            child_fail(rep, STAGE_DUP, errno);
        }

        // dup2 clears CLOEXEC on 0..2; everything else (including rep) closes at exec.
        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256 || maxfd > 65536) maxfd = 65536;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != rep) (void)close(fd);
        }

        (void)umask(077);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) child_fail(rep, STAGE_CHDIR, errno);

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0 && !set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec)) {
            child_fail(rep, STAGE_RLIMIT, errno);
        }
        if (lim.rlimit_as_bytes > 0 && !set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_bytes)) {
            child_fail(rep, STAGE_RLIMIT, errno);
        }
        if (lim.rlimit_fsize_bytes > 0 && !set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_bytes)) {
            child_fail(rep, STAGE_RLIMIT, errno);
        }
        if (lim.rlimit_nofile > 0 && !set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile)) {
            child_fail(rep, STAGE_RLIMIT, errno);
        }
        if (lim.rlimit_nproc > 0 && !set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc)) {
            child_fail(rep, STAGE_RLIMIT, errno);
        }
        (void)set_rlimit(RLIMIT_CORE, 0);

#ifdef __linux__
        if ((lim.no_new_privs || lim.deny_network || confine_fs) && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
            child_fail(rep, STAGE_NO_NEW_PRIVS, errno);
        }
        if (confine_fs) {
            int e = install_fs_confinement(fs_ro.data(), fs_rw.data());
            bool unsupported = e == ENOSYS || e == EOPNOTSUPP;
            if (e != 0 && (!unsupported || lim.require_fs_confinement)) child_fail(rep, STAGE_FS_CONFINE, e);
        }
        if (lim.deny_network) {
            // Plain CLONE_NEWNET needs CAP_SYS_ADMIN; unprivileged callers can
            // usually get one inside a fresh user namespace.
            if (unshare(CLONE_NEWNET) != 0 && unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
                if (lim.require_netns) child_fail(rep, STAGE_NETNS, errno);
            }
            std::string serr = install_network_deny_filter();
            if (!serr.empty()) child_fail(rep, STAGE_SECCOMP, EPERM);
        }
#else
        if (lim.deny_network) child_fail(rep, STAGE_SECCOMP, ENOSYS);
        if (confine_fs && lim.require_fs_confinement) child_fail(rep, STAGE_FS_CONFINE, ENOSYS);
#endif

        execve(exe.c_str(), cargv.data(), cenv.data());
        child_fail(rep, STAGE_EXEC, errno);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(rep_pipe[1]);

    // Blocks until exec succeeds (EOF) or the child reports a setup failure.
    SetupReport report{};
    ssize_t got;
    do {
        got = ::read(rep_pipe[0], &report, sizeof(report));
    } while (got < 0 && errno == EINTR);
    close_fd(rep_pipe[0]);

    if (got == (ssize_t)sizeof(report)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        res->setup_error = std::string(stage_name(report.stage)) + ": " + std::strerror(report.err);
        return false;
    }

    (void)set_nonblocking(out_pipe[0]);
    (void)set_nonblocking(err_pipe[0]);

    Capture cap_out(&res->out, lim.output_max_bytes, &res->truncated);
    Capture cap_err(&res->err, lim.output_max_bytes, &res->truncated);
    bool out_open = true;
    bool err_open = true;

    const auto start = std::chrono::steady_clock::now();
    bool exited = false;

    while (true) {
        if (out_open) out_open = cap_out.pump(out_pipe[0]);
        if (err_open) err_open = cap_err.pump(err_pipe[0]);

        // Peek without reaping: while the zombie exists its pgid cannot be reused.
        siginfo_t si{};
        if (waitid(P_PID, (id_t)pid, &si, WEXITED | WNOHANG | WNOWAIT) == 0 && si.si_pid == pid) {
            exited = true;
            break;
        }

        const int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms >= lim.timeout_ms) {
            res->timed_out = true;
            break;
        }
        if (cancel && cancel->load()) {
            res->cancelled = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) { fds[nfds].fd = out_pipe[0]; fds[nfds].events = POLLIN; nfds++; }
        if (err_open) { fds[nfds].fd = err_pipe[0]; fds[nfds].events = POLLIN; nfds++; }
        int slice = 50;
        if (lim.timeout_ms > 0) {
            slice = (int)std::max<int64_t>(1, std::min<int64_t>(slice, lim.timeout_ms - elapsed_ms));
        }
        if (nfds > 0) (void)poll(fds, nfds, slice);
        else ::usleep((useconds_t)slice * 1000);
    }

    // Sweep the whole group (stragglers after a normal exit, everything on a kill),
    // then reap the leader.
    (void)kill(-pid, SIGKILL);
    if (!exited) (void)kill(pid, SIGKILL);
    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);

    if (out_open) (void)cap_out.pump(out_pipe[0]);
    if (err_open) (void)cap_err.pump(err_pipe[0]);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (w != pid) {
        res->exit_code = 128;
        res->error = std::string("waitpid failed: ") + std::strerror(errno);
        return true;
    }

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

} // namespace warden
