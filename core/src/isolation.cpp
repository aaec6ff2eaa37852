#include "warden/isolation.h"
#include "warden/hash.h"
#include "warden/log.h"
#include "warden/sandbox.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace warden {

namespace {

constexpr const char* kPayloadToken = "{payload}";
constexpr const char* kContainerWorkDir = "/work";

fs::path scratch_parent(const fs::path& configured) {
    if (!configured.empty()) return configured;
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : tmp;
}

// Payloads may chmod their own files away; give the owner rwx back on every
// directory so remove_all can descend.
void restore_owner_access(const fs::path& root) {
    std::error_code ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code pec;
        if (it->is_directory(pec) && !it->is_symlink(pec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, pec);
        }
    }
}

std::vector<std::string> substitute_payload(const std::vector<std::string>& argv, const std::string& path) {
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (const auto& a : argv) {
        std::string s = a;
        size_t pos = s.find(kPayloadToken);
        if (pos != std::string::npos) s.replace(pos, std::strlen(kPayloadToken), path);
        out.push_back(std::move(s));
    }
    return out;
}

std::string format_cpus(double cpu) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", cpu);
    std::string s = buf;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

} // namespace

Limits limits_from_policy(const Policy& policy) {
    Limits l;
    l.cpu = policy.cpu_limit;
    l.memory_bytes = policy.memory_limit_bytes;
    l.timeout_ms = policy.timeout_ms;
    l.network_allowed = policy.network_allowed;
    return l;
}

ScopedTempDir::ScopedTempDir(const fs::path& parent, const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    std::string tmpl = (parent / (prefix + "XXXXXX")).string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        error_ = "mkdtemp " + tmpl + ": " + std::strerror(errno);
        return;
    }
    path_ = tmpl;
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) return;
    restore_owner_access(path_);
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) log_warn("isolation", "scratch cleanup failed for " + path_.string() + ": " + ec.message());
}

Runtime default_runtime_for_image(const std::string& image) {
    std::string base = image;
    size_t slash = base.rfind('/');
    if (slash != std::string::npos) base = base.substr(slash + 1);
    if (base.rfind("python", 0) == 0) return Runtime{{"python3", kPayloadToken}, "payload.py"};
    return Runtime{{"/bin/sh", kPayloadToken}, "payload.sh"};
}

std::string stage_payload(const fs::path& dir, const std::string& name,
                          const std::string& payload, bool world_readable) {
    const fs::path p = dir / name;
    const mode_t mode = world_readable ? 0644 : 0600;
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
    if (fd < 0) return "open " + p.string() + ": " + std::strerror(errno);
    const char* data = payload.data();
    size_t left = payload.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string e = "write " + p.string() + ": " + std::strerror(errno);
            ::close(fd);
            return e;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    // umask may have narrowed the requested mode.
    if (world_readable) (void)::fchmod(fd, mode);
    if (::close(fd) != 0) return "close " + p.string() + ": " + std::strerror(errno);
    return "";
}

RawOutcome outcome_from_proc(bool started, const ProcResult& pr) {
    RawOutcome o;
    o.result.stdout_data = pr.out;
    o.result.stderr_data = pr.err;
    o.result.truncated = pr.truncated;
    if (!started) {
        o.result.allowed = false;
        o.result.exit_code = pr.exit_code;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = !pr.setup_error.empty() ? pr.setup_error : pr.error;
        return o;
    }
    o.result.allowed = true;
    if (pr.timed_out || pr.cancelled) {
        o.result.exit_code = kTimeoutExitCode;
        o.result.reason = Reason::TIMEOUT;
        o.detail = pr.cancelled ? "cancelled" : "deadline exceeded";
        return o;
    }
    o.result.exit_code = pr.exit_code;
    o.result.reason = pr.exit_code == 0 ? Reason::OK : Reason::NONZERO_EXIT;
    return o;
}

// ---------------------------------------------------------------------------
// ProcessBackend
// ---------------------------------------------------------------------------

ProcessBackend::ProcessBackend(ProcessBackendConfig cfg) : cfg_(std::move(cfg)) {
    if (landlock_abi_version() == 0) {
        if (cfg_.fs_strict) {
            log_warn("process", "kernel has no Landlock; every run will report the backend unavailable");
        } else {
            log_warn("process", "kernel has no Landlock; payloads are not confined to their scratch scope");
        }
    }
}

int ProcessBackend::cpu_seconds_for(const Limits& limits) {
    double secs = limits.cpu * (static_cast<double>(limits.timeout_ms) / 1000.0);
    int v = static_cast<int>(std::ceil(secs));
    return v < 1 ? 1 : v;
}

RawOutcome ProcessBackend::execute(const std::string& payload,
                                   const std::string& image,
                                   const Limits& limits,
                                   const std::atomic<bool>& cancel) {
    ScopedTempDir scope(scratch_parent(cfg_.scratch_root));
    if (!scope.ok()) {
        RawOutcome o;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = scope.error();
        return o;
    }

    auto it = cfg_.runtimes.find(image);
    const Runtime rt = it != cfg_.runtimes.end() ? it->second : default_runtime_for_image(image);

    std::string err = stage_payload(scope.path(), rt.payload_name, payload);
    if (!err.empty()) {
        RawOutcome o;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = err;
        return o;
    }

    ProcLimits lim;
    lim.timeout_ms = limits.timeout_ms;
    lim.output_max_bytes = cfg_.output_max_bytes;
    lim.rlimit_cpu_sec = cpu_seconds_for(limits);
    lim.rlimit_as_bytes = limits.memory_bytes;
    lim.rlimit_fsize_bytes = cfg_.max_file_bytes;
    lim.rlimit_nofile = cfg_.max_open_files;
    lim.rlimit_nproc = cfg_.max_processes;
    lim.deny_network = !limits.network_allowed;
    lim.require_netns = cfg_.net_strict;
    lim.fs_read_paths = cfg_.read_only_paths;
    lim.fs_write_paths = {scope.path().string(), "/dev/null"};
    lim.require_fs_confinement = cfg_.fs_strict;

    const auto argv = substitute_payload(rt.argv, (scope.path() / rt.payload_name).string());
    log_debug("process", "exec " + argv[0] + " image=" + image + " timeout_ms=" + std::to_string(lim.timeout_ms));

    ProcResult pr;
    bool started = proc_run_sandboxed(argv, scope.path().string(), lim, &pr, &cancel);
    return outcome_from_proc(started, pr);
}

// ---------------------------------------------------------------------------
// DockerBackend
// ---------------------------------------------------------------------------

DockerBackend::DockerBackend(DockerBackendConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> DockerBackend::build_argv(const std::string& container_name,
                                                   const fs::path& scope,
                                                   const std::string& image,
                                                   const Limits& limits) const {
    const Runtime rt = default_runtime_for_image(image);
    std::vector<std::string> argv = {
        cfg_.docker_bin, "run", "--rm",
        "--name", container_name,
        "--cpus", format_cpus(limits.cpu),
        "--memory", std::to_string(limits.memory_bytes),
        "--memory-swap", std::to_string(limits.memory_bytes),
    };
    if (!limits.network_allowed) {
        argv.push_back("--network");
        argv.push_back("none");
    }
    argv.push_back("-v");
    argv.push_back(scope.string() + ":" + kContainerWorkDir);
    argv.push_back("-w");
    argv.push_back(kContainerWorkDir);
    if (cfg_.pids_limit > 0) {
        argv.push_back("--pids-limit");
        argv.push_back(std::to_string(cfg_.pids_limit));
    }
    if (cfg_.map_user) {
        argv.push_back("--user");
        argv.push_back(std::to_string(::getuid()) + ":" + std::to_string(::getgid()));
    }
    argv.push_back("--cap-drop");
    argv.push_back("ALL");
    argv.push_back("--security-opt");
    argv.push_back("no-new-privileges");
    argv.push_back(image);
    const auto entry = substitute_payload(rt.argv, std::string(kContainerWorkDir) + "/" + rt.payload_name);
    argv.insert(argv.end(), entry.begin(), entry.end());
    return argv;
}

namespace {

// The docker CLI needs these to reach a non-default daemon.
ProcLimits docker_cli_limits(int64_t timeout_ms, size_t output_max_bytes) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.output_max_bytes = output_max_bytes;
    lim.rlimit_cpu_sec = 0;
    lim.rlimit_as_bytes = 0;
    lim.rlimit_nofile = 1024;
    lim.deny_network = false;
    for (const char* k : {"DOCKER_HOST", "DOCKER_CONTEXT", "DOCKER_CONFIG", "DOCKER_CERT_PATH", "DOCKER_TLS_VERIFY"}) {
        const char* v = std::getenv(k);
        if (v && *v) lim.extra_env.push_back(std::string(k) + "=" + v);
    }
    return lim;
}

} // namespace

void DockerBackend::force_remove(const std::string& container_name) {
    ProcLimits lim = docker_cli_limits(cfg_.cleanup_timeout_ms, 4096);
    ProcResult pr;
    bool started = proc_run_sandboxed({cfg_.docker_bin, "rm", "-f", container_name}, "", lim, &pr);
    if (!started || pr.exit_code != 0) {
        log_warn("docker", "force remove of " + container_name + " failed: " +
                 (started ? pr.err : pr.setup_error + pr.error));
    }
}

RawOutcome DockerBackend::execute(const std::string& payload,
                                  const std::string& image,
                                  const Limits& limits,
                                  const std::atomic<bool>& cancel) {
    if (resolve_executable(cfg_.docker_bin).empty()) {
        RawOutcome o;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = "docker binary not found: " + cfg_.docker_bin;
        return o;
    }

    ScopedTempDir scope(scratch_parent(cfg_.scratch_root));
    if (!scope.ok()) {
        RawOutcome o;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = scope.error();
        return o;
    }
    // The container user may differ from ours when map_user is off.
    if (!cfg_.map_user) {
        std::error_code ec;
        fs::permissions(scope.path(), fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec, ec);
    }

    const Runtime rt = default_runtime_for_image(image);
    std::string err = stage_payload(scope.path(), rt.payload_name, payload, !cfg_.map_user);
    if (!err.empty()) {
        RawOutcome o;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = err;
        return o;
    }

    const std::string name = "warden-" + hash::random_hex(8);
    ProcLimits lim = docker_cli_limits(limits.timeout_ms, cfg_.output_max_bytes);
    ProcResult pr;
    bool started = proc_run_sandboxed(build_argv(name, scope.path(), image, limits), "", lim, &pr, &cancel);

    if (started && (pr.timed_out || pr.cancelled)) {
        // Killing the CLI leaves the container running.
        force_remove(name);
    }

    RawOutcome o = outcome_from_proc(started, pr);
    // 125: the daemon could not create or start the container.
    if (started && !pr.timed_out && !pr.cancelled && pr.exit_code == 125) {
        o.result.allowed = false;
        o.result.reason = Reason::BACKEND_UNAVAILABLE;
        o.detail = "docker run failed: " + pr.err;
    }
    return o;
}

fs::path scratch_root_for(const Settings& settings) {
    if (settings.scratch_dir.empty()) return {};
    std::error_code ec1, ec2;
    const fs::path state = fs::weakly_canonical(fs::absolute(settings.state_dir), ec1);
    const fs::path scratch = fs::weakly_canonical(fs::absolute(settings.scratch_dir), ec2);
    if (ec1 || ec2) return settings.scratch_dir;
    auto rel = scratch.lexically_relative(state);
    if (!rel.empty() && *rel.begin() != "..") {
        log_warn("isolation", "scratch dir " + settings.scratch_dir.string() +
                 " is inside the state dir; using the system temp dir");
        return {};
    }
    return settings.scratch_dir;
}

std::unique_ptr<IsolationBackend> make_backend(const Settings& settings) {
    if (settings.backend == BackendKind::DOCKER) {
        DockerBackendConfig cfg;
        cfg.docker_bin = settings.docker_bin;
        cfg.scratch_root = scratch_root_for(settings);
        cfg.output_max_bytes = settings.output_max_bytes;
        return std::make_unique<DockerBackend>(cfg);
    }
    ProcessBackendConfig cfg;
    cfg.scratch_root = scratch_root_for(settings);
    cfg.output_max_bytes = settings.output_max_bytes;
    cfg.net_strict = settings.net_strict;
    cfg.fs_strict = settings.fs_strict;
    cfg.max_processes = settings.max_processes;
    return std::make_unique<ProcessBackend>(cfg);
}

} // namespace warden
