#pragma once

// Isolation backends: run one payload inside a constrained, ephemeral sandbox.
//
// Contract (every implementation):
//   - the image has already been approved; backends never consult the policy
//   - the payload is staged in a private scratch directory that is removed on
//     every exit path
//   - the wall-clock deadline is enforced by the parent, never by the payload
//   - exceptions never escape execute() for conditions the backend can name:
//     missing mechanism / setup failure -> allowed=false, BACKEND_UNAVAILABLE
//     deadline or cancellation          -> TIMEOUT, exit 124, partial output
//     payload exit 0 / non-zero          -> OK / NONZERO_EXIT

#include "warden/config.h"
#include "warden/policy.h"
#include "warden/proc.h"
#include "warden/types.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace warden {

struct Limits {
    double cpu{1.0};                                   // cores
    uint64_t memory_bytes{512ULL * 1024 * 1024};
    int64_t timeout_ms{30000};
    bool network_allowed{false};
};

Limits limits_from_policy(const Policy& policy);

struct RawOutcome {
    Result result;
    std::string detail;   // diagnostic for logs and the audit trail, never parsed
};

class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    // Blocks the calling worker until the payload finished, hit its deadline,
    // or `cancel` was raised (treated exactly like the deadline).
    virtual RawOutcome execute(const std::string& payload,
                               const std::string& image,
                               const Limits& limits,
                               const std::atomic<bool>& cancel) = 0;

    virtual const char* name() const = 0;
};

// Private scratch directory, removed (contents included) on destruction.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::filesystem::path& parent, const std::string& prefix = "warden-");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path path_;
    std::string error_;
};

// How a payload for a given image is launched. "{payload}" in argv is replaced
// by the staged file path (process backend) or its in-container path (docker).
struct Runtime {
    std::vector<std::string> argv;
    std::string payload_name;
};

// Built-in mapping: python* images run `python3 payload.py`, everything else
// `sh payload.sh`.
Runtime default_runtime_for_image(const std::string& image);

// Write payload into dir/name (mode 0600). Returns empty string on success.
std::string stage_payload(const std::filesystem::path& dir, const std::string& name,
                          const std::string& payload, bool world_readable = false);

// Map a finished (or never started) process to the backend contract.
RawOutcome outcome_from_proc(bool started, const ProcResult& pr);

struct ProcessBackendConfig {
    std::filesystem::path scratch_root;           // empty = system temp dir
    size_t output_max_bytes{1024 * 1024};
    bool net_strict{false};                       // fail closed without a network namespace
    bool fs_strict{false};                        // fail closed without Landlock
    int max_processes{256};                       // RLIMIT_NPROC, 0 = untouched
    int max_open_files{64};
    uint64_t max_file_bytes{64ULL * 1024 * 1024};
    std::map<std::string, Runtime> runtimes;      // per-image overrides

    // Readable (and executable) by payloads; the scratch scope is the only
    // writable place besides /dev/null.
    std::vector<std::string> read_only_paths{"/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64",
                                             "/etc", "/dev", "/proc"};
};

// Local fork/exec sandbox: rlimits, no_new_privs, own process group, scrubbed
// environment, Landlock confinement to the scratch scope, seccomp socket
// filter plus network namespace when denied.
class ProcessBackend final : public IsolationBackend {
public:
    explicit ProcessBackend(ProcessBackendConfig cfg = {});

    RawOutcome execute(const std::string& payload,
                       const std::string& image,
                       const Limits& limits,
                       const std::atomic<bool>& cancel) override;

    const char* name() const override { return "process"; }

    // CPU seconds granted for a run: ceil(cores * timeout), at least 1.
    static int cpu_seconds_for(const Limits& limits);

    const ProcessBackendConfig& config() const { return cfg_; }

private:
    ProcessBackendConfig cfg_;
};

struct DockerBackendConfig {
    std::string docker_bin{"docker"};
    std::filesystem::path scratch_root;
    size_t output_max_bytes{1024 * 1024};
    int pids_limit{256};
    bool map_user{true};          // run as the caller's uid:gid so scratch files stay removable
    int64_t cleanup_timeout_ms{15000};
};

// `docker run --rm` with --cpus/--memory, --network none unless allowed, the
// scratch directory mounted at /work. On deadline or cancel the container is
// force-removed by name.
class DockerBackend final : public IsolationBackend {
public:
    explicit DockerBackend(DockerBackendConfig cfg = {});

    RawOutcome execute(const std::string& payload,
                       const std::string& image,
                       const Limits& limits,
                       const std::atomic<bool>& cancel) override;

    const char* name() const override { return "docker"; }

    // Full docker CLI argv for one run (exposed for inspection in tests).
    std::vector<std::string> build_argv(const std::string& container_name,
                                        const std::filesystem::path& scope,
                                        const std::string& image,
                                        const Limits& limits) const;

private:
    void force_remove(const std::string& container_name);

    DockerBackendConfig cfg_;
};

// Scratch parent for backends: settings.scratch_dir, or empty (system temp
// dir) when unset or when it lies inside the state directory.
std::filesystem::path scratch_root_for(const Settings& settings);

std::unique_ptr<IsolationBackend> make_backend(const Settings& settings);

} // namespace warden
