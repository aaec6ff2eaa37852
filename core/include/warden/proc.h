#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace warden {

struct ProcLimits {
    int64_t timeout_ms{2000};          // wall clock, enforced by the parent; <= 0 disables
    size_t output_max_bytes{64 * 1024}; // per stream

    int rlimit_cpu_sec{2};             // CPU time seconds
    uint64_t rlimit_as_bytes{512ULL * 1024 * 1024};
    uint64_t rlimit_fsize_bytes{64ULL * 1024 * 1024};
    int rlimit_nofile{64};
    int rlimit_nproc{0};               // per-uid on Linux; 0 leaves it untouched

    bool no_new_privs{true};

    // Network denial: seccomp socket filter always, private network
    // namespace when the kernel lets us create one.
    bool deny_network{false};
    // Treat a failed network namespace as a setup failure instead of
    // relying on the socket filter alone.
    bool require_netns{false};

    // Landlock confinement, applied when fs_write_paths is non-empty: read and
    // execute below fs_read_paths, full access below fs_write_paths, nothing
    // anywhere else.
    std::vector<std::string> fs_read_paths;
    std::vector<std::string> fs_write_paths;
    // Treat a kernel without Landlock as a setup failure instead of running
    // unconfined.
    bool require_fs_confinement{false};

    // "KEY=VALUE" entries added to the scrubbed child environment.
    std::vector<std::string> extra_env;
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};      // killed at the deadline
    bool cancelled{false};      // killed because the cancel flag was raised
    bool truncated{false};      // some output beyond output_max_bytes was dropped
    std::string out;
    std::string err;
    std::string setup_error;    // the sandbox could not be built; the payload never ran
    std::string error;          // parent-side failure (pipe, fork, ...)
};

// Run argv[0] (resolved against a fixed system PATH) inside a fresh process
// group with rlimits applied, a scrubbed environment and optional network
// denial. stdout and stderr are captured separately.
//
// The child and every process left in its group are SIGKILLed on timeout or
// cancellation, and the group is swept after normal exit as well; the call
// returns only once the child has been reaped.
//
// Returns true when the payload process was started (res->exit_code is then
// meaningful), false when it never ran (res->setup_error or res->error set).
bool proc_run_sandboxed(const std::vector<std::string>& argv,
                        const std::string& cwd,
                        const ProcLimits& lim,
                        ProcResult* res,
                        const std::atomic<bool>* cancel = nullptr);

// Resolve an executable name the way the sandboxed child would see it.
// Returns empty string when nothing executable is found.
std::string resolve_executable(const std::string& name);

} // namespace warden
