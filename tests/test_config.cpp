#include "test_common.h"
#include "warden/config.h"
#include "warden/log.h"
#include <cstdlib>

static const char* const kVars[] = {
    "WARDEN_PROFILE", "WARDEN_POLICY_FILE", "WARDEN_STATE_DIR", "WARDEN_WORKERS",
    "WARDEN_BACKEND", "WARDEN_DOCKER_BIN", "WARDEN_WAL_FSYNC", "WARDEN_OUTPUT_MAX_BYTES",
    "WARDEN_NET_STRICT", "WARDEN_LOG_LEVEL", "WARDEN_SCRATCH_DIR", "WARDEN_FS_STRICT",
    "WARDEN_MAX_PROCS",
};

static void clear_env() {
    for (const char* k : kVars) unsetenv(k);
}

int main() {
    using namespace warden;
    clear_env();

    // Profile detection
    expect_true(detect_profile() == Profile::DEV, "default should be DEV");
    setenv("WARDEN_PROFILE", "PROD", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");
    setenv("WARDEN_PROFILE", "staging", 1);
    expect_true(detect_profile() == Profile::DEV, "unknown profile falls back to DEV");
    expect_eq_str(profile_name(Profile::PROD), "prod", "prod name");

    // Defaults never override what the operator set
    setenv("WARDEN_WAL_FSYNC", "0", 1);
    apply_profile_defaults(Profile::PROD);
    expect_eq_str(std::getenv("WARDEN_WAL_FSYNC"), "0", "pre-existing var kept");
    expect_eq_str(std::getenv("WARDEN_NET_STRICT"), "1", "PROD requires a network namespace");
    expect_eq_str(std::getenv("WARDEN_LOG_LEVEL"), "info", "PROD logs at info");
    expect_eq_str(std::getenv("WARDEN_FS_STRICT"), "1", "PROD requires filesystem confinement");
    clear_env();
    apply_profile_defaults(Profile::DEV);
    expect_eq_str(std::getenv("WARDEN_FS_STRICT"), "0", "DEV tolerates a kernel without Landlock");

    // Settings
    clear_env();
    std::string err;
    Settings s = load_settings(&err);
    expect_true(err.empty(), "clean env has no warnings: " + err);
    expect_eq_ll(s.workers, 2, "default workers");
    expect_true(s.backend == BackendKind::PROCESS, "default backend");
    expect_true(s.policy_file.empty(), "no policy file by default");
    expect_eq_str(s.state_dir.string(), "warden_state", "default state dir");
    expect_true(!s.wal_fsync && !s.net_strict && !s.fs_strict, "lenient defaults");
    expect_eq_ll(s.max_processes, 256, "default process cap");
    expect_true(s.scratch_dir.empty(), "scratch under the system temp dir by default");

    setenv("WARDEN_POLICY_FILE", "/etc/warden/policy.json", 1);
    setenv("WARDEN_WORKERS", "500", 1);
    setenv("WARDEN_BACKEND", "Docker", 1);
    setenv("WARDEN_WAL_FSYNC", "yes", 1);
    setenv("WARDEN_OUTPUT_MAX_BYTES", "4096", 1);
    setenv("WARDEN_SCRATCH_DIR", "/var/tmp/warden", 1);
    setenv("WARDEN_FS_STRICT", "1", 1);
    setenv("WARDEN_MAX_PROCS", "100000", 1);
    s = load_settings(&err);
    expect_eq_str(s.scratch_dir.string(), "/var/tmp/warden", "scratch dir");
    expect_true(s.fs_strict, "fs strict flag");
    expect_eq_ll(s.max_processes, 65536, "process cap clamped");
    expect_eq_str(s.policy_file.string(), "/etc/warden/policy.json", "policy path");
    expect_eq_ll(s.workers, 64, "workers clamped");
    expect_true(s.backend == BackendKind::DOCKER, "docker backend");
    expect_true(s.wal_fsync, "fsync flag");
    expect_eq_ll((long long)s.output_max_bytes, 4096, "output cap");

    setenv("WARDEN_WORKERS", "many", 1);
    setenv("WARDEN_BACKEND", "vm", 1);
    setenv("WARDEN_OUTPUT_MAX_BYTES", "10", 1);
    setenv("WARDEN_MAX_PROCS", "lots", 1);
    err.clear();
    s = load_settings(&err);
    expect_eq_ll(s.workers, 2, "bad workers ignored");
    expect_true(s.backend == BackendKind::PROCESS, "bad backend ignored");
    expect_eq_ll((long long)s.output_max_bytes, 1024 * 1024, "tiny cap ignored");
    expect_true(err.find("WARDEN_WORKERS") != std::string::npos, "workers warning reported");
    expect_true(err.find("WARDEN_BACKEND") != std::string::npos, "backend warning reported");
    expect_eq_ll(s.max_processes, 256, "bad process cap ignored");
    expect_true(err.find("WARDEN_MAX_PROCS") != std::string::npos, "process cap warning reported");

    // Log levels
    expect_true(parse_log_level("WARN") == LogLevel::WARN, "warn level");
    expect_true(parse_log_level("debug") == LogLevel::DEBUG, "debug level");
    expect_true(parse_log_level("loud") == LogLevel::INFO, "unknown level is info");
    set_log_level(LogLevel::ERROR);
    expect_true(log_level() == LogLevel::ERROR, "level threshold set");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
