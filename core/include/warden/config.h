#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

namespace warden {

enum class Profile { DEV, PROD };

// Detect profile from WARDEN_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no fsync, best-effort network namespace and Landlock, debug logging)
// PROD: strict (fsync on, network namespace and Landlock required, info logging)
// Must run before any worker thread exists.
void apply_profile_defaults(Profile p);

enum class BackendKind { PROCESS, DOCKER };

// Process-wide settings, read once at startup and passed down by value.
struct Settings {
    Profile profile{Profile::DEV};
    std::filesystem::path policy_file;        // WARDEN_POLICY_FILE (required)
    std::filesystem::path state_dir{"warden_state"};
    std::filesystem::path scratch_dir;        // empty = system temp dir; never inside state_dir
    int workers{2};                           // 0 = run jobs inside submit()
    BackendKind backend{BackendKind::PROCESS};
    std::string docker_bin{"docker"};
    bool wal_fsync{false};
    size_t output_max_bytes{1024 * 1024};
    bool net_strict{false};
    bool fs_strict{false};                    // no Landlock -> backend unavailable
    int max_processes{256};                   // RLIMIT_NPROC for payloads, 0 = untouched
};

// Reads WARDEN_* variables. Invalid numbers fall back to defaults;
// err receives a description of every ignored value.
Settings load_settings(std::string* err = nullptr);

} // namespace warden
