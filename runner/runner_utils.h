#pragma once

#include "warden/config.h"
#include "warden/isolation.h"
#include "warden/job_store.h"
#include "warden/policy.h"
#include "warden/types.h"

#include <json-c/json.h>

#include <memory>
#include <optional>
#include <string>

namespace warden {

// Exit codes shared by every subcommand.
constexpr int kExitOk = 0;
constexpr int kExitJobFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitStartup = 3;

// Everything a subcommand may need, opened from Settings.
struct Services {
    Settings settings;
    std::unique_ptr<PolicyStore> policy;
    std::unique_ptr<JobStore> store;
    std::unique_ptr<IsolationBackend> backend;
};

enum class StoreAccess { NONE, READ_ONLY, OWNER };

// Open the pieces a command needs. PolicyError / StoreError are reported on
// stderr and turned into kExitStartup; returns kExitOk on success.
// READ_ONLY opens the store without taking its lock, so queries work while
// another process owns the state directory.
int open_services(Services* svc, bool need_policy, StoreAccess store, bool need_backend);

// Whole file, or stdin for "-". Throws std::runtime_error.
std::string slurp(const std::string& path);

// Value following `flag` in argv[first..], if present.
std::optional<std::string> flag_value(int argc, char** argv, int first, const std::string& flag);

// Prints obj (plain JSON, one line) on stdout and drops the reference.
void print_json(json_object* obj);

// 0 only for a job that ran and exited 0.
int exit_code_for(const Job& job);

} // namespace warden
