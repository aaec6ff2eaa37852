#include "runner_utils.h"

#include "warden/log.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace warden {

int open_services(Services* svc, bool need_policy, StoreAccess store, bool need_backend) {
    std::string warn;
    svc->settings = load_settings(&warn);
    if (!warn.empty()) log_warn("config", warn);

    if (need_policy) {
        if (svc->settings.policy_file.empty()) {
            log_error("config", "WARDEN_POLICY_FILE is not set");
            return kExitStartup;
        }
        svc->policy = std::make_unique<PolicyStore>(svc->settings.policy_file);
        try {
            svc->policy->load();
        } catch (const PolicyError& e) {
            log_error("policy", e.what());
            return kExitStartup;
        }
    }

    if (store != StoreAccess::NONE) {
        JobStoreOptions opts;
        opts.state_dir = svc->settings.state_dir;
        opts.fsync = svc->settings.wal_fsync;
        opts.read_only = store == StoreAccess::READ_ONLY;
        try {
            svc->store = std::make_unique<JobStore>(opts);
        } catch (const StoreError& e) {
            log_error("store", e.what());
            return kExitStartup;
        }
    }

    if (need_backend) svc->backend = make_backend(svc->settings);
    return kExitOk;
}

std::string slurp(const std::string& path) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open file: " + path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::optional<std::string> flag_value(int argc, char** argv, int first, const std::string& flag) {
    for (int i = first; i + 1 < argc; i++) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

void print_json(json_object* obj) {
    std::cout << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN) << "\n";
    json_object_put(obj);
}

int exit_code_for(const Job& job) {
    if (!job.result) return kExitJobFailed;
    if (job.result->allowed && job.result->exit_code == 0) return kExitOk;
    return kExitJobFailed;
}

} // namespace warden
