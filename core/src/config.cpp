#include "warden/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <string>

namespace warden {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool env_flag(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

void note(std::string* err, const std::string& msg) {
    if (!err) return;
    if (!err->empty()) *err += "; ";
    *err += msg;
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("WARDEN_PROFILE");
    if (!env) return Profile::DEV;
    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("WARDEN_WAL_FSYNC",  "0",     NO_OVERWRITE);
            setenv("WARDEN_NET_STRICT", "0",     NO_OVERWRITE);
            setenv("WARDEN_FS_STRICT",  "0",     NO_OVERWRITE);
            setenv("WARDEN_LOG_LEVEL",  "debug", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("WARDEN_WAL_FSYNC",  "1",     NO_OVERWRITE);
            setenv("WARDEN_NET_STRICT", "1",     NO_OVERWRITE);
            setenv("WARDEN_FS_STRICT",  "1",     NO_OVERWRITE);
            setenv("WARDEN_LOG_LEVEL",  "info",  NO_OVERWRITE);
            break;
    }
}

Settings load_settings(std::string* err) {
    Settings s;
    s.profile = detect_profile();

    if (const char* v = std::getenv("WARDEN_POLICY_FILE")) s.policy_file = v;
    if (const char* v = std::getenv("WARDEN_STATE_DIR")) s.state_dir = v;
    if (const char* v = std::getenv("WARDEN_DOCKER_BIN")) s.docker_bin = v;
    if (const char* v = std::getenv("WARDEN_SCRATCH_DIR")) s.scratch_dir = v;

    if (const char* v = std::getenv("WARDEN_WORKERS")) {
        try {
            s.workers = std::clamp(std::stoi(v), 0, 64);
        } catch (const std::exception&) {
            note(err, std::string("WARDEN_WORKERS ignored: ") + v);
        }
    }

    if (const char* v = std::getenv("WARDEN_BACKEND")) {
        std::string b = lower(v);
        if (b == "docker") s.backend = BackendKind::DOCKER;
        else if (b == "process") s.backend = BackendKind::PROCESS;
        else note(err, std::string("WARDEN_BACKEND ignored: ") + v);
    }

    if (const char* v = std::getenv("WARDEN_OUTPUT_MAX_BYTES")) {
        try {
            unsigned long long n = std::stoull(v);
            if (n >= 1024) s.output_max_bytes = static_cast<size_t>(n);
            else note(err, "WARDEN_OUTPUT_MAX_BYTES below 1024 ignored");
        } catch (const std::exception&) {
            note(err, std::string("WARDEN_OUTPUT_MAX_BYTES ignored: ") + v);
        }
    }

    if (const char* v = std::getenv("WARDEN_MAX_PROCS")) {
        try {
            s.max_processes = std::clamp(std::stoi(v), 0, 65536);
        } catch (const std::exception&) {
            note(err, std::string("WARDEN_MAX_PROCS ignored: ") + v);
        }
    }

    s.wal_fsync = env_flag("WARDEN_WAL_FSYNC", s.wal_fsync);
    s.net_strict = env_flag("WARDEN_NET_STRICT", s.net_strict);
    s.fs_strict = env_flag("WARDEN_FS_STRICT", s.fs_strict);
    return s;
}

} // namespace warden
