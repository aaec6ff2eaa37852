#include "warden/policy.h"
#include "warden/json_util.h"
#include "warden/log.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace warden {

namespace {

constexpr uint64_t kMinMemoryBytes = 4ULL * 1024 * 1024;

const char* const kKnownKeys[] = {
    "allowed_images", "cpu_limit", "memory_limit", "timeout", "timeout_seconds", "network_allowed",
};

bool is_known_key(const char* k) {
    for (const char* known : kKnownKeys) {
        if (std::string(known) == k) return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

} // namespace

Decision evaluate(const Policy& policy, const std::string& image) {
    return policy.allowed_images.count(image) ? Decision::ALLOWED : Decision::DENIED;
}

std::optional<double> parse_cpu_quantity(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    size_t used = 0;
    double v = 0;
    try {
        v = std::stod(t, &used);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (used != t.size() || !std::isfinite(v) || v <= 0) return std::nullopt;
    return v;
}

std::optional<uint64_t> parse_memory_quantity(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;

    uint64_t mult = 1;
    char last = static_cast<char>(std::tolower(static_cast<unsigned char>(t.back())));
    if (last == 'b' && t.size() >= 2) {
        // accept "512mb" / "1gb" spellings
        char prev = static_cast<char>(std::tolower(static_cast<unsigned char>(t[t.size() - 2])));
        if (prev == 'k' || prev == 'm' || prev == 'g') {
            t.pop_back();
            last = prev;
        }
    }
    if (last == 'k') mult = 1024ULL;
    else if (last == 'm') mult = 1024ULL * 1024;
    else if (last == 'g') mult = 1024ULL * 1024 * 1024;
    if (mult != 1) t.pop_back();
    if (t.empty()) return std::nullopt;

    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    uint64_t n = 0;
    try {
        n = std::stoull(t);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (n > UINT64_MAX / mult) return std::nullopt;
    return n * mult;
}

std::optional<int64_t> parse_duration_ms(const std::string& s) {
    std::string t = trim(s);
    double mult = 1000.0;
    if (t.size() > 2 && t.compare(t.size() - 2, 2, "ms") == 0) {
        mult = 1.0;
        t.resize(t.size() - 2);
    } else if (!t.empty() && (t.back() == 's' || t.back() == 'm')) {
        if (t.back() == 'm') mult = 60000.0;
        t.pop_back();
    }
    if (t.empty()) return std::nullopt;
    size_t used = 0;
    double v = 0;
    try {
        v = std::stod(t, &used);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (used != t.size() || !std::isfinite(v) || v <= 0) return std::nullopt;
    int64_t ms = static_cast<int64_t>(std::llround(v * mult));
    return ms < 1 ? 1 : ms;
}

Policy parse_policy(const std::string& json_text) {
    std::string perr;
    json::Doc doc = json::parse(json_text, &perr);
    if (!doc) throw PolicyError("policy is not valid JSON: " + perr);
    if (!json_object_is_type(doc.root, json_type_object)) {
        throw PolicyError("policy must be a JSON object");
    }

    json_object_object_foreach(doc.root, key, val) {
        (void)val;
        if (!is_known_key(key)) throw PolicyError(std::string("unknown policy field: ") + key);
    }

    Policy p;

    json_object* imgs = json::member(doc.root, "allowed_images");
    if (!imgs) throw PolicyError("policy field allowed_images is required");
    if (!json_object_is_type(imgs, json_type_array)) {
        throw PolicyError("allowed_images must be an array of strings");
    }
    const size_t n = json_object_array_length(imgs);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(imgs, i);
        if (!el || !json_object_is_type(el, json_type_string)) {
            throw PolicyError("allowed_images[" + std::to_string(i) + "] is not a string");
        }
        std::string img = json_object_get_string(el);
        if (img.empty()) throw PolicyError("allowed_images[" + std::to_string(i) + "] is empty");
        p.allowed_images.insert(img);
    }
    p.explicitly_empty = p.allowed_images.empty();

    if (json_object* cpu = json::member(doc.root, "cpu_limit")) {
        std::optional<double> v;
        if (json_object_is_type(cpu, json_type_string)) v = parse_cpu_quantity(json_object_get_string(cpu));
        else if (json_object_is_type(cpu, json_type_int) || json_object_is_type(cpu, json_type_double)) {
            double d = json_object_get_double(cpu);
            if (std::isfinite(d) && d > 0) v = d;
        }
        if (!v) throw PolicyError("cpu_limit must be a positive number of cores");
        p.cpu_limit = *v;
    }

    if (json_object* mem = json::member(doc.root, "memory_limit")) {
        std::optional<uint64_t> v;
        if (json_object_is_type(mem, json_type_string)) v = parse_memory_quantity(json_object_get_string(mem));
        else if (json_object_is_type(mem, json_type_int) && json_object_get_int64(mem) > 0) {
            v = static_cast<uint64_t>(json_object_get_int64(mem));
        }
        if (!v) throw PolicyError("memory_limit must be a byte quantity such as \"512m\"");
        if (*v < kMinMemoryBytes) throw PolicyError("memory_limit below 4m");
        p.memory_limit_bytes = *v;
    }

    // "timeout_seconds" is the older spelling of "timeout".
    json_object* tmo = json::member(doc.root, "timeout");
    const char* tmo_key = "timeout";
    if (json_object* alias = json::member(doc.root, "timeout_seconds")) {
        if (tmo) throw PolicyError("timeout and timeout_seconds are mutually exclusive");
        tmo = alias;
        tmo_key = "timeout_seconds";
    }
    if (tmo) {
        std::optional<int64_t> ms;
        if (json_object_is_type(tmo, json_type_string)) {
            ms = parse_duration_ms(json_object_get_string(tmo));
        } else if (json_object_is_type(tmo, json_type_int) || json_object_is_type(tmo, json_type_double)) {
            double secs = json_object_get_double(tmo);
            if (std::isfinite(secs) && secs > 0) {
                ms = static_cast<int64_t>(std::llround(secs * 1000.0));
                if (*ms < 1) ms = 1;
            }
        }
        if (!ms) throw PolicyError(std::string(tmo_key) + " must be a positive duration (seconds, or \"30s\" / \"500ms\" / \"2m\")");
        p.timeout_ms = *ms;
    }

    if (json::member(doc.root, "network_allowed")) {
        auto net = json::get_bool(doc.root, "network_allowed");
        if (!net) throw PolicyError("network_allowed must be a boolean");
        p.network_allowed = *net;
    }

    return p;
}

Policy load_policy_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw PolicyError("policy file not found: " + path.string());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) throw PolicyError("cannot open policy file: " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw PolicyError("cannot read policy file: " + path.string());

    try {
        return parse_policy(ss.str());
    } catch (const PolicyError& e) {
        throw PolicyError(path.string() + ": " + e.what());
    }
}

PolicyStore::PolicyStore(std::filesystem::path path) : path_(std::move(path)) {}

std::shared_ptr<const Policy> PolicyStore::load() {
    auto fresh = std::make_shared<const Policy>(load_policy_file(path_));
    if (fresh->explicitly_empty) {
        log_warn("policy", path_.string() + ": allowed_images is empty, every job will be rejected");
    } else {
        log_info("policy", "loaded " + path_.string() + " (" +
                 std::to_string(fresh->allowed_images.size()) + " allowed images, network " +
                 (fresh->network_allowed ? "allowed" : "denied") + ")");
    }
    std::lock_guard<std::mutex> lk(mu_);
    current_ = fresh;
    return fresh;
}

void PolicyStore::publish(Policy policy) {
    auto fresh = std::make_shared<const Policy>(std::move(policy));
    std::lock_guard<std::mutex> lk(mu_);
    current_ = std::move(fresh);
}

std::shared_ptr<const Policy> PolicyStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return current_;
}

} // namespace warden
