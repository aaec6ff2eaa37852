#pragma once

// Warden isolation policy: which images may run and under which limits.
//
// The policy document is JSON with exactly these members:
//
//   {
//     "allowed_images":  ["python:3.11-slim", ...],   required, may be []
//     "cpu_limit":       "1" | 0.5,                    cores, default "1"
//     "memory_limit":    "512m" | 268435456,           default "512m"
//     "timeout":         30 | "30s" | "500ms" | "2m",  default 30 seconds
//                        ("timeout_seconds" is accepted as an alias)
//     "network_allowed": false                         default false
//   }
//
// Unknown members, wrong types and unparsable quantities are PolicyError.
// A Policy value is immutable; reloading publishes a new snapshot and never
// touches the one that admitted jobs already hold.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace warden {

class PolicyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Policy {
    std::set<std::string> allowed_images;
    double cpu_limit{1.0};                              // cores
    uint64_t memory_limit_bytes{512ULL * 1024 * 1024};
    int64_t timeout_ms{30000};
    bool network_allowed{false};

    // allowed_images was present but empty: deny-all on purpose.
    bool explicitly_empty{false};
};

enum class Decision { ALLOWED, DENIED };

// Pure membership test.
Decision evaluate(const Policy& policy, const std::string& image);

// "1", "0.5", "2.25" -> cores. nullopt when not a positive finite number.
std::optional<double> parse_cpu_quantity(const std::string& s);

// "512m", "1g", "65536k", "1048576" -> bytes (binary units). nullopt on junk.
std::optional<uint64_t> parse_memory_quantity(const std::string& s);

// "30", "30s", "1500ms", "2m" -> milliseconds; a bare number is seconds.
std::optional<int64_t> parse_duration_ms(const std::string& s);

// Parse and validate a policy document. Throws PolicyError.
Policy parse_policy(const std::string& json_text);

// Read and parse a policy file. A missing file is a PolicyError, never a default.
Policy load_policy_file(const std::filesystem::path& path);

class PolicyStore {
public:
    explicit PolicyStore(std::filesystem::path path);

    // Load (or reload) from disk and publish the result as the current snapshot.
    // On failure the previous snapshot stays current and PolicyError propagates.
    std::shared_ptr<const Policy> load();

    // Install an already validated policy (used by embedders and tests).
    void publish(Policy policy);

    // Current snapshot; nullptr before the first successful load.
    std::shared_ptr<const Policy> snapshot() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mu_;
    std::shared_ptr<const Policy> current_;
};

} // namespace warden
