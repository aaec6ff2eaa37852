#include "test_common.h"

#include "warden/policy.h"

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace warden;

static bool throws_policy_error(const std::string& doc) {
    try {
        (void)parse_policy(doc);
    } catch (const PolicyError&) {
        return true;
    }
    return false;
}

static void write_file(const std::filesystem::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << s;
}

int main() {
    // Quantities
    expect_true(parse_cpu_quantity("1").value_or(0) == 1.0, "cpu 1");
    expect_true(parse_cpu_quantity(" 0.5 ").value_or(0) == 0.5, "cpu 0.5 with spaces");
    expect_true(!parse_cpu_quantity("0"), "cpu 0 rejected");
    expect_true(!parse_cpu_quantity("-1"), "negative cpu rejected");
    expect_true(!parse_cpu_quantity("two"), "junk cpu rejected");
    expect_true(!parse_cpu_quantity("1x"), "trailing junk rejected");

    expect_eq_ll((long long)parse_memory_quantity("512m").value_or(0), 512LL * 1024 * 1024, "512m");
    expect_eq_ll((long long)parse_memory_quantity("1g").value_or(0), 1024LL * 1024 * 1024, "1g");
    expect_eq_ll((long long)parse_memory_quantity("64K").value_or(0), 64LL * 1024, "64K");
    expect_eq_ll((long long)parse_memory_quantity("256mb").value_or(0), 256LL * 1024 * 1024, "256mb");
    expect_eq_ll((long long)parse_memory_quantity("1048576").value_or(0), 1048576, "plain bytes");
    expect_true(!parse_memory_quantity("m"), "suffix only rejected");
    expect_true(!parse_memory_quantity("1.5g"), "fractions rejected");
    expect_true(!parse_memory_quantity("lots"), "junk memory rejected");

    // Full document
    Policy p = parse_policy(R"({
        "allowed_images": ["python:3.11-slim", "alpine:3.19"],
        "cpu_limit": "0.5",
        "memory_limit": "256m",
        "timeout_seconds": 2.5,
        "network_allowed": true
    })");
    expect_eq_ll((long long)p.allowed_images.size(), 2, "two images");
    expect_true(p.cpu_limit == 0.5, "cpu parsed");
    expect_eq_ll((long long)p.memory_limit_bytes, 256LL * 1024 * 1024, "memory parsed");
    expect_eq_ll(p.timeout_ms, 2500, "fractional timeout");
    expect_true(p.network_allowed, "network flag");
    expect_true(!p.explicitly_empty, "not empty");

    expect_true(evaluate(p, "alpine:3.19") == Decision::ALLOWED, "listed image allowed");
    expect_true(evaluate(p, "alpine:3.18") == Decision::DENIED, "other tag denied");
    expect_true(evaluate(p, "alpine") == Decision::DENIED, "exact match only");
    expect_true(evaluate(p, "") == Decision::DENIED, "empty image denied");

    // "timeout" is the field name; "timeout_seconds" is an alias.
    expect_eq_ll(parse_policy(R"({"allowed_images":[],"timeout":30})").timeout_ms, 30000, "timeout in seconds");
    expect_eq_ll(parse_policy(R"({"allowed_images":[],"timeout":0.25})").timeout_ms, 250, "fractional seconds");
    expect_eq_ll(parse_policy(R"({"allowed_images":[],"timeout":"45s"})").timeout_ms, 45000, "seconds suffix");
    expect_eq_ll(parse_policy(R"({"allowed_images":[],"timeout":"1500ms"})").timeout_ms, 1500, "millisecond suffix");
    expect_eq_ll(parse_policy(R"({"allowed_images":[],"timeout":"2m"})").timeout_ms, 120000, "minute suffix");
    expect_eq_ll(parse_policy(R"({"allowed_images":[],"timeout_seconds":"30"})").timeout_ms, 30000, "alias takes strings too");
    expect_true(parse_duration_ms("10").value_or(0) == 10000, "bare number is seconds");
    expect_true(!parse_duration_ms("ms"), "unit only rejected");

    // Defaults
    Policy d = parse_policy(R"({"allowed_images":["x"]})");
    expect_true(d.cpu_limit == 1.0, "default cpu");
    expect_eq_ll((long long)d.memory_limit_bytes, 512LL * 1024 * 1024, "default memory");
    expect_eq_ll(d.timeout_ms, 30000, "default timeout");
    expect_true(!d.network_allowed, "network denied by default");

    // Explicitly empty allowlist is valid and denies everything.
    Policy e = parse_policy(R"({"allowed_images":[]})");
    expect_true(e.explicitly_empty, "empty allowlist flagged");
    expect_true(evaluate(e, "x") == Decision::DENIED, "empty allowlist denies");

    // Malformed documents
    expect_true(throws_policy_error(""), "empty text");
    expect_true(throws_policy_error("[]"), "array document");
    expect_true(throws_policy_error("{}"), "missing allowed_images");
    expect_true(throws_policy_error(R"({"allowed_images":"x"})"), "allowlist not an array");
    expect_true(throws_policy_error(R"({"allowed_images":[1]})"), "non-string image");
    expect_true(throws_policy_error(R"({"allowed_images":[""]})"), "empty image name");
    expect_true(throws_policy_error(R"({"allowed_images":[],"cpu_limit":0})"), "zero cpu");
    expect_true(throws_policy_error(R"({"allowed_images":[],"memory_limit":"1m"})"), "memory below minimum");
    expect_true(throws_policy_error(R"({"allowed_images":[],"timeout_seconds":0})"), "zero timeout");
    expect_true(throws_policy_error(R"({"allowed_images":[],"timeout":"soon"})"), "junk timeout");
    expect_true(throws_policy_error(R"({"allowed_images":[],"timeout":"-5s"})"), "negative timeout");
    expect_true(throws_policy_error(R"({"allowed_images":[],"timeout":true})"), "boolean timeout");
    expect_true(throws_policy_error(R"({"allowed_images":[],"timeout":5,"timeout_seconds":5})"), "both timeout spellings");
    expect_true(throws_policy_error(R"({"allowed_images":[],"network_allowed":"no"})"), "string network flag");
    expect_true(throws_policy_error(R"({"allowed_images":[],"allow_all":true})"), "unknown field");
    expect_true(throws_policy_error(R"({"allowed_images":[]} trailing)"), "trailing data");

    // Store: missing file is fatal, reload publishes a new snapshot and old ones stay intact.
    TestDir dir("policy");
    PolicyStore missing(dir.path / "absent.json");
    bool threw = false;
    try {
        missing.load();
    } catch (const PolicyError&) {
        threw = true;
    }
    expect_true(threw, "missing policy file must throw");
    expect_true(missing.snapshot() == nullptr, "no snapshot after failed load");

    auto path = dir.path / "policy.json";
    write_file(path, R"({"allowed_images":["a"]})");
    PolicyStore store(path);
    auto first = store.load();
    expect_true(store.snapshot() == first, "snapshot is the loaded policy");

    write_file(path, R"({"allowed_images":["b"],"timeout_seconds":1})");
    auto second = store.load();
    expect_true(evaluate(*first, "a") == Decision::ALLOWED, "old snapshot unchanged");
    expect_true(evaluate(*second, "a") == Decision::DENIED, "new snapshot applied");
    expect_eq_ll(first->timeout_ms, 30000, "old snapshot keeps its limits");

    // Failed reload keeps the previous snapshot (atomic load).
    write_file(path, R"({"allowed_images":["c"],"cpu_limit":"zero"})");
    threw = false;
    try {
        store.load();
    } catch (const PolicyError&) {
        threw = true;
    }
    expect_true(threw, "invalid reload throws");
    expect_true(store.snapshot() == second, "previous snapshot still current");

    // Concurrent readers while publishing.
    std::vector<std::thread> readers;
    std::atomic<int> seen{0};
    for (int i = 0; i < 4; i++) {
        readers.emplace_back([&] {
            for (int k = 0; k < 1000; k++) {
                auto s = store.snapshot();
                if (s && !s->allowed_images.empty()) seen++;
            }
        });
    }
    for (int k = 0; k < 50; k++) {
        Policy np;
        np.allowed_images.insert("img" + std::to_string(k));
        store.publish(np);
    }
    for (auto& t : readers) t.join();
    expect_eq_ll(seen.load(), 4000, "every snapshot read was complete");

    std::cerr << "test_policy: ALL PASSED" << std::endl;
    return 0;
}
