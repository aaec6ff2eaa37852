#include "test_common.h"

#include "warden/job_store.h"
#include "warden/wal.h"

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace warden;
namespace fs = std::filesystem;

static Result make_result(bool allowed, int code, Reason reason) {
    Result r;
    r.allowed = allowed;
    r.exit_code = code;
    r.reason = reason;
    r.stdout_data = "out";
    return r;
}

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream f(p);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

static void write_lines(const fs::path& p, const std::vector<std::string>& lines) {
    std::ofstream f(p, std::ios::trunc);
    for (const auto& l : lines) f << l << "\n";
}

int main() {
    TestDir dir("job_store");
    const fs::path state = dir.path / "state";

    {
        JobStore store(JobStoreOptions{state, false});

        std::string err;
        std::string ref = store.put_payload("job1", "echo hi\n", &err);
        expect_true(!ref.empty(), "payload stored: " + err);
        auto j = store.create("job1", ref, "alpine:3.19", 10, &err);
        expect_true(j.has_value(), "create: " + err);
        expect_true(j->state == State::QUEUED, "new jobs are queued");
        expect_true(!j->result.has_value(), "no result yet");

        std::string payload;
        expect_true(store.read_payload(*j, &payload, &err), "payload readable");
        expect_eq_str(payload, "echo hi\n", "payload bytes kept");

        expect_true(!store.create("job1", ref, "alpine:3.19", 10, &err), "duplicate id refused");
        expect_true(!store.create("../evil", ref, "alpine:3.19", 10, &err), "path-like id refused");
        expect_true(store.put_payload("a/b", "x", &err).empty(), "path-like payload id refused");

        // Skipping running is invalid and leaves the state alone.
        expect_true(store.transition("job1", State::SUCCEEDED, make_result(true, 0, Reason::OK)) ==
                    TransitionStatus::INVALID_TRANSITION, "queued -> succeeded invalid");
        expect_true(store.get("job1")->state == State::QUEUED, "state unchanged after invalid transition");

        expect_true(store.transition("missing", State::RUNNING) == TransitionStatus::NOT_FOUND, "unknown job");
        expect_true(!store.get("missing").has_value(), "get unknown");

        expect_true(store.transition("job1", State::RUNNING) == TransitionStatus::OK, "queued -> running");
        expect_true(store.transition("job1", State::QUEUED) == TransitionStatus::INVALID_TRANSITION, "no going back");
        expect_true(store.transition("job1", State::SUCCEEDED, make_result(true, 0, Reason::OK)) ==
                    TransitionStatus::OK, "running -> succeeded");
        expect_true(store.transition("job1", State::FAILED, make_result(true, 1, Reason::NONZERO_EXIT)) ==
                    TransitionStatus::INVALID_TRANSITION, "terminal is final");

        auto done = store.get("job1");
        expect_true(done->state == State::SUCCEEDED, "terminal state stored");
        expect_true(done->result && done->result->reason == Reason::OK, "result stored");
        expect_eq_ll(done->priority, 10, "priority kept");

        auto hist = store.audit("job1");
        expect_eq_ll((long long)hist.size(), 2, "two audited transitions");
        expect_true(hist[0].from == State::QUEUED && hist[0].to == State::RUNNING, "first edge");
        expect_true(hist[1].from == State::RUNNING && hist[1].to == State::SUCCEEDED, "second edge");
        expect_true(hist[0].at_ms <= hist[1].at_ms && hist[0].at_ms > 0, "timestamps ordered");

        // Second job left running, third left queued (simulated crash below).
        std::string r2 = store.put_payload("job2", "sleep 100", &err);
        expect_true(store.create("job2", r2, "alpine:3.19", 5000, &err).has_value(), "create job2");
        expect_true(store.transition("job2", State::RUNNING, std::nullopt, "worker 1") == TransitionStatus::OK, "job2 running");
        std::string r3 = store.put_payload("job3", "true", &err);
        expect_true(store.create("job3", r3, "alpine:3.19", 1, &err).has_value(), "create job3");
        expect_true(store.transition("job3", State::REJECTED, make_result(false, 1, Reason::IMAGE_NOT_ALLOWLISTED)) ==
                    TransitionStatus::OK, "queued -> rejected");
        std::string r4 = store.put_payload("job4", "true", &err);
        expect_true(store.create("job4", r4, "alpine:3.19", 1, &err).has_value(), "create job4");

        expect_eq_ll((long long)store.list(State::RUNNING).size(), 1, "one running");
        expect_eq_ll((long long)store.list(State::QUEUED).size(), 1, "one queued");
        expect_eq_ll((long long)store.list_all().size(), 4, "four jobs");
        expect_eq_ll((long long)store.audit_all().size(), 4, "four transitions in wal order");
        expect_eq_str(store.audit("job2")[0].detail, "worker 1", "audit detail kept");

        // A second owner of the same directory is refused.
        bool refused = false;
        try {
            JobStore other(JobStoreOptions{state, false});
        } catch (const StoreError&) {
            refused = true;
        }
        expect_true(refused, "state directory is single-owner");

        // Queries from another process do not need the owner's lock.
        JobStore reader(JobStoreOptions{state, false, true});
        expect_true(reader.read_only(), "reader is read-only");
        auto seen = reader.get("job1");
        expect_true(seen && seen->state == State::SUCCEEDED, "reader sees the owner's jobs");
        expect_eq_ll((long long)reader.audit("job2").size(), 1, "reader sees the audit trail");
        expect_eq_ll((long long)reader.audit_all().size(), 4, "reader reads the whole trail");
        expect_true(reader.transition("job4", State::RUNNING) == TransitionStatus::STORAGE_ERROR, "reader cannot transition");
        expect_true(!reader.create("job9", r4, "alpine:3.19", 1, &err), "reader cannot create");
        expect_true(reader.put_payload("job9", "x", &err).empty(), "reader cannot store payloads");
        expect_true(store.get("job4")->state == State::QUEUED, "owner unaffected by reader");
    }

    const fs::path wal = state / "jobs.jsonl";
    ChainReport rep = verify_audit_chain(wal);
    expect_true(rep.ok, "chain intact: " + rep.error);
    expect_eq_ll((long long)rep.records, 8, "4 creates + 4 transitions");

    // Crash mid-append: torn tail ignored on replay.
    {
        std::ofstream f(wal, std::ios::binary | std::ios::app);
        f << "{\"type\":\"TRANSITION\",\"job_id\":\"job4\",\"from_st";
    }
    expect_true(verify_audit_chain(wal).ok, "torn tail is not a chain break");

    {
        const auto before = fs::file_size(wal);
        JobStore reader(JobStoreOptions{state, false, true});
        expect_true(reader.get("job4") && reader.get("job4")->state == State::QUEUED, "reader skips an in-flight record");
        expect_eq_ll((long long)fs::file_size(wal), (long long)before, "reader never truncates");
    }

    {
        JobStore store(JobStoreOptions{state, false});
        auto j1 = store.get("job1");
        expect_true(j1 && j1->state == State::SUCCEEDED, "job1 replayed");
        expect_true(j1->result && j1->result->stdout_data == "out", "result replayed");
        expect_true(store.get("job2")->state == State::RUNNING, "job2 replayed as running");
        expect_true(store.get("job3")->state == State::REJECTED, "job3 replayed");
        expect_true(store.get("job4")->state == State::QUEUED, "job4 still queued");
        expect_eq_ll((long long)store.audit("job1").size(), 2, "history replayed");

        // Appends continue the chain after the dropped fragment.
        expect_true(store.transition("job2", State::FAILED, make_result(true, 1, Reason::ORPHANED_AFTER_RESTART)) ==
                    TransitionStatus::OK, "transition after replay");
    }
    rep = verify_audit_chain(wal);
    expect_true(rep.ok, "chain still intact after restart: " + rep.error);
    expect_eq_ll((long long)rep.records, 9, "one more record");

    // Tampering is detected at the modified line.
    auto lines = read_lines(wal);
    expect_eq_ll((long long)lines.size(), 9, "nine lines on disk");
    auto tampered = lines;
    size_t pos = tampered[3].find("\"alpine:3.19\"");
    expect_true(pos != std::string::npos, "line 4 (job2 CREATE) mentions the image");
    tampered[3].replace(pos, 13, "\"alpine:3.20\"");
    write_lines(wal, tampered);
    rep = verify_audit_chain(wal);
    expect_true(!rep.ok, "tampering detected");
    expect_eq_ll((long long)rep.first_bad_line, 4, "first bad line reported");

    auto dropped = lines;
    dropped.erase(dropped.begin() + 2);
    write_lines(wal, dropped);
    rep = verify_audit_chain(wal);
    expect_true(!rep.ok, "deleted record detected");
    expect_eq_ll((long long)rep.first_bad_line, 3, "break at the gap");
    write_lines(wal, lines);

    // Per-job serialization: racing transitions on one job, exactly one wins.
    {
        JobStore store(JobStoreOptions{dir.path / "race", false});
        std::string err;
        std::string ref = store.put_payload("r", "x", &err);
        expect_true(store.create("r", ref, "img", 5000, &err).has_value(), "create race job");
        expect_true(store.transition("r", State::RUNNING) == TransitionStatus::OK, "race job running");

        std::atomic<int> wins{0};
        std::vector<std::thread> ts;
        const State targets[] = {State::SUCCEEDED, State::FAILED, State::TIMED_OUT, State::REJECTED};
        for (int i = 0; i < 8; i++) {
            ts.emplace_back([&, i] {
                if (store.transition("r", targets[i % 4], make_result(true, i, Reason::OK)) == TransitionStatus::OK) wins++;
            });
        }
        for (auto& t : ts) t.join();
        expect_eq_ll(wins.load(), 1, "exactly one terminal transition");
        expect_eq_ll((long long)store.audit("r").size(), 2, "history has one terminal record");

        // Different jobs proceed independently.
        std::vector<std::thread> creators;
        std::atomic<int> created{0};
        for (int i = 0; i < 8; i++) {
            creators.emplace_back([&, i] {
                std::string e;
                std::string id = "p" + std::to_string(i);
                std::string rf = store.put_payload(id, "x", &e);
                if (!store.create(id, rf, "img", i, &e)) return;
                if (store.transition(id, State::RUNNING) != TransitionStatus::OK) return;
                if (store.transition(id, State::SUCCEEDED, make_result(true, 0, Reason::OK)) == TransitionStatus::OK) created++;
            });
        }
        for (auto& t : creators) t.join();
        expect_eq_ll(created.load(), 8, "parallel jobs all completed");

        // Same id from many threads: one CREATE record, one winner.
        std::atomic<int> dup_wins{0};
        std::vector<std::thread> dups;
        std::string derr;
        std::string dref = store.put_payload("dup", "x", &derr);
        for (int i = 0; i < 8; i++) {
            dups.emplace_back([&] {
                std::string e;
                if (store.create("dup", dref, "img", 1, &e)) dup_wins++;
            });
        }
        for (auto& t : dups) t.join();
        expect_eq_ll(dup_wins.load(), 1, "one create per id");
        int create_lines = 0;
        for (const auto& l : read_lines(dir.path / "race" / "jobs.jsonl")) {
            if (l.find("\"CREATE\"") != std::string::npos && l.find("\"job_id\":\"dup\"") != std::string::npos) create_lines++;
        }
        expect_eq_ll(create_lines, 1, "one CREATE record for the id");
    }
    expect_true(verify_audit_chain(dir.path / "race" / "jobs.jsonl").ok, "chain intact under concurrency");

    // Garbage in the middle of the WAL is a startup error, not silent loss.
    {
        const fs::path bad = dir.path / "bad";
        fs::create_directories(bad);
        write_lines(bad / "jobs.jsonl", {"not json", "{}"});
        bool threw = false;
        try {
            JobStore store(JobStoreOptions{bad, false});
        } catch (const StoreError&) {
            threw = true;
        }
        expect_true(threw, "corrupt wal refused");
    }

    std::cerr << "test_job_store: ALL PASSED" << std::endl;
    return 0;
}
