#pragma once

// Warden job state store: durable job_id -> Job map with atomic transitions.
//
// Layout of a state directory:
//   <state_dir>/LOCK          flock()ed by the owning process
//   <state_dir>/jobs.jsonl    hash-chained WAL of CREATE / TRANSITION records
//   <state_dir>/payloads/<id> submitted payload bytes (Job::payload_ref)
//
// Every record is written to the WAL before it becomes visible in memory, so
// a reader never observes a transition that would be lost on restart.
// Transitions for one job are serialized by that job's mutex; different jobs
// only share the WAL append.
//
// A read-only store (status and audit queries from another process) takes no
// lock, never writes, and sees the WAL as it was when it was opened.

#include "warden/types.h"
#include "warden/wal.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct json_object;

namespace warden {

// The state directory cannot be opened, replayed or locked.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TransitionStatus {
    OK,
    INVALID_TRANSITION,   // edge not in the lifecycle graph; stored state unchanged
    NOT_FOUND,
    STORAGE_ERROR,        // WAL append failed; stored state unchanged
};

const char* transition_status_str(TransitionStatus s);

struct JobStoreOptions {
    std::filesystem::path state_dir;
    bool fsync{false};
    bool read_only{false};
};

class JobStore {
public:
    // Locks the directory and replays the WAL (read-only: replay only).
    // Throws StoreError.
    explicit JobStore(JobStoreOptions opts);
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // Persist a payload under payloads/<job_id>. Returns the payload_ref, or an
    // empty string with *err set.
    std::string put_payload(const std::string& job_id, const std::string& payload, std::string* err);
    bool read_payload(const Job& job, std::string* out, std::string* err) const;

    // New job in QUEUED. nullopt (with *err) on duplicate id or storage failure.
    std::optional<Job> create(const std::string& job_id, const std::string& payload_ref,
                              const std::string& image, int priority, std::string* err = nullptr);

    // Move a job to `to`. `result` is stored with terminal states; `detail`
    // goes to the audit record only.
    TransitionStatus transition(const std::string& job_id, State to,
                                const std::optional<Result>& result = std::nullopt,
                                const std::string& detail = "");

    std::optional<Job> get(const std::string& job_id) const;

    // Jobs in `state`, oldest first.
    std::vector<Job> list(State state) const;
    std::vector<Job> list_all() const;

    // Transition history of one job, in order.
    std::vector<TransitionRecord> audit(const std::string& job_id) const;

    // Every transition of every job, in WAL order (read back from disk).
    std::vector<TransitionRecord> audit_all() const;

    const std::filesystem::path& state_dir() const { return opts_.state_dir; }
    bool read_only() const { return opts_.read_only; }
    std::filesystem::path wal_path() const;

private:
    struct Entry {
        mutable std::mutex mu;
        Job job;
        std::vector<TransitionRecord> history;
    };

    std::shared_ptr<Entry> find(const std::string& job_id) const;
    void lock_dir();
    void replay();
    std::string append_chained(json_object* rec);

    JobStoreOptions opts_;
    int lock_fd_{-1};
    Wal wal_;

    std::mutex chain_mu_;
    std::string chain_prev_;

    mutable std::shared_mutex map_mu_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> jobs_;
    std::unordered_set<std::string> reserved_;   // ids whose CREATE is being appended
};

struct ChainReport {
    bool ok{true};
    size_t records{0};
    size_t first_bad_line{0};   // 1-based, 0 when ok
    std::string error;
};

// Recompute the hash chain of a WAL file. A torn final line is not an error.
ChainReport verify_audit_chain(const std::filesystem::path& wal_path);

} // namespace warden
