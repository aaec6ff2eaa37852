#pragma once

// Warden execution orchestrator.
//
// Owns the job lifecycle: submit -> QUEUED, then on a worker slot
//   policy check -> (REJECTED | RUNNING -> backend -> terminal state).
// Every fault on that path ends in a terminal state; a job is never left in
// RUNNING by this process.

#include "warden/isolation.h"
#include "warden/job_store.h"
#include "warden/policy.h"
#include "warden/types.h"
#include "warden/work_queue.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace warden {

constexpr int kDefaultPriority = 5000;
constexpr int kMaxPriority = 9999;

struct OrchestratorConfig {
    int workers{2};   // 0 = process each job inside submit()
};

struct RecoveryReport {
    size_t orphaned{0};   // RUNNING -> FAILED "orphaned after restart"
    size_t requeued{0};   // QUEUED jobs handed back to the work queue
};

enum class CancelStatus {
    CANCELLED,     // queued job rejected
    SIGNALLED,     // running job forced onto the timeout path
    NOT_FOUND,
    ALREADY_DONE,  // terminal
};

const char* cancel_status_str(CancelStatus s);

class Orchestrator {
public:
    Orchestrator(PolicyStore& policy, JobStore& store, IsolationBackend& backend,
                 OrchestratorConfig cfg = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Reconciles orphans, re-queues pending jobs, then starts accepting work.
    RecoveryReport start();

    // Stop accepting work and join the workers. Running jobs finish; queued
    // jobs stay QUEUED in the store for the next start().
    void stop();

    // Reconciliation only (no workers are started).
    RecoveryReport recover();

    // Records the job as QUEUED and returns its id. nullopt (with *err) when
    // not started, the priority is out of range, or the store refused it.
    std::optional<std::string> submit(const std::string& payload, const std::string& image,
                                      int priority = kDefaultPriority, std::string* err = nullptr);

    std::optional<Job> status(const std::string& job_id) const;

    // Blocks until the job is terminal or timeout_ms elapses (< 0 waits
    // forever). Returns the latest view, nullopt for unknown ids.
    std::optional<Job> wait(const std::string& job_id, int64_t timeout_ms = -1);

    CancelStatus cancel(const std::string& job_id);

    bool accepting() const { return accepting_.load(); }

private:
    void worker_loop();
    void process_job(const std::string& job_id);
    void finish(const std::string& job_id, State to, const Result& result, const std::string& detail);
    void fail_internal(const std::string& job_id, const std::string& detail);
    void notify_done();

    std::shared_ptr<std::atomic<bool>> register_running(const std::string& job_id);
    void unregister_running(const std::string& job_id);

    PolicyStore& policy_;
    JobStore& store_;
    IsolationBackend& backend_;
    OrchestratorConfig cfg_;

    WorkQueue<std::string> queue_;
    std::vector<std::thread> workers_;
    std::mutex lifecycle_mu_;
    bool started_{false};
    std::atomic<bool> accepting_{false};
    std::atomic<bool> stopping_{false};

    std::mutex running_mu_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> running_;

    std::mutex done_mu_;
    std::condition_variable done_cv_;
};

} // namespace warden
