#include "warden/orchestrator.h"
#include "warden/hash.h"
#include "warden/log.h"

#include <chrono>
#include <exception>
#include <stdexcept>

namespace warden {

namespace {

const char* const kComponent = "orchestrator";

State terminal_state_for(Reason reason) {
    switch (reason) {
        case Reason::OK:                  return State::SUCCEEDED;
        case Reason::TIMEOUT:             return State::TIMED_OUT;
        case Reason::BACKEND_UNAVAILABLE: return State::REJECTED;
        default:                          return State::FAILED;
    }
}

Result make_result(bool allowed, int exit_code, Reason reason) {
    Result r;
    r.allowed = allowed;
    r.exit_code = exit_code;
    r.reason = reason;
    return r;
}

} // namespace

const char* cancel_status_str(CancelStatus s) {
    switch (s) {
        case CancelStatus::CANCELLED:    return "cancelled";
        case CancelStatus::SIGNALLED:    return "signalled";
        case CancelStatus::NOT_FOUND:    return "not found";
        case CancelStatus::ALREADY_DONE: return "already terminal";
    }
    return "not found";
}

Orchestrator::Orchestrator(PolicyStore& policy, JobStore& store, IsolationBackend& backend,
                           OrchestratorConfig cfg)
    : policy_(policy), store_(store), backend_(backend), cfg_(cfg) {
    if (cfg_.workers < 0) cfg_.workers = 0;
}

Orchestrator::~Orchestrator() {
    stop();
}

RecoveryReport Orchestrator::recover() {
    RecoveryReport rep;

    // No backend handle survives a restart, so everything RUNNING is an orphan.
    for (const Job& job : store_.list(State::RUNNING)) {
        Result r = make_result(true, 1, Reason::ORPHANED_AFTER_RESTART);
        TransitionStatus st = store_.transition(job.job_id, State::FAILED, r, "no live backend handle after restart");
        if (st == TransitionStatus::OK) {
            rep.orphaned++;
            log_warn(kComponent, "job " + job.job_id + " orphaned after restart, marked failed");
        } else {
            log_error(kComponent, "cannot reconcile orphan " + job.job_id + ": " + transition_status_str(st));
        }
    }

    for (const Job& job : store_.list(State::QUEUED)) {
        if (queue_.push(job.priority, job.job_id)) rep.requeued++;
    }
    if (rep.requeued > 0) log_info(kComponent, "re-queued " + std::to_string(rep.requeued) + " pending jobs");
    return rep;
}

RecoveryReport Orchestrator::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (started_) return {};
    started_ = true;

    RecoveryReport rep = recover();

    if (cfg_.workers == 0) {
        WorkQueue<std::string>::Item item;
        while (queue_.try_pop(item)) process_job(item.value);
    } else {
        workers_.reserve(static_cast<size_t>(cfg_.workers));
        for (int i = 0; i < cfg_.workers; i++) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }
    accepting_.store(true);
    log_info(kComponent, "started with " + std::to_string(cfg_.workers) + " workers, backend=" + backend_.name());
    return rep;
}

void Orchestrator::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    accepting_.store(false);
    stopping_.store(true);
    queue_.close();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void Orchestrator::worker_loop() {
    WorkQueue<std::string>::Item item;
    while (queue_.pop(item)) {
        if (stopping_.load()) break;
        process_job(item.value);
    }
}

std::optional<std::string> Orchestrator::submit(const std::string& payload, const std::string& image,
                                                int priority, std::string* err) {
    if (!accepting_.load()) {
        if (err) *err = "orchestrator is not accepting submissions";
        return std::nullopt;
    }
    if (priority < 0 || priority > kMaxPriority) {
        if (err) *err = "priority must be within 0.." + std::to_string(kMaxPriority);
        return std::nullopt;
    }
    if (image.empty()) {
        if (err) *err = "image must not be empty";
        return std::nullopt;
    }

    std::string job_id;
    try {
        job_id = hash::random_hex(16);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return std::nullopt;
    }

    std::string serr;
    std::string ref = store_.put_payload(job_id, payload, &serr);
    if (ref.empty()) {
        if (err) *err = "payload: " + serr;
        return std::nullopt;
    }
    if (!store_.create(job_id, ref, image, priority, &serr)) {
        if (err) *err = serr;
        return std::nullopt;
    }
    log_debug(kComponent, "queued " + job_id + " image=" + image + " priority=" + std::to_string(priority));

    if (cfg_.workers == 0) {
        process_job(job_id);
    } else if (!queue_.push(priority, job_id)) {
        log_warn(kComponent, "queue closed; " + job_id + " stays queued until the next start");
    }
    return job_id;
}

std::optional<Job> Orchestrator::status(const std::string& job_id) const {
    return store_.get(job_id);
}

std::optional<Job> Orchestrator::wait(const std::string& job_id, int64_t timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    std::unique_lock<std::mutex> lk(done_mu_);
    while (true) {
        auto job = store_.get(job_id);
        if (!job || is_terminal(job->state)) return job;
        if (timeout_ms < 0) {
            done_cv_.wait(lk);
        } else if (done_cv_.wait_until(lk, deadline) == std::cv_status::timeout) {
            return store_.get(job_id);
        }
    }
}

CancelStatus Orchestrator::cancel(const std::string& job_id) {
    auto job = store_.get(job_id);
    if (!job) return CancelStatus::NOT_FOUND;

    if (job->state == State::QUEUED) {
        Result r = make_result(false, 1, Reason::CANCELLED);
        TransitionStatus st = store_.transition(job_id, State::REJECTED, r, "cancelled");
        if (st == TransitionStatus::OK) {
            notify_done();
            log_info(kComponent, "job " + job_id + " cancelled while queued");
            return CancelStatus::CANCELLED;
        }
        // Lost the race with a worker; fall through to the running path.
    }

    {
        std::lock_guard<std::mutex> lk(running_mu_);
        auto it = running_.find(job_id);
        if (it != running_.end()) {
            it->second->store(true);
            log_info(kComponent, "cancel requested for running job " + job_id);
            return CancelStatus::SIGNALLED;
        }
    }
    return CancelStatus::ALREADY_DONE;
}

std::shared_ptr<std::atomic<bool>> Orchestrator::register_running(const std::string& job_id) {
    auto flag = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lk(running_mu_);
    if (!running_.emplace(job_id, flag).second) return nullptr;
    return flag;
}

void Orchestrator::unregister_running(const std::string& job_id) {
    std::lock_guard<std::mutex> lk(running_mu_);
    running_.erase(job_id);
}

void Orchestrator::process_job(const std::string& job_id) {
    try {
        auto job = store_.get(job_id);
        // Cancelled (or already handled) while it waited in the queue.
        if (!job || job->state != State::QUEUED) return;

        // The snapshot stays pinned for the whole job; a reload only affects later jobs.
        std::shared_ptr<const Policy> policy = policy_.snapshot();
        if (!policy) throw std::runtime_error("no policy loaded");

        if (evaluate(*policy, job->image) == Decision::DENIED) {
            log_info(kComponent, "job " + job_id + " rejected: image '" + job->image + "' not allowlisted");
            finish(job_id, State::REJECTED, make_result(false, 1, Reason::IMAGE_NOT_ALLOWLISTED), "");
            return;
        }

        std::string payload;
        std::string err;
        if (!store_.read_payload(*job, &payload, &err)) throw std::runtime_error(err);

        auto cancel_flag = register_running(job_id);
        if (!cancel_flag) return;   // another worker picked up the same entry
        TransitionStatus st = store_.transition(job_id, State::RUNNING);
        if (st != TransitionStatus::OK) {
            unregister_running(job_id);
            if (st == TransitionStatus::INVALID_TRANSITION) return;   // cancelled just now
            throw std::runtime_error(std::string("cannot mark running: ") + transition_status_str(st));
        }

        RawOutcome out;
        try {
            out = backend_.execute(payload, job->image, limits_from_policy(*policy), *cancel_flag);
        } catch (...) {
            unregister_running(job_id);
            throw;
        }
        unregister_running(job_id);

        const State to = terminal_state_for(out.result.reason);
        switch (to) {
            case State::TIMED_OUT:
                log_info(kComponent, "job " + job_id + " timed out (" + out.detail + ")");
                break;
            case State::REJECTED:
                log_warn(kComponent, "job " + job_id + ": isolation backend unavailable: " + out.detail);
                break;
            default:
                log_debug(kComponent, "job " + job_id + " " + state_to_str(to) +
                          " exit=" + std::to_string(out.result.exit_code));
                break;
        }
        finish(job_id, to, out.result, out.detail);
    } catch (const std::exception& e) {
        fail_internal(job_id, e.what());
    } catch (...) {
        fail_internal(job_id, "non-standard exception");
    }
}

void Orchestrator::finish(const std::string& job_id, State to, const Result& result, const std::string& detail) {
    TransitionStatus st = store_.transition(job_id, to, result, detail);
    if (st == TransitionStatus::INVALID_TRANSITION) {
        // A concurrent cancel already made the job terminal.
        log_debug(kComponent, "job " + job_id + " already terminal, dropping " + state_to_str(to));
        return;
    }
    if (st != TransitionStatus::OK) {
        throw std::runtime_error(std::string("cannot record ") + state_to_str(to) + ": " + transition_status_str(st));
    }
    notify_done();
}

void Orchestrator::notify_done() {
    // Taking the mutex orders the notify after any waiter's state check.
    { std::lock_guard<std::mutex> lk(done_mu_); }
    done_cv_.notify_all();
}

void Orchestrator::fail_internal(const std::string& job_id, const std::string& detail) {
    log_error(kComponent, "internal error on job " + job_id + ": " + detail);
    auto job = store_.get(job_id);
    if (!job || is_terminal(job->state)) return;

    // FAILED is only reachable from RUNNING.
    if (job->state == State::QUEUED) {
        TransitionStatus st = store_.transition(job_id, State::RUNNING, std::nullopt, "internal fault before execution");
        if (st != TransitionStatus::OK) {
            log_error(kComponent, "cannot record internal error for " + job_id + ": " + transition_status_str(st));
            return;
        }
    }
    TransitionStatus st = store_.transition(job_id, State::FAILED, make_result(false, 1, Reason::INTERNAL_ERROR), detail);
    if (st != TransitionStatus::OK) {
        log_error(kComponent, "cannot record internal error for " + job_id + ": " + transition_status_str(st));
        return;
    }
    notify_done();
}

} // namespace warden
