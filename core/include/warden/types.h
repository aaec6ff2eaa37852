#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace warden {

// Job lifecycle. QUEUED -> RUNNING -> terminal, or QUEUED -> REJECTED.
enum class State {
    QUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    TIMED_OUT,
    REJECTED,
};

// Closed set of outcome tokens. The string form is part of the external
// contract (audit output, CLI JSON) and must never change.
enum class Reason {
    OK,
    NONZERO_EXIT,
    TIMEOUT,
    IMAGE_NOT_ALLOWLISTED,
    BACKEND_UNAVAILABLE,
    INTERNAL_ERROR,
    ORPHANED_AFTER_RESTART,
    CANCELLED,
};

// Sentinel exit code for a sandbox killed at its deadline (shell `timeout` convention).
constexpr int kTimeoutExitCode = 124;

const char* state_to_str(State s);
std::optional<State> state_from_str(const std::string& s);

const char* reason_to_str(Reason r);
std::optional<Reason> reason_from_str(const std::string& s);

bool is_terminal(State s);

// True when `from -> to` is an edge of the lifecycle graph.
bool transition_allowed(State from, State to);

struct Result {
    bool allowed{false};
    int exit_code{1};
    std::string stdout_data;
    std::string stderr_data;
    Reason reason{Reason::INTERNAL_ERROR};
    bool truncated{false};   // some output was cut at the capture cap

    bool operator==(const Result& o) const = default;
};

struct Job {
    std::string job_id;
    std::string payload_ref;  // path of the persisted payload
    std::string image;
    int64_t created_at_ms{0};
    int priority{5000};
    State state{State::QUEUED};
    std::optional<Result> result;  // present once terminal

    bool operator==(const Job& o) const = default;
};

// One entry of the append-only audit trail.
struct TransitionRecord {
    std::string job_id;
    State from{State::QUEUED};
    State to{State::QUEUED};
    int64_t at_ms{0};
    std::string detail;  // fault detail for internal errors, cancellation marker, ...
};

int64_t now_ms();
std::string iso8601_ms(int64_t epoch_ms);

} // namespace warden
