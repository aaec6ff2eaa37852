#include "test_common.h"

#include "warden/serialization.h"
#include "warden/json_util.h"
#include "warden/types.h"

using namespace warden;

int main() {
    const State all[] = {State::QUEUED, State::RUNNING, State::SUCCEEDED,
                         State::FAILED, State::TIMED_OUT, State::REJECTED};

    // Lifecycle graph: queued -> running|rejected, running -> any terminal, terminal -> nothing.
    expect_true(transition_allowed(State::QUEUED, State::RUNNING), "queued -> running");
    expect_true(transition_allowed(State::QUEUED, State::REJECTED), "queued -> rejected");
    expect_true(!transition_allowed(State::QUEUED, State::SUCCEEDED), "queued must not skip running");
    expect_true(!transition_allowed(State::QUEUED, State::FAILED), "queued -> failed is not an edge");
    expect_true(!transition_allowed(State::QUEUED, State::QUEUED), "no self edge");
    expect_true(!transition_allowed(State::RUNNING, State::QUEUED), "never backwards");
    expect_true(!transition_allowed(State::RUNNING, State::RUNNING), "no self edge on running");
    for (State to : {State::SUCCEEDED, State::FAILED, State::TIMED_OUT, State::REJECTED}) {
        expect_true(transition_allowed(State::RUNNING, to), std::string("running -> ") + state_to_str(to));
    }
    for (State from : all) {
        if (!is_terminal(from)) continue;
        for (State to : all) {
            expect_true(!transition_allowed(from, to),
                        std::string("terminal ") + state_to_str(from) + " must not move to " + state_to_str(to));
        }
    }

    for (State s : all) {
        auto back = state_from_str(state_to_str(s));
        expect_true(back && *back == s, std::string("state name round trip: ") + state_to_str(s));
    }
    expect_true(!state_from_str("RUNNING").has_value(), "state names are lower case");

    // Reason tokens are an external contract.
    expect_eq_str(reason_to_str(Reason::OK), "ok", "ok token");
    expect_eq_str(reason_to_str(Reason::NONZERO_EXIT), "nonzero exit", "nonzero token");
    expect_eq_str(reason_to_str(Reason::TIMEOUT), "timeout", "timeout token");
    expect_eq_str(reason_to_str(Reason::IMAGE_NOT_ALLOWLISTED), "image not allowlisted", "denial token");
    expect_eq_str(reason_to_str(Reason::BACKEND_UNAVAILABLE), "isolation backend unavailable", "unavailable token");
    expect_eq_str(reason_to_str(Reason::INTERNAL_ERROR), "internal error", "internal token");
    expect_eq_str(reason_to_str(Reason::ORPHANED_AFTER_RESTART), "orphaned after restart", "orphan token");
    expect_true(!reason_from_str("Timeout").has_value(), "unknown token rejected");
    expect_eq_ll(kTimeoutExitCode, 124, "timeout sentinel");

    expect_eq_str(iso8601_ms(0), "1970-01-01T00:00:00.000Z", "epoch formatting");
    expect_eq_str(iso8601_ms(1700000000123), "2023-11-14T22:13:20.123Z", "millisecond formatting");

    // Job JSON keeps escaped output and the reason token.
    Job j;
    j.job_id = "abc123";
    j.image = "python:3.11-slim";
    j.payload_ref = "/tmp/p";
    j.created_at_ms = 1700000000123;
    j.priority = 7;
    j.state = State::FAILED;
    Result r;
    r.allowed = true;
    r.exit_code = 3;
    r.stdout_data = "line \"one\"\n\ttwo";
    r.stderr_data = "boom\n";
    r.reason = Reason::NONZERO_EXIT;
    j.result = r;

    json::Doc d(job_to_json(j));
    expect_eq_str(json::get_string(d.root, "state").value_or(""), "failed", "state in json");
    json_object* rj = json::member(d.root, "result");
    expect_eq_str(json::get_string(rj, "reason").value_or(""), "nonzero exit", "reason in json");

    Job back;
    expect_true(job_from_json(d.root, &back), "job_from_json");
    expect_true(back == j, "job survives json");

    json::Doc bad = json::parse("{\"job_id\":\"x\",\"image\":\"i\",\"state\":\"paused\"}");
    expect_true(!job_from_json(bad.root, &back), "unknown state rejected");

    std::cerr << "test_types: ALL PASSED" << std::endl;
    return 0;
}
