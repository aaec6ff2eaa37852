#include "warden/types.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden {

const char* state_to_str(State s) {
    switch (s) {
        case State::QUEUED:    return "queued";
        case State::RUNNING:   return "running";
        case State::SUCCEEDED: return "succeeded";
        case State::FAILED:    return "failed";
        case State::TIMED_OUT: return "timed_out";
        case State::REJECTED:  return "rejected";
    }
    return "failed";
}

std::optional<State> state_from_str(const std::string& s) {
    if (s == "queued") return State::QUEUED;
    if (s == "running") return State::RUNNING;
    if (s == "succeeded") return State::SUCCEEDED;
    if (s == "failed") return State::FAILED;
    if (s == "timed_out") return State::TIMED_OUT;
    if (s == "rejected") return State::REJECTED;
    return std::nullopt;
}

const char* reason_to_str(Reason r) {
    switch (r) {
        case Reason::OK:                     return "ok";
        case Reason::NONZERO_EXIT:           return "nonzero exit";
        case Reason::TIMEOUT:                return "timeout";
        case Reason::IMAGE_NOT_ALLOWLISTED:  return "image not allowlisted";
        case Reason::BACKEND_UNAVAILABLE:    return "isolation backend unavailable";
        case Reason::INTERNAL_ERROR:         return "internal error";
        case Reason::ORPHANED_AFTER_RESTART: return "orphaned after restart";
        case Reason::CANCELLED:              return "cancelled";
    }
    return "internal error";
}

std::optional<Reason> reason_from_str(const std::string& s) {
    static const Reason all[] = {
        Reason::OK, Reason::NONZERO_EXIT, Reason::TIMEOUT,
        Reason::IMAGE_NOT_ALLOWLISTED, Reason::BACKEND_UNAVAILABLE,
        Reason::INTERNAL_ERROR, Reason::ORPHANED_AFTER_RESTART, Reason::CANCELLED,
    };
    for (Reason r : all) {
        if (s == reason_to_str(r)) return r;
    }
    return std::nullopt;
}

bool is_terminal(State s) {
    return s == State::SUCCEEDED || s == State::FAILED ||
           s == State::TIMED_OUT || s == State::REJECTED;
}

bool transition_allowed(State from, State to) {
    switch (from) {
        case State::QUEUED:
            return to == State::RUNNING || to == State::REJECTED;
        case State::RUNNING:
            return is_terminal(to);
        default:
            return false;
    }
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso8601_ms(int64_t epoch_ms) {
    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (epoch_ms % 1000) << 'Z';
    return oss.str();
}

} // namespace warden
