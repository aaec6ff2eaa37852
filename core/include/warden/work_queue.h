#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace warden {

// WorkQueue: the orchestrator's in-process job queue.
// - Lower priority value runs first; equal priorities run in submission order
// - pop() blocks until work arrives or close() is called
// - The job store stays the source of truth: a popped job is re-checked there
//   before it runs, so a job cancelled while queued is simply skipped.
template <typename T>
class WorkQueue {
public:
    struct Item {
        int32_t priority{0};
        uint64_t seq{0};
        T value;
    };

private:
    struct Cmp {
        bool operator()(const Item& a, const Item& b) const {
            // std::priority_queue pops the "largest" element; invert so lower priority comes first.
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

public:
    WorkQueue() = default;

    // Returns false once closed.
    bool push(int32_t priority, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push(Item{priority, seq_++, std::move(value)});
        cv_.notify_one();
        return true;
    }

    // Blocks. Returns false when closed and drained.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = q_.top();
        q_.pop();
        return true;
    }

    bool try_pop(Item& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (q_.empty()) return false;
        out = q_.top();
        q_.pop();
        return true;
    }

    // Wakes every blocked pop(); items still queued are handed out until empty.
    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Cmp> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

} // namespace warden
