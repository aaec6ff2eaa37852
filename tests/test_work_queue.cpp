#include "test_common.h"

#include "warden/work_queue.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using warden::WorkQueue;

int main() {
    WorkQueue<std::string> q;

    q.push(5000, "default");
    q.push(1, "urgent1");
    q.push(9999, "idle");
    q.push(1, "urgent2");
    expect_eq_ll((long long)q.size(), 4, "four queued");

    WorkQueue<std::string>::Item it;
    std::vector<std::string> order;
    while (q.try_pop(it)) order.push_back(it.value);
    expect_eq_ll((long long)order.size(), 4, "all drained");
    expect_eq_str(order[0], "urgent1", "lowest value first");
    expect_eq_str(order[1], "urgent2", "FIFO within a priority");
    expect_eq_str(order[2], "default", "then default");
    expect_eq_str(order[3], "idle", "idle last");
    expect_true(!q.try_pop(it), "empty try_pop");

    // Blocking pop wakes for new work.
    WorkQueue<int> q2;
    int got = -1;
    std::thread consumer([&] {
        WorkQueue<int>::Item i2;
        if (q2.pop(i2)) got = i2.value;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    q2.push(0, 42);
    consumer.join();
    expect_eq_ll(got, 42, "blocked pop received the item");

    // close(): pending items still handed out, then pop() returns false; pushes refused.
    q2.push(0, 1);
    q2.close();
    expect_true(q2.closed(), "closed");
    expect_true(!q2.push(0, 2), "push after close refused");
    WorkQueue<int>::Item i3;
    expect_true(q2.pop(i3) && i3.value == 1, "pending item drained after close");
    expect_true(!q2.pop(i3), "pop returns false once drained");

    WorkQueue<int> q3;
    bool popped = true;
    std::thread waiter([&] {
        WorkQueue<int>::Item i4;
        popped = q3.pop(i4);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    q3.close();
    waiter.join();
    expect_true(!popped, "close wakes idle workers");

    std::cerr << "test_work_queue: ALL PASSED" << std::endl;
    return 0;
}
