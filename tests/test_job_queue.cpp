#include "test_common.h"
#include "sheetrun/job_queue.h"

#include <string>

using sheetrun::BoundedFifo;

int main() {
    // Test 1: FIFO order and capacity
    {
        BoundedFifo<std::string> q(2);
        expect_true(q.try_reserve(), "reserve a");
        q.commit("a");
        expect_true(q.try_reserve(), "reserve b");
        q.commit("b");
        expect_true(q.full(), "queue full at capacity");
        expect_true(!q.try_reserve(), "reserve beyond capacity should fail");
        expect_eq_ll((long long)q.size(), 2, "size unchanged after rejected reservation");

        BoundedFifo<std::string>::Entry e;
        expect_true(q.pop(e) && e.value == "a", "first out is a");
        expect_true(q.pop(e) && e.value == "b", "second out is b");
        expect_true(!q.pop(e), "empty queue pops nothing");
    }

    // Test 2: reservations count against capacity until committed or released
    {
        BoundedFifo<int> q(2);
        expect_true(q.try_reserve(), "reserve 1");
        expect_true(q.try_reserve(), "reserve 2");
        expect_true(!q.try_reserve(), "third reservation should fail");
        expect_true(q.empty(), "reservations are not entries");

        q.commit(1);
        q.release_reservation();
        expect_eq_ll((long long)q.size(), 1, "one committed entry");
        expect_eq_ll((long long)q.reserved(), 0, "no reservation left");
        expect_true(q.try_reserve(), "released slot is usable");
        q.commit(2);
        expect_true(q.full(), "full again");
    }

    // Test 3: push_unbounded ignores capacity and keeps order
    {
        BoundedFifo<int> q(1);
        q.push_unbounded(1);
        q.push_unbounded(2);
        q.push_unbounded(3);
        expect_eq_ll((long long)q.size(), 3, "recovered entries may exceed capacity");
        expect_true(!q.try_reserve(), "reservations still bounded");
        BoundedFifo<int>::Entry e;
        long long last_seq = -1;
        for (int want = 1; want <= 3; want++) {
            expect_true(q.pop(e), "pop recovered");
            expect_eq_ll(e.value, want, "recovered order");
            expect_true((long long)e.seq > last_seq, "seq increases");
            last_seq = (long long)e.seq;
        }
    }

    std::cerr << "test_job_queue: ALL PASSED" << std::endl;
    return 0;
}
