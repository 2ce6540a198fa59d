#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

namespace sheetrun {

// BoundedFifo
// - Fixed capacity; try_reserve fails instead of blocking when full
// - Capacity can be reserved ahead of a push (submit prepares the job
//   directory between reserve and commit)
// - Not internally synchronized: the JobManager guards it together with its
//   worker registry under a single mutex

template <typename T>
class BoundedFifo {
public:
    struct Entry {
        uint64_t seq{0};   // enqueue order
        T value;
    };

    explicit BoundedFifo(size_t capacity) : capacity_(capacity) {}

    size_t size() const { return q_.size(); }
    bool empty() const { return q_.empty(); }
    size_t reserved() const { return reserved_; }

    // Slots taken by queued entries plus outstanding reservations.
    bool full() const { return q_.size() + reserved_ >= capacity_; }

    bool try_reserve() {
        if (full()) return false;
        reserved_++;
        return true;
    }

    void release_reservation() {
        if (reserved_ > 0) reserved_--;
    }

    // Consumes a reservation taken by try_reserve().
    void commit(T value) {
        release_reservation();
        q_.push_back(Entry{seq_++, std::move(value)});
    }

    // Ignores capacity. Used only when re-enqueueing recovered jobs.
    void push_unbounded(T value) {
        q_.push_back(Entry{seq_++, std::move(value)});
    }

    bool pop(Entry& out) {
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

private:
    size_t capacity_;
    size_t reserved_{0};
    uint64_t seq_{0};
    std::deque<Entry> q_;
};

} // namespace sheetrun
