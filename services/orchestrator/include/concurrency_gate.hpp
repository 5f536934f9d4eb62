#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

// Counting gate bounding in-flight executions. Capacity is clamped to [1, 100]
// and fixed for the gate's lifetime.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(int capacity);

    void acquire();
    bool try_acquire();
    void release();

    std::size_t capacity() const { return capacity_; }
    std::size_t in_use();

private:
    const std::size_t capacity_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::size_t in_use_{0};
};

// Holds one slot until destroyed.
class GatePermit {
public:
    explicit GatePermit(ConcurrencyGate& gate) : gate_(gate) { gate_.acquire(); }
    ~GatePermit() { gate_.release(); }
    GatePermit(const GatePermit&) = delete;
    GatePermit& operator=(const GatePermit&) = delete;

private:
    ConcurrencyGate& gate_;
};
