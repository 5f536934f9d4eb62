#include "../include/concurrency_gate.hpp"
#include <algorithm>

static std::size_t clamp_capacity(int capacity) {
    return (std::size_t)std::min(100, std::max(1, capacity));
}

ConcurrencyGate::ConcurrencyGate(int capacity) : capacity_(clamp_capacity(capacity)) {}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]{ return in_use_ < capacity_; });
    ++in_use_;
}

bool ConcurrencyGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (in_use_ >= capacity_) return false;
    ++in_use_;
    return true;
}

void ConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}

std::size_t ConcurrencyGate::in_use() {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_use_;
}
