#include "nsm/PermitPool.hpp"

#include <algorithm>

namespace nsm {

PermitPool::PermitPool(size_t permits) : capacity_(std::max<size_t>(1, permits)) {}

PermitPool::Permit PermitPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return active_ < capacity_; });
    ++active_;
    peak_ = std::max(peak_, active_);
    return Permit(this);
}

size_t PermitPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t PermitPool::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void PermitPool::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) --active_;
    }
    cv_.notify_one();
}

} // namespace nsm
