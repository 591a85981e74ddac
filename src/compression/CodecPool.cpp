#include "nsm/CodecPool.hpp"

namespace nsm {

CodecPool::Lease::~Lease() {
    if (pool_ && state_ && clean_) {
        pool_->giveBack(key_, std::move(state_));
    }
}

CodecPool::Lease CodecPool::checkout(Algorithm algo, Direction dir, const Factory& factory) {
    const uint16_t k = key(algo, dir);
    std::unique_ptr<CodecState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = idle_.find(k);
        if (it != idle_.end() && !it->second.empty()) {
            state = std::move(it->second.back());
            it->second.pop_back();
            ++reused_;
        }
    }
    if (state) {
        state->reset();
    } else {
        // Construct outside the lock; factories allocate codec contexts.
        state = factory();
        std::lock_guard<std::mutex> lock(mutex_);
        ++created_;
    }
    return Lease(this, k, std::move(state));
}

size_t CodecPool::created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

size_t CodecPool::reused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reused_;
}

size_t CodecPool::idle(Algorithm algo, Direction dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = idle_.find(key(algo, dir));
    return it == idle_.end() ? 0 : it->second.size();
}

void CodecPool::giveBack(uint16_t k, std::unique_ptr<CodecState> state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = idle_[k];
    if (slot.size() < maxIdlePerKey_) {
        slot.push_back(std::move(state));
    }
}

} // namespace nsm
