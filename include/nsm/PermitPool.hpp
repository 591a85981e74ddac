#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace nsm {

// Counting semaphore bounding concurrent codec jobs. Acquire blocks until a
// permit is free; the returned Permit gives it back when destroyed.
class PermitPool {
public:
    explicit PermitPool(size_t permits);

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    class Permit {
    public:
        Permit() = default;
        explicit Permit(PermitPool* pool) : pool_(pool) {}
        ~Permit() { release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        void release() {
            if (pool_) {
                pool_->release();
                pool_ = nullptr;
            }
        }

    private:
        PermitPool* pool_ = nullptr;
    };

    Permit acquire();

    size_t capacity() const { return capacity_; }
    size_t active() const;
    // Highest number of permits ever held at the same time.
    size_t peak() const;

private:
    void release();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t active_ = 0;
    size_t peak_ = 0;
};

} // namespace nsm
