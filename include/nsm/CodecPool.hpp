#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "nsm/Format.hpp"

namespace nsm {

enum class Direction : uint8_t { Compress = 0, Decompress = 1 };

// Expensive per-stream codec state (zstd contexts, zlib streams).
class CodecState {
public:
    virtual ~CodecState() = default;
    // Drop any residual stream state so the object behaves like a fresh one.
    virtual void reset() = 0;
};

// Recycling pool of codec states keyed by algorithm and direction.
class CodecPool {
public:
    using Factory = std::function<std::unique_ptr<CodecState>()>;

    explicit CodecPool(size_t maxIdlePerKey = 8) : maxIdlePerKey_(maxIdlePerKey) {}

    CodecPool(const CodecPool&) = delete;
    CodecPool& operator=(const CodecPool&) = delete;

    // Scoped checkout. The state goes back to the pool only if markClean() was
    // called after its stream finished; otherwise it is destroyed.
    class Lease {
    public:
        Lease(CodecPool* pool, uint16_t key, std::unique_ptr<CodecState> state)
            : pool_(pool), key_(key), state_(std::move(state)) {}
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept
            : pool_(other.pool_), key_(other.key_), state_(std::move(other.state_)), clean_(other.clean_) {
            other.pool_ = nullptr;
        }
        Lease& operator=(Lease&&) = delete;

        template <typename T>
        T& as() { return static_cast<T&>(*state_); }

        void markClean() { clean_ = true; }

    private:
        CodecPool* pool_;
        uint16_t key_;
        std::unique_ptr<CodecState> state_;
        bool clean_ = false;
    };

    Lease checkout(Algorithm algo, Direction dir, const Factory& factory);

    size_t created() const;
    size_t reused() const;
    size_t idle(Algorithm algo, Direction dir) const;

private:
    static uint16_t key(Algorithm algo, Direction dir) {
        return static_cast<uint16_t>((static_cast<uint16_t>(algo) << 1) | static_cast<uint16_t>(dir));
    }
    void giveBack(uint16_t key, std::unique_ptr<CodecState> state);

    const size_t maxIdlePerKey_;
    mutable std::mutex mutex_;
    std::unordered_map<uint16_t, std::vector<std::unique_ptr<CodecState>>> idle_;
    size_t created_ = 0;
    size_t reused_ = 0;
};

} // namespace nsm
