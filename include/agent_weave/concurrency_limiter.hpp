#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace agent_weave {

/**
 * Counting limiter bounding the number of in-flight executions
 * Behaves like a counting semaphore and additionally tracks the peak usage
 */
class ConcurrencyLimiter {
public:
    /**
     * Scoped permit, releases on destruction
     */
    class Permit {
    public:
        explicit Permit(ConcurrencyLimiter& limiter)
            : limiter_(&limiter)
        {
            limiter_->acquire();
        }

        // Takes over a slot already acquired by the caller
        Permit(ConcurrencyLimiter& limiter, std::adopt_lock_t)
            : limiter_(&limiter)
        {}

        ~Permit() {
            if (limiter_) {
                limiter_->release();
            }
        }

        Permit(Permit&& other) noexcept
            : limiter_(other.limiter_)
        {
            other.limiter_ = nullptr;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;

    private:
        ConcurrencyLimiter* limiter_;
    };

    explicit ConcurrencyLimiter(size_t capacity)
        : capacity_(capacity)
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("Concurrency limit must be at least 1");
        }
    }

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * Block until a slot is free, then take it
     */
    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return in_use_ < capacity_; });
        take_locked();
    }

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ >= capacity_) {
            return false;
        }
        take_locked();
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_use_ == 0) {
                throw std::logic_error("ConcurrencyLimiter released more often than acquired");
            }
            --in_use_;
        }
        cv_.notify_one();
    }

    size_t capacity() const noexcept { return capacity_; }

    size_t in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

    size_t peak_in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

private:
    void take_locked() {
        ++in_use_;
        if (in_use_ > peak_) {
            peak_ = in_use_;
        }
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_use_{0};
    size_t peak_{0};
};

} // namespace agent_weave
