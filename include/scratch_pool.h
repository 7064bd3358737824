// include/scratch_pool.h
#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

// Reusable per-call scratch objects. acquire() hands out an object for the
// exclusive use of one caller; the Lease gives it back when it goes out of
// scope. An empty free list never blocks: a new object is built instead.
template<typename T>
class ScratchPool {
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    class Lease {
    public:
        Lease(Lease&& other) noexcept
            : pool_(std::exchange(other.pool_, nullptr)), obj_(std::move(other.obj_)) {}
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() {
            if (pool_ && obj_) pool_->release(std::move(obj_));
        }

        T& operator*() const noexcept { return *obj_; }
        T* operator->() const noexcept { return obj_.get(); }
        T* get() const noexcept { return obj_.get(); }

    private:
        friend class ScratchPool;
        Lease(ScratchPool* pool, std::unique_ptr<T> obj) noexcept
            : pool_(pool), obj_(std::move(obj)) {}

        ScratchPool* pool_;
        std::unique_ptr<T> obj_;
    };

    explicit ScratchPool(Factory make, std::size_t prewarm = 0)
        : make_(std::move(make)) {
        free_.reserve(prewarm);
        for (std::size_t i = 0; i < prewarm; ++i) {
            free_.push_back(make_());
            created_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    ScratchPool(const ScratchPool&) = delete;
    ScratchPool& operator=(const ScratchPool&) = delete;

    Lease acquire() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!free_.empty()) {
                std::unique_ptr<T> obj = std::move(free_.back());
                free_.pop_back();
                return Lease(this, std::move(obj));
            }
        }
        // built outside the lock; construction may be expensive
        std::unique_ptr<T> obj = make_();
        const std::size_t total = created_.fetch_add(1, std::memory_order_relaxed) + 1;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (free_.capacity() < total) free_.reserve(total);
        }
        return Lease(this, std::move(obj));
    }

    // objects currently parked in the pool
    std::size_t idle() const {
        std::lock_guard<std::mutex> lk(mu_);
        return free_.size();
    }

    // objects ever built by this pool
    std::size_t created() const noexcept {
        return created_.load(std::memory_order_relaxed);
    }

private:
    void release(std::unique_ptr<T> obj) noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        // capacity was reserved for every object this pool built, so no allocation here
        free_.push_back(std::move(obj));
    }

    Factory make_;
    mutable std::mutex mu_;
    std::vector<std::unique_ptr<T>> free_;
    std::atomic<std::size_t> created_{0};
};
