#pragma once

// ============================================================
// concurrency_budget.hpp -- Counting budget of in-flight sessions
// ============================================================

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

class ConcurrencyBudget {
public:
    explicit ConcurrencyBudget(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("ConcurrencyBudget capacity must be > 0");
    }

    // Blocks while all units are taken. Returns false without taking a
    // unit once cancel() has been called.
    bool acquire() {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return cancelled_ || in_use_ < capacity_; });
        if (cancelled_) return false;
        ++in_use_;
        if (in_use_ > peak_) peak_ = in_use_;
        return true;
    }

    // Wakes every waiter; later acquire() calls fail at once.
    // Units already held are still released normally.
    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (in_use_ == 0) throw std::logic_error("ConcurrencyBudget::release without acquire");
            --in_use_;
        }
        cv_.notify_one();
    }

    size_t capacity() const { return capacity_; }

    size_t in_use() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return in_use_;
    }

    // Highest simultaneous use seen so far
    size_t peak() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return peak_;
    }

    // RAII unit: acquired on construction, released exactly once
    class Permit {
    public:
        explicit Permit(ConcurrencyBudget& budget) : budget_(nullptr) {
            if (!budget.acquire()) throw std::runtime_error("ConcurrencyBudget cancelled");
            budget_ = &budget;
        }
        ~Permit() { if (budget_) budget_->release(); }

        Permit(Permit&& other) noexcept : budget_(other.budget_) {
            other.budget_ = nullptr;
        }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;

    private:
        ConcurrencyBudget* budget_;
    };

    ConcurrencyBudget(const ConcurrencyBudget&) = delete;
    ConcurrencyBudget& operator=(const ConcurrencyBudget&) = delete;

private:
    const size_t            capacity_;
    size_t                  in_use_{0};
    size_t                  peak_{0};
    bool                    cancelled_{false};
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
};
