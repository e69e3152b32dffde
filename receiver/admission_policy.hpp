#pragma once

// ============================================================
// admission_policy.hpp -- How many receive sessions may run
// ============================================================

#include "../common/concurrency_budget.hpp"
#include <atomic>
#include <cstddef>
#include <string>

class AdmissionPolicy {
public:
    virtual ~AdmissionPolicy() = default;

    // Called by the accept loop before a session starts; may block.
    // False means the policy was cancelled and the session must not start.
    virtual bool admit() = 0;

    // Wakes a blocked admit() for shutdown; every later admit() fails
    virtual void cancel() = 0;

    // Called once when an admitted session ends, whatever the outcome
    virtual void release() = 0;

    virtual std::string describe() const = 0;

    size_t active() const { return active_.load(); }

protected:
    std::atomic<size_t> active_{0};
};

// Every accepted connection is served immediately
class UnboundedAdmission : public AdmissionPolicy {
public:
    bool admit() override {
        if (cancelled_.load()) return false;
        ++active_;
        return true;
    }
    void cancel() override { cancelled_.store(true); }
    void release() override { --active_; }
    std::string describe() const override { return "unbounded"; }

private:
    std::atomic<bool> cancelled_{false};
};

// At most 'limit' sessions; further connections wait, already accepted
class BoundedAdmission : public AdmissionPolicy {
public:
    explicit BoundedAdmission(size_t limit) : budget_(limit) {}

    bool admit() override {
        if (!budget_.acquire()) return false;
        ++active_;
        return true;
    }
    void cancel() override { budget_.cancel(); }
    void release() override {
        --active_;
        budget_.release();
    }
    std::string describe() const override {
        return "at most " + std::to_string(budget_.capacity());
    }

private:
    ConcurrencyBudget budget_;
};
