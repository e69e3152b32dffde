// Tests for ConcurrencyBudget and the receiver admission policies

#include <gtest/gtest.h>

#include "common/concurrency_budget.hpp"
#include "receiver/admission_policy.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

TEST(ConcurrencyBudgetTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(ConcurrencyBudget(0), std::invalid_argument);
}

TEST(ConcurrencyBudgetTest, PermitReleasesOnScopeExit) {
    ConcurrencyBudget budget(2);
    {
        ConcurrencyBudget::Permit a(budget);
        ConcurrencyBudget::Permit b(budget);
        EXPECT_EQ(budget.in_use(), 2u);
    }
    EXPECT_EQ(budget.in_use(), 0u);
    EXPECT_EQ(budget.peak(), 2u);
}

TEST(ConcurrencyBudgetTest, MovedPermitReleasesOnce) {
    ConcurrencyBudget budget(1);
    {
        ConcurrencyBudget::Permit a(budget);
        ConcurrencyBudget::Permit b(std::move(a));
        EXPECT_EQ(budget.in_use(), 1u);
    }
    EXPECT_EQ(budget.in_use(), 0u);
}

TEST(ConcurrencyBudgetTest, ReleaseWithoutAcquireThrows) {
    ConcurrencyBudget budget(1);
    EXPECT_THROW(budget.release(), std::logic_error);
}

TEST(ConcurrencyBudgetTest, AcquireBlocksUntilRelease) {
    ConcurrencyBudget budget(1);
    ASSERT_TRUE(budget.acquire());

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        acquired = budget.acquire();
        budget.release();
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(acquired.load());
    budget.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(budget.peak(), 1u);
}

TEST(ConcurrencyBudgetTest, PeakNeverExceedsCapacityUnderContention) {
    ConcurrencyBudget budget(3);
    std::atomic<int> inside{0};
    std::atomic<int> worst{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 12; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                ConcurrencyBudget::Permit p(budget);
                int now = ++inside;
                int seen = worst.load();
                while (now > seen && !worst.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(1ms);
                --inside;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_LE(worst.load(), 3);
    EXPECT_LE(budget.peak(), 3u);
    EXPECT_EQ(budget.in_use(), 0u);
}

TEST(ConcurrencyBudgetTest, CancelWakesBlockedAcquire) {
    ConcurrencyBudget budget(1);
    ASSERT_TRUE(budget.acquire());

    std::atomic<bool> returned{false};
    std::atomic<bool> result{true};
    std::thread waiter([&] {
        result = budget.acquire();
        returned = true;
    });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(returned.load());

    budget.cancel();
    waiter.join();
    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(result.load());
    EXPECT_EQ(budget.in_use(), 1u);

    // Held units still release normally; new ones are refused
    budget.release();
    EXPECT_EQ(budget.in_use(), 0u);
    EXPECT_FALSE(budget.acquire());
    EXPECT_THROW({ ConcurrencyBudget::Permit p(budget); }, std::runtime_error);
    EXPECT_EQ(budget.in_use(), 0u);
}

TEST(AdmissionPolicyTest, UnboundedOnlyCounts) {
    UnboundedAdmission policy;
    for (int i = 0; i < 100; ++i) EXPECT_TRUE(policy.admit());
    EXPECT_EQ(policy.active(), 100u);
    for (int i = 0; i < 100; ++i) policy.release();
    EXPECT_EQ(policy.active(), 0u);
    EXPECT_EQ(policy.describe(), "unbounded");
}

TEST(AdmissionPolicyTest, BoundedWaitsForRoom) {
    BoundedAdmission policy(1);
    ASSERT_TRUE(policy.admit());

    std::atomic<bool> admitted{false};
    std::thread second([&] {
        admitted = policy.admit();
    });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(admitted.load());

    policy.release();
    second.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(policy.active(), 1u);
    policy.release();
    EXPECT_EQ(policy.describe(), "at most 1");
}

TEST(AdmissionPolicyTest, CancelRefusesFurtherSessions) {
    UnboundedAdmission unbounded;
    unbounded.cancel();
    EXPECT_FALSE(unbounded.admit());
    EXPECT_EQ(unbounded.active(), 0u);

    BoundedAdmission bounded(1);
    ASSERT_TRUE(bounded.admit());
    std::atomic<bool> returned{false};
    std::atomic<bool> admitted{true};
    std::thread waiter([&] {
        admitted = bounded.admit();
        returned = true;
    });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(returned.load());

    bounded.cancel();
    waiter.join();
    EXPECT_FALSE(admitted.load());
    EXPECT_EQ(bounded.active(), 1u);
    bounded.release();
    EXPECT_EQ(bounded.active(), 0u);
}
