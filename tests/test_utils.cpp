#include <atomic>
#include <cstdint>
#include <optional>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "lfq/utils.hpp"

namespace lfq {
namespace {

TEST(UtilsTest, NextPow2) {
    EXPECT_EQ(next_pow2(0), 1U);
    EXPECT_EQ(next_pow2(1), 1U);
    EXPECT_EQ(next_pow2(2), 2U);
    EXPECT_EQ(next_pow2(3), 4U);
    EXPECT_EQ(next_pow2(129), 256U);
    EXPECT_TRUE(is_pow2(32));
    EXPECT_FALSE(is_pow2(0));
    EXPECT_FALSE(is_pow2(48));
}

TEST(UtilsTest, FetchUpdateInstallsComputedValue) {
    std::atomic<std::uint32_t> counter{5};
    const auto result =
        fetch_update(counter, [](std::uint32_t v) -> std::optional<std::uint32_t> { return v * 2; });

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.previous, 5U);
    EXPECT_EQ(counter.load(), 10U);
}

TEST(UtilsTest, FetchUpdateDeclinesWithoutWriting) {
    std::atomic<std::uint32_t> counter{32};
    const auto result = fetch_update(counter, [](std::uint32_t v) -> std::optional<std::uint32_t> {
        if (v >= 32) return std::nullopt;
        return v + 1;
    });

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.previous, 32U);
    EXPECT_EQ(counter.load(), 32U);
}

TEST(UtilsTest, FetchUpdateClaimsAreUniqueUnderContention) {
    constexpr std::uint32_t kLimit = 20000;
    std::atomic<std::uint32_t> next{0};
    std::vector<std::atomic<int>> claimed(kLimit);
    for (auto& c : claimed) c.store(0);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (;;) {
                const auto r = fetch_update(next, [](std::uint32_t v) -> std::optional<std::uint32_t> {
                    if (v >= kLimit) return std::nullopt;
                    return v + 1;
                });
                if (!r.ok) break;
                claimed[r.previous].fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    for (std::uint32_t i = 0; i < kLimit; ++i) {
        ASSERT_EQ(claimed[i].load(), 1) << "index " << i;
    }
}

TEST(UtilsTest, BackoffCompletesAfterYieldLimit) {
    Backoff backoff;
    EXPECT_FALSE(backoff.is_completed());
    for (int i = 0; i < 32 && !backoff.is_completed(); ++i) backoff.snooze();
    EXPECT_TRUE(backoff.is_completed());
    backoff.reset();
    EXPECT_FALSE(backoff.is_completed());
}

} // namespace
} // namespace lfq
