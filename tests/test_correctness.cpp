#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "lfq/bounded_queue.hpp"
#include "lfq/unbounded_queue.hpp"

namespace lfq {
namespace {

// Uniform push/pop surface over both queues so the ordering properties run against each.
template <class T>
struct BoundedAdapter {
    BoundedQueue<T> q{256};
    bool push(T v) { return q.try_push(std::move(v)); }
    std::optional<T> pop() { return q.try_pop(); }
    bool empty() const { return q.empty(); }
    std::size_t size() const { return q.size(); }
};

template <class T>
struct UnboundedAdapter {
    // Small blocks so a few hundred values cross several block boundaries.
    UnboundedQueue<T, 8> q;
    bool push(T v) {
        q.push(std::move(v));
        return true;
    }
    std::optional<T> pop() { return q.try_pop(); }
    bool empty() const { return q.empty(); }
    std::size_t size() const { return q.size(); }
};

struct BoundedKind {
    template <class T> using queue = BoundedAdapter<T>;
};
struct UnboundedKind {
    template <class T> using queue = UnboundedAdapter<T>;
};

template <class Kind>
class QueueCorrectnessTest : public ::testing::Test {};

using QueueKinds = ::testing::Types<BoundedKind, UnboundedKind>;
TYPED_TEST_SUITE(QueueCorrectnessTest, QueueKinds);

TYPED_TEST(QueueCorrectnessTest, PopsInPushOrder) {
    typename TypeParam::template queue<int> q;
    for (int i = 0; i < 200; ++i) ASSERT_TRUE(q.push(i));
    EXPECT_EQ(q.size(), 200U);

    for (int i = 0; i < 200; ++i) {
        auto v = q.pop();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
    EXPECT_TRUE(q.empty());
}

TYPED_TEST(QueueCorrectnessTest, PopOnFreshQueueIsEmpty) {
    typename TypeParam::template queue<int> q;
    EXPECT_TRUE(q.empty());
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.size(), 0U);
}

TYPED_TEST(QueueCorrectnessTest, PopAfterDrainIsEmptyAndQueueStillUsable) {
    typename TypeParam::template queue<int> q;
    for (int i = 0; i < 20; ++i) ASSERT_TRUE(q.push(i));
    for (int i = 0; i < 20; ++i) ASSERT_TRUE(q.pop().has_value());

    EXPECT_FALSE(q.pop().has_value());
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_EQ(q.size(), 0U);

    ASSERT_TRUE(q.push(99));
    auto v = q.pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 99);
}

TYPED_TEST(QueueCorrectnessTest, InterleavedPushPopKeepsOrder) {
    typename TypeParam::template queue<int> q;
    int next_in = 0;
    int next_out = 0;
    for (int round = 0; round < 50; ++round) {
        for (int k = 0; k < 3; ++k) ASSERT_TRUE(q.push(next_in++));
        for (int k = 0; k < 2; ++k) {
            auto v = q.pop();
            ASSERT_TRUE(v.has_value());
            EXPECT_EQ(*v, next_out++);
        }
    }
    while (auto v = q.pop()) EXPECT_EQ(*v, next_out++);
    EXPECT_EQ(next_out, next_in);
}

TYPED_TEST(QueueCorrectnessTest, RoundTripsStrings) {
    typename TypeParam::template queue<std::string> q;
    const std::string long_text(1000, 'x');
    ASSERT_TRUE(q.push("short"));
    ASSERT_TRUE(q.push(long_text));
    ASSERT_TRUE(q.push(std::string()));

    EXPECT_EQ(q.pop().value(), "short");
    EXPECT_EQ(q.pop().value(), long_text);
    EXPECT_EQ(q.pop().value(), "");
    EXPECT_FALSE(q.pop().has_value());
}

TYPED_TEST(QueueCorrectnessTest, RoundTripsMoveOnlyValues) {
    typename TypeParam::template queue<std::unique_ptr<std::vector<int>>> q;
    ASSERT_TRUE(q.push(std::make_unique<std::vector<int>>(3, 7)));

    auto v = q.pop();
    ASSERT_TRUE(v.has_value());
    ASSERT_NE(*v, nullptr);
    EXPECT_EQ(**v, std::vector<int>(3, 7));
}

} // namespace
} // namespace lfq
