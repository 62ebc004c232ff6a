// =============================================================================
// In-Memory Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include "threnody/store/memory_store.hpp"
#include <algorithm>
#include <set>

using namespace threnody;

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 10; ++i) {
            store_.insert("message " + std::to_string(i + 1), true);
        }
    }

    MemoryMessageStore store_;
};

TEST_F(MemoryStoreTest, IdsAreSequential) {
    EXPECT_EQ(store_.max_id(), 10);
    EXPECT_EQ(store_.count(), 10);
    Message next = store_.insert("eleven", true);
    EXPECT_EQ(next.id, 11);
}

TEST_F(MemoryStoreTest, RangeBackwardDescendsFromCursor) {
    auto rows = store_.range_backward(7, 3, 10);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].id, 7);
    EXPECT_EQ(rows[1].id, 6);
    EXPECT_EQ(rows[2].id, 5);
}

TEST_F(MemoryStoreTest, RangeBackwardRespectsCeiling) {
    auto rows = store_.range_backward(10, 5, 4);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows.front().id, 4);
    EXPECT_EQ(rows.back().id, 1);
}

TEST_F(MemoryStoreTest, AboveIsAscending) {
    auto rows = store_.above(7);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].id, 8);
    EXPECT_EQ(rows[2].id, 10);
    EXPECT_TRUE(store_.above(10).empty());
}

TEST_F(MemoryStoreTest, HiddenRowsNeverReturned) {
    ASSERT_TRUE(store_.soft_delete(10));
    ASSERT_TRUE(store_.set_approved(9, false));
    store_.insert("pending", false);  // id 11, unapproved

    EXPECT_EQ(store_.max_id(), 8);
    EXPECT_EQ(store_.count(), 8);
    EXPECT_EQ(store_.row_count(), 11u);

    auto above = store_.above(7);
    ASSERT_EQ(above.size(), 1u);
    EXPECT_EQ(above[0].id, 8);

    auto rows = store_.range_backward(11, 3, 11);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].id, 8);
}

TEST_F(MemoryStoreTest, EmptyStoreReportsZero) {
    MemoryMessageStore empty;
    EXPECT_EQ(empty.max_id(), 0);
    EXPECT_EQ(empty.count(), 0);
    EXPECT_TRUE(empty.range_backward(100, 10, 100).empty());
    EXPECT_TRUE(empty.above(0).empty());
}

TEST_F(MemoryStoreTest, SeedIsDeterministicAndOrdered) {
    MemoryMessageStore a;
    MemoryMessageStore b;
    seed_store(a, 50, 7);
    seed_store(b, 50, 7);

    auto rows_a = a.above(0);
    auto rows_b = b.above(0);
    ASSERT_EQ(rows_a.size(), 50u);
    ASSERT_EQ(rows_b.size(), 50u);

    for (size_t i = 0; i < rows_a.size(); ++i) {
        EXPECT_EQ(rows_a[i].content, rows_b[i].content);
        EXPECT_FALSE(rows_a[i].content.empty());
        if (i > 0) {
            EXPECT_LE(rows_a[i - 1].created_at, rows_a[i].created_at);
        }
    }
}
