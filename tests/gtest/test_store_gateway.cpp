// =============================================================================
// Store Gateway Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "threnody/error.hpp"
#include "threnody/metrics.hpp"
#include "threnody/store_gateway.hpp"
#include "mock_message_store.hpp"
#include <memory>
#include <vector>

using namespace threnody;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class StoreGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        Metrics::getInstance().reset();
        store_ = std::make_shared<::testing::StrictMock<MockMessageStore>>();
        retry_.max_attempts = 3;
        retry_.base_delay_ms = 100;
        retry_.multiplier = 2.0;
        retry_.max_delay_ms = 150;
        gateway_ = std::make_unique<StoreGateway>(store_, retry_, [this](std::chrono::milliseconds delay) {
            delays_.push_back(delay.count());
        });
    }

    static StoreUnavailableError outage() {
        return StoreUnavailableError("connection refused", "test");
    }

    std::shared_ptr<::testing::StrictMock<MockMessageStore>> store_;
    RetryConfig retry_;
    std::unique_ptr<StoreGateway> gateway_;
    std::vector<int64_t> delays_;
};

TEST_F(StoreGatewayTest, BackoffIsExponentialAndCapped) {
    EXPECT_EQ(gateway_->backoff_delay(1).count(), 100);
    EXPECT_EQ(gateway_->backoff_delay(2).count(), 150);  // 200 capped
    EXPECT_EQ(gateway_->backoff_delay(5).count(), 150);
}

TEST_F(StoreGatewayTest, RetriesTransientFailures) {
    EXPECT_CALL(*store_, max_id())
        .WillOnce(Throw(outage()))
        .WillOnce(Throw(outage()))
        .WillOnce(Return(42));

    EXPECT_EQ(gateway_->max_id(), 42);
    EXPECT_EQ(delays_, (std::vector<int64_t>{100, 150}));
    EXPECT_EQ(Metrics::getInstance().counter("store_retries"), 2);
}

TEST_F(StoreGatewayTest, GivesUpAfterMaxAttempts) {
    EXPECT_CALL(*store_, above(_)).Times(3).WillRepeatedly(Throw(outage()));

    EXPECT_THROW(gateway_->above(0), StoreUnavailableError);
    EXPECT_EQ(delays_.size(), 2u);
    EXPECT_EQ(Metrics::getInstance().counter("store_failures"), 1);
}

TEST_F(StoreGatewayTest, PermanentErrorsAreNotRetried) {
    EXPECT_CALL(*store_, count()).WillOnce(Throw(DatabaseError("relation \"messages\" does not exist")));

    EXPECT_THROW(gateway_->count(), DatabaseError);
    EXPECT_TRUE(delays_.empty());
}

TEST_F(StoreGatewayTest, RangeBackwardRefiltersBackendRows) {
    Message hidden = make_message(8);
    hidden.approved = false;
    Message deleted = make_message(7);
    deleted.deleted_at = Clock::now();

    // Out of order, above the ceiling, duplicated and hidden rows
    EXPECT_CALL(*store_, range_backward(9, 3, 9))
        .WillOnce(Return(std::vector<Message>{
            make_message(5), make_message(12), hidden, make_message(9),
            deleted, make_message(6), make_message(9), make_message(4)}));

    auto rows = gateway_->range_backward(9, 3, 9);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].id, 9);
    EXPECT_EQ(rows[1].id, 6);
    EXPECT_EQ(rows[2].id, 5);
}

TEST_F(StoreGatewayTest, RangeBackwardWithZeroLimitSkipsStore) {
    EXPECT_TRUE(gateway_->range_backward(10, 0, 10).empty());
}

TEST_F(StoreGatewayTest, AboveRefiltersAndSortsAscending) {
    Message hidden = make_message(13);
    hidden.approved = false;

    EXPECT_CALL(*store_, above(10))
        .WillOnce(Return(std::vector<Message>{make_message(12), make_message(9), hidden, make_message(11)}));

    auto rows = gateway_->above(10);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].id, 11);
    EXPECT_EQ(rows[1].id, 12);
}

TEST_F(StoreGatewayTest, NegativeMaxIdClampedToZero) {
    EXPECT_CALL(*store_, max_id()).WillOnce(Return(-1));
    EXPECT_EQ(gateway_->max_id(), 0);
}

TEST_F(StoreGatewayTest, InsertIsSingleAttempt) {
    EXPECT_CALL(*store_, insert("hello", true)).WillOnce(Throw(outage()));

    EXPECT_THROW(gateway_->insert("hello", true), StoreUnavailableError);
    EXPECT_TRUE(delays_.empty());
}

TEST_F(StoreGatewayTest, InsertReturnsStoredMessage) {
    EXPECT_CALL(*store_, insert("hello", false)).WillOnce(Return(make_message(77, "hello")));

    Message msg = gateway_->insert("hello", false);
    EXPECT_EQ(msg.id, 77);
}

TEST_F(StoreGatewayTest, HealthCheckReportsOutage) {
    EXPECT_CALL(*store_, ping()).Times(3).WillRepeatedly(Throw(outage()));
    EXPECT_FALSE(gateway_->health_check());
}

TEST_F(StoreGatewayTest, HealthCheckPassesWhenStoreAnswers) {
    EXPECT_CALL(*store_, ping()).WillOnce(Return());
    EXPECT_TRUE(gateway_->health_check());
}

TEST_F(StoreGatewayTest, NullStoreRejected) {
    EXPECT_THROW(StoreGateway(nullptr, retry_), InvalidArgumentError);
}
