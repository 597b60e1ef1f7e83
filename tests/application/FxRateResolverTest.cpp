/**
 * @file FxRateResolverTest.cpp
 * @brief Unit tests for FxRateResolver
 */

#include <gtest/gtest.h>
#include "application/FxRateResolver.hpp"
#include "../mocks/MockLedgerSnapshot.hpp"
#include "../mocks/LedgerFixtures.hpp"

using namespace reporting;
using namespace reporting::application;
using namespace reporting::tests;

class FxRateResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot_ = std::make_unique<MockLedgerSnapshot>(domain::Date(2024, 3, 31));
    }

    std::unique_ptr<MockLedgerSnapshot> snapshot_;
};

// ============================================================================
// RESOLVE
// ============================================================================

TEST_F(FxRateResolverTest, Resolve_PicksLatestDateNotAfterAsOf) {
    snapshot_->addRate(makeRate("USD", 109.0, "2024-01-31"));
    snapshot_->addRate(makeRate("USD", 110.5, "2024-03-15"));
    snapshot_->addRate(makeRate("USD", 111.0, "2024-02-29"));

    FxRateResolver resolver(*snapshot_);
    auto rate = resolver.resolve("USD", "BDT");

    ASSERT_TRUE(rate.has_value());
    EXPECT_DOUBLE_EQ(rate->rate, 110.5);
    EXPECT_EQ(rate->date, domain::Date(2024, 3, 15));
}

TEST_F(FxRateResolverTest, Resolve_IgnoresInactiveRows) {
    snapshot_->addRate(makeRate("USD", 110.0, "2024-03-01"));
    snapshot_->addRate(makeRate("USD", 999.0, "2024-03-20", false));

    FxRateResolver resolver(*snapshot_);

    EXPECT_DOUBLE_EQ(*resolver.resolveRate("USD", "BDT"), 110.0);
}

TEST_F(FxRateResolverTest, Resolve_SameDate_LatestInsertWins) {
    snapshot_->addRate(makeRate("EUR", 120.0, "2024-03-31"));
    snapshot_->addRate(makeRate("EUR", 121.5, "2024-03-31"));

    FxRateResolver resolver(*snapshot_);

    EXPECT_DOUBLE_EQ(*resolver.resolveRate("EUR", "BDT"), 121.5);
}

TEST_F(FxRateResolverTest, Resolve_NoRow_ReturnsNullopt) {
    snapshot_->addRate(makeRate("USD", 110.0, "2024-03-01"));

    FxRateResolver resolver(*snapshot_);

    EXPECT_FALSE(resolver.resolve("EUR", "BDT").has_value());
    EXPECT_FALSE(resolver.resolveRate("EUR", "BDT").has_value());
}

TEST_F(FxRateResolverTest, Resolve_OnlyInactiveRows_ReturnsNullopt) {
    snapshot_->addRate(makeRate("GBP", 140.0, "2024-03-01", false));

    FxRateResolver resolver(*snapshot_);

    EXPECT_FALSE(resolver.resolve("GBP", "BDT").has_value());
}

TEST_F(FxRateResolverTest, Resolve_IdentityPair_ReturnsOneWithoutLookup) {
    FxRateResolver resolver(*snapshot_);

    auto rate = resolver.resolve("BDT", "BDT");

    ASSERT_TRUE(rate.has_value());
    EXPECT_DOUBLE_EQ(rate->rate, 1.0);
    EXPECT_EQ(rate->source, "identity");
    EXPECT_EQ(snapshot_->listRatesCallCount(), 0);
}

TEST_F(FxRateResolverTest, Resolve_RepeatedPair_QueriesSnapshotOnce) {
    snapshot_->addRate(makeRate("USD", 110.0, "2024-03-01"));

    FxRateResolver resolver(*snapshot_);
    resolver.resolve("USD", "BDT");
    resolver.resolve("USD", "BDT");
    resolver.resolve("EUR", "BDT");
    resolver.resolve("EUR", "BDT");

    EXPECT_EQ(snapshot_->listRatesCallCount(), 2);
}

// ============================================================================
// SELECT RATE
// ============================================================================

TEST_F(FxRateResolverTest, SelectRate_FutureRowsExcluded) {
    std::vector<domain::FxRate> rates = {
        makeRate("USD", 110.0, "2024-03-01"),
        makeRate("USD", 115.0, "2024-04-01")
    };

    auto selected = FxRateResolver::selectRate(rates, domain::Date(2024, 3, 31));

    ASSERT_TRUE(selected.has_value());
    EXPECT_DOUBLE_EQ(selected->rate, 110.0);
}

TEST_F(FxRateResolverTest, SelectRate_TieOnDate_HighestSequenceRegardlessOfOrder) {
    auto older = makeRate("USD", 110.0, "2024-03-31");
    older.sequence = 7;
    auto newer = makeRate("USD", 112.0, "2024-03-31");
    newer.sequence = 9;

    auto selected = FxRateResolver::selectRate({newer, older}, domain::Date(2024, 3, 31));

    ASSERT_TRUE(selected.has_value());
    EXPECT_DOUBLE_EQ(selected->rate, 112.0);
}

TEST_F(FxRateResolverTest, SelectRate_Empty_ReturnsNullopt) {
    EXPECT_FALSE(FxRateResolver::selectRate({}, domain::Date(2024, 3, 31)).has_value());
}
