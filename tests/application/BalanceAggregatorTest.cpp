/**
 * @file BalanceAggregatorTest.cpp
 * @brief Unit tests for BalanceAggregator
 */

#include <gtest/gtest.h>
#include "application/BalanceAggregator.hpp"
#include "../mocks/LedgerFixtures.hpp"
#include <algorithm>

using namespace reporting;
using namespace reporting::application;
using namespace reporting::tests;

class BalanceAggregatorTest : public ::testing::Test {
protected:
    BalanceAggregator aggregator_{"BDT", 0.01};

    static domain::JournalLine entryLine(
        const std::string& entryId, const std::string& code, double debit, double credit)
    {
        auto line = makeLine(code, debit, credit);
        line.entryId = entryId;
        line.entryNumber = "JE-" + entryId;
        return line;
    }
};

// ============================================================================
// AGGREGATE
// ============================================================================

TEST_F(BalanceAggregatorTest, Aggregate_AssetAndLiabilityNetBalances) {
    std::vector<domain::JournalLine> lines = {
        makeLine("1000", 5000.0, 0.0),
        makeLine("1000", 0.0, 2000.0),
        makeLine("2000", 500.0, 0.0),
        makeLine("2000", 0.0, 4000.0)
    };

    auto balances = aggregator_.aggregate(lines);

    const auto& asset = balances.at("1000");
    EXPECT_DOUBLE_EQ(asset.reportingDebit.toDouble(), 5000.0);
    EXPECT_DOUBLE_EQ(asset.reportingCredit.toDouble(), 2000.0);
    EXPECT_DOUBLE_EQ(asset.reportingNet(domain::AccountType::ASSET).toDouble(), 3000.0);

    const auto& liability = balances.at("2000");
    EXPECT_DOUBLE_EQ(liability.reportingNet(domain::AccountType::LIABILITY).toDouble(), 3500.0);
}

TEST_F(BalanceAggregatorTest, Aggregate_OrderIndependent) {
    std::vector<domain::JournalLine> lines = {
        makeLine("1200", 100.0, 0.0, "USD", 110.0),
        makeLine("1200", 0.0, 30.0, "EUR", 120.0),
        makeLine("4000", 0.0, 11000.0),
        makeLine("1200", 50.5, 0.0, "USD", 111.0)
    };
    auto reversed = lines;
    std::reverse(reversed.begin(), reversed.end());

    auto forward = aggregator_.aggregate(lines);
    auto backward = aggregator_.aggregate(reversed);

    ASSERT_EQ(forward.size(), backward.size());
    for (const auto& [code, balance] : forward) {
        const auto& other = backward.at(code);
        EXPECT_EQ(balance.debit, other.debit) << code;
        EXPECT_EQ(balance.credit, other.credit) << code;
        EXPECT_EQ(balance.reportingDebit, other.reportingDebit) << code;
        EXPECT_EQ(balance.reportingCredit, other.reportingCredit) << code;
        EXPECT_EQ(balance.currency, other.currency) << code;
        EXPECT_EQ(balance.mixedCurrency, other.mixedCurrency) << code;
    }
}

TEST_F(BalanceAggregatorTest, Aggregate_MissingReportingAmount_DerivedFromFxRate) {
    auto balances = aggregator_.aggregate({makeLine("1400", 1000.0, 0.0, "USD", 110.0)});

    const auto& ar = balances.at("1400");
    EXPECT_DOUBLE_EQ(ar.debit.toDouble(), 1000.0);
    EXPECT_EQ(ar.debit.currency, "USD");
    EXPECT_DOUBLE_EQ(ar.reportingDebit.toDouble(), 110000.0);
    EXPECT_EQ(ar.reportingDebit.currency, "BDT");
}

TEST_F(BalanceAggregatorTest, Aggregate_ExplicitReportingAmount_TakesPrecedence) {
    auto line = makeLine("1400", 1000.0, 0.0, "USD", 110.0);
    line.reportingDebit = domain::Money::fromDouble(109500.0);

    auto balances = aggregator_.aggregate({line});

    EXPECT_DOUBLE_EQ(balances.at("1400").reportingDebit.toDouble(), 109500.0);
}

TEST_F(BalanceAggregatorTest, Aggregate_StoredZeroReportingAmount_FallsBackToTransactionAmount) {
    auto cash = makeLine("1100", 5000.0, 0.0);
    cash.reportingDebit = domain::Money::fromDouble(0.0);
    cash.reportingCredit = domain::Money::fromDouble(0.0);
    auto ar = makeLine("1400", 100.0, 0.0, "USD", 110.0);
    ar.reportingDebit = domain::Money::fromDouble(0.0);

    auto balances = aggregator_.aggregate({cash, ar});

    const auto& cashBalance = balances.at("1100");
    EXPECT_DOUBLE_EQ(cashBalance.reportingDebit.toDouble(), 5000.0);
    EXPECT_TRUE(cashBalance.reportingCredit.isZero());
    EXPECT_DOUBLE_EQ(cashBalance.reportingNet(domain::AccountType::ASSET).toDouble(), 5000.0);
    EXPECT_DOUBLE_EQ(balances.at("1400").reportingDebit.toDouble(), 11000.0);
}

TEST_F(BalanceAggregatorTest, Aggregate_ZeroBalanceAccountRetained) {
    auto balances = aggregator_.aggregate({
        makeLine("1100", 250.0, 0.0),
        makeLine("1100", 0.0, 250.0)
    });

    ASSERT_EQ(balances.count("1100"), 1u);
    EXPECT_TRUE(balances.at("1100").reportingNet(domain::AccountType::ASSET).isZero());
    EXPECT_EQ(balances.at("1100").lineCount, 2u);
}

TEST_F(BalanceAggregatorTest, Aggregate_MixedCurrency_FlaggedWithWarning) {
    auto balances = aggregator_.aggregate({
        makeLine("1200", 100.0, 0.0, "USD", 110.0),
        makeLine("1200", 100.0, 0.0, "EUR", 120.0),
        makeLine("1000", 100.0, 0.0)
    });

    EXPECT_TRUE(balances.at("1200").mixedCurrency);
    EXPECT_EQ(balances.at("1200").currency, "EUR");
    EXPECT_DOUBLE_EQ(balances.at("1200").reportingDebit.toDouble(), 23000.0);
    EXPECT_FALSE(balances.at("1000").mixedCurrency);

    auto warnings = aggregator_.mixedCurrencyWarnings(balances);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].kind, domain::WarningKind::MIXED_CURRENCY);
    EXPECT_EQ(warnings[0].subject, "1200");
}

// ============================================================================
// NET BALANCE
// ============================================================================

TEST_F(BalanceAggregatorTest, NetBalance_SignConventionByType) {
    auto debit = domain::Money::fromDouble(700.0);
    auto credit = domain::Money::fromDouble(200.0);

    EXPECT_DOUBLE_EQ(BalanceAggregator::netBalance(domain::AccountType::ASSET, debit, credit).toDouble(), 500.0);
    EXPECT_DOUBLE_EQ(BalanceAggregator::netBalance(domain::AccountType::EXPENSE, debit, credit).toDouble(), 500.0);
    EXPECT_DOUBLE_EQ(BalanceAggregator::netBalance(domain::AccountType::LIABILITY, debit, credit).toDouble(), -500.0);
    EXPECT_DOUBLE_EQ(BalanceAggregator::netBalance(domain::AccountType::EQUITY, debit, credit).toDouble(), -500.0);
    EXPECT_DOUBLE_EQ(BalanceAggregator::netBalance(domain::AccountType::REVENUE, debit, credit).toDouble(), -500.0);
}

// ============================================================================
// VALIDATE ENTRIES
// ============================================================================

TEST_F(BalanceAggregatorTest, ValidateEntries_BalancedEntries_NoWarnings) {
    auto warnings = aggregator_.validateEntries({
        entryLine("e1", "1000", 100.0, 0.0),
        entryLine("e1", "4000", 0.0, 60.0),
        entryLine("e1", "4100", 0.0, 40.0)
    });

    EXPECT_TRUE(warnings.empty());
}

TEST_F(BalanceAggregatorTest, ValidateEntries_UnbalancedEntry_OneWarningPerEntry) {
    auto warnings = aggregator_.validateEntries({
        entryLine("e1", "1000", 100.0, 0.0),
        entryLine("e1", "4000", 0.0, 60.0),
        entryLine("e1", "4100", 0.0, 30.0),
        entryLine("e2", "1000", 50.0, 0.0),
        entryLine("e2", "4000", 0.0, 50.0)
    });

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].kind, domain::WarningKind::UNBALANCED_ENTRY);
    EXPECT_EQ(warnings[0].subject, "e1");
    EXPECT_NE(warnings[0].message.find("JE-e1"), std::string::npos);
}

TEST_F(BalanceAggregatorTest, ValidateEntries_DifferenceWithinTolerance_Accepted) {
    auto warnings = aggregator_.validateEntries({
        entryLine("e1", "1000", 100.004, 0.0),
        entryLine("e1", "4000", 0.0, 100.0)
    });

    EXPECT_TRUE(warnings.empty());
}

TEST_F(BalanceAggregatorTest, ValidateEntries_UnbalancedInReportingCurrencyOnly_Flagged) {
    auto debit = makeLine("1400", 100.0, 0.0, "USD", 110.0);
    debit.entryId = "e1";
    auto credit = makeLine("4000", 0.0, 100.0, "USD", 109.0);
    credit.entryId = "e1";

    auto warnings = aggregator_.validateEntries({debit, credit});

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].subject, "e1");
}

TEST_F(BalanceAggregatorTest, ValidateEntries_DraftLinesIgnored) {
    auto line = entryLine("d1", "1000", 100.0, 0.0);
    line.entryStatus = domain::EntryStatus::DRAFT;

    EXPECT_TRUE(aggregator_.validateEntries({line}).empty());
}
