/**
 * @file UnrealizedFxCalculatorTest.cpp
 * @brief Unit tests for UnrealizedFxCalculator
 */

#include <gtest/gtest.h>
#include "application/UnrealizedFxCalculator.hpp"
#include "application/VirtualJournalGenerator.hpp"
#include "../mocks/MockLedgerSnapshot.hpp"
#include "../mocks/LedgerFixtures.hpp"

using namespace reporting;
using namespace reporting::application;
using namespace reporting::tests;

class UnrealizedFxCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot_ = std::make_unique<MockLedgerSnapshot>(asOf_);
        resolver_ = std::make_unique<FxRateResolver>(*snapshot_);
    }

    domain::FxAnalysis compute(
        const std::vector<domain::Invoice>& invoices,
        const std::vector<domain::BankAccount>& banks = {})
    {
        return calculator_.computePositions(invoices, allocations_, banks, *resolver_, asOf_);
    }

    domain::Date asOf_{2024, 3, 31};
    UnrealizedFxCalculator calculator_{"BDT", 0.01};
    std::unique_ptr<MockLedgerSnapshot> snapshot_;
    std::unique_ptr<FxRateResolver> resolver_;
    std::map<std::string, std::vector<domain::PaymentAllocation>> allocations_;
};

// ============================================================================
// INVOICE POSITIONS
// ============================================================================

TEST_F(UnrealizedFxCalculatorTest, Invoice_FullyUnpaid_GainFromRateIncrease) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));

    auto analysis = compute({makeInvoice("1", "USD", 1000.0, 110.0)});

    ASSERT_EQ(analysis.positions.size(), 1u);
    const auto& position = analysis.positions[0];
    EXPECT_EQ(position.sourceType, domain::PositionSource::INVOICE);
    EXPECT_EQ(position.sourceReference, "INV-1");
    EXPECT_DOUBLE_EQ(position.remainingAmount.toDouble(), 1000.0);
    EXPECT_EQ(position.historicalRateKind, domain::HistoricalRateKind::BOOKING);
    EXPECT_DOUBLE_EQ(*position.currentRate, 112.5);
    EXPECT_DOUBLE_EQ(position.historicalValue->toDouble(), 110000.0);
    EXPECT_DOUBLE_EQ(position.currentValue->toDouble(), 112500.0);
    EXPECT_DOUBLE_EQ(position.gainLoss->toDouble(), 2500.0);
    EXPECT_EQ(position.asOfDate, asOf_);

    EXPECT_DOUBLE_EQ(analysis.totalGain.toDouble(), 2500.0);
    EXPECT_TRUE(analysis.totalLoss.isZero());
    EXPECT_DOUBLE_EQ(analysis.netGainLoss.toDouble(), 2500.0);
    EXPECT_TRUE(analysis.missingCurrencies.empty());
}

TEST_F(UnrealizedFxCalculatorTest, Invoice_PartiallyPaid_UsesRemainingAmount) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));
    allocations_["1"] = {makeAllocation("1", 300.0)};

    auto analysis = compute({makeInvoice("1", "USD", 1000.0, 110.0)});

    ASSERT_EQ(analysis.positions.size(), 1u);
    EXPECT_DOUBLE_EQ(analysis.positions[0].remainingAmount.toDouble(), 700.0);
    EXPECT_DOUBLE_EQ(analysis.positions[0].gainLoss->toDouble(), 1750.0);
}

TEST_F(UnrealizedFxCalculatorTest, Totals_IncludeGainBelowJournalThreshold) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));
    snapshot_->addRate(makeRate("EUR", 118.005, "2024-03-31"));

    auto analysis = compute({
        makeInvoice("1", "USD", 1000.0, 110.0),
        makeInvoice("2", "EUR", 1.0, 118.0)
    });
    VirtualJournalGenerator generator(
        std::make_shared<settings::JournalAccountSettings>(), "BDT", 0.01);
    auto journal = generator.generate(analysis.positions);

    EXPECT_NEAR(analysis.totalGain.toDouble(), 2500.005, 1e-9);

    // EUR 0.005 не попадает в журнал: одна строка позиции и одна строка прибыли
    ASSERT_EQ(journal.size(), 2u);
    EXPECT_DOUBLE_EQ(journal[1].credit.toDouble(), 2500.0);
}

TEST_F(UnrealizedFxCalculatorTest, Invoice_RateDecrease_IsLoss) {
    snapshot_->addRate(makeRate("USD", 108.0, "2024-03-31"));

    auto analysis = compute({makeInvoice("1", "USD", 500.0, 110.0)});

    EXPECT_DOUBLE_EQ(analysis.positions[0].gainLoss->toDouble(), -1000.0);
    EXPECT_TRUE(analysis.totalGain.isZero());
    EXPECT_DOUBLE_EQ(analysis.totalLoss.toDouble(), 1000.0);
    EXPECT_DOUBLE_EQ(analysis.netGainLoss.toDouble(), -1000.0);
}

TEST_F(UnrealizedFxCalculatorTest, Invoice_SettledWithinTolerance_NotAPosition) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));
    allocations_["1"] = {makeAllocation("1", 600.0), makeAllocation("1", 399.995)};

    auto analysis = compute({makeInvoice("1", "USD", 1000.0, 110.0)});

    EXPECT_TRUE(analysis.positions.empty());
}

TEST_F(UnrealizedFxCalculatorTest, Invoice_ReportingCurrency_Skipped) {
    auto analysis = compute({makeInvoice("1", "BDT", 1000.0, 1.0)});

    EXPECT_TRUE(analysis.positions.empty());
}

TEST_F(UnrealizedFxCalculatorTest, Invoice_NoCurrentRate_KeptButExcludedFromTotals) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));

    auto analysis = compute({
        makeInvoice("1", "USD", 1000.0, 110.0),
        makeInvoice("2", "EUR", 400.0, 118.0),
        makeInvoice("3", "EUR", 100.0, 119.0)
    });

    ASSERT_EQ(analysis.positions.size(), 3u);
    const auto& eur = analysis.positions[1];
    EXPECT_EQ(eur.currency, "EUR");
    EXPECT_FALSE(eur.currentRate.has_value());
    EXPECT_FALSE(eur.currentValue.has_value());
    EXPECT_FALSE(eur.gainLoss.has_value());

    EXPECT_EQ(analysis.missingCurrencies, std::set<std::string>({"EUR"}));
    ASSERT_EQ(analysis.missingRates.size(), 1u);
    EXPECT_EQ(analysis.missingRates[0].currency, "EUR");
    EXPECT_EQ(analysis.missingRates[0].positionsCount, 2u);
    EXPECT_DOUBLE_EQ(analysis.missingRates[0].totalAmount.toDouble(), 500.0);

    EXPECT_DOUBLE_EQ(analysis.netGainLoss.toDouble(), 2500.0);

    ASSERT_EQ(analysis.warnings.size(), 1u);
    EXPECT_EQ(analysis.warnings[0].kind, domain::WarningKind::MISSING_RATE);
    EXPECT_EQ(analysis.warnings[0].subject, "EUR");
}

TEST_F(UnrealizedFxCalculatorTest, Invoice_NoBookingRate_NotRevaluedAndNotMissing) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));

    auto analysis = compute({makeInvoice("1", "USD", 1000.0, std::nullopt)});

    ASSERT_EQ(analysis.positions.size(), 1u);
    const auto& position = analysis.positions[0];
    EXPECT_DOUBLE_EQ(*position.currentRate, 112.5);
    EXPECT_DOUBLE_EQ(position.currentValue->toDouble(), 112500.0);
    EXPECT_FALSE(position.gainLoss.has_value());
    EXPECT_TRUE(analysis.missingCurrencies.empty());

    ASSERT_EQ(analysis.warnings.size(), 1u);
    EXPECT_EQ(analysis.warnings[0].kind, domain::WarningKind::MISSING_BOOKING_RATE);
    EXPECT_EQ(analysis.warnings[0].subject, "INV-1");
}

// ============================================================================
// BANK POSITIONS
// ============================================================================

TEST_F(UnrealizedFxCalculatorTest, BankBalance_ApproximatedRate_ZeroGainLoss) {
    snapshot_->addRate(makeRate("USD", 112.5, "2024-03-31"));

    auto analysis = compute({}, {makeBankAccount("b1", "USD", 2000.0)});

    ASSERT_EQ(analysis.positions.size(), 1u);
    const auto& position = analysis.positions[0];
    EXPECT_EQ(position.sourceType, domain::PositionSource::BANK_ACCOUNT);
    EXPECT_EQ(position.historicalRateKind, domain::HistoricalRateKind::APPROXIMATED);
    EXPECT_DOUBLE_EQ(*position.historicalRate, 112.5);
    EXPECT_DOUBLE_EQ(position.currentValue->toDouble(), 225000.0);
    ASSERT_TRUE(position.gainLoss.has_value());
    EXPECT_TRUE(position.gainLoss->isZero());
    EXPECT_TRUE(analysis.netGainLoss.isZero());
}

TEST_F(UnrealizedFxCalculatorTest, BankBalance_NoRate_Missing) {
    auto analysis = compute({}, {makeBankAccount("b1", "GBP", 300.0)});

    ASSERT_EQ(analysis.positions.size(), 1u);
    EXPECT_FALSE(analysis.positions[0].currentRate.has_value());
    EXPECT_FALSE(analysis.positions[0].historicalRate.has_value());
    EXPECT_EQ(analysis.missingCurrencies.count("GBP"), 1u);
}

TEST_F(UnrealizedFxCalculatorTest, BankBalance_ZeroOrReportingCurrency_Skipped) {
    auto analysis = compute({}, {
        makeBankAccount("b1", "USD", 0.0),
        makeBankAccount("b2", "BDT", 50000.0)
    });

    EXPECT_TRUE(analysis.positions.empty());
}
