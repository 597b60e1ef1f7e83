/**
 * @file InMemoryLedgerRepositoryTest.cpp
 * @brief Unit tests for InMemoryLedgerRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "../mocks/LedgerFixtures.hpp"

using namespace reporting;
using namespace reporting::adapters::secondary;
using namespace reporting::tests;

class InMemoryLedgerRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<InMemoryLedgerRepository>();
    }

    domain::Date asOf_{2024, 3, 31};
    std::shared_ptr<InMemoryLedgerRepository> repository_;
};

// ============================================================================
// SNAPSHOT FILTERS
// ============================================================================

TEST_F(InMemoryLedgerRepositoryTest, ListPostedLines_SkipsDraftsAndLaterEntries) {
    repository_->addEntry(makeEntry("1", "2024-03-01", {
        makeLine("1100", 10.0, 0.0), makeLine("4000", 0.0, 10.0)}));
    repository_->addEntry(makeEntry("2", "2024-03-02", {
        makeLine("1100", 20.0, 0.0), makeLine("4000", 0.0, 20.0)}, domain::EntryStatus::DRAFT));
    repository_->addEntry(makeEntry("3", "2024-04-01", {
        makeLine("1100", 30.0, 0.0), makeLine("4000", 0.0, 30.0)}));

    auto lines = repository_->openSnapshot(asOf_)->listPostedLines();

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].entryId, "1");
    EXPECT_EQ(lines[0].entryNumber, "JE-1");
    EXPECT_EQ(lines[0].entryDate, domain::Date(2024, 3, 1));
}

TEST_F(InMemoryLedgerRepositoryTest, ListActiveAccounts_FiltersInactiveAndTypes) {
    repository_->addAccount(makeAccount("1100", domain::AccountType::ASSET));
    repository_->addAccount(makeAccount("4000", domain::AccountType::REVENUE));
    auto closed = makeAccount("1900", domain::AccountType::ASSET);
    closed.active = false;
    repository_->addAccount(closed);

    auto snapshot = repository_->openSnapshot(asOf_);

    EXPECT_EQ(snapshot->listActiveAccounts({}).size(), 2u);
    auto assets = snapshot->listActiveAccounts({domain::AccountType::ASSET});
    ASSERT_EQ(assets.size(), 1u);
    EXPECT_EQ(assets[0].code, "1100");
}

TEST_F(InMemoryLedgerRepositoryTest, ListOpenForeignInvoices_OnlyForeignCustomersInOtherCurrency) {
    repository_->addInvoice(makeInvoice("1", "USD", 100.0, 110.0));
    repository_->addInvoice(makeInvoice("2", "USD", 100.0, 110.0, "2024-01-10", "2024-02-10",
                                        domain::CustomerType::LOCAL));
    repository_->addInvoice(makeInvoice("3", "BDT", 100.0, 1.0));
    auto cancelled = makeInvoice("4", "USD", 100.0, 110.0);
    cancelled.status = domain::InvoiceStatus::CANCELLED;
    repository_->addInvoice(cancelled);
    repository_->addInvoice(makeInvoice("5", "USD", 100.0, 110.0, "2024-04-02", "2024-05-02"));

    auto snapshot = repository_->openSnapshot(asOf_);

    EXPECT_EQ(snapshot->listOpenInvoices().size(), 3u);
    auto foreign = snapshot->listOpenForeignInvoices("BDT");
    ASSERT_EQ(foreign.size(), 1u);
    EXPECT_EQ(foreign[0].id, "1");
}

TEST_F(InMemoryLedgerRepositoryTest, ListAllocations_UpToAsOfDate) {
    repository_->addAllocation(makeAllocation("1", 100.0, "2024-03-01"));
    repository_->addAllocation(makeAllocation("1", 50.0, "2024-04-01"));
    repository_->addAllocation(makeAllocation("2", 70.0, "2024-03-01"));

    auto allocations = repository_->openSnapshot(asOf_)->listAllocations("1");

    ASSERT_EQ(allocations.size(), 1u);
    EXPECT_DOUBLE_EQ(allocations[0].amount.toDouble(), 100.0);
}

TEST_F(InMemoryLedgerRepositoryTest, ListRates_PairAndDateFiltered) {
    repository_->addRate(makeRate("USD", 110.0, "2024-03-01"));
    repository_->addRate(makeRate("USD", 111.0, "2024-04-01"));
    repository_->addRate(makeRate("EUR", 120.0, "2024-03-01"));

    auto rates = repository_->openSnapshot(asOf_)->listRates("USD", "BDT");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_DOUBLE_EQ(rates[0].rate, 110.0);
}

TEST_F(InMemoryLedgerRepositoryTest, ListForeignBankAccounts_ActiveNonReporting) {
    repository_->addBankAccount(makeBankAccount("b1", "USD", 100.0));
    repository_->addBankAccount(makeBankAccount("b2", "BDT", 100.0));
    auto dormant = makeBankAccount("b3", "EUR", 100.0);
    dormant.active = false;
    repository_->addBankAccount(dormant);

    auto banks = repository_->openSnapshot(asOf_)->listForeignBankAccounts("BDT");

    ASSERT_EQ(banks.size(), 1u);
    EXPECT_EQ(banks[0].id, "b1");
}

// ============================================================================
// ISOLATION AND WRITES
// ============================================================================

TEST_F(InMemoryLedgerRepositoryTest, Snapshot_LaterWrites_NotVisible) {
    auto snapshot = repository_->openSnapshot(asOf_);

    repository_->addRate(makeRate("USD", 110.0, "2024-03-01"));
    repository_->addEntry(makeEntry("1", "2024-03-01", {
        makeLine("1100", 10.0, 0.0), makeLine("4000", 0.0, 10.0)}));

    EXPECT_TRUE(snapshot->listRates("USD", "BDT").empty());
    EXPECT_TRUE(snapshot->listPostedLines().empty());
    EXPECT_EQ(repository_->openSnapshot(asOf_)->listRates("USD", "BDT").size(), 1u);
}

TEST_F(InMemoryLedgerRepositoryTest, AddEntry_NegativeAmount_Rejected) {
    EXPECT_THROW(repository_->addEntry(makeEntry("1", "2024-03-01", {
        makeLine("1100", -10.0, 0.0), makeLine("4000", 0.0, -10.0)})), std::invalid_argument);

    EXPECT_EQ(repository_->entryCount(), 0u);
}

TEST_F(InMemoryLedgerRepositoryTest, AddAllocation_NegativeAmount_Rejected) {
    EXPECT_THROW(repository_->addAllocation(makeAllocation("1", -5.0)), std::invalid_argument);
}

TEST_F(InMemoryLedgerRepositoryTest, InsertManualRate_AssignsIncreasingSequenceAndId) {
    auto first = repository_->insertManualRate(makeRate("USD", 110.0, "2024-03-31"));
    auto second = repository_->insertManualRate(makeRate("USD", 111.0, "2024-03-31"));

    EXPECT_EQ(first.sequence, 1);
    EXPECT_EQ(second.sequence, 2);
    EXPECT_EQ(first.id, "fx-1");
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(repository_->rateCount(), 2u);
}
