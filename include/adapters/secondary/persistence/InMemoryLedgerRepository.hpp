// include/adapters/secondary/persistence/InMemoryLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/JournalEntry.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <iostream>

namespace reporting::adapters::secondary {

/**
 * @brief Содержимое хранилища: то, что копируется в срез
 */
struct LedgerState {
    std::vector<domain::Account> accounts;
    std::vector<domain::JournalEntry> entries;
    std::vector<domain::FxRate> rates;
    std::vector<domain::Invoice> invoices;
    std::vector<domain::PaymentAllocation> allocations;
    std::vector<domain::BankAccount> bankAccounts;
};

/**
 * @brief Срез in-memory хранилища
 *
 * Владеет копией состояния, поэтому последующие записи в хранилище
 * его не меняют.
 */
class InMemoryLedgerSnapshot : public ports::output::ILedgerSnapshot {
public:
    InMemoryLedgerSnapshot(const domain::Date& asOfDate, LedgerState state)
        : asOfDate_(asOfDate), state_(std::move(state)) {}

    domain::Date asOfDate() const override { return asOfDate_; }

    std::vector<domain::JournalLine> listPostedLines() override {
        std::vector<domain::JournalLine> result;
        for (const auto& entry : state_.entries) {
            if (!entry.isPosted() || entry.date > asOfDate_) {
                continue;
            }
            auto lines = entry.joinedLines();
            result.insert(result.end(), lines.begin(), lines.end());
        }
        return result;
    }

    std::vector<domain::Account> listActiveAccounts(
        const std::vector<domain::AccountType>& types) override
    {
        std::vector<domain::Account> result;
        for (const auto& account : state_.accounts) {
            if (!account.active) {
                continue;
            }
            if (!types.empty() &&
                std::find(types.begin(), types.end(), account.type) == types.end()) {
                continue;
            }
            result.push_back(account);
        }
        return result;
    }

    std::vector<domain::Invoice> listOpenInvoices() override {
        std::vector<domain::Invoice> result;
        for (const auto& invoice : state_.invoices) {
            if (invoice.status == domain::InvoiceStatus::SENT && invoice.date <= asOfDate_) {
                result.push_back(invoice);
            }
        }
        return result;
    }

    std::vector<domain::Invoice> listOpenForeignInvoices(
        const std::string& reportingCurrency) override
    {
        std::vector<domain::Invoice> result;
        for (const auto& invoice : listOpenInvoices()) {
            if (invoice.customerType == domain::CustomerType::FOREIGN &&
                invoice.currency != reportingCurrency) {
                result.push_back(invoice);
            }
        }
        return result;
    }

    std::vector<domain::PaymentAllocation> listAllocations(
        const std::string& invoiceId) override
    {
        std::vector<domain::PaymentAllocation> result;
        for (const auto& allocation : state_.allocations) {
            if (allocation.invoiceId == invoiceId && allocation.allocationDate <= asOfDate_) {
                result.push_back(allocation);
            }
        }
        return result;
    }

    std::vector<domain::BankAccount> listForeignBankAccounts(
        const std::string& reportingCurrency) override
    {
        std::vector<domain::BankAccount> result;
        for (const auto& bank : state_.bankAccounts) {
            if (bank.active && bank.currency != reportingCurrency) {
                result.push_back(bank);
            }
        }
        return result;
    }

    std::vector<domain::FxRate> listRates(
        const std::string& fromCurrency,
        const std::string& toCurrency) override
    {
        std::vector<domain::FxRate> result;
        for (const auto& rate : state_.rates) {
            if (rate.fromCurrency == fromCurrency && rate.toCurrency == toCurrency &&
                rate.date <= asOfDate_) {
                result.push_back(rate);
            }
        }
        return result;
    }

private:
    domain::Date asOfDate_;
    LedgerState state_;
};

/**
 * @brief In-memory хранилище проводок, счетов и курсов
 *
 * Используется как источник "json" (заполняется JsonLedgerLoader) и в тестах.
 * Курсам присваивается sequence в порядке добавления.
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    InMemoryLedgerRepository() {
        std::cout << "[InMemoryLedgerRepository] Created" << std::endl;
    }

    void addAccount(const domain::Account& account) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.accounts.push_back(account);
    }

    /**
     * @throws std::invalid_argument если в строке отрицательная сумма
     */
    void addEntry(const domain::JournalEntry& entry) {
        for (const auto& line : entry.lines) {
            if (line.debit.isNegative() || line.credit.isNegative() ||
                (line.reportingDebit && line.reportingDebit->isNegative()) ||
                (line.reportingCredit && line.reportingCredit->isNegative())) {
                throw std::invalid_argument(
                    "Negative amount in journal line " + line.id + " of entry " + entry.entryNumber);
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        state_.entries.push_back(entry);
    }

    /**
     * @brief Добавить курс, присвоив очередной sequence (и id, если пуст)
     */
    domain::FxRate addRate(const domain::FxRate& rate) {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::FxRate stored = rate;
        stored.sequence = ++lastSequence_;
        if (stored.id.empty()) {
            stored.id = "fx-" + std::to_string(stored.sequence);
        }
        state_.rates.push_back(stored);
        return stored;
    }

    void addInvoice(const domain::Invoice& invoice) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.invoices.push_back(invoice);
    }

    void addAllocation(const domain::PaymentAllocation& allocation) {
        if (allocation.amount.isNegative()) {
            throw std::invalid_argument("Negative allocation amount: " + allocation.id);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        state_.allocations.push_back(allocation);
    }

    void addBankAccount(const domain::BankAccount& bankAccount) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.bankAccounts.push_back(bankAccount);
    }

    size_t rateCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.rates.size();
    }

    size_t entryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.entries.size();
    }

    std::unique_ptr<ports::output::ILedgerSnapshot> openSnapshot(
        const domain::Date& asOfDate) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::make_unique<InMemoryLedgerSnapshot>(asOfDate, state_);
    }

    domain::FxRate insertManualRate(const domain::FxRate& rate) override {
        auto stored = addRate(rate);
        std::cout << "[InMemoryLedgerRepository] Inserted rate " << stored.fromCurrency << "/"
                  << stored.toCurrency << " #" << stored.sequence << std::endl;
        return stored;
    }

private:
    mutable std::mutex mutex_;
    LedgerState state_;
    int64_t lastSequence_ = 0;
};

} // namespace reporting::adapters::secondary
