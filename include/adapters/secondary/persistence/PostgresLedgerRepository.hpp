// include/adapters/secondary/persistence/PostgresLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "domain/exceptions/RepositoryUnavailableException.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <mutex>
#include <memory>
#include <iostream>

namespace reporting::adapters::secondary {

using ReadOnlySnapshotTransaction = pqxx::transaction<
    pqxx::isolation_level::repeatable_read,
    pqxx::write_policy::read_only>;

/**
 * @brief Срез PostgreSQL: одна read-only REPEATABLE READ транзакция
 *
 * Все запросы среза видят одно и то же состояние базы.
 * Пока срез жив, соединение репозитория занято (держит lock).
 */
class PostgresLedgerSnapshot : public ports::output::ILedgerSnapshot {
public:
    PostgresLedgerSnapshot(
        std::unique_lock<std::mutex> lock,
        pqxx::connection& connection,
        const domain::Date& asOfDate
    ) : lock_(std::move(lock)),
        txn_(connection),
        asOfDate_(asOfDate),
        asOfParam_(asOfDate.toString()) {}

    domain::Date asOfDate() const override { return asOfDate_; }

    std::vector<domain::JournalLine> listPostedLines() override {
        auto result = query("listPostedLines", [&] {
            return txn_.exec_params(
                R"(
                    SELECT l.id, l.journal_entry_id, e.entry_number, e.date, e.status,
                           e.description AS entry_description, e.reference,
                           l.account_code, l.description, l.debit_amount, l.credit_amount,
                           l.bdt_debit_amount, l.bdt_credit_amount, l.original_currency, l.fx_rate
                    FROM journal_entry_lines l
                    JOIN journal_entries e ON e.id = l.journal_entry_id
                    WHERE e.status = 'posted' AND e.date <= $1::date
                    ORDER BY e.date, e.entry_number, l.id
                )",
                asOfParam_
            );
        });

        std::vector<domain::JournalLine> lines;
        lines.reserve(result.size());
        for (const auto& row : result) {
            lines.push_back(rowToLine(row));
        }
        return lines;
    }

    std::vector<domain::Account> listActiveAccounts(
        const std::vector<domain::AccountType>& types) override
    {
        auto result = query("listActiveAccounts", [&] {
            return txn_.exec(
                R"(
                    SELECT id, account_code, account_name, account_type,
                           parent_account_id, level, is_active
                    FROM chart_of_accounts
                    WHERE is_active = true
                    ORDER BY account_code
                )"
            );
        });

        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            auto account = rowToAccount(row);
            if (types.empty() ||
                std::find(types.begin(), types.end(), account.type) != types.end()) {
                accounts.push_back(std::move(account));
            }
        }
        return accounts;
    }

    std::vector<domain::Invoice> listOpenInvoices() override {
        auto result = query("listOpenInvoices", [&] {
            return txn_.exec_params(
                R"(
                    SELECT i.id, i.invoice_number, c.name AS customer_name, c.customer_type,
                           i.currency, i.total_amount, i.exchange_rate, i.date, i.due_date, i.status
                    FROM invoices i
                    JOIN customers c ON c.id = i.customer_id
                    WHERE i.status = 'sent' AND i.date <= $1::date
                    ORDER BY i.due_date, i.invoice_number
                )",
                asOfParam_
            );
        });
        return rowsToInvoices(result);
    }

    std::vector<domain::Invoice> listOpenForeignInvoices(
        const std::string& reportingCurrency) override
    {
        auto result = query("listOpenForeignInvoices", [&] {
            return txn_.exec_params(
                R"(
                    SELECT i.id, i.invoice_number, c.name AS customer_name, c.customer_type,
                           i.currency, i.total_amount, i.exchange_rate, i.date, i.due_date, i.status
                    FROM invoices i
                    JOIN customers c ON c.id = i.customer_id
                    WHERE i.status = 'sent' AND i.date <= $1::date
                      AND c.customer_type = 'foreign' AND i.currency <> $2
                    ORDER BY i.invoice_number
                )",
                asOfParam_,
                reportingCurrency
            );
        });
        return rowsToInvoices(result);
    }

    std::vector<domain::PaymentAllocation> listAllocations(
        const std::string& invoiceId) override
    {
        auto result = query("listAllocations", [&] {
            return txn_.exec_params(
                R"(
                    SELECT id, invoice_id, allocated_amount, allocation_date
                    FROM payment_allocations
                    WHERE invoice_id = $1 AND allocation_date <= $2::date
                )",
                invoiceId,
                asOfParam_
            );
        });

        std::vector<domain::PaymentAllocation> allocations;
        for (const auto& row : result) {
            domain::PaymentAllocation allocation;
            allocation.id = row["id"].as<std::string>();
            allocation.invoiceId = row["invoice_id"].as<std::string>();
            allocation.amount = domain::Money::fromDouble(row["allocated_amount"].as<double>());
            allocation.allocationDate = domain::Date::fromString(row["allocation_date"].as<std::string>());
            allocations.push_back(allocation);
        }
        return allocations;
    }

    std::vector<domain::BankAccount> listForeignBankAccounts(
        const std::string& reportingCurrency) override
    {
        auto result = query("listForeignBankAccounts", [&] {
            return txn_.exec_params(
                R"(
                    SELECT id, name, currency, balance, is_active
                    FROM bank_accounts
                    WHERE is_active = true AND currency <> $1
                    ORDER BY name
                )",
                reportingCurrency
            );
        });

        std::vector<domain::BankAccount> accounts;
        for (const auto& row : result) {
            domain::BankAccount bank;
            bank.id = row["id"].as<std::string>();
            bank.name = row["name"].as<std::string>();
            bank.currency = row["currency"].as<std::string>();
            bank.balance = domain::Money::fromDouble(row["balance"].as<double>(), bank.currency);
            bank.active = row["is_active"].as<bool>();
            accounts.push_back(bank);
        }
        return accounts;
    }

    std::vector<domain::FxRate> listRates(
        const std::string& fromCurrency,
        const std::string& toCurrency) override
    {
        // sequence - порядок вставки внутри пары
        auto result = query("listRates", [&] {
            return txn_.exec_params(
                R"(
                    SELECT id, date, from_currency, to_currency, rate, source, is_active, notes,
                           ROW_NUMBER() OVER (ORDER BY created_at, id) AS sequence
                    FROM fx_rates
                    WHERE from_currency = $1 AND to_currency = $2 AND date <= $3::date
                )",
                fromCurrency,
                toCurrency,
                asOfParam_
            );
        });

        std::vector<domain::FxRate> rates;
        for (const auto& row : result) {
            domain::FxRate rate;
            rate.id = row["id"].as<std::string>();
            rate.date = domain::Date::fromString(row["date"].as<std::string>());
            rate.fromCurrency = row["from_currency"].as<std::string>();
            rate.toCurrency = row["to_currency"].as<std::string>();
            rate.rate = row["rate"].as<double>();
            rate.source = row["source"].is_null() ? "" : row["source"].as<std::string>();
            rate.active = row["is_active"].as<bool>();
            rate.notes = row["notes"].is_null() ? "" : row["notes"].as<std::string>();
            rate.sequence = row["sequence"].as<int64_t>();
            rates.push_back(rate);
        }
        return rates;
    }

private:
    std::unique_lock<std::mutex> lock_;
    ReadOnlySnapshotTransaction txn_;
    domain::Date asOfDate_;
    std::string asOfParam_;

    template <typename Query>
    pqxx::result query(const char* name, Query&& run) {
        try {
            return run();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerSnapshot] " << name << "() failed: " << e.what() << std::endl;
            throw domain::RepositoryUnavailableException(std::string(name) + ": " + e.what());
        }
    }

    static std::optional<domain::Money> optionalAmount(const pqxx::field& field) {
        if (field.is_null()) {
            return std::nullopt;
        }
        return domain::Money::fromDouble(field.as<double>());
    }

    static domain::JournalLine rowToLine(const pqxx::row& row) {
        domain::JournalLine line;
        line.id = row["id"].as<std::string>();
        line.entryId = row["journal_entry_id"].as<std::string>();
        line.entryNumber = row["entry_number"].as<std::string>();
        line.entryDate = domain::Date::fromString(row["date"].as<std::string>());
        line.entryStatus = domain::entryStatusFromString(row["status"].as<std::string>());
        line.entryDescription = row["entry_description"].is_null() ? "" : row["entry_description"].as<std::string>();
        line.entryReference = row["reference"].is_null() ? "" : row["reference"].as<std::string>();
        line.accountCode = row["account_code"].as<std::string>();
        line.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
        line.originalCurrency = row["original_currency"].is_null() ? "BDT" : row["original_currency"].as<std::string>();
        line.fxRate = row["fx_rate"].is_null() ? 1.0 : row["fx_rate"].as<double>();
        line.debit = domain::Money::fromDouble(
            row["debit_amount"].is_null() ? 0.0 : row["debit_amount"].as<double>(), line.originalCurrency);
        line.credit = domain::Money::fromDouble(
            row["credit_amount"].is_null() ? 0.0 : row["credit_amount"].as<double>(), line.originalCurrency);
        line.reportingDebit = optionalAmount(row["bdt_debit_amount"]);
        line.reportingCredit = optionalAmount(row["bdt_credit_amount"]);
        return line;
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.code = row["account_code"].as<std::string>();
        account.name = row["account_name"].as<std::string>();
        account.type = domain::accountTypeFromString(row["account_type"].as<std::string>());
        if (!row["parent_account_id"].is_null()) {
            account.parentId = row["parent_account_id"].as<std::string>();
        }
        account.level = row["level"].is_null() ? 1 : row["level"].as<int>();
        account.active = row["is_active"].as<bool>();
        return account;
    }

    static std::vector<domain::Invoice> rowsToInvoices(const pqxx::result& result) {
        std::vector<domain::Invoice> invoices;
        for (const auto& row : result) {
            domain::Invoice invoice;
            invoice.id = row["id"].as<std::string>();
            invoice.invoiceNumber = row["invoice_number"].as<std::string>();
            invoice.customerName = row["customer_name"].is_null() ? "Unknown" : row["customer_name"].as<std::string>();
            invoice.customerType = domain::customerTypeFromString(row["customer_type"].as<std::string>());
            invoice.currency = row["currency"].as<std::string>();
            invoice.totalAmount = domain::Money::fromDouble(row["total_amount"].as<double>(), invoice.currency);
            if (!row["exchange_rate"].is_null()) {
                invoice.historicalRate = row["exchange_rate"].as<double>();
            }
            invoice.date = domain::Date::fromString(row["date"].as<std::string>());
            invoice.dueDate = domain::Date::fromString(row["due_date"].as<std::string>());
            invoice.status = domain::invoiceStatusFromString(row["status"].as<std::string>());
            invoices.push_back(invoice);
        }
        return invoices;
    }
};

/**
 * @brief PostgreSQL реализация хранилища проводок
 *
 * Таблицы: chart_of_accounts, journal_entries, journal_entry_lines, fx_rates,
 * invoices, customers, payment_allocations, bank_accounts.
 *
 * Ручной курс только добавляется (INSERT без ON CONFLICT): на таблице fx_rates
 * не должно быть уникального ключа (from_currency, to_currency, date).
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings)
        : connectionString_(settings->getConnectionString())
    {
        std::cout << "[PostgresLedgerRepo] Connecting to PostgreSQL at "
                  << settings->getHost() << ":" << settings->getPort()
                  << " (timeout " << settings->getConnectTimeoutSeconds() << "s)..." << std::endl;
        connect();
        std::cout << "[PostgresLedgerRepo] Connected successfully" << std::endl;
    }

    ~PostgresLedgerRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::unique_ptr<ports::output::ILedgerSnapshot> openSnapshot(
        const domain::Date& asOfDate) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ensureConnected();
        try {
            return std::make_unique<PostgresLedgerSnapshot>(std::move(lock), *connection_, asOfDate);
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLedgerRepo] openSnapshot() failed: " << e.what() << std::endl;
            throw domain::RepositoryUnavailableException(e.what());
        }
    }

    domain::FxRate insertManualRate(const domain::FxRate& rate) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureConnected();

        try {
            pqxx::work txn(*connection_);

            auto inserted = txn.exec_params(
                R"(
                    INSERT INTO fx_rates (date, from_currency, to_currency, rate, source, is_active, notes)
                    VALUES ($1::date, $2, $3, $4, $5, $6, $7)
                    RETURNING id
                )",
                rate.date.toString(),
                rate.fromCurrency,
                rate.toCurrency,
                rate.rate,
                rate.source,
                rate.active,
                rate.notes
            );

            auto count = txn.exec_params(
                "SELECT COUNT(*) FROM fx_rates WHERE from_currency = $1 AND to_currency = $2",
                rate.fromCurrency,
                rate.toCurrency
            );

            txn.commit();

            domain::FxRate stored = rate;
            stored.id = inserted[0][0].as<std::string>();
            stored.sequence = count[0][0].as<int64_t>();
            std::cout << "[PostgresLedgerRepo] Inserted rate " << stored.fromCurrency << "/"
                      << stored.toCurrency << " = " << stored.rate
                      << " on " << stored.date.toString() << std::endl;
            return stored;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] insertManualRate() failed: " << e.what() << std::endl;
            throw domain::RepositoryUnavailableException(e.what());
        }
    }

private:
    std::string connectionString_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    void connect() {
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString_);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] Connection failed: " << e.what() << std::endl;
            throw domain::RepositoryUnavailableException(e.what());
        }
    }

    void ensureConnected() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresLedgerRepo] Reconnecting..." << std::endl;
            connect();
        }
    }
};

} // namespace reporting::adapters::secondary
