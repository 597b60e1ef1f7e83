#include "adapters/secondary/persistence/JsonLedgerLoader.hpp"
#include "domain/exceptions/RepositoryUnavailableException.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>

namespace reporting::adapters::secondary {

namespace {

using nlohmann::json;

const json& section(const json& document, const char* name) {
    static const json empty = json::array();
    auto it = document.find(name);
    if (it == document.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_array()) {
        throw domain::RepositoryUnavailableException(
            std::string("section '") + name + "' must be an array");
    }
    return *it;
}

std::string text(const json& row, const char* key, const std::string& defaultValue = "") {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) {
        return defaultValue;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // id может быть числом
    return it->dump();
}

std::optional<double> number(const json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return std::stod(it->get<std::string>());
    }
    return it->get<double>();
}

double numberOr(const json& row, const char* key, double defaultValue) {
    return number(row, key).value_or(defaultValue);
}

bool flag(const json& row, const char* key, bool defaultValue) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) {
        return defaultValue;
    }
    return it->get<bool>();
}

void loadAccounts(const json& document, InMemoryLedgerRepository& repository) {
    for (const auto& row : section(document, "chart_of_accounts")) {
        domain::Account account;
        account.code = text(row, "account_code");
        account.id = text(row, "id", account.code);
        account.name = text(row, "account_name");
        account.type = domain::accountTypeFromString(text(row, "account_type"));
        std::string parent = text(row, "parent_account_id");
        if (!parent.empty()) {
            account.parentId = parent;
        }
        account.level = static_cast<int>(numberOr(row, "level", 1));
        account.active = flag(row, "is_active", true);
        repository.addAccount(account);
    }
}

void loadEntries(const json& document, InMemoryLedgerRepository& repository) {
    std::map<std::string, std::vector<domain::JournalLine>> linesByEntry;
    for (const auto& row : section(document, "journal_entry_lines")) {
        domain::JournalLine line;
        line.id = text(row, "id");
        line.entryId = text(row, "journal_entry_id");
        line.accountCode = text(row, "account_code");
        line.description = text(row, "description");
        line.originalCurrency = text(row, "original_currency", "BDT");
        line.fxRate = numberOr(row, "fx_rate", 1.0);
        line.debit = domain::Money::fromDouble(numberOr(row, "debit_amount", 0.0), line.originalCurrency);
        line.credit = domain::Money::fromDouble(numberOr(row, "credit_amount", 0.0), line.originalCurrency);
        if (auto value = number(row, "bdt_debit_amount")) {
            line.reportingDebit = domain::Money::fromDouble(*value);
        }
        if (auto value = number(row, "bdt_credit_amount")) {
            line.reportingCredit = domain::Money::fromDouble(*value);
        }
        linesByEntry[line.entryId].push_back(line);
    }

    for (const auto& row : section(document, "journal_entries")) {
        domain::JournalEntry entry;
        entry.id = text(row, "id");
        entry.entryNumber = text(row, "entry_number", entry.id);
        entry.date = domain::Date::fromString(text(row, "date"));
        entry.description = text(row, "description");
        entry.reference = text(row, "reference");
        entry.status = domain::entryStatusFromString(text(row, "status", "draft"));
        auto lines = linesByEntry.find(entry.id);
        if (lines != linesByEntry.end()) {
            entry.lines = lines->second;
            linesByEntry.erase(lines);
        }
        repository.addEntry(entry);
    }

    if (!linesByEntry.empty()) {
        std::cerr << "[JsonLedgerLoader] " << linesByEntry.size()
                  << " journal_entry_id values have lines but no entry header; skipped" << std::endl;
    }
}

void loadRates(const json& document, InMemoryLedgerRepository& repository) {
    std::vector<std::pair<std::string, domain::FxRate>> rates;
    for (const auto& row : section(document, "fx_rates")) {
        domain::FxRate rate;
        rate.id = text(row, "id");
        rate.date = domain::Date::fromString(text(row, "date"));
        rate.fromCurrency = text(row, "from_currency");
        rate.toCurrency = text(row, "to_currency", "BDT");
        rate.rate = numberOr(row, "rate", 0.0);
        rate.source = text(row, "source");
        rate.active = flag(row, "is_active", true);
        rate.notes = text(row, "notes");
        rates.emplace_back(text(row, "created_at"), rate);
    }

    std::stable_sort(rates.begin(), rates.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [createdAt, rate] : rates) {
        repository.addRate(rate);
    }
}

void loadReceivables(const json& document, InMemoryLedgerRepository& repository) {
    std::map<std::string, std::pair<std::string, domain::CustomerType>> customers;
    for (const auto& row : section(document, "customers")) {
        customers[text(row, "id")] = {
            text(row, "name", "Unknown"),
            domain::customerTypeFromString(text(row, "customer_type", "local"))
        };
    }

    for (const auto& row : section(document, "invoices")) {
        domain::Invoice invoice;
        invoice.id = text(row, "id");
        invoice.invoiceNumber = text(row, "invoice_number", invoice.id);
        invoice.currency = text(row, "currency", "BDT");
        invoice.totalAmount = domain::Money::fromDouble(numberOr(row, "total_amount", 0.0), invoice.currency);
        invoice.historicalRate = number(row, "exchange_rate");
        invoice.date = domain::Date::fromString(text(row, "date"));
        invoice.dueDate = domain::Date::fromString(text(row, "due_date", text(row, "date")));
        invoice.status = domain::invoiceStatusFromString(text(row, "status", "draft"));

        auto customer = customers.find(text(row, "customer_id"));
        if (customer != customers.end()) {
            invoice.customerName = customer->second.first;
            invoice.customerType = customer->second.second;
        } else {
            invoice.customerName = "Unknown";
        }
        repository.addInvoice(invoice);
    }

    for (const auto& row : section(document, "payment_allocations")) {
        domain::PaymentAllocation allocation;
        allocation.id = text(row, "id");
        allocation.invoiceId = text(row, "invoice_id");
        allocation.amount = domain::Money::fromDouble(numberOr(row, "allocated_amount", 0.0));
        allocation.allocationDate = domain::Date::fromString(text(row, "allocation_date"));
        repository.addAllocation(allocation);
    }

    for (const auto& row : section(document, "bank_accounts")) {
        domain::BankAccount bank;
        bank.id = text(row, "id");
        bank.name = text(row, "name");
        bank.currency = text(row, "currency", "BDT");
        bank.balance = domain::Money::fromDouble(numberOr(row, "balance", 0.0), bank.currency);
        bank.active = flag(row, "is_active", true);
        repository.addBankAccount(bank);
    }
}

} // namespace

void JsonLedgerLoader::loadFile(const std::string& path, InMemoryLedgerRepository& repository) {
    std::cout << "[JsonLedgerLoader] Loading snapshot from " << path << std::endl;

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[JsonLedgerLoader] Cannot open " << path << std::endl;
        throw domain::RepositoryUnavailableException("cannot open snapshot file " + path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        std::cerr << "[JsonLedgerLoader] Parse error: " << e.what() << std::endl;
        throw domain::RepositoryUnavailableException(path + ": " + e.what());
    }

    load(document, repository);
}

void JsonLedgerLoader::load(const json& document, InMemoryLedgerRepository& repository) {
    if (!document.is_object()) {
        throw domain::RepositoryUnavailableException("snapshot document must be a JSON object");
    }

    try {
        loadAccounts(document, repository);
        loadEntries(document, repository);
        loadRates(document, repository);
        loadReceivables(document, repository);
    } catch (const json::exception& e) {
        std::cerr << "[JsonLedgerLoader] Malformed snapshot: " << e.what() << std::endl;
        throw domain::RepositoryUnavailableException(std::string("malformed snapshot: ") + e.what());
    }

    std::cout << "[JsonLedgerLoader] Loaded " << repository.entryCount() << " entries, "
              << repository.rateCount() << " rates" << std::endl;
}

} // namespace reporting::adapters::secondary
