// include/adapters/secondary/persistence/JsonLedgerLoader.hpp
#pragma once

#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace reporting::adapters::secondary {

/**
 * @brief Загрузка JSON-среза базы в InMemoryLedgerRepository
 *
 * Формат - выгрузка таблиц с исходными именами колонок:
 * @code
 * {
 *   "chart_of_accounts":   [{"id", "account_code", "account_name", "account_type",
 *                            "parent_account_id", "level", "is_active"}],
 *   "journal_entries":     [{"id", "entry_number", "date", "description", "reference", "status"}],
 *   "journal_entry_lines": [{"id", "journal_entry_id", "account_code", "debit_amount",
 *                            "credit_amount", "bdt_debit_amount", "bdt_credit_amount",
 *                            "original_currency", "fx_rate", "description"}],
 *   "fx_rates":            [{"id", "date", "from_currency", "to_currency", "rate",
 *                            "source", "is_active", "notes", "created_at"}],
 *   "customers":           [{"id", "name", "customer_type"}],
 *   "invoices":            [{"id", "invoice_number", "customer_id", "date", "due_date",
 *                            "currency", "total_amount", "exchange_rate", "status"}],
 *   "payment_allocations": [{"id", "invoice_id", "allocated_amount", "allocation_date"}],
 *   "bank_accounts":       [{"id", "name", "currency", "balance", "is_active"}]
 * }
 * @endcode
 * Все секции необязательны. Суммы - числа или строки (numeric из PostgreSQL).
 * Курсы добавляются в порядке created_at, затем в порядке файла.
 */
class JsonLedgerLoader {
public:
    /**
     * @throws domain::RepositoryUnavailableException если файл не читается или не JSON
     */
    static void loadFile(const std::string& path, InMemoryLedgerRepository& repository);

    /**
     * @throws domain::RepositoryUnavailableException при неверной структуре документа
     * @throws std::invalid_argument при неверных значениях (даты, типы, отрицательные суммы)
     */
    static void load(const nlohmann::json& document, InMemoryLedgerRepository& repository);
};

} // namespace reporting::adapters::secondary
