#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/EntryStatus.hpp"
#include <string>
#include <optional>

namespace reporting::domain {

/**
 * @brief Строка журнальной проводки
 *
 * Содержит поля заголовка проводки (дата, статус, номер), как при выборке
 * journal_entry_lines JOIN journal_entries.
 *
 * debit/credit - в валюте операции (originalCurrency),
 * reportingDebit/reportingCredit - в валюте отчётности. Если суммы
 * в валюте отчётности не заданы, они выводятся из суммы операции.
 * Колонки bdt_*_amount в базе по умолчанию равны 0, поэтому нулевая сумма
 * при ненулевой сумме операции тоже считается незаданной.
 */
struct JournalLine {
    std::string id;
    std::string entryId;
    std::string entryNumber;
    Date entryDate;
    EntryStatus entryStatus = EntryStatus::POSTED;
    std::string entryDescription;
    std::string entryReference;

    std::string accountCode;
    std::string description;
    Money debit;
    Money credit;
    std::optional<Money> reportingDebit;
    std::optional<Money> reportingCredit;
    std::string originalCurrency = "BDT";
    double fxRate = 1.0;

    /**
     * @brief Дебет в валюте отчётности
     */
    Money reportingDebitIn(const std::string& reportingCurrency) const {
        return toReporting(reportingDebit, debit, reportingCurrency);
    }

    /**
     * @brief Кредит в валюте отчётности
     */
    Money reportingCreditIn(const std::string& reportingCurrency) const {
        return toReporting(reportingCredit, credit, reportingCurrency);
    }

private:
    Money toReporting(
        const std::optional<Money>& reported,
        const Money& original,
        const std::string& reportingCurrency) const
    {
        if (reported && (!reported->isZero() || original.isZero())) {
            Money m = *reported;
            m.currency = reportingCurrency;
            return m;
        }
        if (originalCurrency == reportingCurrency) {
            return Money(original.units, original.nano, reportingCurrency);
        }
        return original.convert(fxRate, reportingCurrency);
    }
};

} // namespace reporting::domain
